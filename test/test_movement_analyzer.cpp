#include <gtest/gtest.h>

#include "MovementAnalyzer.h"

static std::vector<Sample> Series(const std::vector<double>& distances, uint64_t step_ms = 1000) {
  std::vector<Sample> out;
  uint64_t ts = 50000;
  for (double d : distances) {
    Sample s{};
    s.ts_ms = ts;
    s.distance_m = d;
    out.push_back(s);
    ts += step_ms;
  }
  return out;
}

TEST(MovementAnalyzer, TooFewSamples) {
  MovementAnalyzer ma;
  for (size_t n = 0; n < MovementAnalyzer::MIN_SAMPLES; n++) {
    const MovementResult r = ma.Analyze(Series(std::vector<double>(n, 3.0)));
    EXPECT_EQ(r.trend, MovementTrend::Stationary);
    EXPECT_FLOAT_EQ(r.confidence, 0.0f);
  }
}

TEST(MovementAnalyzer, Approaching) {
  MovementAnalyzer ma;
  const MovementResult r = ma.Analyze(Series({10, 9, 8, 7, 6, 5, 4, 3}));
  EXPECT_EQ(r.trend, MovementTrend::Approaching);
  EXPECT_NEAR(r.slope_mps, -1.0, 1e-9);
  EXPECT_GT(r.confidence, 0.8f);
}

TEST(MovementAnalyzer, Receding) {
  MovementAnalyzer ma;
  const MovementResult r = ma.Analyze(Series({1.0, 1.5, 2.0, 2.5, 3.0}));
  EXPECT_EQ(r.trend, MovementTrend::Receding);
  EXPECT_NEAR(r.slope_mps, 0.5, 1e-9);
  EXPECT_GT(r.confidence, 0.8f);
}

TEST(MovementAnalyzer, Stationary) {
  MovementAnalyzer ma;
  const MovementResult r = ma.Analyze(Series({5.0, 5.0, 5.0, 5.0}));
  EXPECT_EQ(r.trend, MovementTrend::Stationary);
  EXPECT_FLOAT_EQ(r.confidence, 1.0f);
}

TEST(MovementAnalyzer, SlowDriftIsStationary) {
  MovementAnalyzer ma;
  const MovementResult r = ma.Analyze(Series({5.00, 5.01, 5.02, 5.03}));
  EXPECT_EQ(r.trend, MovementTrend::Stationary);
}

TEST(MovementAnalyzer, Erratic) {
  MovementAnalyzer ma;
  const MovementResult r = ma.Analyze(Series({1, 10, 1, 10, 1, 10}));
  EXPECT_EQ(r.trend, MovementTrend::Erratic);
  EXPECT_GT(r.residual_rms_m, ERRATIC_RMS_M);
  EXPECT_LT(r.confidence, 0.5f);
}

TEST(MovementAnalyzer, ConfidenceFallsWithNoise) {
  MovementAnalyzer ma;
  const MovementResult clean = ma.Analyze(Series({8, 7, 6, 5, 4}));
  const MovementResult noisy = ma.Analyze(Series({8, 6.5, 6.5, 4.5, 4}));
  EXPECT_GT(clean.confidence, noisy.confidence);
  EXPECT_GT(noisy.confidence, 0.0f);
}

TEST(MovementAnalyzer, SameInstant) {
  MovementAnalyzer ma;
  const MovementResult r = ma.Analyze(Series({1, 5, 9}, 0));
  EXPECT_EQ(r.trend, MovementTrend::Stationary);
  EXPECT_FLOAT_EQ(r.confidence, 0.0f);
}

TEST(MovementAnalyzer, ConfiguredThresholds) {
  ScanConfig cfg{};
  cfg.trend_slope_mps = 1.0;
  MovementAnalyzer ma(cfg);
  EXPECT_EQ(ma.Analyze(Series({1.0, 1.5, 2.0, 2.5})).trend, MovementTrend::Stationary);
}
