#include <gtest/gtest.h>

#include "DistanceEstimator.h"

#include <cmath>
#include <limits>

TEST(DistanceEstimator, ReferenceRssiIsOneMeter) {
  DistanceEstimator est;
  EXPECT_DOUBLE_EQ(est.Estimate(-59), 1.0);
  EXPECT_EQ(est.referenceRssi(), -59);
  EXPECT_DOUBLE_EQ(est.pathLossExponent(), 2.0);
}

TEST(DistanceEstimator, TwentyDbIsTenTimes) {
  DistanceEstimator est;
  EXPECT_NEAR(est.Estimate(-79), 10.0, 1e-9);
  EXPECT_NEAR(est.Estimate(-99), 100.0, 1e-7);
}

TEST(DistanceEstimator, WeakerIsFarther) {
  DistanceEstimator est;
  double prev = 0.0;
  for (int rssi = -30; rssi >= -110; rssi -= 5) {
    const double d = est.Estimate(rssi);
    EXPECT_GE(d, prev) << "rssi " << rssi;
    prev = d;
  }
}

TEST(DistanceEstimator, Clamped) {
  DistanceEstimator est;
  EXPECT_DOUBLE_EQ(est.Estimate(-10), MIN_DISTANCE_M);
  EXPECT_DOUBLE_EQ(est.Estimate(-200), MAX_DISTANCE_M);
  EXPECT_DOUBLE_EQ(est.Estimate(std::numeric_limits<double>::quiet_NaN()), MAX_DISTANCE_M);
}

TEST(DistanceEstimator, CalibratedReference) {
  DistanceEstimator est;
  EXPECT_DOUBLE_EQ(est.Estimate(-65, -65), 1.0);
  EXPECT_NEAR(est.Estimate(-85, -65), 10.0, 1e-9);
}

TEST(DistanceEstimator, ExponentOverride) {
  DistanceEstimator est;
  EXPECT_NEAR(est.Estimate(-89, std::nullopt, 3.0), 10.0, 1e-9);
  EXPECT_DOUBLE_EQ(est.Estimate(-89, std::nullopt, 0.0), MAX_DISTANCE_M);
}

TEST(DistanceEstimator, ConfiguredModel) {
  ScanConfig cfg{};
  cfg.reference_rssi = -70;
  cfg.path_loss_exponent = 2.5;
  cfg.max_distance_m = 50.0;
  DistanceEstimator est(cfg);

  EXPECT_DOUBLE_EQ(est.Estimate(-70), 1.0);
  EXPECT_NEAR(est.Estimate(-95), 10.0, 1e-9);
  EXPECT_DOUBLE_EQ(est.Estimate(-120), 50.0);
}

TEST(DistanceEstimator, SolveExponent) {
  double n = 0.0;
  ASSERT_TRUE(DistanceEstimator::SolvePathLossExponent(-59, -71, 10.0, n));
  EXPECT_NEAR(n, 1.2, 1e-9);

  ASSERT_TRUE(DistanceEstimator::SolvePathLossExponent(-59, -65, 2.0, n));
  EXPECT_NEAR(n, 6.0 / (10.0 * std::log10(2.0)), 1e-9);

  DistanceEstimator est;
  EXPECT_NEAR(est.Estimate(-65, std::nullopt, n), 2.0, 1e-9);
}

TEST(DistanceEstimator, SolveExponentRejectsDegenerate) {
  double n = 7.0;
  EXPECT_FALSE(DistanceEstimator::SolvePathLossExponent(-59, -70, 1.0, n));
  EXPECT_FALSE(DistanceEstimator::SolvePathLossExponent(-59, -70, 0.0, n));
  EXPECT_FALSE(DistanceEstimator::SolvePathLossExponent(-59, -70, -3.0, n));
  EXPECT_FALSE(DistanceEstimator::SolvePathLossExponent(-59, -59, 5.0, n));
  EXPECT_DOUBLE_EQ(n, 7.0);
}
