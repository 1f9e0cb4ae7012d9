#include "MovementAnalyzer.h"

#include <math.h>

MovementAnalyzer::MovementAnalyzer(const ScanConfig& cfg) {
  const ScanConfig c = cfg.Sanitized();
  _slope_threshold = fabs(c.trend_slope_mps);
  _erratic_rms = (c.erratic_rms_m > 0.0) ? c.erratic_rms_m : ERRATIC_RMS_M;
}

MovementResult MovementAnalyzer::Analyze(const std::vector<Sample>& history) const {
  MovementResult out{};
  const size_t n = history.size();
  if (n < MIN_SAMPLES) return out;

  // Time relative to the first sample keeps the sums small
  const uint64_t t0 = history.front().ts_ms;

  double mean_t = 0.0, mean_d = 0.0;
  for (const Sample& s : history) {
    mean_t += ((double)s.ts_ms - (double)t0) / 1000.0;
    mean_d += s.distance_m;
  }
  mean_t /= (double)n;
  mean_d /= (double)n;

  double sxx = 0.0, sxy = 0.0;
  for (const Sample& s : history) {
    const double dt = ((double)s.ts_ms - (double)t0) / 1000.0 - mean_t;
    sxx += dt * dt;
    sxy += dt * (s.distance_m - mean_d);
  }

  // All samples at the same instant: no time axis to fit against
  if (sxx <= 1e-12) return out;

  const double slope = sxy / sxx;
  const double intercept = mean_d - slope * mean_t;

  double sse = 0.0;
  for (const Sample& s : history) {
    const double t = ((double)s.ts_ms - (double)t0) / 1000.0;
    const double r = s.distance_m - (intercept + slope * t);
    sse += r * r;
  }
  const double rms = sqrt(sse / (double)n);

  out.slope_mps = slope;
  out.residual_rms_m = rms;

  const double q = rms / _erratic_rms;
  out.confidence = (float)(1.0 / (1.0 + q * q));

  if (rms > _erratic_rms)               out.trend = MovementTrend::Erratic;
  else if (slope < -_slope_threshold)   out.trend = MovementTrend::Approaching;
  else if (slope >  _slope_threshold)   out.trend = MovementTrend::Receding;
  else                                  out.trend = MovementTrend::Stationary;

  return out;
}
