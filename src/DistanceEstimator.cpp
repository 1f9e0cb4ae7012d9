#include "DistanceEstimator.h"

#include <math.h>

DistanceEstimator::DistanceEstimator(const ScanConfig& cfg) {
  const ScanConfig c = cfg.Sanitized();
  _reference_rssi = c.reference_rssi;
  _exponent = c.path_loss_exponent;
  _min_m = c.min_distance_m;
  _max_m = c.max_distance_m;
}

double DistanceEstimator::Estimate(double rssi_dbm, std::optional<int> calib_rssi_at_1m) const {
  return Estimate(rssi_dbm, calib_rssi_at_1m, std::nullopt);
}

double DistanceEstimator::Estimate(double rssi_dbm, std::optional<int> calib_rssi_at_1m,
                                   std::optional<double> path_loss_exponent) const {
  const double ref = (double)calib_rssi_at_1m.value_or(_reference_rssi);
  const double n = path_loss_exponent.value_or(_exponent);

  if (!isfinite(rssi_dbm) || !(n > 0.0)) return _max_m;

  const double d = pow(10.0, (ref - rssi_dbm) / (10.0 * n));

  if (!isfinite(d) || d > _max_m) return _max_m;
  if (d < _min_m) return _min_m;
  return d;
}

bool DistanceEstimator::SolvePathLossExponent(double reference_rssi, double rssi_dbm,
                                              double known_distance_m, double& out) {
  if (!(known_distance_m > 0.0) || !isfinite(rssi_dbm)) return false;

  const double lg = log10(known_distance_m);
  if (fabs(lg) < 1e-9) return false;

  const double n = fabs((reference_rssi - rssi_dbm) / (10.0 * lg));
  if (!(n > 0.0) || !isfinite(n)) return false;

  out = n;
  return true;
}
