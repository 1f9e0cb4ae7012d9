#pragma once

#include <optional>

#include "ScanConfig.h"

// Log-distance path-loss model:
//   d = 10 ^ ((ref - rssi) / (10 * n))
class DistanceEstimator {
public:
  explicit DistanceEstimator(const ScanConfig& cfg = ScanConfig{});

  double Estimate(double rssi_dbm, std::optional<int> calib_rssi_at_1m = std::nullopt) const;
  double Estimate(double rssi_dbm, std::optional<int> calib_rssi_at_1m,
                  std::optional<double> path_loss_exponent) const;

  // Exponent that makes rssi_dbm map to known_distance_m for the given 1 m
  // reference. False when the distance is not positive or is 1 m (log10 = 0).
  static bool SolvePathLossExponent(double reference_rssi, double rssi_dbm,
                                    double known_distance_m, double& out);

  int referenceRssi() const { return _reference_rssi; }
  double pathLossExponent() const { return _exponent; }

private:
  int    _reference_rssi;
  double _exponent;
  double _min_m;
  double _max_m;
};
