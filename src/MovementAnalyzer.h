#pragma once

#include <vector>

#include "ScanConfig.h"
#include "Track.h"          // Sample, MovementTrend

struct MovementResult {
  MovementTrend trend = MovementTrend::Stationary;
  float         confidence = 0.0f;   // 0..1
  double        slope_mps = 0.0;     // least-squares d(distance)/dt
  double        residual_rms_m = 0.0;
};

class MovementAnalyzer {
public:
  static constexpr size_t MIN_SAMPLES = 3;

  explicit MovementAnalyzer(const ScanConfig& cfg = ScanConfig{});

  // history must be in chronological order
  MovementResult Analyze(const std::vector<Sample>& history) const;

private:
  double _slope_threshold;
  double _erratic_rms;
};
