#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "AdvertisementDecoder.h"
#include "CadenceTracker.h"
#include "ConfidenceScorer.h"
#include "DistanceEstimator.h"
#include "MovementAnalyzer.h"
#include "ScanConfig.h"
#include "Track.h"

enum class CalibrationResult : uint8_t {
  Applied = 0,
  UnknownDevice,
  OutOfRange,
  NoSamples,
  NotCalibrating,
};

enum class ScanDuty : uint8_t { Relaxed = 0, Balanced, Aggressive };

// Suggested radio settings for the adapter layer; the session never touches
// the radio itself.
struct ScanHint {
  ScanDuty duty = ScanDuty::Balanced;
  uint16_t interval_ms = 45;
  uint16_t window_ms = 15;
  size_t   high_confidence = 0;   // devices at or above the detection threshold
};

struct ScanSummary {
  size_t      total = 0;
  size_t      trackers = 0;       // anything not classified NotATracker
  std::string closest_address;
  std::string closest_name;
  int         closest_rssi = -127;
  double      closest_distance_m = 0.0;
  double      avg_distance_m = 0.0;
  double      min_distance_m = 0.0;
  double      max_distance_m = 0.0;
  float       duration_s = 0.0f;
};

struct RangeTestEntry {
  std::string    address;
  Classification classification = Classification::NotATracker;
  int            score = 0;
  RangeTestStats range{};
};

class ScanSession {
public:
  explicit ScanSession(const ScanConfig& cfg = ScanConfig{});

  // Runs decode -> cadence -> score -> distance -> movement for one event and
  // returns a copy of the updated device.
  DeviceView onAdvertisement(const RawAdvertisement& adv);

  void setMode(ScanMode mode);
  ScanMode mode() const;

  // Explicit 1 m reference for one device. Out-of-range values leave the
  // current calibration untouched.
  CalibrationResult calibrate(const std::string& address, int rssi_at_1m);

  // Solves the device's path-loss exponent from its smoothed RSSI with the
  // device placed at a known distance. 1 m sets the reference instead.
  CalibrationResult calibrateAtDistance(const std::string& address, double known_distance_m);

  // Calibration mode: collect RSSI from one device placed at 1 m, then apply
  // the mean as its reference.
  CalibrationResult beginCalibration(const std::string& address);
  CalibrationResult commitCalibration();
  void cancelCalibration();
  std::string calibrationTarget() const;
  size_t calibrationSamples() const;

  bool clearCalibration(const std::string& address);

  // Drops devices not seen for longer than max_age_ms. Returns how many.
  size_t clearStale(uint64_t now_ms, uint64_t max_age_ms);
  void reset();

  bool device(const std::string& address, DeviceView& out) const;
  std::vector<DeviceView> devices() const;             // score desc, then RSSI
  std::vector<DeviceView> interestingDevices() const;  // mode filter applied
  size_t deviceCount() const;

  std::vector<Sample> samples(const std::string& address) const;
  std::vector<DecodedPayload> payloads(const std::string& address) const;

  ScanHint scanHint() const;
  ScanSummary summarize(uint64_t now_ms) const;
  std::vector<RangeTestEntry> rangeTestReport() const;

  const ScanConfig& config() const { return _cfg; }

private:
  DeviceRecord& findOrCreate(const RawAdvertisement& adv);
  void updateRssiStats(DeviceRecord& r, int rssi) const;
  void maybeAdaptReference(DeviceRecord& r, int rssi);
  void refreshDistances(DeviceRecord& r) const;
  void updateTrend(DeviceRecord& r) const;
  std::optional<int> referenceFor(const DeviceRecord& r) const;

  CalibrationResult applyCalibration(DeviceRecord& r, int rssi_at_1m);
  void endCalibration();

  bool isInteresting(const DeviceRecord& r) const;
  DeviceView makeView(const DeviceRecord& r) const;
  void setModeLocked(ScanMode mode);

  mutable std::mutex _lock;

  const ScanConfig     _cfg;
  AdvertisementDecoder _decoder;
  CadenceTracker       _cadence;
  ConfidenceScorer     _scorer;
  DistanceEstimator    _estimator;
  MovementAnalyzer     _analyzer;

  ScanMode _mode = ScanMode::Normal;

  std::unordered_map<std::string, DeviceRecord> _devices;
  uint16_t _next_index = 1;

  std::string _calib_target;
  ScanMode    _mode_before_calib = ScanMode::Normal;
  long        _calib_rssi_sum = 0;
  uint32_t    _calib_rssi_count = 0;
};
