#include "ScanSession.h"

#include <algorithm>
#include <math.h>

// Adapter duty cycles (NimBLE scan interval/window, ms)
static constexpr uint16_t RELAXED_INTERVAL_MS    = 160;
static constexpr uint16_t RELAXED_WINDOW_MS      = 16;
static constexpr uint16_t BALANCED_INTERVAL_MS   = 45;
static constexpr uint16_t BALANCED_WINDOW_MS     = 15;
static constexpr uint16_t AGGRESSIVE_INTERVAL_MS = 45;
static constexpr uint16_t AGGRESSIVE_WINDOW_MS   = 45;

// Distances beyond this are shown as "unknown" and left out of the summary
static constexpr double SUMMARY_MAX_DISTANCE_M = 100.0;

ScanSession::ScanSession(const ScanConfig& cfg)
  : _cfg(cfg.Sanitized()),
    _cadence(_cfg),
    _scorer(_cfg.scoring),
    _estimator(_cfg),
    _analyzer(_cfg) {}

// ----------------------------- Helpers -----------------------------

DeviceRecord& ScanSession::findOrCreate(const RawAdvertisement& adv) {
  auto it = _devices.find(adv.address);
  if (it != _devices.end()) return it->second;

  it = _devices.try_emplace(adv.address, _cfg.history_capacity).first;
  DeviceRecord& r = it->second;
  r.address = adv.address;
  r.index = _next_index++;
  r.first_seen_ms = adv.ts_ms;
  r.last_seen_ms = adv.ts_ms;
  return r;
}

// Mean and population stddev over the newest samples plus this one.
void ScanSession::updateRssiStats(DeviceRecord& r, int rssi) const {
  std::vector<Sample> w = r.samples.tail(_cfg.rssi_smoothing - 1);

  double sum = (double)rssi;
  for (const Sample& s : w) sum += (double)s.rssi;
  const double n = (double)(w.size() + 1);
  const double mean = sum / n;

  double var = ((double)rssi - mean) * ((double)rssi - mean);
  for (const Sample& s : w) var += ((double)s.rssi - mean) * ((double)s.rssi - mean);
  var /= n;

  r.smooth_rssi = (float)mean;
  r.rssi_stddev = (float)sqrt(var);
}

// Adaptive distance: a strong, steady signal is taken to be ~1 m away.
void ScanSession::maybeAdaptReference(DeviceRecord& r, int rssi) {
  if (_mode != ScanMode::Adaptive || !_cfg.adaptive_reference) return;
  if (r.calib_rssi_at_1m) return;
  if (r.samples.empty()) return;
  if (rssi <= _cfg.adaptive_near_dbm) return;
  if (r.rssi_stddev >= _cfg.adaptive_max_dev_db) return;

  const int ref = (int)lroundf(r.smooth_rssi);
  if (ref < _cfg.calib_rssi_min || ref > _cfg.calib_rssi_max) return;
  r.adaptive_rssi_at_1m = ref;
}

std::optional<int> ScanSession::referenceFor(const DeviceRecord& r) const {
  if (r.calib_rssi_at_1m) return r.calib_rssi_at_1m;
  return r.adaptive_rssi_at_1m;
}

// Re-estimates every retained sample after the device's calibration changed,
// so the movement window never mixes two references.
void ScanSession::refreshDistances(DeviceRecord& r) const {
  const std::optional<int> ref = referenceFor(r);
  for (size_t i = 0; i < r.samples.size(); i++) {
    Sample& s = r.samples[i];
    s.distance_m = _estimator.Estimate(s.smooth_rssi, ref, r.path_loss_exponent);
  }
  updateTrend(r);
}

void ScanSession::updateTrend(DeviceRecord& r) const {
  const MovementResult mv = _analyzer.Analyze(r.samples.tail(_cfg.movement_window));
  r.trend = mv.trend;
  r.trend_confidence = mv.confidence;
}

bool ScanSession::isInteresting(const DeviceRecord& r) const {
  if (_mode != ScanMode::FindMyOnly) return true;
  if (r.payloads.empty()) return false;

  switch (r.payloads.back().kind) {
    case PayloadKind::AirTagRegistered:
    case PayloadKind::AirTagUnregistered:
    case PayloadKind::FindMyGeneric:
      return true;
    default:
      return false;
  }
}

DeviceView ScanSession::makeView(const DeviceRecord& r) const {
  DeviceView v{};
  v.address = r.address;
  v.name = r.name;
  v.index = r.index;

  if (!r.payloads.empty()) {
    const DecodedPayload& p = r.payloads.back();
    v.kind = p.kind;
    v.battery = p.battery;
    v.is_separated = p.is_separated;
    v.is_play_sound = p.is_play_sound;
    v.is_lost_mode_hint = p.is_lost_mode_hint;
  }

  v.classification = r.classification;
  v.score = r.score;

  if (!r.samples.empty()) {
    v.distance_m = r.samples.back().distance_m;
    v.rssi = r.samples.back().rssi;
  }
  v.smooth_rssi = r.smooth_rssi;
  v.rssi_stddev = r.rssi_stddev;

  v.trend = r.trend;
  v.trend_confidence = r.trend_confidence;

  v.reference_rssi = referenceFor(r).value_or(_estimator.referenceRssi());
  v.path_loss_exponent = r.path_loss_exponent.value_or(_estimator.pathLossExponent());

  v.mean_gap_s = r.cadence.mean_gap_s;
  v.rotation_count = r.cadence.rotation_count;
  v.since_rotation_s = r.cadence.since_rotation_s;

  v.first_seen_ms = r.first_seen_ms;
  v.last_seen_ms = r.last_seen_ms;
  v.adv_count = r.adv_count;

  SetFlag(v.flags, DeviceFlags::Calibrated, r.calib_rssi_at_1m.has_value() || r.path_loss_exponent.has_value());
  SetFlag(v.flags, DeviceFlags::AdaptiveReference, !r.calib_rssi_at_1m && r.adaptive_rssi_at_1m.has_value());
  SetFlag(v.flags, DeviceFlags::Interesting, isInteresting(r));
  SetFlag(v.flags, DeviceFlags::Rotating, r.cadence.rotation_observed);
  SetFlag(v.flags, DeviceFlags::AirTagCadence, r.cadence.matches_airtag_cadence);
  return v;
}

// ----------------------------- Processing -----------------------------

DeviceView ScanSession::onAdvertisement(const RawAdvertisement& adv) {
  std::lock_guard<std::mutex> guard(_lock);

  DeviceRecord& r = findOrCreate(adv);
  if (!adv.name.empty()) r.name = adv.name;
  r.last_seen_ms = std::max(r.last_seen_ms, adv.ts_ms);
  r.adv_count++;

  // 1) decode
  const DecodedPayload payload = _decoder.Decode(adv.mfg_data, adv.company_id);
  r.payloads.push(payload);

  // 2) cadence
  r.cadence = _cadence.observe(adv.address, adv.ts_ms, payload.key_fragment);

  // 3) score
  const TrackerScore ts = _scorer.Score(payload, r.cadence);
  r.score = ts.score;
  r.classification = ts.classification;

  // 4) distance, from smoothed RSSI
  updateRssiStats(r, adv.rssi);
  maybeAdaptReference(r, adv.rssi);

  Sample s{};
  s.ts_ms = adv.ts_ms;
  s.rssi = adv.rssi;
  s.smooth_rssi = r.smooth_rssi;
  s.distance_m = _estimator.Estimate(r.smooth_rssi, referenceFor(r), r.path_loss_exponent);
  r.samples.push(s);

  // 5) movement
  updateTrend(r);

  if (_mode == ScanMode::Calibration && !_calib_target.empty() && adv.address == _calib_target) {
    _calib_rssi_sum += adv.rssi;
    _calib_rssi_count++;
  }

  if (_mode == ScanMode::RangeTest && r.score >= _cfg.range_test_min_score) {
    RangeTestStats& rt = r.range;
    if (rt.samples == 0) {
      rt.min_rssi = rt.max_rssi = adv.rssi;
      rt.min_distance_m = rt.max_distance_m = s.distance_m;
    } else {
      rt.min_rssi = std::min(rt.min_rssi, adv.rssi);
      rt.max_rssi = std::max(rt.max_rssi, adv.rssi);
      rt.min_distance_m = std::min(rt.min_distance_m, s.distance_m);
      rt.max_distance_m = std::max(rt.max_distance_m, s.distance_m);
    }
    rt.samples++;
  }

  return makeView(r);
}

// ----------------------------- Mode -----------------------------

void ScanSession::setModeLocked(ScanMode mode) {
  if (_mode == ScanMode::Calibration && mode != ScanMode::Calibration) endCalibration();
  if (mode == ScanMode::Calibration && _mode != ScanMode::Calibration) _mode_before_calib = _mode;

  // Each range test starts from a clean envelope
  if (mode == ScanMode::RangeTest && _mode != ScanMode::RangeTest) {
    for (auto& kv : _devices) kv.second.range = RangeTestStats{};
  }
  _mode = mode;
}

void ScanSession::setMode(ScanMode mode) {
  std::lock_guard<std::mutex> guard(_lock);
  setModeLocked(mode);
}

ScanMode ScanSession::mode() const {
  std::lock_guard<std::mutex> guard(_lock);
  return _mode;
}

// ----------------------------- Calibration -----------------------------

CalibrationResult ScanSession::applyCalibration(DeviceRecord& r, int rssi_at_1m) {
  if (rssi_at_1m < _cfg.calib_rssi_min || rssi_at_1m > _cfg.calib_rssi_max)
    return CalibrationResult::OutOfRange;

  r.calib_rssi_at_1m = rssi_at_1m;
  r.adaptive_rssi_at_1m.reset();
  refreshDistances(r);
  return CalibrationResult::Applied;
}

CalibrationResult ScanSession::calibrate(const std::string& address, int rssi_at_1m) {
  std::lock_guard<std::mutex> guard(_lock);

  auto it = _devices.find(address);
  if (it == _devices.end()) return CalibrationResult::UnknownDevice;
  return applyCalibration(it->second, rssi_at_1m);
}

CalibrationResult ScanSession::calibrateAtDistance(const std::string& address, double known_distance_m) {
  std::lock_guard<std::mutex> guard(_lock);

  auto it = _devices.find(address);
  if (it == _devices.end()) return CalibrationResult::UnknownDevice;
  DeviceRecord& r = it->second;
  if (r.samples.empty()) return CalibrationResult::NoSamples;

  if (fabs(known_distance_m - 1.0) < 1e-6)
    return applyCalibration(r, (int)lroundf(r.smooth_rssi));

  const double ref = (double)referenceFor(r).value_or(_estimator.referenceRssi());
  double n = 0.0;
  if (!DistanceEstimator::SolvePathLossExponent(ref, r.smooth_rssi, known_distance_m, n))
    return CalibrationResult::OutOfRange;

  r.path_loss_exponent = n;
  refreshDistances(r);
  return CalibrationResult::Applied;
}

CalibrationResult ScanSession::beginCalibration(const std::string& address) {
  std::lock_guard<std::mutex> guard(_lock);

  if (_devices.find(address) == _devices.end()) return CalibrationResult::UnknownDevice;

  setModeLocked(ScanMode::Calibration);
  _calib_target = address;
  _calib_rssi_sum = 0;
  _calib_rssi_count = 0;
  return CalibrationResult::Applied;
}

void ScanSession::endCalibration() {
  _calib_target.clear();
  _calib_rssi_sum = 0;
  _calib_rssi_count = 0;
}

CalibrationResult ScanSession::commitCalibration() {
  std::lock_guard<std::mutex> guard(_lock);

  if (_mode != ScanMode::Calibration || _calib_target.empty())
    return CalibrationResult::NotCalibrating;

  // Keep collecting; the caller can retry once the device has been heard
  if (_calib_rssi_count == 0) return CalibrationResult::NoSamples;

  auto it = _devices.find(_calib_target);
  if (it == _devices.end()) {
    setModeLocked(_mode_before_calib);
    return CalibrationResult::UnknownDevice;
  }

  const int mean = (int)lround((double)_calib_rssi_sum / (double)_calib_rssi_count);
  const CalibrationResult res = applyCalibration(it->second, mean);
  setModeLocked(_mode_before_calib);
  return res;
}

void ScanSession::cancelCalibration() {
  std::lock_guard<std::mutex> guard(_lock);
  if (_mode == ScanMode::Calibration) setModeLocked(_mode_before_calib);
}

std::string ScanSession::calibrationTarget() const {
  std::lock_guard<std::mutex> guard(_lock);
  return _calib_target;
}

size_t ScanSession::calibrationSamples() const {
  std::lock_guard<std::mutex> guard(_lock);
  return _calib_rssi_count;
}

bool ScanSession::clearCalibration(const std::string& address) {
  std::lock_guard<std::mutex> guard(_lock);

  auto it = _devices.find(address);
  if (it == _devices.end()) return false;

  DeviceRecord& r = it->second;
  r.calib_rssi_at_1m.reset();
  r.adaptive_rssi_at_1m.reset();
  r.path_loss_exponent.reset();
  refreshDistances(r);
  return true;
}

// ----------------------------- Lifecycle -----------------------------

size_t ScanSession::clearStale(uint64_t now_ms, uint64_t max_age_ms) {
  std::lock_guard<std::mutex> guard(_lock);

  size_t removed = 0;
  for (auto it = _devices.begin(); it != _devices.end();) {
    const uint64_t last = it->second.last_seen_ms;
    const uint64_t idle = (now_ms > last) ? (now_ms - last) : 0;
    if (idle > max_age_ms) {
      if (it->first == _calib_target) setModeLocked(_mode_before_calib);
      _cadence.forget(it->first);
      it = _devices.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

void ScanSession::reset() {
  std::lock_guard<std::mutex> guard(_lock);

  if (_mode == ScanMode::Calibration) setModeLocked(_mode_before_calib);
  _devices.clear();
  _cadence.clear();
  _next_index = 1;
}

// ----------------------------- Snapshots -----------------------------

bool ScanSession::device(const std::string& address, DeviceView& out) const {
  std::lock_guard<std::mutex> guard(_lock);

  auto it = _devices.find(address);
  if (it == _devices.end()) return false;
  out = makeView(it->second);
  return true;
}

static void sortViews(std::vector<DeviceView>& out) {
  std::sort(out.begin(), out.end(), [](const DeviceView& a, const DeviceView& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.smooth_rssi != b.smooth_rssi) return a.smooth_rssi > b.smooth_rssi;
    return a.index < b.index;
  });
}

std::vector<DeviceView> ScanSession::devices() const {
  std::lock_guard<std::mutex> guard(_lock);

  std::vector<DeviceView> out;
  out.reserve(_devices.size());
  for (const auto& kv : _devices) out.push_back(makeView(kv.second));
  sortViews(out);
  return out;
}

std::vector<DeviceView> ScanSession::interestingDevices() const {
  std::lock_guard<std::mutex> guard(_lock);

  std::vector<DeviceView> out;
  for (const auto& kv : _devices) {
    if (isInteresting(kv.second)) out.push_back(makeView(kv.second));
  }
  sortViews(out);
  return out;
}

size_t ScanSession::deviceCount() const {
  std::lock_guard<std::mutex> guard(_lock);
  return _devices.size();
}

std::vector<Sample> ScanSession::samples(const std::string& address) const {
  std::lock_guard<std::mutex> guard(_lock);

  auto it = _devices.find(address);
  if (it == _devices.end()) return {};
  return it->second.samples.toVector();
}

std::vector<DecodedPayload> ScanSession::payloads(const std::string& address) const {
  std::lock_guard<std::mutex> guard(_lock);

  auto it = _devices.find(address);
  if (it == _devices.end()) return {};
  return it->second.payloads.toVector();
}

ScanHint ScanSession::scanHint() const {
  std::lock_guard<std::mutex> guard(_lock);

  ScanHint h{};
  for (const auto& kv : _devices) {
    if (kv.second.score >= _cfg.detection_threshold) h.high_confidence++;
  }

  if (_mode != ScanMode::Adaptive) return h;

  if (h.high_confidence == 0) {
    h.duty = ScanDuty::Relaxed;
    h.interval_ms = RELAXED_INTERVAL_MS;
    h.window_ms = RELAXED_WINDOW_MS;
  } else if (h.high_confidence == 1) {
    h.duty = ScanDuty::Balanced;
    h.interval_ms = BALANCED_INTERVAL_MS;
    h.window_ms = BALANCED_WINDOW_MS;
  } else {
    h.duty = ScanDuty::Aggressive;
    h.interval_ms = AGGRESSIVE_INTERVAL_MS;
    h.window_ms = AGGRESSIVE_WINDOW_MS;
  }
  return h;
}

ScanSummary ScanSession::summarize(uint64_t now_ms) const {
  std::lock_guard<std::mutex> guard(_lock);

  ScanSummary s{};
  s.total = _devices.size();
  if (_devices.empty()) return s;

  uint64_t first = UINT64_MAX;
  bool have_closest = false;
  size_t n_dist = 0;
  double sum_dist = 0.0;

  for (const auto& kv : _devices) {
    const DeviceRecord& r = kv.second;
    if (r.classification != Classification::NotATracker) s.trackers++;
    first = std::min(first, r.first_seen_ms);

    if (r.samples.empty()) continue;
    const double d = r.samples.back().distance_m;

    const int rssi = (int)lroundf(r.smooth_rssi);
    if (!have_closest || rssi > s.closest_rssi) {
      have_closest = true;
      s.closest_rssi = rssi;
      s.closest_address = r.address;
      s.closest_name = r.name;
      s.closest_distance_m = d;
    }

    if (d < SUMMARY_MAX_DISTANCE_M) {
      if (n_dist == 0) {
        s.min_distance_m = s.max_distance_m = d;
      } else {
        s.min_distance_m = std::min(s.min_distance_m, d);
        s.max_distance_m = std::max(s.max_distance_m, d);
      }
      sum_dist += d;
      n_dist++;
    }
  }

  if (n_dist > 0) s.avg_distance_m = sum_dist / (double)n_dist;
  if (now_ms > first) s.duration_s = (float)(now_ms - first) / 1000.0f;
  return s;
}

std::vector<RangeTestEntry> ScanSession::rangeTestReport() const {
  std::lock_guard<std::mutex> guard(_lock);

  std::vector<RangeTestEntry> out;
  for (const auto& kv : _devices) {
    const DeviceRecord& r = kv.second;
    if (r.range.samples == 0) continue;

    RangeTestEntry e{};
    e.address = r.address;
    e.classification = r.classification;
    e.score = r.score;
    e.range = r.range;
    out.push_back(e);
  }

  std::sort(out.begin(), out.end(), [](const RangeTestEntry& a, const RangeTestEntry& b) {
    return a.range.max_distance_m > b.range.max_distance_m;
  });
  return out;
}
