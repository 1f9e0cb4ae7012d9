#include "CadenceTracker.h"

#include <math.h>

CadenceTracker::CadenceTracker(const ScanConfig& cfg) {
  const ScanConfig c = cfg.Sanitized();
  _capacity    = c.history_capacity;
  _window      = c.cadence_window;
  _expected_s  = c.expected_interval_s;
  _tolerance_s = c.interval_tolerance_s;
}

void CadenceTracker::forget(const std::string& address) {
  _histories.erase(address);
}

void CadenceTracker::clear() {
  _histories.clear();
}

std::vector<uint64_t> CadenceTracker::arrivals(const std::string& address) const {
  auto it = _histories.find(address);
  if (it == _histories.end()) return {};
  return it->second.arrivals.toVector();
}

CadenceStats CadenceTracker::observe(const std::string& address, uint64_t ts_ms,
                                     const std::optional<KeyFragment>& key) {
  auto it = _histories.find(address);
  if (it == _histories.end()) {
    it = _histories.emplace(address, History(_capacity)).first;
  }
  History& h = it->second;

  CadenceStats st{};

  // Rotation epoch boundary: only a present key can differ from a present key
  if (key) {
    if (h.has_key && *key != h.last_key) {
      st.rotation_changed = true;
      h.rotated = true;
      h.last_rotation_ms = ts_ms;
      h.rotation_count++;
    }
    h.has_key = true;
    h.last_key = *key;
  }

  h.arrivals.push(ts_ms);

  st.rotation_observed = h.rotated;
  st.rotation_count = h.rotation_count;
  if (h.rotated) {
    const uint64_t since = (ts_ms > h.last_rotation_ms) ? (ts_ms - h.last_rotation_ms) : 0;
    st.since_rotation_s = (float)since / 1000.0f;
  }

  // Gaps over the last K arrivals
  const std::vector<uint64_t> w = h.arrivals.tail(_window);
  if (w.size() < 2) return st;

  const size_t n = w.size() - 1;
  double sum = 0.0;
  for (size_t i = 1; i < w.size(); i++) {
    const uint64_t gap = (w[i] > w[i - 1]) ? (w[i] - w[i - 1]) : 0;
    sum += (double)gap / 1000.0;
  }
  const double mean = sum / (double)n;

  double var = 0.0;
  for (size_t i = 1; i < w.size(); i++) {
    const uint64_t gap = (w[i] > w[i - 1]) ? (w[i] - w[i - 1]) : 0;
    const double d = (double)gap / 1000.0 - mean;
    var += d * d;
  }
  var /= (double)n;

  st.gap_count = n;
  st.mean_gap_s = (float)mean;
  st.stddev_gap_s = (float)sqrt(var);
  st.matches_airtag_cadence = fabs(mean - (double)_expected_s) <= (double)_tolerance_s;
  return st;
}
