#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "RingBuffer.h"
#include "ScanConfig.h"
#include "Track.h"          // CadenceStats, KeyFragment

class CadenceTracker {
public:
  explicit CadenceTracker(const ScanConfig& cfg = ScanConfig{});

  // Records one advertisement arrival. Timestamps must be non-decreasing per
  // address; an earlier one is treated as a zero gap.
  CadenceStats observe(const std::string& address, uint64_t ts_ms,
                       const std::optional<KeyFragment>& key);

  void forget(const std::string& address);
  void clear();

  size_t trackedCount() const { return _histories.size(); }

  // Retained arrival times for an address, oldest first (empty if unknown).
  std::vector<uint64_t> arrivals(const std::string& address) const;

private:
  struct History {
    explicit History(size_t capacity) : arrivals(capacity) {}

    RingBuffer<uint64_t> arrivals;

    bool        has_key = false;
    KeyFragment last_key{};

    bool     rotated = false;
    uint64_t last_rotation_ms = 0;
    uint32_t rotation_count = 0;
  };

  size_t _capacity;
  size_t _window;
  float  _expected_s;
  float  _tolerance_s;

  std::unordered_map<std::string, History> _histories;
};
