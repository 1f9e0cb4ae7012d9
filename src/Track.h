#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "RingBuffer.h"

static constexpr size_t FINDMY_KEY_FRAGMENT_LEN = 22;

using KeyFragment = std::array<uint8_t, FINDMY_KEY_FRAGMENT_LEN>;

enum class PayloadKind : uint8_t {
  Unknown = 0,
  AirTagRegistered,
  AirTagUnregistered,
  FindMyGeneric,
  OtherBLE,
};

enum class BatteryTier : uint8_t {
  Unknown = 0,
  Full,
  Medium,
  Low,
  VeryLow,
};

enum class Classification : uint8_t {
  NotATracker = 0,
  UnregisteredAirTag,
  LikelyFindMy,
  ConfirmedAirTag,
};

enum class MovementTrend : uint8_t {
  Stationary = 0,
  Approaching,
  Receding,
  Erratic,
};

enum class ScanMode : uint8_t {
  Normal = 0,
  FindMyOnly,
  Adaptive,
  Calibration,
  RangeTest,
};

// Kind decides which of the optional fields are populated:
//   AirTagRegistered   status + key_fragment (+ battery)
//   FindMyGeneric      status, key_fragment only for the full shape
//   AirTagUnregistered nothing
//   OtherBLE/Unknown   nothing
struct DecodedPayload {
  PayloadKind              kind = PayloadKind::Unknown;
  std::optional<uint8_t>   status;
  std::optional<bool>      is_separated;
  std::optional<bool>      is_play_sound;
  std::optional<bool>      is_lost_mode_hint;
  BatteryTier              battery = BatteryTier::Unknown;
  std::optional<KeyFragment> key_fragment;
};

struct RawAdvertisement {
  std::string          address;
  int                  rssi = -127;     // dBm
  std::vector<uint8_t> mfg_data;        // after the company id
  uint16_t             company_id = 0;
  uint64_t             ts_ms = 0;       // monotonic
  std::string          name;            // advertised local name, may be empty
};

struct CadenceStats {
  size_t gap_count = 0;
  float  mean_gap_s = 0.0f;
  float  stddev_gap_s = 0.0f;

  bool   matches_airtag_cadence = false;
  bool   rotation_changed = false;      // key differs from the previous one
  bool   rotation_observed = false;     // any change since first seen

  uint32_t rotation_count = 0;
  std::optional<float> since_rotation_s;
};

struct Sample {
  uint64_t ts_ms = 0;
  int      rssi = -127;
  float    smooth_rssi = -127.0f;   // what distance_m was estimated from
  double   distance_m = 0.0;
};

enum class DeviceFlags : uint8_t {
  None              = 0,
  Calibrated        = (1 << 0),
  AdaptiveReference = (1 << 1),
  Interesting       = (1 << 2),
  Rotating          = (1 << 3),
  AirTagCadence     = (1 << 4),
};

constexpr DeviceFlags operator|(DeviceFlags a, DeviceFlags b)
{
  using U = std::underlying_type_t<DeviceFlags>;
  return static_cast<DeviceFlags>(static_cast<U>(a) | static_cast<U>(b));
}

constexpr DeviceFlags operator&(DeviceFlags a, DeviceFlags b)
{
  using U = std::underlying_type_t<DeviceFlags>;
  return static_cast<DeviceFlags>(static_cast<U>(a) & static_cast<U>(b));
}

constexpr DeviceFlags& operator|=(DeviceFlags& a, DeviceFlags b)
{
  a = a | b;
  return a;
}

constexpr bool HasFlag(DeviceFlags v, DeviceFlags f)
{
  using U = std::underlying_type_t<DeviceFlags>;
  return (static_cast<U>(v) & static_cast<U>(f)) != 0;
}

constexpr void SetFlag(DeviceFlags& v, DeviceFlags f)
{
  v |= f;
}

constexpr void ClearFlag(DeviceFlags& v, DeviceFlags f)
{
  using U = std::underlying_type_t<DeviceFlags>;
  v = static_cast<DeviceFlags>(static_cast<U>(v) & ~static_cast<U>(f));
}

constexpr void SetFlag(DeviceFlags& v, DeviceFlags f, bool on)
{
  if (on)
    SetFlag(v, f);
  else
    ClearFlag(v, f);
}

struct RangeTestStats {
  uint32_t samples = 0;
  int      min_rssi = 0;
  int      max_rssi = 0;
  double   min_distance_m = 0.0;
  double   max_distance_m = 0.0;
};

// Per-device aggregate, owned by ScanSession.
struct DeviceRecord {
  explicit DeviceRecord(size_t capacity)
    : payloads(capacity), samples(capacity) {}

  std::string address;
  std::string name;
  uint16_t    index = 0;

  RingBuffer<DecodedPayload> payloads;
  RingBuffer<Sample>         samples;

  uint64_t first_seen_ms = 0;
  uint64_t last_seen_ms  = 0;
  uint32_t adv_count     = 0;

  int            score = 0;
  Classification classification = Classification::NotATracker;
  MovementTrend  trend = MovementTrend::Stationary;
  float          trend_confidence = 0.0f;

  float smooth_rssi = -127.0f;
  float rssi_stddev = 0.0f;

  std::optional<int>    calib_rssi_at_1m;     // explicit calibration
  std::optional<int>    adaptive_rssi_at_1m;  // adaptive mode estimate
  std::optional<double> path_loss_exponent;   // from distance calibration

  CadenceStats   cadence{};
  RangeTestStats range{};
};

// Immutable copy handed to the UI / report layer.
struct DeviceView {
  std::string    address;
  std::string    name;
  uint16_t       index = 0;

  PayloadKind    kind = PayloadKind::Unknown;
  Classification classification = Classification::NotATracker;
  int            score = 0;

  double         distance_m = 0.0;
  int            rssi = -127;          // last raw sample
  float          smooth_rssi = -127.0f;
  float          rssi_stddev = 0.0f;

  MovementTrend  trend = MovementTrend::Stationary;
  float          trend_confidence = 0.0f;

  BatteryTier         battery = BatteryTier::Unknown;
  std::optional<bool> is_separated;
  std::optional<bool> is_play_sound;
  std::optional<bool> is_lost_mode_hint;

  int      reference_rssi = 0;         // 1 m reference in effect
  double   path_loss_exponent = 0.0;   // exponent in effect

  float    mean_gap_s = 0.0f;
  uint32_t rotation_count = 0;
  std::optional<float> since_rotation_s;

  uint64_t first_seen_ms = 0;
  uint64_t last_seen_ms  = 0;
  uint32_t adv_count = 0;

  DeviceFlags flags = DeviceFlags::None;
};
