#include "AdvertisementDecoder.h"

#include <algorithm>

static constexpr uint16_t BT_COMPANY_ID_APPLE = 0x004C;

// Apple continuity TLV types
static constexpr uint8_t APPLE_TYPE_UNREGISTERED   = 0x07;
static constexpr uint8_t APPLE_TYPE_OFFLINE_FINDING = 0x12;

// Offline finding payload lengths
static constexpr size_t OF_FULL_LEN   = 0x19;  // status + 22 key bytes + key bits + hint
static constexpr size_t OF_NEARBY_LEN = 0x02;  // status + hint (near owner)

// Unregistered (setup) shape is shorter than the full offline finding one
static constexpr size_t UNREG_MAX_LEN = OF_FULL_LEN - 1;

// Status byte layout
static constexpr uint8_t STATUS_PLAY_SOUND   = 0x01;
static constexpr uint8_t STATUS_LOST_MODE    = 0x02;
static constexpr uint8_t STATUS_SEPARATED    = 0x04;
static constexpr uint8_t STATUS_TYPE_MASK    = 0x18;
static constexpr uint8_t STATUS_TYPE_ACCESSORY = 0x18;  // AirPods-style accessory, not a tag
static constexpr uint8_t STATUS_RESERVED     = 0x20;
static constexpr uint8_t STATUS_BATTERY_SHIFT = 6;

bool AdvertisementDecoder::SplitManufacturerData(const uint8_t* raw, size_t n,
                                                 uint16_t& company_id, std::vector<uint8_t>& payload) {
  company_id = 0;
  payload.clear();

  if (!raw || n < 2) return false;

  company_id = (uint16_t)raw[0] | (uint16_t(raw[1]) << 8);
  payload.assign(raw + 2, raw + n);
  return true;
}

BatteryTier AdvertisementDecoder::BatteryFromStatus(uint8_t status) {
  switch ((status >> STATUS_BATTERY_SHIFT) & 0x03) {
    case 0:  return BatteryTier::Full;
    case 1:  return BatteryTier::Medium;
    case 2:  return BatteryTier::Low;
    default: return BatteryTier::VeryLow;
  }
}

bool AdvertisementDecoder::StatusIsClean(uint8_t status) {
  return (status & STATUS_RESERVED) == 0;
}

void AdvertisementDecoder::ApplyStatus(uint8_t status, DecodedPayload& out) {
  out.status = status;
  out.is_play_sound     = (status & STATUS_PLAY_SOUND) != 0;
  out.is_lost_mode_hint = (status & STATUS_LOST_MODE) != 0;
  out.is_separated      = (status & STATUS_SEPARATED) != 0;
}

// Walks the [type][len][value] list. Returns true on the first TLV of the
// requested type; sets malformed when a declared length runs past the end.
bool AdvertisementDecoder::FindTlv(const uint8_t* data, size_t n, uint8_t type,
                                   const uint8_t*& value, size_t& len, bool& malformed) {
  value = nullptr;
  len = 0;
  malformed = false;

  size_t i = 0;
  while (i < n) {
    if (i + 2 > n) { malformed = true; return false; }

    const uint8_t t = data[i + 0];
    const uint8_t l = data[i + 1];
    i += 2;

    if (i + l > n) { malformed = true; return false; }

    if (t == type) {
      value = data + i;
      len = l;
      return true;
    }
    i += l;
  }
  return false;
}

DecodedPayload AdvertisementDecoder::Decode(const std::vector<uint8_t>& data, uint16_t company_id) const {
  return Decode(data.data(), data.size(), company_id);
}

DecodedPayload AdvertisementDecoder::Decode(const uint8_t* data, size_t n, uint16_t company_id) const {
  DecodedPayload out{};

  if (company_id != BT_COMPANY_ID_APPLE) return out;
  if (!data || n < 2) return out;

  const uint8_t* v = nullptr;
  size_t len = 0;
  bool malformed = false;

  // 1) Offline finding (registered Find My item)
  if (FindTlv(data, n, APPLE_TYPE_OFFLINE_FINDING, v, len, malformed)) {
    if (len == OF_FULL_LEN) {
      const uint8_t status = v[0];
      const bool accessory = (status & STATUS_TYPE_MASK) == STATUS_TYPE_ACCESSORY;

      out.kind = accessory ? PayloadKind::FindMyGeneric : PayloadKind::AirTagRegistered;
      ApplyStatus(status, out);
      if (!accessory) out.battery = BatteryFromStatus(status);

      KeyFragment key{};
      std::copy(v + 1, v + 1 + FINDMY_KEY_FRAGMENT_LEN, key.begin());
      out.key_fragment = key;
      return out;
    }

    if (len == OF_NEARBY_LEN) {
      out.kind = PayloadKind::FindMyGeneric;
      ApplyStatus(v[0], out);
      return out;
    }

    // Offline finding type with a length we do not know
    return DecodedPayload{};
  }
  if (malformed) return DecodedPayload{};

  // 2) Unregistered AirTag
  if (FindTlv(data, n, APPLE_TYPE_UNREGISTERED, v, len, malformed)) {
    if (len >= 1 && len <= UNREG_MAX_LEN) {
      out.kind = PayloadKind::AirTagUnregistered;
      return out;
    }
    return DecodedPayload{};
  }
  if (malformed) return DecodedPayload{};

  // 3) Well-formed Apple continuity data that is not Find My
  out.kind = PayloadKind::OtherBLE;
  return out;
}
