#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "Track.h"          // DecodedPayload, PayloadKind, BatteryTier

class AdvertisementDecoder {
public:
  // Pure classification from manufacturer data (company id already stripped).
  // Never fails: anything unrecognised comes back as PayloadKind::Unknown.
  DecodedPayload Decode(const uint8_t* data, size_t n, uint16_t company_id) const;
  DecodedPayload Decode(const std::vector<uint8_t>& data, uint16_t company_id) const;

  // NimBLE hands out manufacturer data with the little-endian company id in
  // front. Splits it; false if there are fewer than two bytes.
  static bool SplitManufacturerData(const uint8_t* raw, size_t n,
                                    uint16_t& company_id, std::vector<uint8_t>& payload);

  // Status-byte bit table (applies to any payload carrying a status byte).
  static void ApplyStatus(uint8_t status, DecodedPayload& out);
  static BatteryTier BatteryFromStatus(uint8_t status);
  static bool StatusIsClean(uint8_t status);

private:
  static bool FindTlv(const uint8_t* data, size_t n, uint8_t type,
                      const uint8_t*& value, size_t& len, bool& malformed);
};
