#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Track.h"

// Builders for Apple continuity manufacturer data (company id stripped).

static constexpr uint16_t TEST_APPLE_ID = 0x004C;

inline KeyFragment MakeKey(uint8_t seed) {
  KeyFragment k{};
  for (size_t i = 0; i < k.size(); i++) k[i] = (uint8_t)(seed + i);
  return k;
}

// 0x12 / 0x19: status, 22-byte key fragment, key bits, hint
inline std::vector<uint8_t> RegisteredPayload(uint8_t status, const KeyFragment& key = MakeKey(0x10)) {
  std::vector<uint8_t> p = {0x12, 0x19, status};
  p.insert(p.end(), key.begin(), key.end());
  p.push_back(0x00);   // key bits
  p.push_back(0x00);   // hint
  return p;
}

// 0x12 / 0x02: status + hint, owner nearby
inline std::vector<uint8_t> NearOwnerPayload(uint8_t status) {
  return {0x12, 0x02, status, 0x00};
}

inline std::vector<uint8_t> UnregisteredPayload(uint8_t len = 0x0F) {
  std::vector<uint8_t> p = {0x07, len};
  for (uint8_t i = 0; i < len; i++) p.push_back((uint8_t)(0xA0 + i));
  return p;
}

// Nearby-info TLV: valid Apple continuity data that is not Find My
inline std::vector<uint8_t> NearbyInfoPayload() {
  return {0x10, 0x05, 0x01, 0x18, 0x44, 0x5A, 0x1C};
}

inline RawAdvertisement MakeAdv(const std::string& address, uint64_t ts_ms, int rssi,
                                const std::vector<uint8_t>& payload,
                                uint16_t company_id = TEST_APPLE_ID) {
  RawAdvertisement a{};
  a.address = address;
  a.ts_ms = ts_ms;
  a.rssi = rssi;
  a.mfg_data = payload;
  a.company_id = company_id;
  return a;
}
