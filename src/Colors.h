#pragma once
#include <stdint.h>

#include "Track.h"          // Classification, MovementTrend

// RGB888 -> RGB565 (M5.Display native)
static constexpr uint16_t RGB565(uint8_t r, uint8_t g, uint8_t b) {
  return (uint16_t)(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
}

// Packed 0xRRGGBB -> RGB565
static constexpr uint16_t HEX_TO_RGB565(uint32_t rgb) {
  return RGB565((uint8_t)(rgb >> 16), (uint8_t)(rgb >> 8), (uint8_t)rgb);
}

// ---- Palette ----
static constexpr uint16_t C_BLACK       = HEX_TO_RGB565(0x000000);
static constexpr uint16_t C_NAVY        = HEX_TO_RGB565(0x1D2B53);
static constexpr uint16_t C_SLATE       = HEX_TO_RGB565(0x5F574F);
static constexpr uint16_t C_SILVER      = HEX_TO_RGB565(0xC2C3C7);
static constexpr uint16_t C_WHITE       = HEX_TO_RGB565(0xFFF1E8);
static constexpr uint16_t C_RED         = HEX_TO_RGB565(0xFF004D);
static constexpr uint16_t C_ORANGE      = HEX_TO_RGB565(0xFFA300);
static constexpr uint16_t C_YELLOW      = HEX_TO_RGB565(0xFFEC27);
static constexpr uint16_t C_GREEN       = HEX_TO_RGB565(0x00E436);
static constexpr uint16_t C_SKY         = HEX_TO_RGB565(0x29ADFF);
static constexpr uint16_t C_PINK        = HEX_TO_RGB565(0xFF77A8);

// ---- Status view ----
static constexpr uint16_t UI_BG          = C_BLACK;
static constexpr uint16_t UI_FG          = C_WHITE;
static constexpr uint16_t UI_HEADER_BG   = C_NAVY;
static constexpr uint16_t UI_SEL_BG      = C_SLATE;
static constexpr uint16_t UI_WARN        = C_ORANGE;
static constexpr uint16_t UI_OK          = C_GREEN;
static constexpr uint16_t UI_MUTED       = C_SILVER;

static constexpr uint16_t ClassificationColor(Classification c) {
  return c == Classification::ConfirmedAirTag    ? C_RED
       : c == Classification::UnregisteredAirTag ? C_PINK
       : c == Classification::LikelyFindMy       ? C_ORANGE
       :                                           UI_MUTED;
}

// Approaching is the alarming direction
static constexpr uint16_t TrendColor(MovementTrend t) {
  return t == MovementTrend::Approaching ? C_RED
       : t == MovementTrend::Receding    ? C_GREEN
       : t == MovementTrend::Erratic     ? C_YELLOW
       :                                   C_SKY;
}
