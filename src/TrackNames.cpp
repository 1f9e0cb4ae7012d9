#include "TrackNames.h"

static bool ieq(const char* a, const char* b) {
  if (!a || !b) return false;
  while (*a && *b) {
    char ca = *a++, cb = *b++;
    if (ca >= 'A' && ca <= 'Z') ca = (char)(ca - 'A' + 'a');
    if (cb >= 'A' && cb <= 'Z') cb = (char)(cb - 'A' + 'a');
    if (ca != cb) return false;
  }
  return *a == 0 && *b == 0;
}

const char* PayloadKindName(PayloadKind k) {
  switch (k) {
    case PayloadKind::Unknown:            return "Unknown";
    case PayloadKind::AirTagRegistered:   return "AirTag";
    case PayloadKind::AirTagUnregistered: return "AirTag (unregistered)";
    case PayloadKind::FindMyGeneric:      return "Find My";
    case PayloadKind::OtherBLE:           return "Apple BLE";
    default:                              return "Unknown";
  }
}

const char* ClassificationName(Classification c) {
  switch (c) {
    case Classification::NotATracker:        return "Not a Tracker";
    case Classification::UnregisteredAirTag: return "Unregistered AirTag";
    case Classification::LikelyFindMy:       return "Likely Find-My Accessory";
    case Classification::ConfirmedAirTag:    return "Confirmed AirTag";
    default:                                 return "Not a Tracker";
  }
}

// Fits the Cardputer list row
const char* ClassificationShortName(Classification c) {
  switch (c) {
    case Classification::NotATracker:        return "-";
    case Classification::UnregisteredAirTag: return "UNREG";
    case Classification::LikelyFindMy:       return "LIKELY";
    case Classification::ConfirmedAirTag:    return "AIRTAG";
    default:                                 return "-";
  }
}

const char* MovementTrendName(MovementTrend t) {
  switch (t) {
    case MovementTrend::Stationary:  return "Stationary";
    case MovementTrend::Approaching: return "Approaching";
    case MovementTrend::Receding:    return "Receding";
    case MovementTrend::Erratic:     return "Erratic";
    default:                         return "Stationary";
  }
}

const char* BatteryTierName(BatteryTier b) {
  switch (b) {
    case BatteryTier::Unknown: return "Unknown";
    case BatteryTier::Full:    return "Full";
    case BatteryTier::Medium:  return "Medium";
    case BatteryTier::Low:     return "Low";
    case BatteryTier::VeryLow: return "Very Low";
    default:                   return "Unknown";
  }
}

const char* ScanModeName(ScanMode m) {
  switch (m) {
    case ScanMode::Normal:      return "Normal";
    case ScanMode::FindMyOnly:  return "Find My only";
    case ScanMode::Adaptive:    return "Adaptive";
    case ScanMode::Calibration: return "Calibration";
    case ScanMode::RangeTest:   return "Range test";
    default:                    return "Normal";
  }
}

bool ParseScanMode(const char* s, ScanMode& out) {
  out = ScanMode::Normal;
  if (!s || !*s) return false;

  if (ieq(s, "Normal"))       { out = ScanMode::Normal; return true; }
  if (ieq(s, "Find My only")) { out = ScanMode::FindMyOnly; return true; }
  if (ieq(s, "FindMyOnly"))   { out = ScanMode::FindMyOnly; return true; }
  if (ieq(s, "Adaptive"))     { out = ScanMode::Adaptive; return true; }
  if (ieq(s, "Calibration"))  { out = ScanMode::Calibration; return true; }
  if (ieq(s, "Range test"))   { out = ScanMode::RangeTest; return true; }
  if (ieq(s, "RangeTest"))    { out = ScanMode::RangeTest; return true; }

  return false;
}

bool ParseClassification(const char* s, Classification& out) {
  out = Classification::NotATracker;
  if (!s || !*s) return false;

  if (ieq(s, "Not a Tracker"))            { out = Classification::NotATracker; return true; }
  if (ieq(s, "Unregistered AirTag"))      { out = Classification::UnregisteredAirTag; return true; }
  if (ieq(s, "Likely Find-My Accessory")) { out = Classification::LikelyFindMy; return true; }
  if (ieq(s, "Confirmed AirTag"))         { out = Classification::ConfirmedAirTag; return true; }

  return false;
}
