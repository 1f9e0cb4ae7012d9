// StatusView.cpp
#include "StatusView.h"

#include "Colors.h"
#include "TrackNames.h"

#include <algorithm>
#include <cstdio>

static constexpr uint32_t STATUS_MSG_MS = 3000;

static const char* CalibrationResultText(CalibrationResult r)
{
  switch (r) {
    case CalibrationResult::Applied:        return "calibrated";
    case CalibrationResult::UnknownDevice:  return "unknown device";
    case CalibrationResult::OutOfRange:     return "rejected: out of range";
    case CalibrationResult::NoSamples:      return "no samples yet";
    case CalibrationResult::NotCalibrating: return "not calibrating";
    default:                                return "?";
  }
}

static const char* TrendArrow(MovementTrend t)
{
  switch (t) {
    case MovementTrend::Approaching: return "<<";
    case MovementTrend::Receding:    return ">>";
    case MovementTrend::Erratic:     return "??";
    default:                         return "==";
  }
}

// ------------------------------------------------------------

StatusView::StatusView(const std::string &version) : _version(version) {}

void StatusView::begin(DeviceTracker* tracker)
{
  _tracker = tracker;
  _sel = 0;
  _offset = 0;
  _sel_address.clear();

  M5Cardputer.Display.setTextWrap(false);
  M5Cardputer.Display.setTextSize(1);
  M5Cardputer.Display.fillScreen(UI_BG);
}

void StatusView::setStatus(const char* msg)
{
  snprintf(_status, sizeof(_status), "%s", msg);
  _status_ms = millis();
  Serial.printf("[ui] %s\n", msg);
}

void StatusView::formatDistance(double m, char* out, size_t n)
{
  if (m >= 100.0) snprintf(out, n, "  ?m");
  else if (m >= 10.0) snprintf(out, n, "%4.0fm", m);
  else snprintf(out, n, "%4.1fm", m);
}

// ------------------------------------------------------------
// Selection
// ------------------------------------------------------------

// Keep the cursor on the same device across list updates
void StatusView::syncSelectionToAddress()
{
  if (_items.empty()) {
    _sel = 0;
    return;
  }

  if (!_sel_address.empty()) {
    for (int i = 0; i < (int)_items.size(); ++i) {
      if (_items[i].address == _sel_address) {
        _sel = i;
        return;
      }
    }
  }

  _sel = std::min(_sel, (int)_items.size() - 1);
  _sel_address = _items[_sel].address;
}

void StatusView::moveSelection(int delta)
{
  if (_items.empty()) return;
  _sel = std::max(0, std::min((int)_items.size() - 1, _sel + delta));
  _sel_address = _items[_sel].address;
}

const DeviceView* StatusView::selected() const
{
  if (_sel < 0 || _sel >= (int)_items.size()) return nullptr;
  return &_items[_sel];
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

void StatusView::toggleCalibration()
{
  ScanSession& s = _tracker->session();

  if (s.mode() == ScanMode::Calibration) {
    const CalibrationResult r = s.commitCalibration();
    char msg[48];
    snprintf(msg, sizeof(msg), "1m ref: %s", CalibrationResultText(r));
    setStatus(msg);
    return;
  }

  const DeviceView* v = selected();
  if (!v) {
    setStatus("select a device first");
    return;
  }

  const CalibrationResult r = s.beginCalibration(v->address);
  if (r == CalibrationResult::Applied)
    setStatus("hold at 1m, press c again");
  else
    setStatus(CalibrationResultText(r));
}

void StatusView::calibrateAtDistance(double meters)
{
  const DeviceView* v = selected();
  if (!v) {
    setStatus("select a device first");
    return;
  }

  const CalibrationResult r = _tracker->session().calibrateAtDistance(v->address, meters);
  char msg[48];
  snprintf(msg, sizeof(msg), "%.0fm: %s", meters, CalibrationResultText(r));
  setStatus(msg);
}

void StatusView::printSummary()
{
  const ScanSummary s = _tracker->session().summarize(DeviceTracker::nowMs());

  Serial.println("---- scan summary ----");
  Serial.printf("devices:  %u\n", (unsigned)s.total);
  Serial.printf("trackers: %u\n", (unsigned)s.trackers);
  if (!s.closest_address.empty()) {
    Serial.printf("closest:  %s (%s) %d dBm, %.2f m\n",
                  s.closest_name.empty() ? "Unknown" : s.closest_name.c_str(),
                  s.closest_address.c_str(), s.closest_rssi, s.closest_distance_m);
  }
  Serial.printf("distance: avg %.2f  min %.2f  max %.2f m\n",
                s.avg_distance_m, s.min_distance_m, s.max_distance_m);
  Serial.printf("duration: %.1f s\n", s.duration_s);

  setStatus("summary -> serial");
}

void StatusView::printRangeTest()
{
  const std::vector<RangeTestEntry> report = _tracker->session().rangeTestReport();

  Serial.println("---- range test ----");
  for (const RangeTestEntry& e : report) {
    Serial.printf("%s %-24s n=%u rssi %d..%d dist %.1f..%.1f m\n",
                  e.address.c_str(), ClassificationName(e.classification),
                  (unsigned)e.range.samples, e.range.min_rssi, e.range.max_rssi,
                  e.range.min_distance_m, e.range.max_distance_m);
  }
  if (report.empty()) Serial.println("(no qualifying devices)");
}

void StatusView::handleKeyboard(Keyboard_Class& kb)
{
  if (!_tracker) return;
  ScanSession& s = _tracker->session();

  const auto& ks = kb.keysState();

  const bool up   = kb.isKeyPressed(';') || kb.isKeyPressed(':');
  const bool down = kb.isKeyPressed('.') || kb.isKeyPressed('>');

  if (up)   { moveSelection(-1); return; }
  if (down) { moveSelection(+1); return; }

  if (ks.del) {
    _tracker->reset();
    _items.clear();
    _sel_address.clear();
    setStatus("session reset");
    return;
  }

  if (kb.isKeyPressed('n')) { s.setMode(ScanMode::Normal);     setStatus("mode: Normal"); return; }
  if (kb.isKeyPressed('f')) { s.setMode(ScanMode::FindMyOnly); setStatus("mode: Find My only"); return; }
  if (kb.isKeyPressed('a')) { s.setMode(ScanMode::Adaptive);   setStatus("mode: Adaptive"); return; }

  if (kb.isKeyPressed('r')) {
    if (s.mode() == ScanMode::RangeTest) {
      printRangeTest();
      s.setMode(ScanMode::Normal);
      setStatus("range test -> serial");
    } else {
      s.setMode(ScanMode::RangeTest);
      setStatus("mode: Range test");
    }
    return;
  }

  if (kb.isKeyPressed('c')) { toggleCalibration(); return; }

  for (char k = '1'; k <= '5'; ++k) {
    if (kb.isKeyPressed(k)) {
      calibrateAtDistance((double)(k - '0'));
      return;
    }
  }

  if (kb.isKeyPressed('x')) {
    const size_t n = s.clearStale(DeviceTracker::nowMs(), STALE_MS);
    char msg[48];
    snprintf(msg, sizeof(msg), "cleared %u stale", (unsigned)n);
    setStatus(msg);
    return;
  }

  if (kb.isKeyPressed('z')) { printSummary(); return; }

  if (kb.isKeyPressed('d')) {
    _tracker->setDebug(!_tracker->debug());
    setStatus(_tracker->debug() ? "debug on" : "debug off");
    return;
  }
}

// ------------------------------------------------------------
// Drawing
// ------------------------------------------------------------

void StatusView::refresh()
{
  _items = _tracker->session().interestingDevices();
  syncSelectionToAddress();

  const int rows = (M5Cardputer.Display.height() - HEADER_H - FOOTER_H) / ROW_H;
  if (_sel < _offset) _offset = _sel;
  if (_sel >= _offset + rows) _offset = _sel - rows + 1;
  _offset = std::max(0, std::min(_offset, std::max(0, (int)_items.size() - rows)));
}

void StatusView::drawHeader()
{
  auto& d = M5Cardputer.Display;
  const ScanSession& s = _tracker->session();

  d.fillRect(0, 0, d.width(), HEADER_H, UI_HEADER_BG);
  d.setTextColor(UI_FG, UI_HEADER_BG);
  d.setCursor(2, 3);
  d.printf("TagScout %s  %s  %u dev", _version.c_str(), ScanModeName(s.mode()), (unsigned)_items.size());
}

void StatusView::drawRow(int y, const DeviceView& v, bool sel)
{
  auto& d = M5Cardputer.Display;
  const uint16_t bg = sel ? UI_SEL_BG : UI_BG;

  d.fillRect(0, y, d.width(), ROW_H, bg);

  char dist[12];
  formatDistance(v.distance_m, dist, sizeof(dist));

  d.setCursor(2, y + 2);
  d.setTextColor(ClassificationColor(v.classification), bg);
  d.printf("%-6s %3d ", ClassificationShortName(v.classification), v.score);

  // last three octets
  const char* tail = v.address.size() >= 17 ? v.address.c_str() + 9 : v.address.c_str();
  d.setTextColor(UI_FG, bg);
  d.printf("%s %s ", tail, dist);

  d.setTextColor(TrendColor(v.trend), bg);
  d.printf("%s", TrendArrow(v.trend));

  if (v.battery == BatteryTier::Low || v.battery == BatteryTier::VeryLow) {
    d.setTextColor(UI_WARN, bg);
    d.print(" bat");
  }
  if (v.is_separated.value_or(false)) {
    d.setTextColor(UI_WARN, bg);
    d.print(" sep");
  }
}

void StatusView::drawRows()
{
  auto& d = M5Cardputer.Display;
  const int rows = (d.height() - HEADER_H - FOOTER_H) / ROW_H;

  for (int i = 0; i < rows; ++i) {
    const int idx = _offset + i;
    const int y = HEADER_H + i * ROW_H;
    if (idx < (int)_items.size()) {
      drawRow(y, _items[idx], idx == _sel);
    } else {
      d.fillRect(0, y, d.width(), ROW_H, UI_BG);
    }
  }
}

void StatusView::drawFooter()
{
  auto& d = M5Cardputer.Display;
  const int y = d.height() - FOOTER_H;

  d.fillRect(0, y, d.width(), FOOTER_H, UI_BG);
  d.setCursor(2, y + 2);

  if (_status[0] && millis() - _status_ms < STATUS_MSG_MS) {
    d.setTextColor(UI_OK, UI_BG);
    d.print(_status);
    return;
  }

  d.setTextColor(UI_MUTED, UI_BG);
  const DeviceView* v = selected();
  if (v) {
    d.printf("%s %s bat:%s conf:%.2f ref:%d",
             PayloadKindName(v->kind), MovementTrendName(v->trend),
             BatteryTierName(v->battery), v->trend_confidence, v->reference_rssi);
  } else {
    d.print("n/f/a/r mode  c cal  x stale  z sum");
  }
}

void StatusView::update()
{
  if (!_tracker) return;

  refresh();

  auto& d = M5Cardputer.Display;
  d.startWrite();
  drawHeader();
  drawRows();
  drawFooter();
  d.endWrite();
}
