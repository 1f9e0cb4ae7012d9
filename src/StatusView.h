// StatusView.h
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <M5Cardputer.h>
#include "DeviceTracker.h"

class StatusView
{
public:
  explicit StatusView(const std::string &version);

  void begin(DeviceTracker* tracker);
  void update();
  void handleKeyboard(Keyboard_Class& kb);

private:
  static constexpr int ROW_H      = 12;
  static constexpr int HEADER_H   = 14;
  static constexpr int FOOTER_H   = 12;

  static constexpr uint64_t STALE_MS = 5ULL * 60ULL * 1000ULL;

  void refresh();
  void drawHeader();
  void drawRows();
  void drawFooter();
  void drawRow(int y, const DeviceView& v, bool selected);

  void moveSelection(int delta);
  void syncSelectionToAddress();
  const DeviceView* selected() const;

  void toggleCalibration();
  void calibrateAtDistance(double meters);
  void printSummary();
  void printRangeTest();
  void setStatus(const char* msg);

  static void formatDistance(double m, char* out, size_t n);

private:
  std::string _version;
  DeviceTracker* _tracker = nullptr;

  std::vector<DeviceView> _items;
  int _sel = 0;
  int _offset = 0;
  std::string _sel_address;

  char _status[48] = {0};
  uint32_t _status_ms = 0;
};
