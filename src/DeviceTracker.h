#pragma once
#include <Arduino.h>

#include <atomic>

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#include "ScanSession.h"

class NimBLEScan;
class NimBLEAdvertisedDevice;

// Adapter layer: NimBLE scan results -> queue -> ScanSession.
class DeviceTracker {
public:
  explicit DeviceTracker(const ScanConfig& cfg = ScanConfig{});

  bool begin();                 // starts BLE scan + processing task
  void reset();                 // drops queued events and every tracked device

  ScanSession& session() { return _session; }
  const ScanSession& session() const { return _session; }

  void setDebug(bool on) { _debug = on; }
  bool debug() const { return _debug; }

  uint32_t droppedEvents() const { return _dropped.load(); }
  static uint64_t nowMs();

  // Called from the NimBLE host task.
  void enqueue(NimBLEAdvertisedDevice* dev);

private:
  static void processingTask(void* arg);
  void processPending();
  void applyScanHint();
  void pruneIfFull();

  ScanSession _session;

  QueueHandle_t _queue = nullptr;
  NimBLEScan*   _scan = nullptr;

  ScanHint _hint{};
  std::atomic<uint32_t> _dropped{0};
  volatile bool _debug = false;
};
