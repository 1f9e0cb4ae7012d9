#include "DeviceTracker.h"

#include <NimBLEDevice.h>

#include "freertos/task.h"
#include "esp_timer.h"

#include "TrackNames.h"

#include <algorithm>
#include <stdio.h>
#include <string.h>

// ----------------------------- Tuning -----------------------------

static constexpr int      QUEUE_DEPTH      = 256;
static constexpr int      MAX_TRACKS       = 256;
static constexpr uint64_t TRACK_IDLE_MS    = 20ULL * 60ULL * 1000ULL;
static constexpr uint32_t HINT_PERIOD_MS   = 5000;

// Legacy advertisements carry at most 31 bytes of AD data
static constexpr size_t   MAX_MFG_LEN  = 31;
static constexpr size_t   MAX_NAME_LEN = 32;

// ----------------------------- Observations -----------------------------

// Plain bytes only: FreeRTOS queues copy by memcpy.
struct Observation {
  uint8_t  addr[6];
  int8_t   rssi_dbm;
  uint8_t  mfg[MAX_MFG_LEN];
  uint8_t  mfg_len;
  char     name[MAX_NAME_LEN];
  uint8_t  name_len;
  uint64_t ts_ms;
};

static inline void formatMac(const uint8_t* mac, char* out) {
  // NimBLE stores the native address little-endian
  sprintf(out, "%02X:%02X:%02X:%02X:%02X:%02X",
          mac[5], mac[4], mac[3], mac[2], mac[1], mac[0]);
}

// ----------------------------- BLE scanning -----------------------------

class ScanCB : public NimBLEAdvertisedDeviceCallbacks {
public:
  explicit ScanCB(DeviceTracker* tracker) : _tracker(tracker) {}

  void onResult(NimBLEAdvertisedDevice* dev) override {
    _tracker->enqueue(dev);
  }

private:
  DeviceTracker* _tracker;
};

// ----------------------------- DeviceTracker -----------------------------

DeviceTracker::DeviceTracker(const ScanConfig& cfg)
  : _session(cfg) {}

uint64_t DeviceTracker::nowMs() {
  return (uint64_t)esp_timer_get_time() / 1000ULL;
}

void DeviceTracker::enqueue(NimBLEAdvertisedDevice* dev) {
  if (!_queue || !dev) return;

  Observation obs{};
  obs.ts_ms = nowMs();
  obs.rssi_dbm = (int8_t)dev->getRSSI();

  NimBLEAddress a = dev->getAddress();
  memcpy(obs.addr, a.getNative(), 6);

  if (dev->haveManufacturerData()) {
    const std::string mfg = dev->getManufacturerData();
    const size_t ncopy = std::min<size_t>(mfg.size(), sizeof(obs.mfg));
    obs.mfg_len = (uint8_t)ncopy;
    if (ncopy) memcpy(obs.mfg, mfg.data(), ncopy);
  }

  if (dev->haveName()) {
    const std::string name = dev->getName();
    const size_t ncopy = std::min<size_t>(name.length(), sizeof(obs.name));
    obs.name_len = (uint8_t)ncopy;
    if (ncopy) memcpy(obs.name, name.c_str(), ncopy);
  }

  if (xQueueSend(_queue, &obs, 0) != pdTRUE) _dropped++;
}

void DeviceTracker::processPending() {
  Observation obs;
  if (xQueueReceive(_queue, &obs, pdMS_TO_TICKS(250)) != pdTRUE) return;

  char mac[18];
  formatMac(obs.addr, mac);

  RawAdvertisement adv{};
  adv.address = mac;
  adv.rssi = obs.rssi_dbm;
  adv.ts_ms = obs.ts_ms;
  adv.name.assign(obs.name, obs.name_len);

  // No manufacturer data: company id stays 0 and the decoder reports Unknown
  AdvertisementDecoder::SplitManufacturerData(obs.mfg, obs.mfg_len, adv.company_id, adv.mfg_data);

  DeviceView prev{};
  const bool known = _session.device(adv.address, prev);

  const DeviceView v = _session.onAdvertisement(adv);

  if (_debug && v.kind == PayloadKind::Unknown && adv.company_id == 0x004C) {
    Serial.printf("[ble] %s undecodable Apple payload (%u bytes)\n", mac, (unsigned)adv.mfg_data.size());
  }

  if ((!known && v.classification != Classification::NotATracker) ||
      (known && prev.classification != v.classification)) {
    Serial.printf("[scan] %s %s score=%d rssi=%d dist=%.1fm\n",
                  mac, ClassificationName(v.classification), v.score, v.rssi, v.distance_m);
  }
}

// Bound memory: the session never forgets on its own
void DeviceTracker::pruneIfFull() {
  if (_session.deviceCount() <= (size_t)MAX_TRACKS) return;

  const size_t n = _session.clearStale(nowMs(), TRACK_IDLE_MS);
  Serial.printf("[scan] pruned %u idle devices\n", (unsigned)n);
}

void DeviceTracker::applyScanHint() {
  if (!_scan) return;

  const ScanHint h = _session.scanHint();
  if (h.interval_ms == _hint.interval_ms && h.window_ms == _hint.window_ms) return;

  _scan->stop();
  _scan->setInterval(h.interval_ms);
  _scan->setWindow(h.window_ms);
  _scan->start(0, nullptr, false);
  _hint = h;

  Serial.printf("[scan] hint interval=%u window=%u (%u high-confidence)\n",
                (unsigned)h.interval_ms, (unsigned)h.window_ms, (unsigned)h.high_confidence);
}

void DeviceTracker::processingTask(void* arg) {
  DeviceTracker* self = static_cast<DeviceTracker*>(arg);
  uint32_t last_hint_ms = 0;

  while (true) {
    self->processPending();

    const uint32_t ms = millis();
    if (ms - last_hint_ms >= HINT_PERIOD_MS) {
      last_hint_ms = ms;
      self->applyScanHint();
      self->pruneIfFull();
    }
  }
}

bool DeviceTracker::begin() {
  Serial.println("DeviceTracker starting...");

  _queue = xQueueCreate(QUEUE_DEPTH, sizeof(Observation));
  if (!_queue) return false;

  NimBLEDevice::init("");

  _scan = NimBLEDevice::getScan();
  _scan->setAdvertisedDeviceCallbacks(new ScanCB(this), false);
  _scan->setActiveScan(true);
  _scan->setInterval(_hint.interval_ms);
  _scan->setWindow(_hint.window_ms);
  _scan->setDuplicateFilter(false);
  _scan->start(0, nullptr, false);

  Serial.println("BLE scan started");

  if (xTaskCreatePinnedToCore(processingTask, "dt_proc", 8192, this, 10, nullptr, 0) != pdPASS) {
    Serial.println("[scan] processing task create failed");
    return false;
  }
  return true;
}

void DeviceTracker::reset() {
  // Clear pending observations so we don't immediately repopulate from old data.
  if (_queue) {
    xQueueReset(_queue);
  }
  _session.reset();
  _dropped = 0;
}
