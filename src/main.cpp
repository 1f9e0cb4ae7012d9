#include <M5Cardputer.h>

#include "DeviceTracker.h"
#include "StatusView.h"
#include "Colors.h"

#define VERSION "1.0.00"

static DeviceTracker g_tracker;
static StatusView g_ui(VERSION);

static const uint32_t UI_FRAME_MS = 250;

static constexpr uint32_t SPLASH_MS = 1500;

static void drawSplashScreen()
{
  auto& d = M5Cardputer.Display;
  const int W = d.width();
  const int H = d.height();

  d.startWrite();
  d.fillScreen(C_BLACK);

  d.setTextSize(2);
  d.setTextColor(C_RED, C_BLACK);
  const char* title = "TagScout";
  d.setCursor((W - d.textWidth(title)) / 2, H / 2 - 16);
  d.print(title);

  d.setTextSize(1);
  d.setTextColor(C_WHITE, C_BLACK);
  d.setCursor(0, H - 10);
  d.print(VERSION);

  const char* right = "Find My scanner";
  d.setCursor(W - d.textWidth(right), H - 10);
  d.print(right);

  d.endWrite();
}

void setup() {
  Serial.begin(115200);

  auto cfg = M5.config();
  cfg.serial_baudrate = 115200;
  cfg.fallback_board  = m5::board_t::board_M5Cardputer;
  M5Cardputer.begin(cfg, true);
  M5Cardputer.Keyboard.begin();

  M5.Display.setRotation(1);
  M5.Display.setBrightness(128);

  const uint32_t t0 = millis();

  drawSplashScreen();

  if (!g_tracker.begin()) {
    Serial.println("DeviceTracker.begin failed");
  }

  const uint32_t elapsed = millis() - t0;
  if (elapsed < SPLASH_MS) {
    delay(SPLASH_MS - elapsed);
  }

  g_ui.begin(&g_tracker);

  Serial.printf("[heap] free=%u min=%u\n",
                (unsigned)esp_get_free_heap_size(),
                (unsigned)esp_get_minimum_free_heap_size());
}

void loop() {
  M5Cardputer.update();

  if (M5Cardputer.Keyboard.isChange() && M5Cardputer.Keyboard.isPressed())
    g_ui.handleKeyboard(M5Cardputer.Keyboard);

  // UI refresh ~4 Hz
  static uint32_t last_ms = 0;
  const uint32_t ms = millis();
  if (ms - last_ms >= UI_FRAME_MS) {
    last_ms = ms;
    g_ui.update();
  }

  static uint32_t last_heap_ms = 0;
  if (ms - last_heap_ms >= 60000) {
    last_heap_ms = ms;
    Serial.printf("[heap] free=%u min=%u dropped=%u\n",
                  (unsigned)esp_get_free_heap_size(),
                  (unsigned)esp_get_minimum_free_heap_size(),
                  (unsigned)g_tracker.droppedEvents());
  }

  delay(1);
}
