#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

// ----------------------------- Tuning -----------------------------

static constexpr size_t HISTORY_CAPACITY     = 20;
static constexpr size_t CADENCE_WINDOW       = 10;

static constexpr float  AIRTAG_INTERVAL_S    = 2.0f;
static constexpr float  AIRTAG_INTERVAL_TOL_S = 0.5f;

static constexpr int    RSSI_AT_ONE_METER    = -59;
static constexpr double PATH_LOSS_EXPONENT   = 2.0;
static constexpr double MIN_DISTANCE_M       = 0.1;
static constexpr double MAX_DISTANCE_M       = 1000.0;

static constexpr int    CALIB_RSSI_MIN_DBM   = -100;
static constexpr int    CALIB_RSSI_MAX_DBM   = -10;

static constexpr size_t RSSI_SMOOTHING       = 5;
static constexpr size_t MOVEMENT_WINDOW      = 8;
static constexpr double TREND_SLOPE_MPS      = 0.05;
static constexpr double ERRATIC_RMS_M        = 1.5;

static constexpr int    DETECTION_THRESHOLD  = 50;

// Adaptive distance: strong + stable signal is assumed to be ~1 m away
static constexpr int    ADAPTIVE_NEAR_DBM    = -55;
static constexpr float  ADAPTIVE_MAX_DEV_DB  = 3.0f;

static constexpr int    RANGE_TEST_MIN_SCORE = 45;

// Scoring weights. Policy, not protocol: tune against reference captures.
struct ScoringPolicy {
  int registered_base       = 60;
  int registered_cadence    = 15;
  int registered_status     = 10;
  int registered_rotation   = 5;

  int unregistered_base     = 45;
  int unregistered_cadence  = 15;

  int generic_base          = 35;
  int generic_cadence       = 10;

  int confirmed_min         = 80;
  int likely_min            = 50;
  int unregistered_min      = 45;
};

struct ScanConfig {
  size_t history_capacity   = HISTORY_CAPACITY;
  size_t cadence_window     = CADENCE_WINDOW;

  float  expected_interval_s = AIRTAG_INTERVAL_S;
  float  interval_tolerance_s = AIRTAG_INTERVAL_TOL_S;

  int    reference_rssi     = RSSI_AT_ONE_METER;
  double path_loss_exponent = PATH_LOSS_EXPONENT;
  double min_distance_m     = MIN_DISTANCE_M;
  double max_distance_m     = MAX_DISTANCE_M;

  int    calib_rssi_min     = CALIB_RSSI_MIN_DBM;
  int    calib_rssi_max     = CALIB_RSSI_MAX_DBM;

  size_t rssi_smoothing     = RSSI_SMOOTHING;
  size_t movement_window    = MOVEMENT_WINDOW;
  double trend_slope_mps    = TREND_SLOPE_MPS;
  double erratic_rms_m      = ERRATIC_RMS_M;

  int    detection_threshold = DETECTION_THRESHOLD;

  bool   adaptive_reference = true;
  int    adaptive_near_dbm  = ADAPTIVE_NEAR_DBM;
  float  adaptive_max_dev_db = ADAPTIVE_MAX_DEV_DB;

  int    range_test_min_score = RANGE_TEST_MIN_SCORE;

  ScoringPolicy scoring{};

  // Copy with windows forced into a usable range (K <= N, all windows >= 1).
  ScanConfig Sanitized() const {
    ScanConfig c = *this;
    c.history_capacity = std::max<size_t>(c.history_capacity, 3);
    c.cadence_window   = std::min(std::max<size_t>(c.cadence_window, 2), c.history_capacity);
    c.rssi_smoothing   = std::min(std::max<size_t>(c.rssi_smoothing, 1), c.history_capacity);
    c.movement_window  = std::min(std::max<size_t>(c.movement_window, 3), c.history_capacity);
    if (!(c.path_loss_exponent > 0.0)) c.path_loss_exponent = PATH_LOSS_EXPONENT;
    if (!(c.min_distance_m > 0.0))     c.min_distance_m = MIN_DISTANCE_M;
    if (c.max_distance_m < c.min_distance_m) c.max_distance_m = c.min_distance_m;
    if (c.interval_tolerance_s < 0.0f) c.interval_tolerance_s = 0.0f;
    if (c.calib_rssi_min > c.calib_rssi_max) std::swap(c.calib_rssi_min, c.calib_rssi_max);
    return c;
  }
};
