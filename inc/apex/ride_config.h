// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_RIDE_CONFIG_H_
#define INC_APEX_RIDE_CONFIG_H_

//=============================================================================
// CENTRALIZED RIDE RECORDING CONFIGURATION
// Signal processing thresholds, sensor options and storage keys used by the
// recording engine.
//=============================================================================

// Spherical earth model for haversine distance
#define EARTH_RADIUS_KM              6371.0

// Lean signal processing
#define LEAN_SMOOTHING_ALPHA         0.15    // EMA weight of the newest sample
#define LEAN_MAX_DEG                 70.0    // Reality clamp (degrees)
#define MOTION_LOCK_SPEED_KMH        10.0    // Below this lean output is forced to 0
#define MOTION_LOCK_SPEED_MS         (MOTION_LOCK_SPEED_KMH / 3.6)  // ~2.78 m/s

// Auto-pause
#define AUTO_PAUSE_STILL_MS          (5UL * 60UL * 1000UL)  // 5 minutes without movement

// Position watch options
#define GPS_HIGH_ACCURACY            true
#define GPS_TIMEOUT_MS               30000   // Give the receiver 30s per fix
#define GPS_MAX_FIX_AGE_MS           5000    // Accept cached fixes up to 5s old

// Persistence rounding
#define RIDE_DISTANCE_DECIMALS       2
#define RIDE_LEAN_DECIMALS           1

// Settings file keys
#define KEY_CALIBRATION_OFFSET       "apex-calibration-offset"
#define KEY_BIKE_ID                  "bike_id"
#define KEY_USER_ID                  "user_id"
#define KEY_RIDE_LOG_PATH            "ride_log"
#define KEY_GEOMETRY_SUPPORTED       "geometry"
#define KEY_ORIENTATION_SOURCE       "orientation_source"
#define KEY_LOG_LEVEL                "log_level"

#define DEFAULT_RIDE_LOG_PATH        "rides.jsonl"
#define DEFAULT_SETTINGS_PATH        "apex-settings.json"

// User facing notices
#define NOTICE_QUEUE_DEPTH           3       // Pending notices kept for the UI
#define NOTICE_MESSAGE_LEN           96

#endif  // INC_APEX_RIDE_CONFIG_H_
