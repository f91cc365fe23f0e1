/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file for the host process. Defines file locations,
 * loop timing, log buffer sizes and the default engine settings.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Identity ---
#define DEVICE_NAME "SeventyTwo Block Timer"
#define DEVICE_VERSION "1.0.0"

// =================================================================================
// SECTION: FILES
// =================================================================================

#define DEFAULT_DATA_DIR "./data"
#define SETTINGS_FILE "settings.json"
#define ACTIVE_RUN_FILE "active_run.json"
#define BLOCKS_DIR "blocks"

// Bumped when the on-disk JSON shape changes
#define STORE_SCHEMA_VERSION 1

// =================================================================================
// SECTION: LOOP & LOGGING
// =================================================================================

#define SUSPEND_DETECT_MS 3000  // Wake-up later than this means the host was frozen
#define IDLE_WAIT_MS 1000       // select() timeout when nothing is armed
#define MAX_COMMAND_LENGTH 4096

#define LOG_BUFFER_SIZE 150
#define MAX_LOG_LENGTH 150
#define STDOUT_QUEUE_SIZE 50
#define LOG_DRAIN_PER_PASS 10

// =================================================================================
// SECTION: SETTINGS LIMITS
// =================================================================================

#define ABS_MAX_DAY_START_HOUR 23
#define ABS_MAX_UTC_OFFSET 50400 // +/- 14 h
#define ABS_MIN_CHECK_IN 1
#define ABS_MAX_CHECK_IN 12
#define ABS_MIN_BREAK_NOTIFY 60
#define ABS_MAX_BREAK_NOTIFY 1200
#define ABS_MIN_SNAPSHOT 1
#define ABS_MAX_SNAPSHOT 60
#define ABS_MAX_MIN_LABEL 600
#define ABS_MIN_AUTO_CONTINUE_DELAY 5
#define ABS_MAX_AUTO_CONTINUE_DELAY 120

// =================================================================================
// SECTION: DEFAULTS
// =================================================================================

// Host-only behaviour, not seen by the engine
struct HostConfig {
  bool autoContinueEnabled;
  uint32_t autoContinueDelaySeconds;
};

static const EngineConfig DEFAULT_ENGINE_CONFIG = {
    6,   // dayStartHour
    0,   // utcOffsetSeconds
    3,   // checkInThreshold
    300, // breakNotifySeconds
    5,   // snapshotIntervalSeconds
    10   // minLabelSegmentSeconds
};

static const HostConfig DEFAULT_HOST_CONFIG = {
    true, // autoContinueEnabled
    25    // autoContinueDelaySeconds
};
