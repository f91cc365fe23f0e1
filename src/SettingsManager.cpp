/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      SettingsManager.h / SettingsManager.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Persistent settings (settings.json). All values pass through the same
 * clamp-and-log path whether they come from disk or from a command.
 * =================================================================================
 */
#include <fstream>
#include <memory>
#include <sstream>
#include <stdio.h>

#include "SettingsManager.h"

void SettingsManager::log(IBlockHAL &hal, const char *key, const char *val) {
  char tempBuf[LOG_LINE_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, val);
  hal.log(tempBuf);
}

// Negative or non-numeric input reads as 0 and is then clamped like any other value.
static uint32_t readUnsigned(JsonVariantConst v) {
  int64_t raw = v.as<int64_t>();
  if (raw < 0)
    return 0;
  if (raw > 0xFFFFFFFFLL)
    return 0xFFFFFFFFu;
  return (uint32_t)raw;
}

// =================================================================================
// SECTION: VALIDATION
// =================================================================================

uint32_t SettingsManager::validateAndClamp(uint32_t value, uint32_t min, uint32_t max, const char *label,
                                           const char *unit, IBlockHAL &hal) {
  uint32_t finalValue = value;
  const char *note = "";

  if (finalValue < min) {
    finalValue = min;
    note = " (Clamped Min)";
  } else if (finalValue > max) {
    finalValue = max;
    note = " (Clamped Max)";
  }

  char logBuf[128];
  if (value != finalValue) {
    snprintf(logBuf, sizeof(logBuf), "%s: %u %s%s (Req: %u)", label, finalValue, unit, note, value);
  } else {
    snprintf(logBuf, sizeof(logBuf), "%s: %u %s", label, finalValue, unit);
  }
  log(hal, "Settings", logBuf);

  return finalValue;
}

void SettingsManager::apply(JsonVariantConst json, EngineConfig &engine, HostConfig &host, IBlockHAL &hal) {
  // --- Engine ---
  if (!json["dayStartHour"].isNull())
    engine.dayStartHour =
        validateAndClamp(readUnsigned(json["dayStartHour"]), 0, ABS_MAX_DAY_START_HOUR, "Day Start", "h", hal);

  if (!json["utcOffsetSeconds"].isNull()) {
    int64_t req = json["utcOffsetSeconds"].as<int64_t>();
    int64_t offset = req;
    const char *note = "";
    if (offset < -ABS_MAX_UTC_OFFSET) {
      offset = -ABS_MAX_UTC_OFFSET;
      note = " (Clamped Min)";
    } else if (offset > ABS_MAX_UTC_OFFSET) {
      offset = ABS_MAX_UTC_OFFSET;
      note = " (Clamped Max)";
    }
    engine.utcOffsetSeconds = (int32_t)offset;

    char logBuf[128];
    if (offset != req) {
      snprintf(logBuf, sizeof(logBuf), "UTC Offset: %ld s%s (Req: %lld)", (long)offset, note, (long long)req);
    } else {
      snprintf(logBuf, sizeof(logBuf), "UTC Offset: %ld s", (long)offset);
    }
    log(hal, "Settings", logBuf);
  }

  if (!json["checkInThreshold"].isNull())
    engine.checkInThreshold = validateAndClamp(readUnsigned(json["checkInThreshold"]), ABS_MIN_CHECK_IN,
                                               ABS_MAX_CHECK_IN, "Check-In Every", "blocks", hal);

  if (!json["breakNotifySeconds"].isNull())
    engine.breakNotifySeconds = validateAndClamp(readUnsigned(json["breakNotifySeconds"]), ABS_MIN_BREAK_NOTIFY,
                                                 ABS_MAX_BREAK_NOTIFY, "Break Reminder", "s", hal);

  if (!json["snapshotIntervalSeconds"].isNull())
    engine.snapshotIntervalSeconds = validateAndClamp(readUnsigned(json["snapshotIntervalSeconds"]),
                                                      ABS_MIN_SNAPSHOT, ABS_MAX_SNAPSHOT, "Snapshot Every", "s", hal);

  if (!json["minLabelSegmentSeconds"].isNull())
    engine.minLabelSegmentSeconds = validateAndClamp(readUnsigned(json["minLabelSegmentSeconds"]), 0,
                                                     ABS_MAX_MIN_LABEL, "Min Label Segment", "s", hal);

  // --- Host ---
  if (!json["autoContinueEnabled"].isNull()) {
    host.autoContinueEnabled = json["autoContinueEnabled"].as<bool>();
    log(hal, "Settings", host.autoContinueEnabled ? "Auto-Continue: Enabled" : "Auto-Continue: Disabled");
  }

  if (!json["autoContinueDelaySeconds"].isNull())
    host.autoContinueDelaySeconds =
        validateAndClamp(readUnsigned(json["autoContinueDelaySeconds"]), ABS_MIN_AUTO_CONTINUE_DELAY,
                         ABS_MAX_AUTO_CONTINUE_DELAY, "Auto-Continue Delay", "s", hal);
}

void SettingsManager::encode(const EngineConfig &engine, const HostConfig &host, JsonObject out) {
  out["dayStartHour"] = engine.dayStartHour;
  out["utcOffsetSeconds"] = engine.utcOffsetSeconds;
  out["checkInThreshold"] = engine.checkInThreshold;
  out["breakNotifySeconds"] = engine.breakNotifySeconds;
  out["snapshotIntervalSeconds"] = engine.snapshotIntervalSeconds;
  out["minLabelSegmentSeconds"] = engine.minLabelSegmentSeconds;
  out["autoContinueEnabled"] = host.autoContinueEnabled;
  out["autoContinueDelaySeconds"] = host.autoContinueDelaySeconds;
}

// =================================================================================
// SECTION: LOAD / SAVE
// =================================================================================

bool SettingsManager::load(const std::string &path, EngineConfig &engine, HostConfig &host, IBlockHAL &hal) {
  std::ifstream in(path.c_str());
  if (!in.is_open()) {
    log(hal, "Settings", "No settings file. Using defaults.");
    if (!save(path, engine, host, hal))
      log(hal, "Settings", "Defaults not persisted.");
    return true;
  }

  std::ostringstream buf;
  buf << in.rdbuf();

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  DeserializationError error = deserializeJson(*doc, buf.str());
  if (error) {
    char logBuf[100];
    snprintf(logBuf, sizeof(logBuf), "Failed to parse settings: %s", error.c_str());
    log(hal, "Settings", logBuf);
    return false;
  }

  apply(doc->as<JsonVariantConst>(), engine, host, hal);
  return true;
}

bool SettingsManager::save(const std::string &path, const EngineConfig &engine, const HostConfig &host,
                           IBlockHAL &hal) {
  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  encode(engine, host, doc->to<JsonObject>());

  std::string tmpPath = path + ".tmp";
  {
    std::ofstream out(tmpPath.c_str(), std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
      log(hal, "Settings", "Cannot write settings file.");
      return false;
    }
    serializeJsonPretty(*doc, out);
    if (!out.good()) {
      log(hal, "Settings", "Settings write failed.");
      return false;
    }
  }

  if (rename(tmpPath.c_str(), path.c_str()) != 0) {
    log(hal, "Settings", "Settings rename failed.");
    remove(tmpPath.c_str());
    return false;
  }

  log(hal, "Settings", "Settings saved.");
  return true;
}
