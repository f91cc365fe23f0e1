/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      CommandApi.h / CommandApi.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON command handlers. Each handler maps one command onto a TimerEngine or
 * BlockRecorder call and turns the returned status code into a response.
 * =================================================================================
 */
#include <memory>
#include <stdio.h>

#include "BlockCalendar.h"
#include "BlockCodec.h"
#include "CommandApi.h"
#include "SettingsManager.h"

CommandApi::CommandApi(TimerEngine &engine, BlockRecorder &recorder, PosixBlockHAL &hal, Logger &logger,
                       HostConfig &hostConfig, const std::string &settingsPath)
    : _engine(engine), _recorder(recorder), _hal(hal), _logger(logger), _hostConfig(hostConfig),
      _settingsPath(settingsPath) {}

// =================================================================================
// SECTION: HELPER FUNCTIONS
// =================================================================================

const char *CommandApi::describeCode(int code) {
  switch (code) {
  case 200:
    return "OK";
  case 400:
    return "Invalid request.";
  case 409:
    return "Command not allowed in the current state.";
  case 412:
    return "Block is not available right now.";
  case 413:
    return "Payload too large.";
  case 423:
    return "Check-in required before continuing.";
  default:
    return "Unknown error.";
  }
}

/**
 * Helper function to build a standardized JSON error response.
 */
std::string CommandApi::sendJsonError(int code, const std::string &message) {
  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "error";
  (*doc)["code"] = code;
  (*doc)["message"] = message;
  std::string response;
  serializeJson(*doc, response);
  return response;
}

std::string CommandApi::statusResponse(const char *action) {
  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "ok";
  if (action != nullptr)
    (*doc)["action"] = action;
  BlockCodec::encodeStatus(_engine.getStatus(), (*doc)["engine"].to<JsonObject>());
  std::string response;
  serializeJson(*doc, response);
  return response;
}

std::string CommandApi::respond(int code, const char *action) {
  if (code != 200)
    return sendJsonError(code, describeCode(code));
  return statusResponse(action);
}

// =================================================================================
// SECTION: DISPATCH
// =================================================================================

std::string CommandApi::handle(const std::string &line) {
  if (line.size() > MAX_COMMAND_LENGTH) {
    return sendJsonError(413, describeCode(413));
  }

  // ALLOCATE ON HEAP via RAII
  std::unique_ptr<JsonDocument> doc(new JsonDocument());

  DeserializationError error = deserializeJson(*doc, line);
  if (error) {
    char logBuf[100];
    snprintf(logBuf, sizeof(logBuf), "Failed to parse command JSON: %s", error.c_str());
    _hal.logKeyValue("API", logBuf);
    return sendJsonError(400, "Invalid JSON body.");
  }

  JsonVariantConst body = doc->as<JsonVariantConst>();
  std::string cmd = body["cmd"] | "";

  if (cmd != "status" && cmd != "log") {
    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "/%s", cmd.c_str());
    _hal.logKeyValue("API", logBuf);
  }

  if (cmd == "status")
    return handleStatus();
  if (cmd == "start")
    return handleStart(body, false);
  if (cmd == "continue")
    return handleStart(body, true);
  if (cmd == "pause")
    return respond(_engine.pause(), "paused");
  if (cmd == "resume")
    return respond(_engine.resume(), "resumed");
  if (cmd == "stop")
    return handleStop(body);
  if (cmd == "switch")
    return handleSwitch(body);
  if (cmd == "category")
    return handleCategory(body);
  if (cmd == "snooze")
    return handleSnooze(body);
  if (cmd == "dismiss")
    return respond(_engine.dismiss(), "dismissed");
  if (cmd == "ack") {
    _engine.acknowledgeCheckIn();
    return statusResponse("acknowledged");
  }
  if (cmd == "skip")
    return handleSkip();
  if (cmd == "blocks")
    return handleBlocks(body);
  if (cmd == "log")
    return handleLog();
  if (cmd == "settings")
    return handleSettings(body);

  return sendJsonError(400, "Unknown command: " + cmd);
}

// =================================================================================
// SECTION: SESSION HANDLERS
// =================================================================================

std::string CommandApi::handleStatus() { return statusResponse(nullptr); }

std::string CommandApi::handleStart(JsonVariantConst body, bool isContinue) {
  StartRequest request;
  std::string errorMsg;
  if (!BlockCodec::parseStartRequest(body, request, errorMsg)) {
    return sendJsonError(400, errorMsg);
  }

  // Without explicit segments the slot continues from what is already stored
  if (body["segments"].isNull()) {
    if (_recorder.currentDate() != request.date && !_recorder.loadDay(request.date)) {
      _hal.logKeyValue("API", "Day not readable. Starting without stored segments.");
    }
    request.existingSegments = _recorder.existingSegmentsFor(request.blockIndex);
  }

  int rc = isContinue ? _engine.continueSession(request) : _engine.start(request);
  return respond(rc, isContinue ? "continued" : "started");
}

std::string CommandApi::handleStop(JsonVariantConst body) {
  bool markComplete = body["markComplete"] | false;
  return respond(_engine.stop(markComplete), "stopped");
}

std::string CommandApi::handleSwitch(JsonVariantConst body) {
  const char *modeStr = body["mode"] | "";
  SegmentKind mode;
  if (!BlockCodec::parseKind(modeStr, mode)) {
    return sendJsonError(400, std::string("Invalid mode: ") + modeStr);
  }
  return respond(_engine.switchMode(mode), "switched");
}

std::string CommandApi::handleCategory(JsonVariantConst body) {
  std::string category = body["category"] | "";
  std::string label = body["label"] | "";
  return respond(_engine.updateCategory(category, label), "categorized");
}

std::string CommandApi::handleSnooze(JsonVariantConst body) {
  int64_t seconds = body["seconds"] | 0;
  if (seconds < 0 || seconds > SLOT_SECONDS) {
    return sendJsonError(400, "seconds must be within 0..1200.");
  }
  return respond(_engine.snoozeBreakNotify((uint32_t)seconds), "snoozed");
}

// =================================================================================
// SECTION: DAY & DIAGNOSTICS HANDLERS
// =================================================================================

std::string CommandApi::handleSkip() {
  EngineState state = _engine.getState();
  int activeIndex = (state == IDLE) ? -1 : _engine.getBlockIndex();

  int changed = _recorder.processAutoSkip(_hal.getEpochMillis(), activeIndex);

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "ok";
  (*doc)["changed"] = changed;
  std::string response;
  serializeJson(*doc, response);
  return response;
}

std::string CommandApi::handleBlocks(JsonVariantConst body) {
  const EngineConfig &config = _engine.getConfig();
  std::string date = body["date"] | "";
  if (date.empty()) {
    date = BlockCalendar::logicalDate(_hal.getEpochMillis(), config.dayStartHour, config.utcOffsetSeconds);
  }

  int64_t days = 0;
  if (!BlockCalendar::parseDate(date, days)) {
    return sendJsonError(400, "Invalid date (expected YYYY-MM-DD): " + date);
  }

  if (_recorder.currentDate() != date && !_recorder.loadDay(date)) {
    return sendJsonError(503, "Day could not be read.");
  }

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "ok";
  (*doc)["date"] = date;
  JsonArray blocks = (*doc)["blocks"].to<JsonArray>();
  const std::vector<Block> &stored = _recorder.blocks();
  for (size_t i = 0; i < stored.size(); i++) {
    BlockCodec::encodeBlock(stored[i], blocks.add<JsonObject>());
  }
  (*doc)["pendingSaves"] = _recorder.pendingCount();

  std::string response;
  serializeJson(*doc, response);
  return response;
}

std::string CommandApi::handleLog() {
  std::vector<std::string> lines = _logger.snapshot();

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "ok";
  (*doc)["dropped"] = _logger.dropped();
  JsonArray out = (*doc)["lines"].to<JsonArray>();
  for (size_t i = 0; i < lines.size(); i++) {
    out.add(lines[i]);
  }

  std::string response;
  serializeJson(*doc, response);
  return response;
}

/**
 * {"cmd":"settings"} returns the stored settings.
 * {"cmd":"settings","set":{...}} clamps, validates and saves them. Host
 * settings apply immediately; engine settings apply on the next launch.
 */
std::string CommandApi::handleSettings(JsonVariantConst body) {
  EngineConfig engineConfig = _engine.getConfig();
  HostConfig hostConfig = _hostConfig;

  // Pick up what is on disk so a partial update never reverts earlier edits
  if (!SettingsManager::load(_settingsPath, engineConfig, hostConfig, _hal)) {
    return sendJsonError(503, "Settings file could not be read.");
  }

  bool restartRequired = false;
  JsonVariantConst update = body["set"];
  if (!update.isNull()) {
    if (!update.is<JsonObjectConst>()) {
      return sendJsonError(400, "set must be an object.");
    }

    SettingsManager::apply(update, engineConfig, hostConfig, _hal);
    if (!_engine.validateConfig(engineConfig)) {
      return sendJsonError(400, "Settings rejected.");
    }
    if (!SettingsManager::save(_settingsPath, engineConfig, hostConfig, _hal)) {
      return sendJsonError(503, "Settings could not be saved.");
    }

    _hostConfig = hostConfig;

    const EngineConfig &live = _engine.getConfig();
    restartRequired = live.dayStartHour != engineConfig.dayStartHour ||
                      live.utcOffsetSeconds != engineConfig.utcOffsetSeconds ||
                      live.checkInThreshold != engineConfig.checkInThreshold ||
                      live.breakNotifySeconds != engineConfig.breakNotifySeconds ||
                      live.snapshotIntervalSeconds != engineConfig.snapshotIntervalSeconds ||
                      live.minLabelSegmentSeconds != engineConfig.minLabelSegmentSeconds;
  }

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["status"] = "ok";
  SettingsManager::encode(engineConfig, hostConfig, (*doc)["settings"].to<JsonObject>());
  (*doc)["restartRequired"] = restartRequired;

  std::string response;
  serializeJson(*doc, response);
  return response;
}
