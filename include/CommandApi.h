/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      CommandApi.h / CommandApi.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Line-oriented JSON command interface. Each request is one JSON object with a
 * "cmd" field; each response is one JSON object. Errors use the shape
 * {"status":"error","code":N,"message":"..."}.
 * =================================================================================
 */
#ifndef COMMAND_API_H
#define COMMAND_API_H

#include <ArduinoJson.h>
#include <string>

#include "BlockRecorder.h"
#include "Config.h"
#include "Logger.h"
#include "PosixBlockHAL.h"
#include "TimerEngine.h"

class CommandApi {
public:
  CommandApi(TimerEngine &engine, BlockRecorder &recorder, PosixBlockHAL &hal, Logger &logger,
             HostConfig &hostConfig, const std::string &settingsPath);

  // Handles one request line and returns the response line (no trailing newline).
  std::string handle(const std::string &line);

  // Human-readable text for an engine status code.
  static const char *describeCode(int code);

private:
  TimerEngine &_engine;
  BlockRecorder &_recorder;
  PosixBlockHAL &_hal;
  Logger &_logger;
  HostConfig &_hostConfig;
  std::string _settingsPath;

  // --- Handlers ---
  std::string handleStatus();
  std::string handleStart(JsonVariantConst body, bool isContinue);
  std::string handleSwitch(JsonVariantConst body);
  std::string handleCategory(JsonVariantConst body);
  std::string handleSnooze(JsonVariantConst body);
  std::string handleStop(JsonVariantConst body);
  std::string handleSkip();
  std::string handleBlocks(JsonVariantConst body);
  std::string handleLog();
  std::string handleSettings(JsonVariantConst body);

  // --- Helpers ---
  std::string sendJsonError(int code, const std::string &message);
  std::string respond(int code, const char *action);
  std::string statusResponse(const char *action);
};

#endif
