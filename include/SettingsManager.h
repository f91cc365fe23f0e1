/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Loads and stores settings.json.
 * - Every numeric field is clamped to its absolute limits and logged.
 * - Unknown or missing keys fall back to the compiled defaults.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <stdint.h>
#include <string>

#include "BlockContext.h"
#include "Config.h"
#include "Types.h"

class SettingsManager {
public:
  // Missing file: defaults are kept and written out. Returns false only on a corrupt file.
  static bool load(const std::string &path, EngineConfig &engine, HostConfig &host, IBlockHAL &hal);
  static bool save(const std::string &path, const EngineConfig &engine, const HostConfig &host, IBlockHAL &hal);

  // Applies the keys present in json on top of the given values, clamping each.
  static void apply(JsonVariantConst json, EngineConfig &engine, HostConfig &host, IBlockHAL &hal);

  static void encode(const EngineConfig &engine, const HostConfig &host, JsonObject out);

private:
  // Internal helper to perform clamping and logging
  static uint32_t validateAndClamp(uint32_t value, uint32_t min, uint32_t max, const char *label, const char *unit,
                                   IBlockHAL &hal);
  static void log(IBlockHAL &hal, const char *key, const char *value);
};
