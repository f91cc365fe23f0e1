/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      BlockStore.h / BlockStore.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <ArduinoJson.h>
#include <errno.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>

#include "BlockCodec.h"
#include "BlockStore.h"
#include "Config.h"

BlockStore::BlockStore(const std::string &dataDir, IBlockHAL &hal)
    : _dataDir(dataDir), _hal(hal), _snapshotPresent(true) {}

void BlockStore::logKeyValue(const char *key, const char *value) {
  char tempBuf[LOG_LINE_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

static bool ensureDirectory(const std::string &path) {
  if (mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
  }
  return false;
}

bool BlockStore::initialize() {
  char logBuf[128];

  if (!ensureDirectory(_dataDir) || !ensureDirectory(_dataDir + "/" + BLOCKS_DIR)) {
    snprintf(logBuf, sizeof(logBuf), "Cannot create data dir %s: %s", _dataDir.c_str(), strerror(errno));
    logKeyValue("Store", logBuf);
    return false;
  }

  snprintf(logBuf, sizeof(logBuf), "Data dir: %s", _dataDir.c_str());
  logKeyValue("Store", logBuf);
  return true;
}

std::string BlockStore::dayPath(const std::string &date) const {
  return _dataDir + "/" + BLOCKS_DIR + "/" + date + ".json";
}

std::string BlockStore::snapshotPath() const { return _dataDir + "/" + ACTIVE_RUN_FILE; }

// =================================================================================
// SECTION: FILE HELPERS
// =================================================================================

bool BlockStore::readFile(const std::string &path, std::string &out) const {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open())
    return false;

  std::ostringstream buf;
  buf << in.rdbuf();
  out = buf.str();
  return !in.bad();
}

bool BlockStore::writeFileAtomic(const std::string &path, const std::string &content) {
  std::string tmpPath = path + ".tmp";

  {
    std::ofstream out(tmpPath.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open())
      return false;
    out << content;
    out.flush();
    if (!out.good()) {
      remove(tmpPath.c_str());
      return false;
    }
  }

  if (rename(tmpPath.c_str(), path.c_str()) != 0) {
    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "rename failed for %s: %s", path.c_str(), strerror(errno));
    logKeyValue("Store", logBuf);
    remove(tmpPath.c_str());
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: BLOCKS (blocks/<date>.json)
// =================================================================================

bool BlockStore::load(const std::string &date, std::vector<Block> &out) {
  out.clear();

  std::string content;
  if (!readFile(dayPath(date), content)) {
    // A day nobody has written yet is simply empty
    return true;
  }

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  DeserializationError error = deserializeJson(*doc, content);
  if (error) {
    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Corrupt day file %s: %s", date.c_str(), error.c_str());
    logKeyValue("Store", logBuf);
    return false;
  }

  JsonArrayConst blocks = (*doc)["blocks"].as<JsonArrayConst>();
  for (JsonVariantConst item : blocks) {
    Block block;
    std::string errorMsg;
    if (!BlockCodec::decodeBlock(item, block, errorMsg)) {
      // One bad record does not cost the rest of the day
      char logBuf[128];
      snprintf(logBuf, sizeof(logBuf), "Skipping block in %s: %s", date.c_str(), errorMsg.c_str());
      logKeyValue("Store", logBuf);
      continue;
    }
    out.push_back(block);
  }
  return true;
}

bool BlockStore::save(const Block &block) {
  std::vector<Block> day;
  if (!load(block.date, day)) {
    // Never overwrite a file we could not read
    return false;
  }

  bool replaced = false;
  for (size_t i = 0; i < day.size(); i++) {
    if (day[i].blockIndex == block.blockIndex) {
      day[i] = block;
      replaced = true;
      break;
    }
  }
  if (!replaced)
    day.push_back(block);

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["schema"] = STORE_SCHEMA_VERSION;
  (*doc)["date"] = block.date;
  JsonArray blocks = (*doc)["blocks"].to<JsonArray>();
  for (size_t i = 0; i < day.size(); i++) {
    BlockCodec::encodeBlock(day[i], blocks.add<JsonObject>());
  }

  std::string content;
  serializeJson(*doc, content);

  if (!writeFileAtomic(dayPath(block.date), content)) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Save failed: %s #%d", block.date.c_str(), block.blockIndex);
    logKeyValue("Store", logBuf);
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: ACTIVE RUN (active_run.json)
// =================================================================================

void BlockStore::publish(const RunSnapshot &snapshot) {
  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  (*doc)["schema"] = STORE_SCHEMA_VERSION;
  BlockCodec::encodeSnapshot(snapshot, (*doc)["run"].to<JsonObject>());

  std::string content;
  serializeJson(*doc, content);

  if (writeFileAtomic(snapshotPath(), content)) {
    _snapshotPresent = true;
  } else {
    logKeyValue("Store", "Snapshot write failed.");
  }
}

void BlockStore::clear() {
  if (!_snapshotPresent)
    return;

  if (remove(snapshotPath().c_str()) != 0 && errno != ENOENT) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Cannot remove snapshot: %s", strerror(errno));
    logKeyValue("Store", logBuf);
    return;
  }
  _snapshotPresent = false;
}

bool BlockStore::loadSnapshot(RunSnapshot &out) {
  std::string content;
  if (!readFile(snapshotPath(), content)) {
    _snapshotPresent = false;
    return false;
  }

  std::unique_ptr<JsonDocument> doc(new JsonDocument());
  DeserializationError error = deserializeJson(*doc, content);
  if (error) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Corrupt snapshot: %s", error.c_str());
    logKeyValue("Store", logBuf);
    return false;
  }

  std::string errorMsg;
  if (!BlockCodec::decodeSnapshot((*doc)["run"], out, errorMsg)) {
    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "Invalid snapshot: %s", errorMsg.c_str());
    logKeyValue("Store", logBuf);
    return false;
  }
  return true;
}
