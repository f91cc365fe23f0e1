/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      BlockStore.h / BlockStore.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * File-backed persistence. One JSON file per logical day under blocks/, plus
 * active_run.json mirroring the live session for crash recovery. Writes go to
 * a temporary file first and are renamed into place.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include "BlockCollaborators.h"
#include "BlockContext.h"
#include "Types.h"

class BlockStore : public IBlockRepository, public ISnapshotPublisher {
public:
  BlockStore(const std::string &dataDir, IBlockHAL &hal);

  // Creates the data and blocks directories. Returns false if either is unusable.
  bool initialize();

  // --- IBlockRepository ---
  bool load(const std::string &date, std::vector<Block> &out) override;
  bool save(const Block &block) override;

  // --- ISnapshotPublisher ---
  void publish(const RunSnapshot &snapshot) override;
  void clear() override;

  // Reads active_run.json. Returns false when absent or unreadable.
  bool loadSnapshot(RunSnapshot &out);

  const std::string &dataDir() const { return _dataDir; }

private:
  std::string _dataDir;
  IBlockHAL &_hal;
  bool _snapshotPresent;

  std::string dayPath(const std::string &date) const;
  std::string snapshotPath() const;

  bool readFile(const std::string &path, std::string &out) const;
  bool writeFileAtomic(const std::string &path, const std::string &content);

  void logKeyValue(const char *key, const char *value);
};
