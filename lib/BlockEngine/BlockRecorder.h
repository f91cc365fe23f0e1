/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/BlockRecorder.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Listener that folds engine output into per-slot Block records and hands
 * them to the IBlockRepository. Save failures are queued and retried with
 * flushPending(); the engine never waits on them.
 * =================================================================================
 */
#pragma once
#include <vector>

#include "Types.h"
#include "BlockContext.h"
#include "BlockCollaborators.h"
#include "BlockEvents.h"

class BlockRecorder : public IBlockEngineListener {
public:
    BlockRecorder(IBlockRepository& repository, IBlockHAL& hal, const EngineConfig& config);

    // Replaces the in-memory day with the repository's copy.
    bool loadDay(const std::string& date);

    const std::string& currentDate() const { return _date; }
    const std::vector<Block>& blocks() const { return _blocks; }
    bool findBlock(int blockIndex, Block& out) const;

    // Stored segments of a slot of the loaded day, used to seed a new session.
    SegmentList existingSegmentsFor(int blockIndex) const;

    /**
     * Closes every unfinished slot before "now" in the logical day:
     * DONE when it holds real usage, SKIPPED otherwise.
     * Muted slots and the slot of the active session are left alone.
     * @param activeIndex Slot the engine is writing to, or -1.
     * @return number of blocks changed.
     */
    int processAutoSkip(EpochMillis now, int activeIndex);

    // Retries queued saves. Returns how many are still pending.
    size_t flushPending();
    size_t pendingCount() const { return _pending.size(); }

    // --- IBlockEngineListener ---
    void onSnapshot(const RunSnapshot& snapshot) override;
    void onComplete(const CompletionReport& report) override;

private:
    IBlockRepository& _repository;
    IBlockHAL& _hal;
    EngineConfig _config;

    std::string _date;
    std::vector<Block> _blocks;
    std::vector<Block> _pending;

    Block& blockFor(const std::string& date, int blockIndex);
    void persist(const Block& block);
    void sortByDisplayOrder();

    void logKeyValue(const char* key, const char* value);
};
