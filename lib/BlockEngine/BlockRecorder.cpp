/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/BlockRecorder.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <stdio.h>
#include <algorithm>

#include "BlockRecorder.h"
#include "BlockCalendar.h"

static double percentOfSlot(uint32_t seconds) {
    double pct = (double)seconds / (double)SLOT_SECONDS * 100.0;
    return (pct > 100.0) ? 100.0 : pct;
}

static Block emptyBlock(const std::string& date, int blockIndex) {
    Block block;
    block.date = date;
    block.blockIndex = blockIndex;
    block.status = BLOCK_IDLE;
    block.usedSeconds = 0;
    block.progress = 0.0;
    block.breakProgress = 0.0;
    block.isMuted = false;
    block.hasActiveRun = false;
    return block;
}

BlockRecorder::BlockRecorder(IBlockRepository& repository, IBlockHAL& hal, const EngineConfig& config)
    : _repository(repository),
      _hal(hal),
      _config(config)
{
}

void BlockRecorder::logKeyValue(const char* key, const char* value) {
    char tempBuf[LOG_LINE_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

// =================================================================================
// SECTION: DAY CACHE
// =================================================================================

bool BlockRecorder::loadDay(const std::string& date) {
    std::vector<Block> loaded;
    if (!_repository.load(date, loaded)) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Load failed for %s. Starting empty.", date.c_str());
        logKeyValue("Blocks", logBuf);
        _date = date;
        _blocks.clear();
        return false;
    }

    _date = date;
    _blocks.swap(loaded);
    sortByDisplayOrder();
    return true;
}

void BlockRecorder::sortByDisplayOrder() {
    uint32_t dayStart = _config.dayStartHour;
    std::sort(_blocks.begin(), _blocks.end(), [dayStart](const Block& a, const Block& b) {
        return BlockCalendar::displayNumber(a.blockIndex, dayStart) < BlockCalendar::displayNumber(b.blockIndex, dayStart);
    });
}

bool BlockRecorder::findBlock(int blockIndex, Block& out) const {
    for (size_t i = 0; i < _blocks.size(); i++) {
        if (_blocks[i].blockIndex == blockIndex) {
            out = _blocks[i];
            return true;
        }
    }
    return false;
}

SegmentList BlockRecorder::existingSegmentsFor(int blockIndex) const {
    Block block;
    if (!findBlock(blockIndex, block)) return SegmentList();
    return block.segments;
}

Block& BlockRecorder::blockFor(const std::string& date, int blockIndex) {
    if (date != _date) loadDay(date);

    for (size_t i = 0; i < _blocks.size(); i++) {
        if (_blocks[i].blockIndex == blockIndex) return _blocks[i];
    }

    _blocks.push_back(emptyBlock(date, blockIndex));
    sortByDisplayOrder();
    for (size_t i = 0; i < _blocks.size(); i++) {
        if (_blocks[i].blockIndex == blockIndex) return _blocks[i];
    }
    return _blocks.back();
}

// =================================================================================
// SECTION: PERSISTENCE
// =================================================================================

void BlockRecorder::persist(const Block& block) {
    if (_repository.save(block)) return;

    char logBuf[80];
    snprintf(logBuf, sizeof(logBuf), "Save failed for %s/%d. Queued for retry.", block.date.c_str(), block.blockIndex);
    logKeyValue("Blocks", logBuf);

    // Only the latest version of a block is worth retrying
    for (size_t i = 0; i < _pending.size(); i++) {
        if (_pending[i].date == block.date && _pending[i].blockIndex == block.blockIndex) {
            _pending[i] = block;
            return;
        }
    }
    _pending.push_back(block);
}

size_t BlockRecorder::flushPending() {
    std::vector<Block> stillPending;
    for (size_t i = 0; i < _pending.size(); i++) {
        if (!_repository.save(_pending[i])) stillPending.push_back(_pending[i]);
    }

    if (!_pending.empty()) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Retried %u saves, %u still pending.", (unsigned)_pending.size(),
                 (unsigned)stillPending.size());
        logKeyValue("Blocks", logBuf);
    }

    _pending.swap(stillPending);
    return _pending.size();
}

// =================================================================================
// SECTION: ENGINE EVENTS
// =================================================================================

void BlockRecorder::onSnapshot(const RunSnapshot& snapshot) {
    Block& block = blockFor(snapshot.date, snapshot.blockIndex);

    SegmentList all = snapshot.previousSegments;
    all.insert(all.end(), snapshot.segments.begin(), snapshot.segments.end());

    block.segments = all;
    block.usedSeconds = sumSeconds(all);
    block.progress = percentOfSlot(sumSeconds(all, SEG_WORK));
    block.breakProgress = percentOfSlot(sumSeconds(all, SEG_BREAK));
    if (!snapshot.lastWorkCategory.empty()) block.category = snapshot.lastWorkCategory;
    if (!snapshot.lastWorkLabel.empty()) block.label = snapshot.lastWorkLabel;
    if (block.status == BLOCK_IDLE) block.status = BLOCK_PLANNED;
    block.hasActiveRun = true;

    persist(block);
}

/**
 * Natural means the run reached its own end (within the jitter tolerance).
 * A block is DONE on natural completion, an explicit request, or 95% use.
 */
void BlockRecorder::onComplete(const CompletionReport& report) {
    Block& block = blockFor(report.date, report.blockIndex);

    double progress = percentOfSlot(report.secondsUsed);
    bool natural = report.natural ||
                   report.secondsUsed + NATURAL_COMPLETION_TOLERANCE >= report.initialDuration;

    block.usedSeconds = report.secondsUsed;
    block.progress = progress;
    block.segments = report.segments;
    if (!report.category.empty()) block.category = report.category;
    if (!report.label.empty()) block.label = report.label;
    if (natural || report.markComplete || progress >= DONE_PROGRESS_PERCENT) block.status = BLOCK_DONE;
    block.hasActiveRun = false;

    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Block %s/%d: %u s, %.0f%%, natural=%s -> %s", block.date.c_str(),
             block.blockIndex, block.usedSeconds, progress, natural ? "yes" : "no",
             blockStatusToString(block.status));
    logKeyValue("Blocks", logBuf);

    persist(block);
}

// =================================================================================
// SECTION: AUTO-SKIP
// =================================================================================

int BlockRecorder::processAutoSkip(EpochMillis now, int activeIndex) {
    std::string today = BlockCalendar::logicalDate(now, _config.dayStartHour, _config.utcOffsetSeconds);
    int currentIndex = BlockCalendar::indexForInstant(now, _config.utcOffsetSeconds);

    if (today != _date) loadDay(today);

    int changed = 0;
    for (size_t i = 0; i < _blocks.size(); i++) {
        Block& block = _blocks[i];

        if (!BlockCalendar::isBefore(block.blockIndex, currentIndex, _config.dayStartHour)) continue;
        if (block.status == BLOCK_DONE || block.status == BLOCK_SKIPPED) continue;
        if (block.isMuted) continue;

        // Never close the slot a session is still writing to
        if (block.blockIndex == activeIndex) continue;

        bool hasRealUsage = !block.segments.empty() || block.usedSeconds > 0 || block.hasActiveRun;
        block.status = hasRealUsage ? BLOCK_DONE : BLOCK_SKIPPED;
        persist(block);
        changed++;
    }

    if (changed > 0) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Auto-closed %d past blocks before #%d.", changed,
                 BlockCalendar::displayNumber(currentIndex, _config.dayStartHour));
        logKeyValue("Blocks", logBuf);
    }
    return changed;
}
