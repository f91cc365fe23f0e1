/*
 * =================================================================================
 * File:      lib/BlockEngine/BlockEvents.h
 * Description: Observer interface for engine output. Listeners receive copies
 * or const references only; they never get a handle into engine state.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class IBlockEngineListener {
public:
    virtual ~IBlockEngineListener() {}

    virtual void onTick(uint32_t timeLeft, double progressPercent) {}
    virtual void onSegmentBoundary(const Segment& segment) {}
    virtual void onBreakNotify() {}
    virtual void onSnapshot(const RunSnapshot& snapshot) {}
    virtual void onComplete(const CompletionReport& report) {}
    virtual void onCheckInRequired() {}
    virtual void onPausedExpiry(int blockIndex, const std::string& date) {}
    virtual void onStateChanged(EngineState state) {}
};
