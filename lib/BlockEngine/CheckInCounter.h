/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/CheckInCounter.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Counts consecutive fully-automatic continuations and trips a gate that
 * requires an explicit acknowledgement once the threshold is hit.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class CheckInCounter {
public:
    explicit CheckInCounter(uint32_t threshold);

    // True if one more automatic continuation may happen.
    bool allowsAutoContinuation() const;

    // Called only for continuations with no user action in between.
    void recordAutoContinuation();

    // Any explicit user action.
    void reset();

    void setThreshold(uint32_t threshold);

    uint32_t consecutiveAutoContinuations() const { return _count; }
    uint32_t threshold() const { return _threshold; }
    bool isCheckInRequired() const { return !allowsAutoContinuation(); }

private:
    uint32_t _count;
    uint32_t _threshold;
};
