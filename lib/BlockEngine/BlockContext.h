/*
 * =================================================================================
 * File:      lib/BlockEngine/BlockContext.h
 * Description: Abstraction layer (HAL) for Clock, Timers, and Logging.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class IBlockHAL {
public:
    virtual ~IBlockHAL() {}

    // --- Clock ---
    // Wall-clock time in milliseconds since the epoch (UTC).
    virtual EpochMillis getEpochMillis() = 0;

    // --- Periodic Cadence ---
    // Starts the 1-second tick and the snapshot callback as one unit.
    // The host calls TimerEngine::tick() and TimerEngine::snapshotTick().
    virtual void armCadence(uint32_t tickSeconds, uint32_t snapshotSeconds) = 0;

    // Cancels both periodic callbacks. Must take effect before the call returns.
    virtual void disarmCadence() = 0;

    // --- One-Shot Timer ---
    // Fires TimerEngine::handlePausedExpiry() at the given absolute instant.
    virtual void armPausedExpiryTimer(EpochMillis at) = 0;
    virtual void disarmPausedExpiryTimer() = 0;

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Utils ---
    virtual uint32_t getRandom(uint32_t min, uint32_t max) = 0;
};
