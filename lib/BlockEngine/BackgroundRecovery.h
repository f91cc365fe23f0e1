/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/BackgroundRecovery.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Reconciles the engine after an unobserved real-time gap. Host suspension
 * is only ever detected after the fact, so everything here compares the
 * clock against the engine's absolute deadlines.
 * =================================================================================
 */
#pragma once
#include "BlockCollaborators.h"
#include "TimerEngine.h"

class BackgroundRecovery : public ILifecycleSignal {
public:
    BackgroundRecovery(TimerEngine& engine, IBlockHAL& hal);

    // Persist the latest state before the host may be frozen.
    void onSuspend() override;

    // Boundary passed while unobserved: full-credit completion (running) or
    // PAUSED_EXPIRY (paused). Otherwise the cadence is resumed.
    void onResume() override;

    /**
     * Rebuilds a session after full process loss and reconciles it exactly
     * like a resume from suspension.
     * @return the engine's restore status code (200 on success).
     */
    int recoverFromSnapshot(const RunSnapshot& snapshot);

private:
    TimerEngine& _engine;
    IBlockHAL& _hal;

    void logKeyValue(const char* key, const char* value);
};
