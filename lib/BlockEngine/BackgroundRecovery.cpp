/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/BackgroundRecovery.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <stdio.h>

#include "BackgroundRecovery.h"
#include "TimeUtils.h"

BackgroundRecovery::BackgroundRecovery(TimerEngine& engine, IBlockHAL& hal)
    : _engine(engine),
      _hal(hal)
{
}

void BackgroundRecovery::logKeyValue(const char* key, const char* value) {
    char tempBuf[LOG_LINE_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void BackgroundRecovery::onSuspend() {
    EngineState state = _engine.getState();
    if (state != RUNNING && state != PAUSED) return;

    logKeyValue("Recovery", "Suspending. Publishing snapshot.");
    _engine.snapshotTick();
}

void BackgroundRecovery::onResume() {
    EngineState state = _engine.getState();
    EpochMillis now = _hal.getEpochMillis();
    EpochMillis endAt = _engine.getEndAt();

    switch (state) {
    case RUNNING:
        if (endAt <= now) {
            char logBuf[96];
            char timeStr[48];
            TimeUtils::formatSeconds((unsigned long)((now - endAt) / 1000), timeStr, sizeof(timeStr));
            snprintf(logBuf, sizeof(logBuf), "Boundary passed %s ago. Completing with full credit.", timeStr);
            logKeyValue("Recovery", logBuf);
            _engine.complete();
        } else {
            logKeyValue("Recovery", "Resuming cadence.");
            _engine.resumeCadence();
        }
        break;

    case PAUSED:
        if (endAt <= now) {
            logKeyValue("Recovery", "Boundary passed while paused.");
            _engine.handlePausedExpiry();
        }
        break;

    case IDLE:
    case PAUSED_EXPIRY:
    case COMPLETED:
    default:
        break;
    }
}

int BackgroundRecovery::recoverFromSnapshot(const RunSnapshot& snapshot) {
    int rc = _engine.restoreSnapshot(snapshot);
    if (rc != 200) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Snapshot discarded (code %d).", rc);
        logKeyValue("Recovery", logBuf);
        return rc;
    }

    onResume();
    return rc;
}
