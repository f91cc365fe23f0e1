/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/TimerEngine.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the TimerEngine class, the state machine that owns the single
 * active block session.
 *
 * NOTES:
 * 1. Decoupled from the host via IBlockHAL (clock, cadence, logging).
 * 2. Output flows through collaborators (notifications, snapshots) and
 *    IBlockEngineListener observers. Nobody gets a mutable handle.
 * 3. All transitions run through changeState(), which arms/disarms the
 *    periodic cadence and the paused-expiry one-shot.
 * 4. Every deadline is an absolute epoch instant. Nothing counts down.
 * =================================================================================
 */
#pragma once
#include <vector>

#include "Types.h"
#include "BlockContext.h"
#include "BlockCollaborators.h"
#include "BlockEvents.h"
#include "SegmentLedger.h"
#include "VisualFill.h"
#include "CheckInCounter.h"

class TimerEngine {
public:
    TimerEngine(IBlockHAL& hal,
                INotificationScheduler& notifier,
                ISnapshotPublisher& publisher,
                CheckInCounter& checkIn,
                const EngineConfig& config);

    // --- Observers ---
    void subscribe(IBlockEngineListener* listener);
    void unsubscribe(IBlockEngineListener* listener);

    // --- Cadence Callbacks (driven by the host) ---
    void tick();
    void snapshotTick();
    void handlePausedExpiry();

    // --- Commands ---
    int start(const StartRequest& request);
    int continueSession(const StartRequest& request);
    int autoContinue(const SegmentList& existingSegments, bool hasVisualFill, double existingVisualFill);
    int switchMode(SegmentKind newMode);
    int updateCategory(const std::string& category, const std::string& label);
    int snoozeBreakNotify(uint32_t seconds);
    int pause();
    int resume();
    int stop(bool markComplete);
    int dismiss();
    void acknowledgeCheckIn();

    // --- Recovery ---
    // Natural completion with full credit. Only acts while RUNNING.
    void complete();
    // Recomputes timeLeft from the clock, re-arms the cadence and fires an overdue break reminder.
    void resumeCadence();
    // Rebuilds a RUNNING or PAUSED session from a persisted snapshot. Only from IDLE.
    int restoreSnapshot(const RunSnapshot& snapshot);

    // --- State Accessors (Read-Only) ---
    EngineState getState() const { return _state; }
    EngineStatus getStatus() const;
    RunSnapshot buildSnapshot() const;
    double currentVisualFill() const;
    EpochMillis getEndAt() const { return _endAt; }
    int getBlockIndex() const { return _blockIndex; }
    const EngineConfig& getConfig() const { return _config; }

    void printStartupDiagnostics();
    bool validateConfig(const EngineConfig& config) const;

private:
    // --- Dependencies ---
    IBlockHAL& _hal;
    INotificationScheduler& _notifier;
    ISnapshotPublisher& _publisher;
    CheckInCounter& _checkIn;

    // --- Configuration ---
    EngineConfig _config;

    // --- Observers ---
    std::vector<IBlockEngineListener*> _listeners;

    // --- Dynamic State ---
    EngineState _state;

    std::string _runId;
    int _blockIndex;
    std::string _date;
    SegmentKind _mode;
    std::string _category;
    std::string _label;
    std::string _lastWorkCategory;
    std::string _lastWorkLabel;

    // Leg timing. A resume opens a new leg; earlier legs live in _carriedSeconds.
    EpochMillis _legStartedAt;
    EpochMillis _endAt;
    uint32_t _legInitial;
    uint32_t _sessionInitial;
    uint32_t _carriedSeconds;
    uint32_t _timeLeft;
    uint32_t _legUsed;

    SegmentList _previousSegments;
    SegmentLedger _ledger;
    VisualFillTracker _fill;

    // Frozen values while PAUSED, PAUSED_EXPIRY and COMPLETED
    uint32_t _pausedSecondsUsed;
    double _frozenFill;

    EpochMillis _breakNotifyAt;

    // =========================================================================
    // SECTION: STATE TRANSITION SYSTEM
    // =========================================================================

    void changeState(EngineState newState);
    void applyCadenceProfile();
    bool isLive(EngineState s) const;

    // =========================================================================
    // SECTION: LOGIC HELPERS
    // =========================================================================

    int beginSession(const StartRequest& request);
    void openLeg(EpochMillis now, double previousProportion);
    void resetSession();
    void enterPausedExpiry();

    void updateTimeLeft(EpochMillis now);
    void checkBreakNotify(EpochMillis now);
    void scheduleNotification();
    void publishSnapshot();
    void emitBoundary(bool created);
    void verifyInvariants();

    CompletionReport buildReport(bool natural, bool markComplete) const;
    SegmentList combinedSegments() const;
    uint32_t sessionSecondsUsed() const;
    double sessionProgressPercent() const;

    void logKeyValue(const char* key, const char* value);
};
