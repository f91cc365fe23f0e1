/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/TimerEngine.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Core session logic.
 * - Uses 'changeState' for every transition (cadence and one-shot arming).
 * - Splits elapsed time into typed segments via SegmentLedger.
 * - Maps elapsed time to visual fill via VisualFillTracker.
 * - Gates automatic continuation behind CheckInCounter.
 * =================================================================================
 */
#include <assert.h>
#include <stdio.h>

#include "TimerEngine.h"
#include "BlockCalendar.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

TimerEngine::TimerEngine(IBlockHAL& hal,
                         INotificationScheduler& notifier,
                         ISnapshotPublisher& publisher,
                         CheckInCounter& checkIn,
                         const EngineConfig& config)
    : _hal(hal),
      _notifier(notifier),
      _publisher(publisher),
      _checkIn(checkIn),
      _config(config)
{
    _state = IDLE;
    resetSession();
    _checkIn.setThreshold(_config.checkInThreshold);
}

void TimerEngine::subscribe(IBlockEngineListener* listener) {
    if (listener == nullptr) return;
    for (size_t i = 0; i < _listeners.size(); i++) {
        if (_listeners[i] == listener) return;
    }
    _listeners.push_back(listener);
}

void TimerEngine::unsubscribe(IBlockEngineListener* listener) {
    for (size_t i = 0; i < _listeners.size(); i++) {
        if (_listeners[i] == listener) {
            _listeners.erase(_listeners.begin() + i);
            return;
        }
    }
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Validation)
// =================================================================================

void TimerEngine::logKeyValue(const char* key, const char* value) {
    char tempBuf[LOG_LINE_LENGTH];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

/**
 * Sanity limits for the engine configuration.
 * start() is refused while this returns false.
 */
bool TimerEngine::validateConfig(const EngineConfig& config) const {
    if (config.dayStartHour > 23) return false;

    // A check-in after 0 continuations would block every continuation
    if (config.checkInThreshold == 0 || config.checkInThreshold > 12) return false;

    if (config.breakNotifySeconds == 0) return false;
    if (config.snapshotIntervalSeconds == 0) return false;
    if (config.minLabelSegmentSeconds > SLOT_SECONDS) return false;

    // Real-world offsets span UTC-12 to UTC+14
    const int32_t MAX_OFFSET_SEC = 14 * 3600;
    if (config.utcOffsetSeconds > MAX_OFFSET_SEC || config.utcOffsetSeconds < -MAX_OFFSET_SEC) return false;

    return true;
}

void TimerEngine::printStartupDiagnostics() {
    char logBuf[LOG_LINE_LENGTH];
    char timeStr[48];
    EpochMillis now = _hal.getEpochMillis();

    _hal.log("==========================================================================");
    _hal.log("                        BLOCK ENGINE DIAGNOSTICS                          ");
    _hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _hal.log("[ ENGINE STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Current Mode", stateToString(_state));
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u / %u", "Auto Continuations",
             _checkIn.consecutiveAutoContinuations(), _checkIn.threshold());
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: CONFIGURATION STATUS
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ CONFIGURATION STATUS ]");

    bool configValid = validateConfig(_config);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Self-Check", configValid ? "PASS" : "FAIL (INVALID CONFIG)");
    _hal.log(logBuf);

    if (!configValid) {
        _hal.log(" WARNING: Engine will reject session starts until configuration is fixed.");
    }

    snprintf(logBuf, sizeof(logBuf), " %-25s : %02u:00", "Day Start", _config.dayStartHour);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %d s", "UTC Offset", (int)_config.utcOffsetSeconds);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Check-In Threshold", _config.checkInThreshold);
    _hal.log(logBuf);

    TimeUtils::formatSeconds(_config.breakNotifySeconds, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Break Reminder", timeStr);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Snapshot Interval", _config.snapshotIntervalSeconds);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Min Label Segment", _config.minLabelSegmentSeconds);
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: CALENDAR
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ CALENDAR ]");

    int index = BlockCalendar::indexForInstant(now, _config.utcOffsetSeconds);
    std::string date = BlockCalendar::logicalDate(now, _config.dayStartHour, _config.utcOffsetSeconds);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Logical Date", date.c_str());
    _hal.log(logBuf);

    TimeUtils::formatSlotTime(index, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : #%d (index %d, %s)", "Current Slot",
             BlockCalendar::displayNumber(index, _config.dayStartHour), index, timeStr);
    _hal.log(logBuf);

    TimeUtils::formatCountdown(BlockCalendar::remainingSeconds(index, date, now, _config.dayStartHour,
                                                               _config.utcOffsetSeconds),
                               timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Slot Remaining", timeStr);
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: ACTIVE SESSION
    // -------------------------------------------------------------------------
    if (_state == IDLE) return;

    _hal.log("");
    _hal.log("[ ACTIVE SESSION ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Run", _runId.c_str());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s #%d (%s)", "Block", _date.c_str(),
             BlockCalendar::displayNumber(_blockIndex, _config.dayStartHour), kindToString(_mode));
    _hal.log(logBuf);

    TimeUtils::formatSeconds(sessionSecondsUsed(), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Seconds Used", timeStr);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.1f %%", "Visual Fill", currentVisualFill() * 100.0);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u + %u", "Segments (prev + live)",
             (unsigned)_previousSegments.size(), (unsigned)_ledger.segments().size());
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: STATE TRANSITION SYSTEM (The Event Core)
// =================================================================================

bool TimerEngine::isLive(EngineState s) const {
    return (s == RUNNING || s == PAUSED || s == PAUSED_EXPIRY);
}

void TimerEngine::applyCadenceProfile() {
    if (_state == RUNNING) {
        _hal.disarmPausedExpiryTimer();
        _hal.armCadence(1, _config.snapshotIntervalSeconds);
    } else if (_state == PAUSED) {
        _hal.disarmCadence();
        _hal.armPausedExpiryTimer(_endAt);
    } else {
        _hal.disarmCadence();
        _hal.disarmPausedExpiryTimer();
    }
}

/**
 * Centralized State Machine Transition.
 * All state changes MUST go through this function so the periodic cadence is
 * cancelled before any session state is cleared.
 */
void TimerEngine::changeState(EngineState newState) {
    if (_state == newState) return;

    _state = newState;

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), ">>> STATE CHANGE: %s", stateToString(_state));
    logKeyValue("Engine", logBuf);

    applyCadenceProfile();

    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onStateChanged(_state);
    }
}

// =================================================================================
// SECTION: LOGIC HELPERS
// =================================================================================

void TimerEngine::resetSession() {
    _runId.clear();
    _blockIndex = -1;
    _date.clear();
    _mode = SEG_WORK;
    _category.clear();
    _label.clear();
    _lastWorkCategory.clear();
    _lastWorkLabel.clear();

    _legStartedAt = 0;
    _endAt = 0;
    _legInitial = 0;
    _sessionInitial = 0;
    _carriedSeconds = 0;
    _timeLeft = 0;
    _legUsed = 0;

    _previousSegments.clear();
    _ledger.reset(SEG_WORK, "", "");
    _fill.reset();

    _pausedSecondsUsed = 0;
    _frozenFill = 0.0;
    _breakNotifyAt = 0;
}

/**
 * Opens a new leg ending at _endAt.
 * The scale factor uses the sub-second remaining time; the leg duration is
 * that time rounded up to whole seconds.
 */
void TimerEngine::openLeg(EpochMillis now, double previousProportion) {
    EpochMillis remainingMs = _endAt - now;

    _legStartedAt = now;
    _legInitial = (uint32_t)((remainingMs + 999) / 1000);
    _timeLeft = _legInitial;
    _legUsed = 0;
    _pausedSecondsUsed = 0;

    _fill.begin(previousProportion, (double)remainingMs / 1000.0);
    _frozenFill = _fill.previousProportion();
    _ledger.reset(_mode, _category, _label);
}

/**
 * Recomputes timeLeft from the absolute deadline.
 * Leg seconds never move backwards, even if the wall clock does.
 */
void TimerEngine::updateTimeLeft(EpochMillis now) {
    EpochMillis remainingMs = _endAt - now;
    _timeLeft = (remainingMs > 0) ? (uint32_t)((remainingMs + 999) / 1000) : 0;

    uint32_t used = (_timeLeft < _legInitial) ? _legInitial - _timeLeft : 0;
    if (used > _legUsed) _legUsed = used;
}

void TimerEngine::checkBreakNotify(EpochMillis now) {
    if (_mode != SEG_BREAK || _breakNotifyAt == 0) return;
    if (now < _breakNotifyAt) return;

    // A reminder at or past the boundary is superseded by completion
    bool beforeBoundary = (_breakNotifyAt < _endAt);
    _breakNotifyAt = 0;
    if (!beforeBoundary) return;

    logKeyValue("Engine", "Break reminder due.");
    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onBreakNotify();
    }
    scheduleNotification();
}

void TimerEngine::scheduleNotification() {
    if (_mode == SEG_WORK) {
        _notifier.scheduleCompletion(_endAt, _blockIndex, false);
        return;
    }

    EpochMillis at = (_breakNotifyAt != 0 && _breakNotifyAt < _endAt) ? _breakNotifyAt : _endAt;
    _notifier.scheduleCompletion(at, _blockIndex, true);
}

void TimerEngine::publishSnapshot() {
    RunSnapshot snapshot = buildSnapshot();
    _publisher.publish(snapshot);
    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onSnapshot(snapshot);
    }
}

void TimerEngine::emitBoundary(bool created) {
    if (!created || _ledger.segments().empty()) return;

    Segment segment = _ledger.segments().back();

    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Segment closed: %s %u s @ %u", kindToString(segment.kind),
             segment.seconds, segment.startOffset);
    logKeyValue("Ledger", logBuf);

    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onSegmentBoundary(segment);
    }
}

/**
 * Accounting checks. A failure here is a bug in this file, so it is logged
 * and then asserted.
 */
void TimerEngine::verifyInvariants() {
    char logBuf[LOG_LINE_LENGTH];
    uint32_t openStart = _ledger.currentSegmentStart();

    if (openStart > _legUsed) {
        snprintf(logBuf, sizeof(logBuf), "Open segment starts at %u, after elapsed %u", openStart, _legUsed);
        logKeyValue("INVARIANT", logBuf);
        assert(openStart <= _legUsed);
        return;
    }

    if (_legUsed > _legInitial) {
        snprintf(logBuf, sizeof(logBuf), "Leg used %u s exceeds leg duration %u s", _legUsed, _legInitial);
        logKeyValue("INVARIANT", logBuf);
        assert(_legUsed <= _legInitial);
    }

    uint32_t accounted = _ledger.totalSeconds(_legUsed);
    if (accounted != _legUsed) {
        snprintf(logBuf, sizeof(logBuf), "Segments sum %u s != leg used %u s", accounted, _legUsed);
        logKeyValue("INVARIANT", logBuf);
        assert(accounted == _legUsed);
    }

    // One second of rounding is allowed before the clamp
    double raw = _fill.rawFill(_legUsed);
    if (raw > 1.0 + _fill.scaleFactor() + 1e-9) {
        snprintf(logBuf, sizeof(logBuf), "Visual fill %.6f exceeds 1.0", raw);
        logKeyValue("INVARIANT", logBuf);
        assert(raw <= 1.0 + _fill.scaleFactor() + 1e-9);
    }
}

SegmentList TimerEngine::combinedSegments() const {
    SegmentList all = _previousSegments;
    const SegmentList& live = _ledger.segments();
    all.insert(all.end(), live.begin(), live.end());
    return all;
}

uint32_t TimerEngine::sessionSecondsUsed() const {
    switch (_state) {
    case IDLE:
        return 0;
    case COMPLETED:
        return _sessionInitial;
    default:
        return _carriedSeconds + _legUsed;
    }
}

// Share of the session's own duration used so far; independent of the fill bar.
double TimerEngine::sessionProgressPercent() const {
    if (_sessionInitial == 0) return 0.0;
    double percent = (double)sessionSecondsUsed() * 100.0 / (double)_sessionInitial;
    return (percent > 100.0) ? 100.0 : percent;
}

CompletionReport TimerEngine::buildReport(bool natural, bool markComplete) const {
    CompletionReport report;
    report.blockIndex = _blockIndex;
    report.date = _date;
    report.isBreak = (_mode == SEG_BREAK);
    report.natural = natural;
    report.markComplete = markComplete;
    report.secondsUsed = natural ? _sessionInitial : _carriedSeconds + _legUsed;
    report.initialDuration = _sessionInitial;
    report.segments = combinedSegments();
    report.visualFill = natural ? 1.0 : currentVisualFill();
    report.completedAt = 0;
    report.category = _lastWorkCategory;
    report.label = _lastWorkLabel;
    return report;
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

/**
 * Called 1x/sec while RUNNING.
 */
void TimerEngine::tick() {
    if (_state != RUNNING) return;

    EpochMillis now = _hal.getEpochMillis();
    updateTimeLeft(now);
    verifyInvariants();

    double progress = sessionProgressPercent();
    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onTick(_timeLeft, progress);
    }

    checkBreakNotify(now);

    if (_timeLeft == 0) complete();
}

void TimerEngine::snapshotTick() {
    if (_state == RUNNING) {
        updateTimeLeft(_hal.getEpochMillis());
        if (_timeLeft == 0) {
            complete();
            return;
        }
        publishSnapshot();
    } else if (_state == PAUSED) {
        publishSnapshot();
    }
}

void TimerEngine::handlePausedExpiry() {
    if (_state != PAUSED) return;

    // Spurious wake-up before the boundary
    if (_hal.getEpochMillis() < _endAt) return;

    enterPausedExpiry();
}

void TimerEngine::enterPausedExpiry() {
    changeState(PAUSED_EXPIRY);
    logKeyValue("Engine", "Slot ended while paused. Awaiting decision.");

    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onPausedExpiry(_blockIndex, _date);
    }
}

// =================================================================================
// SECTION: ACTIONS & TRANSITIONS
// =================================================================================

/**
 * Shared start path for start(), continueSession() and autoContinue().
 * Only the slot containing "now" can be started.
 */
int TimerEngine::beginSession(const StartRequest& request) {
    EpochMillis now = _hal.getEpochMillis();
    EpochMillis slotStart = 0;
    EpochMillis slotEnd = 0;

    if (request.blockIndex < 0 || request.blockIndex >= SLOTS_PER_DAY ||
        !BlockCalendar::slotBounds(request.blockIndex, request.date, _config.dayStartHour,
                                   _config.utcOffsetSeconds, slotStart, slotEnd)) {
        logKeyValue("Engine", "Rejected: Malformed block index or date.");
        return 400;
    }

    int currentIndex = BlockCalendar::indexForInstant(now, _config.utcOffsetSeconds);
    std::string currentDate = BlockCalendar::logicalDate(now, _config.dayStartHour, _config.utcOffsetSeconds);
    if (request.blockIndex != currentIndex || request.date != currentDate) {
        char logBuf[96];
        snprintf(logBuf, sizeof(logBuf), "Rejected: Block %s/%d is not the current slot (%s/%d).",
                 request.date.c_str(), request.blockIndex, currentDate.c_str(), currentIndex);
        logKeyValue("Engine", logBuf);
        return 412;
    }

    if (slotEnd - now <= 0) {
        logKeyValue("Engine", "Rejected: Slot has no real time left.");
        return 412;
    }

    double previousFill = request.hasVisualFill ? request.existingVisualFill
                                                : VisualFillTracker::baselineProportion(request.existingSegments);
    if (request.mode == SEG_WORK && previousFill >= 1.0) {
        logKeyValue("Engine", "Rejected: No visual room left in this slot.");
        return 412;
    }

    if (_state == COMPLETED) {
        logKeyValue("Engine", "Dismissing completed session.");
    }
    resetSession();

    _blockIndex = request.blockIndex;
    _date = request.date;
    _mode = request.mode;
    if (_mode == SEG_WORK) {
        _category = request.category;
        _label = request.label;
    }
    _lastWorkCategory = request.category;
    _lastWorkLabel = request.label;
    _previousSegments = request.existingSegments;
    _endAt = slotEnd;

    openLeg(now, previousFill);
    _sessionInitial = _legInitial;

    char idBuf[40];
    snprintf(idBuf, sizeof(idBuf), "%lld-%04x", (long long)now, _hal.getRandom(0, 0xFFFF));
    _runId = idBuf;

    if (_mode == SEG_BREAK) {
        _breakNotifyAt = now + (EpochMillis)_config.breakNotifySeconds * 1000;
    }

    char logBuf[LOG_LINE_LENGTH];
    char timeStr[16];
    TimeUtils::formatCountdown(_legInitial, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Start %s #%d (%s): %s left, prior fill %.3f, scale %.6f",
             _date.c_str(), BlockCalendar::displayNumber(_blockIndex, _config.dayStartHour),
             kindToString(_mode), timeStr, _fill.previousProportion(), _fill.scaleFactor());
    logKeyValue("Engine", logBuf);

    changeState(RUNNING);
    scheduleNotification();
    publishSnapshot();

    return 200;
}

int TimerEngine::start(const StartRequest& request) {
    if (isLive(_state)) {
        logKeyValue("Engine", "Rejected: Start while a session is active.");
        return 409;
    }

    if (!validateConfig(_config)) {
        logKeyValue("Engine", "Start Failed: Invalid engine configuration.");
        return 400;
    }

    int rc = beginSession(request);
    if (rc == 200) _checkIn.reset();
    return rc;
}

/**
 * Explicit "keep going" from the user. Closes a session stuck in
 * PAUSED_EXPIRY (crediting only the time worked) before starting.
 */
int TimerEngine::continueSession(const StartRequest& request) {
    if (_state == RUNNING || _state == PAUSED) {
        logKeyValue("Engine", "Rejected: Continue while a session is running.");
        return 409;
    }

    if (!validateConfig(_config)) {
        logKeyValue("Engine", "Continue Failed: Invalid engine configuration.");
        return 400;
    }

    if (_state == PAUSED_EXPIRY) stop(false);

    int rc = beginSession(request);
    if (rc == 200) _checkIn.reset();
    return rc;
}

/**
 * Fully automatic continuation into the slot containing "now", in work mode
 * with the preserved work context.
 */
int TimerEngine::autoContinue(const SegmentList& existingSegments, bool hasVisualFill, double existingVisualFill) {
    if (_state != COMPLETED) {
        logKeyValue("Engine", "Rejected: Auto-continue without a completed session.");
        return 409;
    }

    if (!_checkIn.allowsAutoContinuation()) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Check-in required (%u/%u auto continuations).",
                 _checkIn.consecutiveAutoContinuations(), _checkIn.threshold());
        logKeyValue("Engine", logBuf);

        for (size_t i = 0; i < _listeners.size(); i++) {
            _listeners[i]->onCheckInRequired();
        }
        return 423;
    }

    if (!validateConfig(_config)) {
        logKeyValue("Engine", "Continue Failed: Invalid engine configuration.");
        return 400;
    }

    EpochMillis now = _hal.getEpochMillis();
    StartRequest request;
    request.blockIndex = BlockCalendar::indexForInstant(now, _config.utcOffsetSeconds);
    request.date = BlockCalendar::logicalDate(now, _config.dayStartHour, _config.utcOffsetSeconds);
    request.mode = SEG_WORK;
    request.category = _lastWorkCategory;
    request.label = _lastWorkLabel;
    request.existingSegments = existingSegments;
    request.hasVisualFill = hasVisualFill;
    request.existingVisualFill = existingVisualFill;

    int rc = beginSession(request);
    if (rc == 200) {
        _checkIn.recordAutoContinuation();

        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Auto continuation %u/%u", _checkIn.consecutiveAutoContinuations(),
                 _checkIn.threshold());
        logKeyValue("Engine", logBuf);
    }
    return rc;
}

int TimerEngine::switchMode(SegmentKind newMode) {
    if (_state != RUNNING) {
        logKeyValue("Engine", "Rejected: Mode switch while not running.");
        return 409;
    }

    _checkIn.reset();
    if (newMode == _mode) return 200;

    EpochMillis now = _hal.getEpochMillis();
    updateTimeLeft(now);
    if (_timeLeft == 0) {
        complete();
        return 412;
    }

    bool created = false;
    if (newMode == SEG_BREAK) {
        // Work context is already mirrored in _lastWork*
        created = _ledger.splitAt(_legUsed, SEG_BREAK, "", "");
        _category.clear();
        _label.clear();
        _breakNotifyAt = now + (EpochMillis)_config.breakNotifySeconds * 1000;
    } else {
        _category = _lastWorkCategory;
        _label = _lastWorkLabel;
        created = _ledger.splitAt(_legUsed, SEG_WORK, _category, _label);
        _breakNotifyAt = 0;
    }
    _mode = newMode;

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Switched to %s at %u s", kindToString(_mode), _legUsed);
    logKeyValue("Engine", logBuf);

    emitBoundary(created);
    scheduleNotification();
    publishSnapshot();
    return 200;
}

int TimerEngine::updateCategory(const std::string& category, const std::string& label) {
    if (_state != RUNNING && _state != PAUSED) {
        logKeyValue("Engine", "Rejected: Category change without a session.");
        return 409;
    }

    _checkIn.reset();

    _lastWorkCategory = category;
    _lastWorkLabel = label;

    // During a break only the preserved work context changes
    if (_mode == SEG_BREAK) {
        logKeyValue("Engine", "Work context updated during break.");
        publishSnapshot();
        return 200;
    }

    if (_state == RUNNING) updateTimeLeft(_hal.getEpochMillis());

    bool created = _ledger.retag(_legUsed, category, label, _config.minLabelSegmentSeconds);
    _category = category;
    _label = label;

    emitBoundary(created);
    publishSnapshot();
    return 200;
}

int TimerEngine::snoozeBreakNotify(uint32_t seconds) {
    if (_state != RUNNING || _mode != SEG_BREAK) {
        logKeyValue("Engine", "Rejected: Snooze outside of a running break.");
        return 409;
    }

    _checkIn.reset();
    if (seconds == 0) seconds = _config.breakNotifySeconds;

    _breakNotifyAt = _hal.getEpochMillis() + (EpochMillis)seconds * 1000;
    scheduleNotification();

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Break reminder snoozed %u s", seconds);
    logKeyValue("Engine", logBuf);
    return 200;
}

int TimerEngine::pause() {
    if (_state != RUNNING) {
        logKeyValue("Engine", "Rejected: Pause while not running.");
        return 409;
    }

    updateTimeLeft(_hal.getEpochMillis());
    if (_timeLeft == 0) {
        complete();
        return 412;
    }

    _checkIn.reset();

    bool created = _ledger.finalize(_legUsed);
    _pausedSecondsUsed = _legUsed;
    _frozenFill = _fill.currentFill(_legUsed);
    emitBoundary(created);

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Paused at %u s, fill %.4f", _pausedSecondsUsed, _frozenFill);
    logKeyValue("Engine", logBuf);

    changeState(PAUSED);
    _notifier.cancel(_blockIndex);
    publishSnapshot();
    return 200;
}

/**
 * Opens a new leg. Paused wall-clock time is never credited; the fill
 * continues from exactly the value frozen at pause.
 */
int TimerEngine::resume() {
    if (_state != PAUSED) {
        logKeyValue("Engine", "Rejected: Resume while not paused.");
        return 409;
    }

    _checkIn.reset();

    EpochMillis now = _hal.getEpochMillis();
    if (_endAt <= now) {
        enterPausedExpiry();
        return 412;
    }

    SegmentList finished = _ledger.release();
    _previousSegments.insert(_previousSegments.end(), finished.begin(), finished.end());
    _carriedSeconds += _pausedSecondsUsed;

    double fillAtPause = _frozenFill;
    openLeg(now, fillAtPause);

    char logBuf[96];
    char timeStr[16];
    TimeUtils::formatCountdown(_legInitial, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Resumed: %s left, fill %.4f, scale %.6f", timeStr, fillAtPause,
             _fill.scaleFactor());
    logKeyValue("Engine", logBuf);

    changeState(RUNNING);
    scheduleNotification();
    publishSnapshot();
    return 200;
}

/**
 * Natural completion: the slot boundary was reached while running.
 * Always credits the full session duration and a fill of exactly 1.0.
 */
void TimerEngine::complete() {
    if (_state != RUNNING) return;

    _timeLeft = 0;
    _legUsed = _legInitial;
    bool created = _ledger.finalize(_legUsed);
    emitBoundary(created);

    _frozenFill = 1.0;
    _breakNotifyAt = 0;
    CompletionReport report = buildReport(true, false);
    report.completedAt = _endAt;

    changeState(COMPLETED);
    _publisher.clear();

    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Completed %s #%d: %u s credited, %u segments", _date.c_str(),
             BlockCalendar::displayNumber(_blockIndex, _config.dayStartHour), report.secondsUsed,
             (unsigned)report.segments.size());
    logKeyValue("Engine", logBuf);

    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onComplete(report);
    }
}

int TimerEngine::stop(bool markComplete) {
    if (!isLive(_state)) {
        logKeyValue("Engine", "Rejected: Stop without a session.");
        return 409;
    }

    if (_state == RUNNING) {
        updateTimeLeft(_hal.getEpochMillis());
        if (_timeLeft == 0) {
            complete();
            return 200;
        }
        bool created = _ledger.finalize(_legUsed);
        emitBoundary(created);
    }

    _checkIn.reset();

    CompletionReport report = buildReport(false, markComplete);
    report.completedAt = _hal.getEpochMillis();
    int blockIndex = _blockIndex;

    // Cancellation first, so no stale tick can see a half-cleared session
    changeState(IDLE);
    _notifier.cancel(blockIndex);
    _publisher.clear();
    resetSession();

    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Stopped: %u s used, fill %.4f%s", report.secondsUsed, report.visualFill,
             markComplete ? " (mark done)" : "");
    logKeyValue("Engine", logBuf);

    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onComplete(report);
    }
    return 200;
}

int TimerEngine::dismiss() {
    if (_state != COMPLETED && _state != PAUSED_EXPIRY) {
        logKeyValue("Engine", "Rejected: Nothing to dismiss.");
        return 409;
    }

    // An expired pause still owes its worked time to the block
    if (_state == PAUSED_EXPIRY) {
        logKeyValue("Engine", "Dismissing expired pause with worked time.");
        return stop(false);
    }

    changeState(IDLE);
    _publisher.clear();
    resetSession();
    _checkIn.reset();
    return 200;
}

void TimerEngine::acknowledgeCheckIn() {
    if (_checkIn.consecutiveAutoContinuations() > 0) {
        logKeyValue("Engine", "Check-in acknowledged.");
    }
    _checkIn.reset();
}

// =================================================================================
// SECTION: RECOVERY
// =================================================================================

void TimerEngine::resumeCadence() {
    if (_state != RUNNING) return;

    EpochMillis now = _hal.getEpochMillis();
    updateTimeLeft(now);
    if (_timeLeft == 0) {
        complete();
        return;
    }

    _hal.armCadence(1, _config.snapshotIntervalSeconds);
    scheduleNotification();
    checkBreakNotify(now);

    double progress = sessionProgressPercent();
    for (size_t i = 0; i < _listeners.size(); i++) {
        _listeners[i]->onTick(_timeLeft, progress);
    }
    publishSnapshot();
}

/**
 * Rebuilds a session from a persisted snapshot. The open tail of the live
 * segment list is re-derived from currentSegmentStart, not stored.
 * Reconciliation against the clock is left to the caller.
 */
int TimerEngine::restoreSnapshot(const RunSnapshot& snapshot) {
    if (_state != IDLE) {
        logKeyValue("Recovery", "Rejected: Restore while a session exists.");
        return 409;
    }

    int64_t days = 0;
    if (snapshot.blockIndex < 0 || snapshot.blockIndex >= SLOTS_PER_DAY ||
        !BlockCalendar::parseDate(snapshot.date, days) ||
        snapshot.currentSegmentStart > snapshot.initialDurationSeconds ||
        sumSeconds(snapshot.segments) > snapshot.initialDurationSeconds ||
        snapshot.pausedSecondsUsed > snapshot.initialDurationSeconds ||
        snapshot.endAt <= snapshot.startedAt) {
        logKeyValue("Recovery", "Rejected: Snapshot is inconsistent.");
        return 400;
    }

    resetSession();

    _runId = snapshot.runId;
    _blockIndex = snapshot.blockIndex;
    _date = snapshot.date;
    _mode = snapshot.currentMode;
    _category = (_mode == SEG_WORK) ? snapshot.currentCategory : std::string();
    _label = (_mode == SEG_WORK) ? snapshot.currentLabel : std::string();
    _lastWorkCategory = snapshot.lastWorkCategory;
    _lastWorkLabel = snapshot.lastWorkLabel;

    _legStartedAt = snapshot.startedAt;
    _endAt = snapshot.endAt;
    _legInitial = snapshot.initialDurationSeconds;
    _sessionInitial = (snapshot.sessionDurationSeconds > 0) ? snapshot.sessionDurationSeconds : _legInitial;
    _carriedSeconds = snapshot.carriedSeconds;
    _previousSegments = snapshot.previousSegments;
    _breakNotifyAt = snapshot.breakNotifyAt;

    // Drop the synthesized tail; it is rebuilt from currentSegmentStart
    SegmentList finalized;
    for (size_t i = 0; i < snapshot.segments.size(); i++) {
        if (snapshot.segments[i].startOffset < snapshot.currentSegmentStart) {
            finalized.push_back(snapshot.segments[i]);
        }
    }
    _ledger.restore(finalized, snapshot.currentSegmentStart, _mode, _category, _label);
    _fill.restore(snapshot.previousVisualProportion, snapshot.scaleFactor);

    _legUsed = sumSeconds(snapshot.segments);
    if (_legUsed < snapshot.currentSegmentStart) _legUsed = snapshot.currentSegmentStart;

    char logBuf[LOG_LINE_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Restored run %s (%s #%d, %s)", _runId.c_str(), _date.c_str(),
             BlockCalendar::displayNumber(_blockIndex, _config.dayStartHour), snapshot.paused ? "paused" : "running");
    logKeyValue("Recovery", logBuf);

    if (snapshot.paused) {
        if (snapshot.pausedSecondsUsed > _legUsed) _legUsed = snapshot.pausedSecondsUsed;
        _pausedSecondsUsed = _legUsed;
        _timeLeft = _legInitial - _legUsed;
        _frozenFill = _fill.currentFill(_legUsed);
        changeState(PAUSED);
    } else {
        _timeLeft = _legInitial - _legUsed;
        _frozenFill = _fill.previousProportion();
        changeState(RUNNING);
    }
    return 200;
}

// =================================================================================
// SECTION: READ-ONLY VIEWS
// =================================================================================

double TimerEngine::currentVisualFill() const {
    switch (_state) {
    case RUNNING:
        return _fill.currentFill(_legUsed);
    case PAUSED:
    case PAUSED_EXPIRY:
    case COMPLETED:
        return _frozenFill;
    default:
        return 0.0;
    }
}

EngineStatus TimerEngine::getStatus() const {
    EngineStatus status;
    status.state = _state;
    status.blockIndex = _blockIndex;
    status.date = _date;
    status.mode = _mode;
    status.timeLeft = _timeLeft;
    status.secondsUsed = sessionSecondsUsed();
    status.initialDuration = _sessionInitial;
    status.visualFill = currentVisualFill();
    status.progressPercent = sessionProgressPercent();
    status.scaleFactor = _fill.scaleFactor();
    status.category = _category;
    status.label = _label;
    status.endAt = _endAt;
    status.autoContinuations = _checkIn.consecutiveAutoContinuations();
    return status;
}

RunSnapshot TimerEngine::buildSnapshot() const {
    RunSnapshot snapshot;
    snapshot.runId = _runId;
    snapshot.blockIndex = _blockIndex;
    snapshot.date = _date;
    snapshot.startedAt = _legStartedAt;
    snapshot.endAt = _endAt;
    snapshot.initialDurationSeconds = _legInitial;
    snapshot.sessionDurationSeconds = _sessionInitial;
    snapshot.carriedSeconds = _carriedSeconds;
    snapshot.scaleFactor = _fill.scaleFactor();
    snapshot.previousVisualProportion = _fill.previousProportion();
    snapshot.previousSegments = _previousSegments;
    snapshot.segments = _ledger.liveView(_legUsed);
    snapshot.currentSegmentStart = _ledger.currentSegmentStart();
    snapshot.currentMode = _mode;
    snapshot.currentCategory = _category;
    snapshot.currentLabel = _label;
    snapshot.lastWorkCategory = _lastWorkCategory;
    snapshot.lastWorkLabel = _lastWorkLabel;
    snapshot.paused = (_state == PAUSED || _state == PAUSED_EXPIRY);
    snapshot.pausedSecondsUsed = _pausedSecondsUsed;
    snapshot.breakNotifyAt = _breakNotifyAt;
    return snapshot;
}
