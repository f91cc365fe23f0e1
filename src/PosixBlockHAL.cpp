/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      src/PosixBlockHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Host adapter for the timer engine. Provides the wall clock, the periodic
 * tick/snapshot cadence, the paused-expiry one-shot and the completion
 * notification slot. The main loop sleeps until nextDeadline() and then
 * consumes whatever became due.
 * =================================================================================
 */
#include <stdio.h>
#include <time.h>
#include <unistd.h>

#include "PosixBlockHAL.h"

PosixBlockHAL::PosixBlockHAL(Logger &logger)
    : _logger(logger), _rng(std::random_device()()), _cadenceArmed(false), _tickMs(1000), _snapshotMs(5000),
      _nextTickAt(0), _nextSnapshotAt(0), _expiryAt(0), _notificationPending(false) {
  _notification.blockIndex = -1;
  _notification.isBreak = false;
  _notification.at = 0;
}

// =================================================================================
// SECTION: CLOCK
// =================================================================================

EpochMillis PosixBlockHAL::getEpochMillis() {
  struct timespec ts;
  if (clock_gettime(CLOCK_REALTIME, &ts) != 0) {
    return (EpochMillis)time(nullptr) * 1000;
  }
  return (EpochMillis)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

uint32_t PosixBlockHAL::getRandom(uint32_t min, uint32_t max) {
  if (max <= min)
    return min;
  std::uniform_int_distribution<uint32_t> dist(min, max);
  return dist(_rng);
}

// =================================================================================
// SECTION: CADENCE & ONE-SHOT
// =================================================================================

void PosixBlockHAL::armCadence(uint32_t tickSeconds, uint32_t snapshotSeconds) {
  EpochMillis now = getEpochMillis();

  _tickMs = (tickSeconds > 0 ? tickSeconds : 1) * 1000;
  _snapshotMs = (snapshotSeconds > 0 ? snapshotSeconds : 1) * 1000;
  _nextTickAt = now + _tickMs;
  _nextSnapshotAt = now + _snapshotMs;
  _cadenceArmed = true;
}

void PosixBlockHAL::disarmCadence() {
  // Single-threaded loop: nothing can fire after this returns
  _cadenceArmed = false;
  _nextTickAt = 0;
  _nextSnapshotAt = 0;
}

void PosixBlockHAL::armPausedExpiryTimer(EpochMillis at) {
  _expiryAt = at;

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Paused expiry armed (+%lld s)", (long long)((at - getEpochMillis()) / 1000));
  logKeyValue("HAL", logBuf);
}

void PosixBlockHAL::disarmPausedExpiryTimer() { _expiryAt = 0; }

bool PosixBlockHAL::consumeTickDue(EpochMillis now) {
  if (!_cadenceArmed || now < _nextTickAt)
    return false;

  // Missed ticks collapse into one. The engine recomputes from the clock.
  _nextTickAt = now + _tickMs;
  return true;
}

bool PosixBlockHAL::consumeSnapshotDue(EpochMillis now) {
  if (!_cadenceArmed || now < _nextSnapshotAt)
    return false;

  _nextSnapshotAt = now + _snapshotMs;
  return true;
}

bool PosixBlockHAL::consumeExpiryDue(EpochMillis now) {
  if (_expiryAt == 0 || now < _expiryAt)
    return false;

  _expiryAt = 0;
  return true;
}

// =================================================================================
// SECTION: NOTIFICATIONS
// =================================================================================

void PosixBlockHAL::scheduleCompletion(EpochMillis at, int blockIndex, bool isBreak) {
  _notification.blockIndex = blockIndex;
  _notification.isBreak = isBreak;
  _notification.at = at;
  _notificationPending = true;
}

void PosixBlockHAL::cancel(int blockIndex) {
  if (_notificationPending && _notification.blockIndex == blockIndex) {
    _notificationPending = false;
  }
}

bool PosixBlockHAL::popDueNotification(EpochMillis now, DueNotification &out) {
  if (!_notificationPending || now < _notification.at)
    return false;

  out = _notification;
  _notificationPending = false;
  return true;
}

EpochMillis PosixBlockHAL::nextDeadline() const {
  EpochMillis next = 0;

  if (_cadenceArmed) {
    next = _nextTickAt;
    if (_nextSnapshotAt < next)
      next = _nextSnapshotAt;
  }
  if (_expiryAt != 0 && (next == 0 || _expiryAt < next))
    next = _expiryAt;
  if (_notificationPending && (next == 0 || _notification.at < next))
    next = _notification.at;

  return next;
}

// =================================================================================
// SECTION: LOGGING
// =================================================================================

void PosixBlockHAL::log(const char *message) { _logger.logMessage(message); }

void PosixBlockHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

void PosixBlockHAL::printStartupDiagnostics() {
  char logBuf[128];

  log(LOG_SEP_MAJOR);
  log("                              HOST DIAGNOSTICS                            ");
  log(LOG_SEP_MAJOR);

  // -------------------------------------------------------------------------
  // SECTION: PROCESS
  // -------------------------------------------------------------------------
  log("[ PROCESS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "PID", (long)getpid());
  log(logBuf);

  struct timespec res;
  if (clock_getres(CLOCK_REALTIME, &res) == 0) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %ld ns", "Clock Resolution", (long)res.tv_nsec);
    log(logBuf);
  }

  time_t nowSec = (time_t)(getEpochMillis() / 1000);
  struct tm utc;
  gmtime_r(&nowSec, &utc);
  char timeBuf[32];
  strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Wall Clock (UTC)", timeBuf);
  log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: TIMERS
  // -------------------------------------------------------------------------
  log("");
  log("[ TIMERS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Cadence", _cadenceArmed ? "ARMED" : "Idle");
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Paused Expiry", _expiryAt != 0 ? "ARMED" : "Idle");
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Notification", _notificationPending ? "Pending" : "None");
  log(logBuf);
}
