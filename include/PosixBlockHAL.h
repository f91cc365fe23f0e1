/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      include/PosixBlockHAL.h
 * Description: POSIX implementation of IBlockHAL and INotificationScheduler.
 * Timers are absolute deadlines polled by the main loop, never signals.
 * =================================================================================
 */
#pragma once

#include <random>
#include <stdint.h>

#include "BlockCollaborators.h"
#include "BlockContext.h"
#include "Logger.h"
#include "Types.h"

// A completion notification that became due while the loop was polling.
struct DueNotification {
  int blockIndex;
  bool isBreak;
  EpochMillis at;
};

class PosixBlockHAL : public IBlockHAL, public INotificationScheduler {
public:
  explicit PosixBlockHAL(Logger &logger);

  // --- IBlockHAL ---
  EpochMillis getEpochMillis() override;
  void armCadence(uint32_t tickSeconds, uint32_t snapshotSeconds) override;
  void disarmCadence() override;
  void armPausedExpiryTimer(EpochMillis at) override;
  void disarmPausedExpiryTimer() override;
  void log(const char *message) override;
  uint32_t getRandom(uint32_t min, uint32_t max) override;

  // --- INotificationScheduler ---
  void scheduleCompletion(EpochMillis at, int blockIndex, bool isBreak) override;
  void cancel(int blockIndex) override;

  // --- Loop Polling ---
  // Each returns true at most once per elapsed deadline and re-arms periodic ones.
  bool consumeTickDue(EpochMillis now);
  bool consumeSnapshotDue(EpochMillis now);
  bool consumeExpiryDue(EpochMillis now);
  bool popDueNotification(EpochMillis now, DueNotification &out);

  // Earliest armed deadline, or 0 when nothing is armed.
  EpochMillis nextDeadline() const;

  void logKeyValue(const char *key, const char *value);
  void printStartupDiagnostics();

private:
  Logger &_logger;
  std::mt19937 _rng;

  // --- Cadence ---
  bool _cadenceArmed;
  uint32_t _tickMs;
  uint32_t _snapshotMs;
  EpochMillis _nextTickAt;
  EpochMillis _nextSnapshotAt;

  // --- One-Shot ---
  EpochMillis _expiryAt; // 0 when disarmed

  // --- Notification ---
  bool _notificationPending;
  DueNotification _notification;
};
