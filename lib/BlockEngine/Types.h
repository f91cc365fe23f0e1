/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/Types.h
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

// Milliseconds since the Unix epoch (UTC). Every deadline is stored this way.
typedef int64_t EpochMillis;

// --- Enums ---
enum EngineState : uint8_t { IDLE, RUNNING, PAUSED, PAUSED_EXPIRY, COMPLETED };
enum SegmentKind : uint8_t { SEG_WORK, SEG_BREAK };
enum BlockStatus : uint8_t { BLOCK_IDLE, BLOCK_PLANNED, BLOCK_DONE, BLOCK_SKIPPED };

// --- Constants ---

// Calendar
#define SLOT_SECONDS 1200
#define SLOTS_PER_DAY 72
#define SLOTS_PER_HOUR 3
#define SECONDS_PER_DAY 86400

// Accounting
#define BASELINE_SCALE_FACTOR (1.0 / 1200.0)
#define NATURAL_COMPLETION_TOLERANCE 5
#define DONE_PROGRESS_PERCENT 95.0

// Logging
#define LOG_LINE_LENGTH 150

// --- Configuration Structs ---
struct EngineConfig {
  uint32_t dayStartHour;            // Hour that display slot "1" starts at
  int32_t utcOffsetSeconds;         // Fixed local offset used for slot arithmetic
  uint32_t checkInThreshold;        // Auto-continuations allowed before a check-in
  uint32_t breakNotifySeconds;      // Mid-slot break reminder delay
  uint32_t snapshotIntervalSeconds; // Snapshot cadence
  uint32_t minLabelSegmentSeconds;  // Label-only boundary floor
};

// --- Data Structs ---

// Category/label are empty strings when unset. Break segments never carry them.
struct Segment {
  SegmentKind kind;
  uint32_t seconds;
  std::string category;
  std::string label;
  uint32_t startOffset;
};

typedef std::vector<Segment> SegmentList;

struct StartRequest {
  int blockIndex;
  std::string date; // Logical date, "YYYY-MM-DD"
  SegmentKind mode;
  std::string category;
  std::string label;
  SegmentList existingSegments;
  bool hasVisualFill;
  double existingVisualFill;
};

/**
 * Persistable projection of the active session.
 * startedAt / initialDurationSeconds describe the current leg (a resume opens a
 * new leg); carriedSeconds holds the seconds accounted in earlier legs.
 */
struct RunSnapshot {
  std::string runId;
  int blockIndex;
  std::string date;
  EpochMillis startedAt;
  EpochMillis endAt;
  uint32_t initialDurationSeconds;
  uint32_t sessionDurationSeconds;
  uint32_t carriedSeconds;
  double scaleFactor;
  double previousVisualProportion;
  SegmentList previousSegments;
  SegmentList segments; // Live segments including the in-progress tail
  uint32_t currentSegmentStart;
  SegmentKind currentMode;
  std::string currentCategory;
  std::string currentLabel;
  std::string lastWorkCategory;
  std::string lastWorkLabel;
  bool paused;
  uint32_t pausedSecondsUsed;
  EpochMillis breakNotifyAt; // 0 when no reminder is pending
};

struct CompletionReport {
  int blockIndex;
  std::string date;
  bool isBreak;
  bool natural;      // Slot boundary reached while running
  bool markComplete; // Manual stop asked for the block to be marked done
  uint32_t secondsUsed;
  uint32_t initialDuration;
  SegmentList segments;
  double visualFill;
  EpochMillis completedAt; // Slot boundary for natural completion, otherwise the stop instant
  std::string category;
  std::string label;
};

// Immutable status view handed to observers and the command layer.
struct EngineStatus {
  EngineState state;
  int blockIndex;
  std::string date;
  SegmentKind mode;
  uint32_t timeLeft;
  uint32_t secondsUsed;
  uint32_t initialDuration;
  double progressPercent;
  double visualFill;
  double scaleFactor;
  std::string category;
  std::string label;
  EpochMillis endAt;
  uint32_t autoContinuations;
};

struct Block {
  std::string date;
  int blockIndex;
  std::string category;
  std::string label;
  BlockStatus status;
  SegmentList segments;
  uint32_t usedSeconds;
  double progress;
  double breakProgress;
  bool isMuted;
  bool hasActiveRun;
};

extern const char *stateToString(EngineState s);
extern const char *kindToString(SegmentKind k);
extern const char *blockStatusToString(BlockStatus s);
extern uint32_t sumSeconds(const SegmentList &segments);
extern uint32_t sumSeconds(const SegmentList &segments, SegmentKind kind);
