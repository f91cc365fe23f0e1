/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/Types.cpp
 * =================================================================================
 */

#include "Types.h"

const char *stateToString(EngineState s) {
  switch (s) {
  case IDLE:
    return "IDLE";
  case RUNNING:
    return "RUNNING";
  case PAUSED:
    return "PAUSED";
  case PAUSED_EXPIRY:
    return "PAUSED_EXPIRY";
  case COMPLETED:
    return "COMPLETED";
  default:
    return "IDLE";
  }
}

const char *kindToString(SegmentKind k) {
  switch (k) {
  case SEG_BREAK:
    return "break";
  default:
    return "work";
  }
}

const char *blockStatusToString(BlockStatus s) {
  switch (s) {
  case BLOCK_PLANNED:
    return "planned";
  case BLOCK_DONE:
    return "done";
  case BLOCK_SKIPPED:
    return "skipped";
  default:
    return "idle";
  }
}

uint32_t sumSeconds(const SegmentList &segments) {
  uint32_t total = 0;
  for (size_t i = 0; i < segments.size(); i++) {
    total += segments[i].seconds;
  }
  return total;
}

uint32_t sumSeconds(const SegmentList &segments, SegmentKind kind) {
  uint32_t total = 0;
  for (size_t i = 0; i < segments.size(); i++) {
    if (segments[i].kind == kind) total += segments[i].seconds;
  }
  return total;
}
