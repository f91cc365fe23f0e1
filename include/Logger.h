/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Logging system. Keeps a ring buffer of recent lines for the "log" command
 * and a bounded output queue that the main loop drains to stderr.
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

#include <stdio.h>
#include <string>
#include <vector>

#include "Config.h"

// =================================================================================
// SECTION: LOGGING CONSTANTS
// =================================================================================
#define LOG_SEP_MAJOR "=========================================================================="

class Logger {
public:
  Logger();

  // Stores the line and queues it for output. Never blocks.
  void logMessage(const char *message);

  // Writes up to maxLines queued lines. Returns the number written.
  int processLogQueue(FILE *out, int maxLines = LOG_DRAIN_PER_PASS);

  // Buffered lines, oldest first.
  std::vector<std::string> snapshot() const;

  int dropped() const { return _dropped; }

private:
  char _logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH];
  int _logBufferIndex;
  bool _logBufferFull;

  char _outQueue[STDOUT_QUEUE_SIZE][MAX_LOG_LENGTH];
  int _queueHead;
  int _queueTail;
  int _dropped;
};

#endif
