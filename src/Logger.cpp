#include <string.h>

#include "Logger.h"

Logger::Logger() : _logBufferIndex(0), _logBufferFull(false), _queueHead(0), _queueTail(0), _dropped(0) {
  for (int i = 0; i < LOG_BUFFER_SIZE; i++)
    _logBuffer[i][0] = '\0';
}

/**
 * Adds a message to the in-memory ring buffer and pushes it to the output queue.
 * NO IO IN THIS FUNCTION.
 */
void Logger::logMessage(const char *message) {
  // Update RAM ring buffer (for API)
  snprintf(_logBuffer[_logBufferIndex], MAX_LOG_LENGTH, "%s", message);
  _logBufferIndex++;
  if (_logBufferIndex >= LOG_BUFFER_SIZE) {
    _logBufferIndex = 0;
    _logBufferFull = true;
  }

  // Push to output queue
  int nextHead = (_queueHead + 1) % STDOUT_QUEUE_SIZE;
  if (nextHead != _queueTail) {
    snprintf(_outQueue[_queueHead], MAX_LOG_LENGTH, "%s", message);
    _queueHead = nextHead;
  } else {
    // Queue full: the line is still in the ring buffer
    _dropped++;
  }
}

/**
 * Called in the main loop to drain the queue.
 * Drains a bounded number of lines per call so command handling stays responsive.
 */
int Logger::processLogQueue(FILE *out, int maxLines) {
  int written = 0;

  while (written < maxLines && _queueHead != _queueTail) {
    fprintf(out, "%s\n", _outQueue[_queueTail]);
    _queueTail = (_queueTail + 1) % STDOUT_QUEUE_SIZE;
    written++;
  }

  if (written > 0)
    fflush(out);
  return written;
}

std::vector<std::string> Logger::snapshot() const {
  std::vector<std::string> lines;

  int count = _logBufferFull ? LOG_BUFFER_SIZE : _logBufferIndex;
  int start = _logBufferFull ? _logBufferIndex : 0;

  for (int i = 0; i < count; i++) {
    lines.push_back(_logBuffer[(start + i) % LOG_BUFFER_SIZE]);
  }
  return lines;
}
