/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      main.cpp
 * Description: Application entry point. Wires the engine to the POSIX host,
 * restores an interrupted session and runs the single-threaded event loop.
 * Commands arrive on stdin, responses and events go to stdout, logs to stderr.
 * =================================================================================
 */

#include <ArduinoJson.h>
#include <errno.h>
#include <memory>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <sys/select.h>
#include <unistd.h>

// --- Module Includes ---
#include "BlockStore.h"
#include "CommandApi.h"
#include "Config.h"
#include "Logger.h"
#include "PosixBlockHAL.h"
#include "SettingsManager.h"

// --- Block Engine Includes ---
#include "BackgroundRecovery.h"
#include "BlockCalendar.h"
#include "BlockCodec.h"
#include "BlockRecorder.h"
#include "CheckInCounter.h"
#include "TimerEngine.h"
#include "TimeUtils.h"

// --- Signal Flags ---
static volatile sig_atomic_t g_shutdownRequested = 0;
static volatile sig_atomic_t g_suspendRequested = 0;
static volatile sig_atomic_t g_resumed = 0;

static void handleShutdownSignal(int) { g_shutdownRequested = 1; }
static void handleSuspendSignal(int) { g_suspendRequested = 1; }
static void handleContinueSignal(int) { g_resumed = 1; }

static void installSignal(int sig, void (*handler)(int)) {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handler;
  sigemptyset(&sa.sa_mask);
  sigaction(sig, &sa, nullptr);
}

static void writeLine(const std::string &line) {
  fprintf(stdout, "%s\n", line.c_str());
  fflush(stdout);
}

// =================================================================
// --- Event Output ---
// =================================================================

/**
 * Mirrors engine events to stdout and arms the auto-continue grace period.
 * Only records facts here. Commands are never issued from inside a callback.
 */
class EventPrinter : public IBlockEngineListener {
public:
  EventPrinter() : _autoContinuePending(false), _completedAt(0) {}

  void onTick(uint32_t timeLeft, double progressPercent) override {
    std::unique_ptr<JsonDocument> doc(new JsonDocument());
    (*doc)["event"] = "tick";
    (*doc)["timeLeft"] = timeLeft;
    (*doc)["progress"] = progressPercent;
    emit(*doc);
  }

  void onSegmentBoundary(const Segment &segment) override {
    std::unique_ptr<JsonDocument> doc(new JsonDocument());
    (*doc)["event"] = "segment";
    BlockCodec::encodeSegment(segment, (*doc)["segment"].to<JsonObject>());
    emit(*doc);
  }

  void onBreakNotify() override { emitSimple("break_notify"); }

  void onComplete(const CompletionReport &report) override {
    std::unique_ptr<JsonDocument> doc(new JsonDocument());
    (*doc)["event"] = "complete";
    BlockCodec::encodeReport(report, (*doc)["report"].to<JsonObject>());
    emit(*doc);

    _autoContinuePending = report.natural;
    _completedAt = report.completedAt;
  }

  void onCheckInRequired() override { emitSimple("checkin_required"); }

  void onPausedExpiry(int blockIndex, const std::string &date) override {
    std::unique_ptr<JsonDocument> doc(new JsonDocument());
    (*doc)["event"] = "paused_expiry";
    (*doc)["blockIndex"] = blockIndex;
    (*doc)["date"] = date;
    emit(*doc);
  }

  void onStateChanged(EngineState state) override {
    std::unique_ptr<JsonDocument> doc(new JsonDocument());
    (*doc)["event"] = "state";
    (*doc)["state"] = stateToString(state);
    emit(*doc);
  }

  void emitNotification(const DueNotification &notification) {
    std::unique_ptr<JsonDocument> doc(new JsonDocument());
    (*doc)["event"] = "notification";
    (*doc)["blockIndex"] = notification.blockIndex;
    (*doc)["isBreak"] = notification.isBreak;
    emit(*doc);
  }

  bool isAutoContinuePending() const { return _autoContinuePending; }
  EpochMillis completedAt() const { return _completedAt; }
  void clearAutoContinue() { _autoContinuePending = false; }

private:
  bool _autoContinuePending;
  EpochMillis _completedAt;

  void emit(JsonDocument &doc) {
    std::string line;
    serializeJson(doc, line);
    writeLine(line);
  }

  void emitSimple(const char *name) {
    std::unique_ptr<JsonDocument> doc(new JsonDocument());
    (*doc)["event"] = name;
    emit(*doc);
  }
};

/**
 * Prints high-level identity and build information.
 */
static void printFirmwareDiagnostics(PosixBlockHAL &hal) {
  char logBuf[128];

  hal.log(LOG_SEP_MAJOR);
  hal.log("                       APPLICATION IDENTITY                               ");
  hal.log(LOG_SEP_MAJOR);

  // -------------------------------------------------------------------------
  // SECTION: IDENTITY
  // -------------------------------------------------------------------------
  hal.log("[ VERSION INFO ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Application Name", DEVICE_NAME);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Version", DEVICE_VERSION);
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: BUILD METADATA
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ BUILD DETAILS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", (long)__cplusplus);
  hal.log(logBuf);

  hal.log(LOG_SEP_MAJOR);
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int main(int argc, char **argv) {
  std::string dataDir = (argc > 1) ? argv[1] : DEFAULT_DATA_DIR;

  // 1. Logging & Host Adapter
  Logger logger;
  PosixBlockHAL hal(logger);
  printFirmwareDiagnostics(hal);

  // 2. Storage & Settings
  BlockStore store(dataDir, hal);
  if (!store.initialize()) {
    logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE);
    return 1;
  }

  EngineConfig engineConfig = DEFAULT_ENGINE_CONFIG;
  HostConfig hostConfig = DEFAULT_HOST_CONFIG;
  std::string settingsPath = dataDir + "/" + SETTINGS_FILE;
  if (!SettingsManager::load(settingsPath, engineConfig, hostConfig, hal)) {
    hal.logKeyValue("System", "Settings unreadable. Running on defaults.");
    engineConfig = DEFAULT_ENGINE_CONFIG;
    hostConfig = DEFAULT_HOST_CONFIG;
  }

  logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE);

  // 3. Engine
  CheckInCounter checkIn(engineConfig.checkInThreshold);
  TimerEngine engine(hal, hal, store, checkIn, engineConfig);
  if (!engine.validateConfig(engineConfig)) {
    hal.logKeyValue("System", "CRITICAL: Engine configuration rejected.");
    logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE);
    return 1;
  }

  BlockRecorder recorder(store, hal, engineConfig);
  EventPrinter events;
  engine.subscribe(&recorder);
  engine.subscribe(&events);

  BackgroundRecovery recovery(engine, hal);
  CommandApi api(engine, recorder, hal, logger, hostConfig, settingsPath);

  // 4. Load Today & Restore Interrupted Session
  EpochMillis now = hal.getEpochMillis();
  std::string today = BlockCalendar::logicalDate(now, engineConfig.dayStartHour, engineConfig.utcOffsetSeconds);
  if (!recorder.loadDay(today)) {
    hal.logKeyValue("System", "Today's blocks unreadable. Starting with an empty day.");
  }

  {
    int slot = BlockCalendar::indexForInstant(now, engineConfig.utcOffsetSeconds);
    char slotTime[8];
    TimeUtils::formatSlotTime(slot, slotTime, sizeof(slotTime));
    char logBuf[80];
    snprintf(logBuf, sizeof(logBuf), "%s, block #%d (%s)", today.c_str(),
             BlockCalendar::displayNumber(slot, engineConfig.dayStartHour), slotTime);
    hal.logKeyValue("System", logBuf);
  }

  RunSnapshot snapshot;
  if (store.loadSnapshot(snapshot)) {
    hal.logKeyValue("System", "Restoring interrupted session...");
    int rc = recovery.recoverFromSnapshot(snapshot);
    if (rc != 200) {
      hal.logKeyValue("System", "Snapshot rejected. Discarding.");
      store.clear();
    }
  } else {
    hal.logKeyValue("System", "No previous session. Starting fresh.");
  }

  logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE);

  // 5. Diagnostics
  hal.printStartupDiagnostics();
  logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE);
  engine.printStartupDiagnostics();
  hal.log(LOG_SEP_MAJOR);
  logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE);

  // 6. Signals
  installSignal(SIGINT, handleShutdownSignal);
  installSignal(SIGTERM, handleShutdownSignal);
  installSignal(SIGTSTP, handleSuspendSignal);
  installSignal(SIGCONT, handleContinueSignal);
  signal(SIGPIPE, SIG_IGN);

  // 7. Event Loop
  std::string inputBuffer;
  bool inputOpen = true;
  int lastSlot = BlockCalendar::indexForInstant(now, engineConfig.utcOffsetSeconds);
  EpochMillis lastFlushAt = now;

  recorder.processAutoSkip(now, engine.getState() == IDLE ? -1 : engine.getBlockIndex());

  while (!g_shutdownRequested) {
    // --- Suspension ---
    if (g_suspendRequested) {
      g_suspendRequested = 0;
      recovery.onSuspend();
      logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE);

      // Stop for real with the default action, then take the signal back
      signal(SIGTSTP, SIG_DFL);
      raise(SIGTSTP);
      installSignal(SIGTSTP, handleSuspendSignal);
    }
    if (g_resumed) {
      g_resumed = 0;
      hal.logKeyValue("System", "Resumed (SIGCONT).");
      recovery.onResume();
    }

    // --- Wait for input or the next deadline ---
    now = hal.getEpochMillis();
    EpochMillis deadline = hal.nextDeadline();
    long waitMs = IDLE_WAIT_MS;
    if (deadline != 0) {
      long untilDeadline = (long)(deadline - now);
      if (untilDeadline < waitMs)
        waitMs = untilDeadline < 0 ? 0 : untilDeadline;
    }

    fd_set readSet;
    FD_ZERO(&readSet);
    if (inputOpen)
      FD_SET(STDIN_FILENO, &readSet);

    struct timeval tv;
    tv.tv_sec = waitMs / 1000;
    tv.tv_usec = (waitMs % 1000) * 1000;

    EpochMillis before = now;
    int ready = select(inputOpen ? STDIN_FILENO + 1 : 0, &readSet, nullptr, nullptr, &tv);
    if (ready < 0 && errno != EINTR) {
      char logBuf[64];
      snprintf(logBuf, sizeof(logBuf), "select failed: %s", strerror(errno));
      hal.logKeyValue("System", logBuf);
      break;
    }

    now = hal.getEpochMillis();

    // Woke far later than asked: the whole host was frozen
    if (now - before > waitMs + SUSPEND_DETECT_MS && !g_resumed) {
      char logBuf[64];
      snprintf(logBuf, sizeof(logBuf), "Wake gap of %lld s detected.", (long long)((now - before) / 1000));
      hal.logKeyValue("System", logBuf);
      recovery.onResume();
    }

    // --- Commands ---
    if (ready > 0 && inputOpen && FD_ISSET(STDIN_FILENO, &readSet)) {
      char chunk[1024];
      ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
      if (n > 0) {
        inputBuffer.append(chunk, (size_t)n);
        size_t pos;
        while ((pos = inputBuffer.find('\n')) != std::string::npos) {
          std::string line = inputBuffer.substr(0, pos);
          inputBuffer.erase(0, pos + 1);
          if (!line.empty() && line[line.size() - 1] == '\r')
            line.erase(line.size() - 1);
          if (line.empty())
            continue;
          writeLine(api.handle(line));
        }
        if (inputBuffer.size() > MAX_COMMAND_LENGTH) {
          inputBuffer.clear();
          writeLine("{\"status\":\"error\",\"code\":413,\"message\":\"Payload too large.\"}");
        }
      } else if (n == 0) {
        hal.logKeyValue("System", "Input closed. Shutting down.");
        inputOpen = false;
        g_shutdownRequested = 1;
      } else if (errno != EINTR && errno != EAGAIN) {
        inputOpen = false;
      }
    }

    // --- Timers ---
    now = hal.getEpochMillis();
    if (hal.consumeExpiryDue(now))
      engine.handlePausedExpiry();
    if (hal.consumeTickDue(now))
      engine.tick();
    if (hal.consumeSnapshotDue(now))
      engine.snapshotTick();

    DueNotification notification;
    if (hal.popDueNotification(now, notification))
      events.emitNotification(notification);

    // --- Auto-Continue ---
    if (events.isAutoContinuePending()) {
      if (engine.getState() != COMPLETED || !hostConfig.autoContinueEnabled) {
        events.clearAutoContinue();
      } else if (now >= events.completedAt() + (EpochMillis)hostConfig.autoContinueDelaySeconds * 1000) {
        events.clearAutoContinue();

        const EngineConfig &config = engine.getConfig();
        std::string date = BlockCalendar::logicalDate(now, config.dayStartHour, config.utcOffsetSeconds);
        int slot = BlockCalendar::indexForInstant(now, config.utcOffsetSeconds);
        if (recorder.currentDate() != date && !recorder.loadDay(date)) {
          hal.logKeyValue("System", "Day not readable. Continuing without stored segments.");
        }

        int rc = engine.autoContinue(recorder.existingSegmentsFor(slot), false, 0.0);
        if (rc != 200) {
          char logBuf[80];
          snprintf(logBuf, sizeof(logBuf), "Auto-continue declined (%d): %s", rc, CommandApi::describeCode(rc));
          hal.logKeyValue("System", logBuf);
        }
      }
    }

    // --- Day Housekeeping ---
    int slot = BlockCalendar::indexForInstant(now, engine.getConfig().utcOffsetSeconds);
    if (slot != lastSlot) {
      lastSlot = slot;
      recorder.processAutoSkip(now, engine.getState() == IDLE ? -1 : engine.getBlockIndex());
    }

    if (recorder.pendingCount() > 0 && now - lastFlushAt >= 30000) {
      lastFlushAt = now;
      recorder.flushPending();
    }

    logger.processLogQueue(stderr);
  }

  // 8. Shutdown
  EngineState state = engine.getState();
  if (state == RUNNING || state == PAUSED) {
    hal.logKeyValue("System", "Persisting active session before exit.");
    engine.snapshotTick();
  }
  if (recorder.flushPending() > 0) {
    hal.logKeyValue("System", "Some block saves could not be written.");
  }

  while (logger.processLogQueue(stderr, STDOUT_QUEUE_SIZE) > 0) {
  }
  return 0;
}
