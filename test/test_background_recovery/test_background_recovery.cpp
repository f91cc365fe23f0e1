/*
 * File: test/test_background_recovery/test_background_recovery.cpp
 * Description: Reconciliation after host suspension and full process loss.
 * Every decision is made by comparing the clock with the stored deadlines.
 */
#include <unity.h>
#include "BackgroundRecovery.h"
#include "MockBlockHAL.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// SUSPEND / RESUME
// ============================================================================

void test_suspend_publishes_snapshot(void) {
    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.engine.start(makeRequest());
    rig.runSeconds(100);

    int before = rig.publisher.publishCount;
    recovery.onSuspend();
    TEST_ASSERT_EQUAL_INT(before + 1, rig.publisher.publishCount);
    TEST_ASSERT_EQUAL_UINT32(100, rig.publisher.last.segments[0].seconds);
}

void test_suspend_when_idle_does_nothing(void) {
    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);

    recovery.onSuspend();
    recovery.onResume();
    TEST_ASSERT_EQUAL_INT(0, rig.publisher.publishCount);
    TEST_ASSERT_EQUAL(IDLE, rig.engine.getState());
}

void test_suspend_past_boundary_forces_completion(void) {
    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.engine.start(makeRequest());
    rig.runSeconds(100);
    recovery.onSuspend();

    // Frozen for longer than the slot had left
    rig.hal.advanceSeconds(2000);
    recovery.onResume();

    TEST_ASSERT_EQUAL(COMPLETED, rig.engine.getState());
    TEST_ASSERT_EQUAL(1, rig.listener.completions.size());

    const CompletionReport& report = rig.listener.completions[0];
    TEST_ASSERT_TRUE(report.natural);
    TEST_ASSERT_EQUAL_UINT32(1200, report.secondsUsed);
    TEST_ASSERT_EQUAL_UINT32(report.initialDuration, report.secondsUsed);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.0, report.visualFill);

    // Dated at the boundary, not at the moment the host woke up
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 1200000LL, report.completedAt);
    TEST_ASSERT_TRUE(report.completedAt < rig.hal.getEpochMillis());
}

void test_short_suspend_resumes_cadence(void) {
    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.engine.start(makeRequest());
    rig.runSeconds(100);

    // The host lost its timers while frozen
    rig.hal.disarmCadence();
    rig.hal.advanceSeconds(300);
    recovery.onResume();

    TEST_ASSERT_EQUAL(RUNNING, rig.engine.getState());
    TEST_ASSERT_TRUE(rig.hal.cadenceArmed);
    TEST_ASSERT_EQUAL_UINT32(800, rig.listener.lastTimeLeft);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 400.0 / 1200.0, rig.engine.currentVisualFill());
    TEST_ASSERT_TRUE(rig.notifier.pending);
}

void test_overdue_break_reminder_fires_once_on_resume(void) {
    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.engine.start(makeRequest(SEG_BREAK));

    rig.hal.advanceSeconds(400);
    recovery.onResume();
    TEST_ASSERT_EQUAL_INT(1, rig.listener.breakNotifyCount);

    rig.hal.advanceSeconds(10);
    recovery.onResume();
    rig.runSeconds(5);
    TEST_ASSERT_EQUAL_INT(1, rig.listener.breakNotifyCount);
}

void test_paused_past_boundary_enters_paused_expiry(void) {
    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.engine.start(makeRequest());
    rig.runSeconds(300);
    rig.engine.pause();

    rig.hal.advanceSeconds(1000);
    recovery.onResume();
    TEST_ASSERT_EQUAL(PAUSED_EXPIRY, rig.engine.getState());
    TEST_ASSERT_EQUAL_INT(0, rig.listener.completions.size());
}

void test_paused_within_slot_stays_paused(void) {
    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.engine.start(makeRequest());
    rig.runSeconds(300);
    rig.engine.pause();

    rig.hal.advanceSeconds(100);
    recovery.onResume();
    TEST_ASSERT_EQUAL(PAUSED, rig.engine.getState());
    TEST_ASSERT_EQUAL_UINT32(300, rig.engine.getStatus().secondsUsed);
}

// ============================================================================
// PROCESS LOSS (SNAPSHOT RESTORE)
// ============================================================================

void test_recover_running_snapshot(void) {
    RunSnapshot snapshot;
    EpochMillis lostAt = 0;
    {
        EngineRig original;
        original.engine.start(makeRequest());
        original.runSeconds(200);
        original.engine.snapshotTick();
        snapshot = original.publisher.last;
        lostAt = original.hal.getEpochMillis();
    }

    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.hal.setTime(lostAt + 100000);

    TEST_ASSERT_EQUAL_INT(200, recovery.recoverFromSnapshot(snapshot));
    TEST_ASSERT_EQUAL(RUNNING, rig.engine.getState());

    EngineStatus status = rig.engine.getStatus();
    TEST_ASSERT_EQUAL_UINT32(900, status.timeLeft);
    TEST_ASSERT_EQUAL_UINT32(300, status.secondsUsed);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.25, status.visualFill);
    TEST_ASSERT_EQUAL_STRING("deep", status.category.c_str());
    TEST_ASSERT_TRUE(rig.hal.cadenceArmed);

    rig.engine.stop(false);
    const CompletionReport& report = rig.listener.completions[0];
    TEST_ASSERT_EQUAL(1, report.segments.size());
    TEST_ASSERT_EQUAL_UINT32(300, report.segments[0].seconds);
}

void test_recover_snapshot_rebuilds_open_tail(void) {
    RunSnapshot snapshot;
    EpochMillis lostAt = 0;
    {
        EngineRig original;
        original.engine.start(makeRequest());
        original.runSeconds(200);
        original.engine.switchMode(SEG_BREAK);
        original.runSeconds(50);
        original.engine.snapshotTick();
        snapshot = original.publisher.last;
        lostAt = original.hal.getEpochMillis();
    }
    TEST_ASSERT_EQUAL(2, snapshot.segments.size());
    TEST_ASSERT_EQUAL_UINT32(200, snapshot.currentSegmentStart);

    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.hal.setTime(lostAt);
    TEST_ASSERT_EQUAL_INT(200, recovery.recoverFromSnapshot(snapshot));
    TEST_ASSERT_EQUAL(SEG_BREAK, rig.engine.getStatus().mode);

    rig.runSeconds(10);
    rig.engine.stop(false);

    // Tail was not duplicated; it kept growing from its original start
    const SegmentList& segs = rig.listener.completions[0].segments;
    TEST_ASSERT_EQUAL(2, segs.size());
    TEST_ASSERT_EQUAL_UINT32(200, segs[0].seconds);
    TEST_ASSERT_EQUAL(SEG_BREAK, segs[1].kind);
    TEST_ASSERT_EQUAL_UINT32(60, segs[1].seconds);
    TEST_ASSERT_EQUAL_UINT32(200, segs[1].startOffset);
    TEST_ASSERT_EQUAL_STRING("deep", rig.listener.completions[0].category.c_str());
}

void test_recover_expired_running_snapshot_completes(void) {
    RunSnapshot snapshot;
    {
        EngineRig original;
        original.engine.start(makeRequest());
        original.runSeconds(200);
        original.engine.snapshotTick();
        snapshot = original.publisher.last;
    }

    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.hal.setTime(snapshot.endAt + 5000);

    TEST_ASSERT_EQUAL_INT(200, recovery.recoverFromSnapshot(snapshot));
    TEST_ASSERT_EQUAL(COMPLETED, rig.engine.getState());
    TEST_ASSERT_EQUAL_UINT32(1200, rig.listener.completions[0].secondsUsed);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.0, rig.listener.completions[0].visualFill);
}

void test_recover_paused_snapshot(void) {
    RunSnapshot snapshot;
    {
        EngineRig original;
        original.engine.start(makeRequest());
        original.runSeconds(300);
        original.engine.pause();
        snapshot = original.publisher.last;
    }
    TEST_ASSERT_TRUE(snapshot.paused);

    EngineRig rig;
    BackgroundRecovery recovery(rig.engine, rig.hal);
    rig.hal.setTime(slotStartMs() + 600000LL);

    TEST_ASSERT_EQUAL_INT(200, recovery.recoverFromSnapshot(snapshot));
    TEST_ASSERT_EQUAL(PAUSED, rig.engine.getState());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.25, rig.engine.currentVisualFill());
    TEST_ASSERT_EQUAL_INT64(snapshot.endAt, rig.hal.expiryAt);

    TEST_ASSERT_EQUAL_INT(200, rig.engine.resume());
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 0.75 / 600.0, rig.engine.getStatus().scaleFactor);
}

void test_restore_requires_idle_engine(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    RunSnapshot snapshot = rig.publisher.last;

    TEST_ASSERT_EQUAL_INT(409, rig.engine.restoreSnapshot(snapshot));
}

void test_restore_rejects_inconsistent_snapshot(void) {
    RunSnapshot snapshot;
    {
        EngineRig original;
        original.engine.start(makeRequest());
        original.runSeconds(10);
        original.engine.snapshotTick();
        snapshot = original.publisher.last;
    }

    EngineRig rig;
    RunSnapshot bad = snapshot;
    bad.endAt = bad.startedAt;
    TEST_ASSERT_EQUAL_INT(400, rig.engine.restoreSnapshot(bad));

    bad = snapshot;
    bad.blockIndex = 99;
    TEST_ASSERT_EQUAL_INT(400, rig.engine.restoreSnapshot(bad));

    bad = snapshot;
    bad.currentSegmentStart = 5000;
    TEST_ASSERT_EQUAL_INT(400, rig.engine.restoreSnapshot(bad));

    TEST_ASSERT_EQUAL(IDLE, rig.engine.getState());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_suspend_publishes_snapshot);
    RUN_TEST(test_suspend_when_idle_does_nothing);
    RUN_TEST(test_suspend_past_boundary_forces_completion);
    RUN_TEST(test_short_suspend_resumes_cadence);
    RUN_TEST(test_overdue_break_reminder_fires_once_on_resume);
    RUN_TEST(test_paused_past_boundary_enters_paused_expiry);
    RUN_TEST(test_paused_within_slot_stays_paused);
    RUN_TEST(test_recover_running_snapshot);
    RUN_TEST(test_recover_snapshot_rebuilds_open_tail);
    RUN_TEST(test_recover_expired_running_snapshot_completes);
    RUN_TEST(test_recover_paused_snapshot);
    RUN_TEST(test_restore_requires_idle_engine);
    RUN_TEST(test_restore_rejects_inconsistent_snapshot);
    return UNITY_END();
}
