/*
 * File: test/test_mode_changes/test_mode_changes.cpp
 * Description: Work/break switching, category and label edits, and the
 * mid-break reminder with its notification scheduling.
 */
#include <unity.h>
#include "MockBlockHAL.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// WORK / BREAK SWITCHING
// ============================================================================

void test_switch_to_break_and_back_restores_work_context(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    rig.runSeconds(300);

    TEST_ASSERT_EQUAL_INT(200, rig.engine.switchMode(SEG_BREAK));
    EngineStatus status = rig.engine.getStatus();
    TEST_ASSERT_EQUAL(SEG_BREAK, status.mode);
    TEST_ASSERT_EQUAL_STRING("", status.category.c_str());
    TEST_ASSERT_EQUAL_STRING("", status.label.c_str());

    rig.runSeconds(300);
    TEST_ASSERT_EQUAL_INT(200, rig.engine.switchMode(SEG_WORK));
    status = rig.engine.getStatus();
    TEST_ASSERT_EQUAL(SEG_WORK, status.mode);
    TEST_ASSERT_EQUAL_STRING("deep", status.category.c_str());
    TEST_ASSERT_EQUAL_STRING("report", status.label.c_str());

    TEST_ASSERT_EQUAL(2, rig.listener.boundaries.size());
    TEST_ASSERT_EQUAL(SEG_WORK, rig.listener.boundaries[0].kind);
    TEST_ASSERT_EQUAL_UINT32(300, rig.listener.boundaries[0].seconds);
    TEST_ASSERT_EQUAL_STRING("deep", rig.listener.boundaries[0].category.c_str());
    TEST_ASSERT_EQUAL(SEG_BREAK, rig.listener.boundaries[1].kind);
    TEST_ASSERT_EQUAL_UINT32(300, rig.listener.boundaries[1].startOffset);
    TEST_ASSERT_EQUAL_STRING("", rig.listener.boundaries[1].category.c_str());

    rig.runSeconds(600);
    const CompletionReport& report = rig.listener.completions[0];
    TEST_ASSERT_EQUAL(3, report.segments.size());
    TEST_ASSERT_EQUAL_UINT32(600, report.segments[2].seconds);
    TEST_ASSERT_EQUAL_STRING("report", report.segments[2].label.c_str());
    TEST_ASSERT_FALSE(report.isBreak);
}

void test_switch_to_same_mode_is_a_no_op(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    rig.runSeconds(100);

    TEST_ASSERT_EQUAL_INT(200, rig.engine.switchMode(SEG_WORK));
    TEST_ASSERT_EQUAL(0, rig.listener.boundaries.size());
}

void test_immediate_switch_creates_no_zero_length_segment(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());

    TEST_ASSERT_EQUAL_INT(200, rig.engine.switchMode(SEG_BREAK));
    TEST_ASSERT_EQUAL(0, rig.listener.boundaries.size());

    rig.runSeconds(50);
    rig.engine.stop(false);
    const CompletionReport& report = rig.listener.completions[0];
    TEST_ASSERT_EQUAL(1, report.segments.size());
    TEST_ASSERT_EQUAL(SEG_BREAK, report.segments[0].kind);
    TEST_ASSERT_TRUE(report.isBreak);
}

void test_switch_requires_running_session(void) {
    EngineRig rig;
    TEST_ASSERT_EQUAL_INT(409, rig.engine.switchMode(SEG_BREAK));

    rig.engine.start(makeRequest());
    rig.runSeconds(10);
    rig.engine.pause();
    TEST_ASSERT_EQUAL_INT(409, rig.engine.switchMode(SEG_BREAK));
}

// ============================================================================
// CATEGORY AND LABEL
// ============================================================================

void test_category_change_closes_segment(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    rig.runSeconds(5);

    TEST_ASSERT_EQUAL_INT(200, rig.engine.updateCategory("admin", "report"));
    TEST_ASSERT_EQUAL(1, rig.listener.boundaries.size());
    TEST_ASSERT_EQUAL_UINT32(5, rig.listener.boundaries[0].seconds);
    TEST_ASSERT_EQUAL_STRING("deep", rig.listener.boundaries[0].category.c_str());
    TEST_ASSERT_EQUAL_STRING("admin", rig.engine.getStatus().category.c_str());
}

void test_short_label_change_retags_open_segment(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    rig.runSeconds(5);

    // Under the 10 s floor: no boundary, tags move to the open segment
    TEST_ASSERT_EQUAL_INT(200, rig.engine.updateCategory("deep", "notes"));
    TEST_ASSERT_EQUAL(0, rig.listener.boundaries.size());

    rig.runSeconds(20);
    TEST_ASSERT_EQUAL_INT(200, rig.engine.updateCategory("deep", "final"));
    TEST_ASSERT_EQUAL(1, rig.listener.boundaries.size());
    TEST_ASSERT_EQUAL_UINT32(25, rig.listener.boundaries[0].seconds);
    TEST_ASSERT_EQUAL_UINT32(0, rig.listener.boundaries[0].startOffset);
    TEST_ASSERT_EQUAL_STRING("notes", rig.listener.boundaries[0].label.c_str());
}

void test_category_edit_during_break_updates_work_context_only(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    rig.runSeconds(100);
    rig.engine.switchMode(SEG_BREAK);
    rig.runSeconds(100);

    TEST_ASSERT_EQUAL_INT(200, rig.engine.updateCategory("admin", "mail"));
    TEST_ASSERT_EQUAL(1, rig.listener.boundaries.size());
    TEST_ASSERT_EQUAL_STRING("", rig.engine.getStatus().category.c_str());

    rig.engine.switchMode(SEG_WORK);
    TEST_ASSERT_EQUAL_STRING("admin", rig.engine.getStatus().category.c_str());
    TEST_ASSERT_EQUAL_STRING("mail", rig.engine.getStatus().label.c_str());

    // The break that just closed stays untagged
    TEST_ASSERT_EQUAL(2, rig.listener.boundaries.size());
    TEST_ASSERT_EQUAL(SEG_BREAK, rig.listener.boundaries[1].kind);
    TEST_ASSERT_EQUAL_STRING("", rig.listener.boundaries[1].category.c_str());
}

void test_category_edit_while_paused_applies_on_resume(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    rig.runSeconds(100);
    rig.engine.pause();

    TEST_ASSERT_EQUAL_INT(200, rig.engine.updateCategory("admin", ""));
    rig.engine.resume();
    rig.runSeconds(50);
    rig.engine.stop(false);

    const CompletionReport& report = rig.listener.completions[0];
    TEST_ASSERT_EQUAL(2, report.segments.size());
    TEST_ASSERT_EQUAL_STRING("deep", report.segments[0].category.c_str());
    TEST_ASSERT_EQUAL_STRING("admin", report.segments[1].category.c_str());
    TEST_ASSERT_EQUAL_STRING("admin", report.category.c_str());
}

void test_category_edit_requires_session(void) {
    EngineRig rig;
    TEST_ASSERT_EQUAL_INT(409, rig.engine.updateCategory("admin", ""));
}

// ============================================================================
// BREAK REMINDER
// ============================================================================

void test_break_reminder_fires_once(void) {
    EngineRig rig;
    rig.engine.start(makeRequest(SEG_BREAK));

    TEST_ASSERT_TRUE(rig.notifier.lastIsBreak);
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 300000LL, rig.notifier.lastAt);

    rig.runSeconds(299);
    TEST_ASSERT_EQUAL_INT(0, rig.listener.breakNotifyCount);
    rig.runSeconds(1);
    TEST_ASSERT_EQUAL_INT(1, rig.listener.breakNotifyCount);

    // Next notification is the slot end
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 1200000LL, rig.notifier.lastAt);

    rig.runSeconds(600);
    TEST_ASSERT_EQUAL_INT(1, rig.listener.breakNotifyCount);
}

void test_break_reminder_at_boundary_is_suppressed(void) {
    EngineRig rig;
    rig.hal.setTime(slotStartMs() + 900000LL);
    TEST_ASSERT_EQUAL_INT(200, rig.engine.start(makeRequest(SEG_BREAK)));

    // Reminder would land exactly on the slot end
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 1200000LL, rig.notifier.lastAt);

    rig.runSeconds(300);
    TEST_ASSERT_EQUAL(COMPLETED, rig.engine.getState());
    TEST_ASSERT_EQUAL_INT(0, rig.listener.breakNotifyCount);
    TEST_ASSERT_TRUE(rig.listener.completions[0].isBreak);
}

void test_switch_to_work_cancels_break_reminder(void) {
    EngineRig rig;
    rig.engine.start(makeRequest(SEG_BREAK));
    rig.runSeconds(100);
    rig.engine.switchMode(SEG_WORK);

    TEST_ASSERT_FALSE(rig.notifier.lastIsBreak);
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 1200000LL, rig.notifier.lastAt);

    rig.runSeconds(400);
    TEST_ASSERT_EQUAL_INT(0, rig.listener.breakNotifyCount);
}

void test_snooze_reschedules_reminder(void) {
    EngineRig rig;
    rig.engine.start(makeRequest(SEG_BREAK));
    rig.runSeconds(100);

    TEST_ASSERT_EQUAL_INT(200, rig.engine.snoozeBreakNotify(60));
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 160000LL, rig.notifier.lastAt);

    rig.runSeconds(60);
    TEST_ASSERT_EQUAL_INT(1, rig.listener.breakNotifyCount);

    // Zero means the configured delay
    TEST_ASSERT_EQUAL_INT(200, rig.engine.snoozeBreakNotify(0));
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 460000LL, rig.notifier.lastAt);
}

void test_snooze_requires_running_break(void) {
    EngineRig rig;
    TEST_ASSERT_EQUAL_INT(409, rig.engine.snoozeBreakNotify(60));

    rig.engine.start(makeRequest());
    TEST_ASSERT_EQUAL_INT(409, rig.engine.snoozeBreakNotify(60));
}

void test_work_session_schedules_slot_end(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());

    TEST_ASSERT_TRUE(rig.notifier.pending);
    TEST_ASSERT_FALSE(rig.notifier.lastIsBreak);
    TEST_ASSERT_EQUAL_INT(TEST_SLOT, rig.notifier.lastBlockIndex);
    TEST_ASSERT_EQUAL_INT64(slotStartMs() + 1200000LL, rig.notifier.lastAt);
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_switch_to_break_and_back_restores_work_context);
    RUN_TEST(test_switch_to_same_mode_is_a_no_op);
    RUN_TEST(test_immediate_switch_creates_no_zero_length_segment);
    RUN_TEST(test_switch_requires_running_session);
    RUN_TEST(test_category_change_closes_segment);
    RUN_TEST(test_short_label_change_retags_open_segment);
    RUN_TEST(test_category_edit_during_break_updates_work_context_only);
    RUN_TEST(test_category_edit_while_paused_applies_on_resume);
    RUN_TEST(test_category_edit_requires_session);
    RUN_TEST(test_break_reminder_fires_once);
    RUN_TEST(test_break_reminder_at_boundary_is_suppressed);
    RUN_TEST(test_switch_to_work_cancels_break_reminder);
    RUN_TEST(test_snooze_reschedules_reminder);
    RUN_TEST(test_snooze_requires_running_break);
    RUN_TEST(test_work_session_schedules_slot_end);
    return UNITY_END();
}
