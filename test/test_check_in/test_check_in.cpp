/*
 * File: test/test_check_in/test_check_in.cpp
 * Description: Auto-continuation gating. N automatic continuations are
 * allowed, the next one asks for a check-in, and any explicit user action
 * resets the count.
 */
#include <unity.h>
#include "MockBlockHAL.h"

void setUp(void) {}
void tearDown(void) {}

// --- Helper ---
// Runs the current session to its natural end.
static void runToCompletion(EngineRig& rig) {
    rig.runSeconds(rig.engine.getStatus().timeLeft);
    TEST_ASSERT_EQUAL(COMPLETED, rig.engine.getState());
}

// ============================================================================
// COUNTER
// ============================================================================

void test_counter_allows_up_to_threshold(void) {
    CheckInCounter counter(3);

    for (int i = 0; i < 3; i++) {
        TEST_ASSERT_TRUE(counter.allowsAutoContinuation());
        counter.recordAutoContinuation();
    }
    TEST_ASSERT_FALSE(counter.allowsAutoContinuation());
    TEST_ASSERT_TRUE(counter.isCheckInRequired());

    counter.reset();
    TEST_ASSERT_EQUAL_UINT32(0, counter.consecutiveAutoContinuations());
    TEST_ASSERT_TRUE(counter.allowsAutoContinuation());
}

void test_counter_zero_threshold_means_one(void) {
    CheckInCounter counter(0);
    TEST_ASSERT_EQUAL_UINT32(1, counter.threshold());

    counter.recordAutoContinuation();
    TEST_ASSERT_FALSE(counter.allowsAutoContinuation());

    counter.setThreshold(2);
    TEST_ASSERT_TRUE(counter.allowsAutoContinuation());
}

// ============================================================================
// ENGINE GATING
// ============================================================================

void test_fourth_auto_continuation_requires_check_in(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    runToCompletion(rig);

    for (int i = 0; i < 3; i++) {
        TEST_ASSERT_EQUAL_INT(200, rig.engine.autoContinue(SegmentList(), false, 0.0));
        TEST_ASSERT_EQUAL_UINT32(i + 1, rig.checkIn.consecutiveAutoContinuations());
        runToCompletion(rig);
    }

    TEST_ASSERT_EQUAL_INT(423, rig.engine.autoContinue(SegmentList(), false, 0.0));
    TEST_ASSERT_EQUAL_INT(1, rig.listener.checkInCount);
    TEST_ASSERT_EQUAL(COMPLETED, rig.engine.getState());
    TEST_ASSERT_EQUAL_UINT32(3, rig.engine.getStatus().autoContinuations);

    rig.engine.acknowledgeCheckIn();
    TEST_ASSERT_EQUAL_INT(200, rig.engine.autoContinue(SegmentList(), false, 0.0));
    TEST_ASSERT_EQUAL_UINT32(1, rig.checkIn.consecutiveAutoContinuations());
}

void test_auto_continue_uses_current_slot_and_work_context(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    rig.runSeconds(600);
    rig.engine.switchMode(SEG_BREAK);
    runToCompletion(rig);

    TEST_ASSERT_EQUAL_INT(200, rig.engine.autoContinue(SegmentList(), false, 0.0));

    EngineStatus status = rig.engine.getStatus();
    TEST_ASSERT_EQUAL_INT(TEST_SLOT + 1, status.blockIndex);
    TEST_ASSERT_EQUAL(SEG_WORK, status.mode);
    TEST_ASSERT_EQUAL_STRING("deep", status.category.c_str());
    TEST_ASSERT_EQUAL_STRING("report", status.label.c_str());
}

void test_auto_continue_seeds_from_stored_segments(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    runToCompletion(rig);

    SegmentList stored;
    stored.push_back(makeSegment(SEG_WORK, 600, 0, "deep", ""));
    TEST_ASSERT_EQUAL_INT(200, rig.engine.autoContinue(stored, false, 0.0));
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.5, rig.engine.currentVisualFill());
}

void test_failed_auto_continue_is_not_counted(void) {
    EngineRig rig;
    rig.engine.start(makeRequest());
    runToCompletion(rig);

    TEST_ASSERT_EQUAL_INT(412, rig.engine.autoContinue(SegmentList(), true, 1.0));
    TEST_ASSERT_EQUAL_UINT32(0, rig.checkIn.consecutiveAutoContinuations());
}

void test_auto_continue_requires_completed_session(void) {
    EngineRig rig;
    TEST_ASSERT_EQUAL_INT(409, rig.engine.autoContinue(SegmentList(), false, 0.0));

    rig.engine.start(makeRequest());
    TEST_ASSERT_EQUAL_INT(409, rig.engine.autoContinue(SegmentList(), false, 0.0));
}

// ============================================================================
// EXPLICIT ACTIONS RESET THE COUNT
// ============================================================================

// Leaves the rig RUNNING after two automatic continuations.
static void twoAutoContinuations(EngineRig& rig) {
    rig.engine.start(makeRequest());
    runToCompletion(rig);
    rig.engine.autoContinue(SegmentList(), false, 0.0);
    runToCompletion(rig);
    rig.engine.autoContinue(SegmentList(), false, 0.0);
    TEST_ASSERT_EQUAL_UINT32(2, rig.checkIn.consecutiveAutoContinuations());
}

void test_pause_resets_count(void) {
    EngineRig rig;
    twoAutoContinuations(rig);
    rig.runSeconds(10);
    rig.engine.pause();
    TEST_ASSERT_EQUAL_UINT32(0, rig.checkIn.consecutiveAutoContinuations());
}

void test_switch_resets_count(void) {
    EngineRig rig;
    twoAutoContinuations(rig);
    rig.runSeconds(10);
    rig.engine.switchMode(SEG_BREAK);
    TEST_ASSERT_EQUAL_UINT32(0, rig.checkIn.consecutiveAutoContinuations());
}

void test_category_change_resets_count(void) {
    EngineRig rig;
    twoAutoContinuations(rig);
    rig.engine.updateCategory("admin", "");
    TEST_ASSERT_EQUAL_UINT32(0, rig.checkIn.consecutiveAutoContinuations());
}

void test_stop_resets_count(void) {
    EngineRig rig;
    twoAutoContinuations(rig);
    rig.runSeconds(10);
    rig.engine.stop(false);
    TEST_ASSERT_EQUAL_UINT32(0, rig.checkIn.consecutiveAutoContinuations());
}

void test_dismiss_resets_count(void) {
    EngineRig rig;
    twoAutoContinuations(rig);
    runToCompletion(rig);
    rig.engine.dismiss();
    TEST_ASSERT_EQUAL_UINT32(0, rig.checkIn.consecutiveAutoContinuations());
}

void test_explicit_start_resets_count(void) {
    EngineRig rig;
    twoAutoContinuations(rig);
    runToCompletion(rig);

    int slot = rig.engine.getBlockIndex() + 1;
    TEST_ASSERT_EQUAL_INT(200, rig.engine.start(makeRequest(SEG_WORK, "deep", "", slot)));
    TEST_ASSERT_EQUAL_UINT32(0, rig.checkIn.consecutiveAutoContinuations());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_counter_allows_up_to_threshold);
    RUN_TEST(test_counter_zero_threshold_means_one);
    RUN_TEST(test_fourth_auto_continuation_requires_check_in);
    RUN_TEST(test_auto_continue_uses_current_slot_and_work_context);
    RUN_TEST(test_auto_continue_seeds_from_stored_segments);
    RUN_TEST(test_failed_auto_continue_is_not_counted);
    RUN_TEST(test_auto_continue_requires_completed_session);
    RUN_TEST(test_pause_resets_count);
    RUN_TEST(test_switch_resets_count);
    RUN_TEST(test_category_change_resets_count);
    RUN_TEST(test_stop_resets_count);
    RUN_TEST(test_dismiss_resets_count);
    RUN_TEST(test_explicit_start_resets_count);
    return UNITY_END();
}
