/*
 * File: test/test_visual_fill/test_visual_fill.cpp
 * Description: Visual fill mapping. Baseline from stored segments, scaling
 * into the remaining visual space, and clamping.
 */
#include <unity.h>
#include "VisualFill.h"

void setUp(void) {}
void tearDown(void) {}

static Segment seg(SegmentKind kind, uint32_t seconds) {
    Segment s;
    s.kind = kind;
    s.seconds = seconds;
    s.startOffset = 0;
    return s;
}

void test_baseline_from_segments(void) {
    SegmentList segments;
    segments.push_back(seg(SEG_WORK, 300));
    segments.push_back(seg(SEG_BREAK, 300));

    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.5, VisualFillTracker::baselineProportion(segments));
}

void test_baseline_is_clamped(void) {
    SegmentList segments;
    segments.push_back(seg(SEG_WORK, 1000));
    segments.push_back(seg(SEG_WORK, 1000));

    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.0, VisualFillTracker::baselineProportion(segments));
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.0, VisualFillTracker::baselineProportion(SegmentList()));
}

void test_fresh_slot_uses_baseline_scale(void) {
    VisualFillTracker fill;
    fill.begin(0.0, 1200.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-9, 1.0 / 1200.0, fill.scaleFactor());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.5, fill.currentFill(600));
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.0, fill.currentFill(1200));
}

void test_late_start_fills_remaining_space(void) {
    VisualFillTracker fill;
    fill.begin(0.5, 600.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-9, 0.5 / 600.0, fill.scaleFactor());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.75, fill.currentFill(300));
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.0, fill.currentFill(600));
}

void test_fill_is_clamped_to_one(void) {
    VisualFillTracker fill;
    fill.begin(0.9, 100.0);

    TEST_ASSERT_TRUE(fill.rawFill(200) > 1.0);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.0, fill.currentFill(200));
}

void test_no_real_time_falls_back_to_baseline(void) {
    VisualFillTracker fill;
    fill.begin(0.2, 0.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-9, BASELINE_SCALE_FACTOR, fill.scaleFactor());
}

void test_full_slot_has_no_room(void) {
    VisualFillTracker fill;
    fill.begin(1.0, 600.0);

    TEST_ASSERT_FALSE(fill.hasRoom());
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 0.0, fill.scaleFactor());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.0, fill.currentFill(300));
}

void test_restore_keeps_stored_scale(void) {
    VisualFillTracker fill;
    fill.restore(0.25, 0.75 / 600.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.25, fill.currentFill(0));
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.625, fill.currentFill(300));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_baseline_from_segments);
    RUN_TEST(test_baseline_is_clamped);
    RUN_TEST(test_fresh_slot_uses_baseline_scale);
    RUN_TEST(test_late_start_fills_remaining_space);
    RUN_TEST(test_fill_is_clamped_to_one);
    RUN_TEST(test_no_real_time_falls_back_to_baseline);
    RUN_TEST(test_full_slot_has_no_room);
    RUN_TEST(test_restore_keeps_stored_scale);
    return UNITY_END();
}
