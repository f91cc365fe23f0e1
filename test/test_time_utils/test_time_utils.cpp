/*
 * File: test/test_time_utils/test_time_utils.cpp
 * Description: Unit tests for the static TimeUtils class.
 * Verifies countdown, slot start time and duration formatting.
 */

#include <unity.h>
#include "TimeUtils.h"
#include <string.h>

void setUp(void) {}
void tearDown(void) {}

// --- Countdown ---

void test_countdown_full_slot(void) {
    char buf[16];
    TimeUtils::formatCountdown(1200, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("20:00", buf);
}

void test_countdown_pads_seconds(void) {
    char buf[16];
    TimeUtils::formatCountdown(65, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("01:05", buf);

    TimeUtils::formatCountdown(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("00:00", buf);
}

void test_countdown_does_not_wrap_minutes(void) {
    char buf[16];
    // 2h = 120 minutes
    TimeUtils::formatCountdown(7200, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("120:00", buf);
}

// --- Slot Start Times ---

void test_slot_time_first_and_last(void) {
    char buf[16];
    TimeUtils::formatSlotTime(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("00:00", buf);

    TimeUtils::formatSlotTime(71, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("23:40", buf);
}

void test_slot_time_mid_hour(void) {
    char buf[16];
    // Slot 19 = 380 minutes
    TimeUtils::formatSlotTime(19, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("06:20", buf);

    TimeUtils::formatSlotTime(30, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("10:00", buf);
}

// --- Durations ---

void test_format_zero_seconds(void) {
    char buf[32];
    TimeUtils::formatSeconds(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("0s", buf);
}

void test_format_seconds_only(void) {
    char buf[32];
    TimeUtils::formatSeconds(45, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("45s", buf);
}

void test_format_slot_length(void) {
    char buf[32];
    TimeUtils::formatSeconds(1200, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("20min", buf);
}

void test_format_hours_minutes_seconds(void) {
    char buf[64];
    // 1h (3600) + 10min (600) + 5s = 4205
    TimeUtils::formatSeconds(4205, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h 10min 5s", buf);
}

void test_format_skips_zero_middle_units(void) {
    char buf[64];
    // 1h (3600) + 5s = 3605. (Minutes should be skipped)
    TimeUtils::formatSeconds(3605, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h 5s", buf);
}

void test_format_full_day(void) {
    char buf[64];
    // 72 slots
    TimeUtils::formatSeconds(86400, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("24h", buf);
}

// --- Buffer Safety ---

void test_format_small_buffer_truncates(void) {
    char buf[5];
    TimeUtils::formatSeconds(4205, buf, sizeof(buf));
    TEST_ASSERT_EQUAL(4, strlen(buf));
    TEST_ASSERT_EQUAL_STRING("1h 1", buf);
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_countdown_full_slot);
    RUN_TEST(test_countdown_pads_seconds);
    RUN_TEST(test_countdown_does_not_wrap_minutes);
    RUN_TEST(test_slot_time_first_and_last);
    RUN_TEST(test_slot_time_mid_hour);
    RUN_TEST(test_format_zero_seconds);
    RUN_TEST(test_format_seconds_only);
    RUN_TEST(test_format_slot_length);
    RUN_TEST(test_format_hours_minutes_seconds);
    RUN_TEST(test_format_skips_zero_middle_units);
    RUN_TEST(test_format_full_day);
    RUN_TEST(test_format_small_buffer_truncates);
    return UNITY_END();
}
