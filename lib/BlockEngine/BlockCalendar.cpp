/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/BlockCalendar.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <stdio.h>

#include "BlockCalendar.h"

// Floor division / modulo (instants before 1970 stay consistent).
static int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

static int64_t floorMod(int64_t a, int64_t b) {
    return a - floorDiv(a, b) * b;
}

// =================================================================================
// SECTION: SLOT ARITHMETIC
// =================================================================================

int BlockCalendar::indexForInstant(EpochMillis now, int32_t utcOffsetSeconds) {
    int64_t localSeconds = floorDiv(now, 1000) + utcOffsetSeconds;
    int64_t secondOfDay = floorMod(localSeconds, SECONDS_PER_DAY);
    return (int)(secondOfDay / SLOT_SECONDS);
}

std::string BlockCalendar::logicalDate(EpochMillis now, uint32_t dayStartHour, int32_t utcOffsetSeconds) {
    int64_t localSeconds = floorDiv(now, 1000) + utcOffsetSeconds;
    int64_t days = floorDiv(localSeconds, SECONDS_PER_DAY);
    int64_t secondOfDay = floorMod(localSeconds, SECONDS_PER_DAY);

    // Before the day-start hour we are still in the previous logical day
    if (secondOfDay < (int64_t)dayStartHour * 3600) days--;

    return formatDate(days);
}

bool BlockCalendar::slotBounds(int index, const std::string& date, uint32_t dayStartHour,
                               int32_t utcOffsetSeconds, EpochMillis& start, EpochMillis& end) {
    int64_t days = 0;
    if (!parseDate(date, days)) return false;

    // Slots before the day-start hour run on the next calendar date
    if (index < (int)(dayStartHour * SLOTS_PER_HOUR)) days++;

    int64_t localStart = days * SECONDS_PER_DAY + (int64_t)index * SLOT_SECONDS;
    start = (localStart - utcOffsetSeconds) * 1000;
    end = start + (EpochMillis)SLOT_SECONDS * 1000;
    return true;
}

uint32_t BlockCalendar::remainingSeconds(int index, const std::string& date, EpochMillis now,
                                         uint32_t dayStartHour, int32_t utcOffsetSeconds) {
    EpochMillis start = 0;
    EpochMillis end = 0;
    if (!slotBounds(index, date, dayStartHour, utcOffsetSeconds, start, end)) return 0;

    if (now >= end) return 0;
    if (now < start) return SLOT_SECONDS;

    // Round up so a slot with 0.4 s left still reports 1 s
    return (uint32_t)((end - now + 999) / 1000);
}

int BlockCalendar::displayNumber(int index, uint32_t dayStartHour) {
    int firstIndex = (int)(dayStartHour * SLOTS_PER_HOUR);
    return (int)floorMod(index - firstIndex, SLOTS_PER_DAY) + 1;
}

bool BlockCalendar::isBefore(int a, int b, uint32_t dayStartHour) {
    return displayNumber(a, dayStartHour) < displayNumber(b, dayStartHour);
}

// =================================================================================
// SECTION: CIVIL DATE CONVERSION (proleptic Gregorian)
// =================================================================================

int64_t BlockCalendar::daysFromCivil(int year, unsigned month, unsigned day) {
    int64_t y = (int64_t)year - (month <= 2 ? 1 : 0);
    int64_t era = floorDiv(y, 400);
    unsigned yoe = (unsigned)(y - era * 400);
    unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (int64_t)doe - 719468;
}

void BlockCalendar::civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day) {
    days += 719468;
    int64_t era = floorDiv(days, 146097);
    unsigned doe = (unsigned)(days - era * 146097);
    unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = (int64_t)yoe + era * 400;
    unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = (int)(y + (month <= 2 ? 1 : 0));
}

std::string BlockCalendar::formatDate(int64_t days) {
    int y = 0;
    unsigned m = 0, d = 0;
    civilFromDays(days, y, m, d);

    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return std::string(buf);
}

bool BlockCalendar::parseDate(const std::string& date, int64_t& days) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;

    int y = 0;
    unsigned m = 0, d = 0;
    if (sscanf(date.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) return false;
    if (m < 1 || m > 12 || d < 1 || d > 31) return false;

    days = daysFromCivil(y, m, d);
    return true;
}
