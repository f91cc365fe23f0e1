/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/BlockCalendar.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Pure slot arithmetic. A day holds 72 slots of 1200 s; slot N starts at
 * local N * 20 min. The configured day-start hour decides which logical date
 * an instant belongs to: slots before that hour are the tail of the previous
 * logical day and occur on the following calendar date.
 * All functions are static and stateless. An out-of-range index is a caller
 * contract violation.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class BlockCalendar {
public:
    // Slot containing the instant, 0..71.
    static int indexForInstant(EpochMillis now, int32_t utcOffsetSeconds);

    // Logical date ("YYYY-MM-DD") containing the instant.
    static std::string logicalDate(EpochMillis now, uint32_t dayStartHour, int32_t utcOffsetSeconds);

    /**
     * Absolute bounds of a slot of a logical date.
     * @return false if the date string is malformed.
     */
    static bool slotBounds(int index, const std::string& date, uint32_t dayStartHour,
                           int32_t utcOffsetSeconds, EpochMillis& start, EpochMillis& end);

    /**
     * Seconds left in the slot, rounded up.
     * 0 once the slot has passed, the full 1200 if it has not started yet.
     */
    static uint32_t remainingSeconds(int index, const std::string& date, EpochMillis now,
                                     uint32_t dayStartHour, int32_t utcOffsetSeconds);

    // Day-order numbering: the slot starting at dayStartHour is "1", the last is "72".
    static int displayNumber(int index, uint32_t dayStartHour);

    // True when index a comes strictly before index b within one logical day.
    static bool isBefore(int a, int b, uint32_t dayStartHour);

    // --- Date helpers ---
    static int64_t daysFromCivil(int year, unsigned month, unsigned day);
    static void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day);
    static std::string formatDate(int64_t days);
    static bool parseDate(const std::string& date, int64_t& days);
};
