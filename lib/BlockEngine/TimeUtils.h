/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/TimeUtils.h
 *
 * Description:
 * Static utility class for time formatting.
 * Converts raw seconds and slot indices into the short strings used by
 * logging and the status API: countdowns ("19:59"), slot start times
 * ("06:20") and durations ("1h 5min 3s").
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdio.h>

class TimeUtils {
public:
    /**
     * Formats a countdown as MM:SS. Minutes are not wrapped at 60.
     * @param totalSeconds Seconds remaining.
     * @param buffer       The destination buffer.
     * @param size         The size of the buffer.
     */
    static void formatCountdown(unsigned long totalSeconds, char *buffer, size_t size) {
        snprintf(buffer, size, "%02lu:%02lu", totalSeconds / 60, totalSeconds % 60);
    }

    /**
     * Formats the local wall-clock start of a slot as HH:MM.
     * @param index Slot index 0..71.
     */
    static void formatSlotTime(int index, char *buffer, size_t size) {
        int minutes = index * 20;
        snprintf(buffer, size, "%02d:%02d", (minutes / 60) % 24, minutes % 60);
    }

    /**
     * Formats seconds into a human-readable duration (e.g., "1h 5min 3s").
     * Units with 0 values are omitted unless the total time is 0s.
     */
    static void formatSeconds(unsigned long totalSeconds, char *buffer, size_t size) {
        if (totalSeconds == 0) {
            snprintf(buffer, size, "0s");
            return;
        }

        const unsigned long SECS_MIN  = 60;
        const unsigned long SECS_HOUR = 3600;

        unsigned long h = totalSeconds / SECS_HOUR;
        unsigned long m = (totalSeconds % SECS_HOUR) / SECS_MIN;
        unsigned long s = totalSeconds % SECS_MIN;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                offset += snprintf(buffer + offset, size - offset, "%lu%s ", val, suffix);
            }
        };

        append(h, "h");
        append(m, "min");

        if (s > 0) {
            if (offset < size) {
                snprintf(buffer + offset, size - offset, "%lus", s);
            }
        } else if (offset > 0 && offset <= size && buffer[offset - 1] == ' ') {
            // Trim trailing space
            buffer[offset - 1] = '\0';
        }
    }
};
