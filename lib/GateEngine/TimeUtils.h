/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/TimeUtils.h
 *
 * Description:
 * Static helpers for human-readable durations (e.g. "5min 5s") in logs and
 * diagnostics, and ISO-8601 formatting of activity timestamps.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <time.h>

class TimeUtils {
public:
    /**
     * Formats seconds into a human-readable string (e.g. "1d 2h 3min 4s").
     * Units with 0 values are omitted unless the total time is 0s.
     */
    static void formatSeconds(unsigned long totalSeconds, char *buffer, size_t size) {
        if (size == 0) return;
        if (totalSeconds == 0) {
            snprintf(buffer, size, "0s");
            return;
        }

        const unsigned long SECS_MIN  = 60;
        const unsigned long SECS_HOUR = 3600;
        const unsigned long SECS_DAY  = 86400;

        unsigned long rem = totalSeconds;

        unsigned long d = rem / SECS_DAY;
        rem %= SECS_DAY;

        unsigned long h = rem / SECS_HOUR;
        rem %= SECS_HOUR;

        unsigned long m = rem / SECS_MIN;
        unsigned long s = rem % SECS_MIN;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                offset += snprintf(buffer + offset, size - offset, "%lu%s ", val, suffix);
            }
        };

        append(d, "d");
        append(h, "h");
        append(m, "min");

        if (s > 0 || offset == 0) {
            if (offset < size) {
                offset += snprintf(buffer + offset, size - offset, "%lus", s);
            }
        } else if (offset > 0 && offset <= size && buffer[offset - 1] == ' ') {
            // Trim trailing space
            buffer[offset - 1] = '\0';
        }
    }

    /**
     * Formats epoch seconds as "YYYY-MM-DDTHH:MM:SSZ".
     * An epoch of 0 (clock not synchronized) yields "unsynced".
     */
    static void formatEpoch(uint32_t epochSeconds, char *buffer, size_t size) {
        if (size == 0) return;
        if (epochSeconds == 0) {
            snprintf(buffer, size, "unsynced");
            return;
        }
        time_t t = (time_t)epochSeconds;
        struct tm tmUtc;
        gmtime_r(&t, &tmUtc);
        strftime(buffer, size, "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
    }
};
