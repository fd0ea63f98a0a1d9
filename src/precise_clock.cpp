#include "precise_clock.h"
#include <stdio.h>
#include <string.h>
#include <time.h>

Timestamp timestampFromEpochMs(int64_t epochMs) {
    return Timestamp(std::chrono::milliseconds(epochMs));
}

int64_t timestampToEpochMs(Timestamp ts) {
    return ts.time_since_epoch().count();
}

static void splitEpochMs(int64_t epochMs, time_t& seconds, int& millis) {
    int64_t secs = epochMs / 1000;
    int64_t rem = epochMs % 1000;
    if (rem < 0) {
        rem += 1000;
        secs -= 1;
    }
    seconds = (time_t)secs;
    millis = (int)rem;
}

std::string formatIsoTimestamp(Timestamp ts) {
    time_t seconds;
    int millis;
    splitEpochMs(timestampToEpochMs(ts), seconds, millis);

    struct tm utc;
    gmtime_r(&seconds, &utc);

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return std::string(buffer);
}

bool parseIsoTimestamp(const std::string& text, Timestamp& ts) {
    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
               &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    const char* p = text.c_str() + consumed;
    int millis = 0;
    if (*p == '.') {
        p++;
        int digits = 0;
        while (*p >= '0' && *p <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (*p - '0');
            }
            digits++;
            p++;
        }
        if (digits == 0) return false;
        for (; digits < 3; digits++) {
            millis *= 10;
        }
    }
    if (*p == 'Z') {
        p++;
    }
    if (*p != '\0') {
        return false;
    }

    struct tm utc;
    memset(&utc, 0, sizeof(utc));
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    time_t seconds = timegm(&utc);

    ts = timestampFromEpochMs((int64_t)seconds * 1000 + millis);
    return true;
}

std::string formatDay(Timestamp ts) {
    // First 10 characters of the ISO form
    return formatIsoTimestamp(ts).substr(0, 10);
}

PreciseClock::PreciseClock()
    : wallAnchorMs(0)
    , monotonicAnchorNs(0)
    , synchronized(false)
    , syncCount(0) {
}

void PreciseClock::synchronize() {
    wallAnchorMs = readWallClockMs();
    monotonicAnchorNs = readMonotonicNs();
    synchronized = true;
    syncCount++;
}

Timestamp PreciseClock::now() const {
    if (!synchronized) {
        return timestampFromEpochMs(readWallClockMs());
    }
    int64_t elapsedMs = (readMonotonicNs() - monotonicAnchorNs) / 1000000;
    return timestampFromEpochMs(wallAnchorMs + elapsedMs);
}

Timestamp PreciseClock::systemNow() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

int64_t PreciseClock::readWallClockMs() const {
    return timestampToEpochMs(systemNow());
}

int64_t PreciseClock::readMonotonicNs() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}
