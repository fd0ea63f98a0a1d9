#pragma once

#include <chrono>
#include <stdint.h>
#include <string>

// Absolute time with millisecond resolution (UTC epoch based)
typedef std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds> Timestamp;

Timestamp timestampFromEpochMs(int64_t epochMs);
int64_t timestampToEpochMs(Timestamp ts);

// "2024-05-01T08:15:30.250Z"
std::string formatIsoTimestamp(Timestamp ts);
// Accepts the format above; fraction and trailing 'Z' are optional
bool parseIsoTimestamp(const std::string& text, Timestamp& ts);
// UTC calendar day, "2024-05-01"
std::string formatDay(Timestamp ts);

/**
 * @brief Drift-stable absolute clock
 *
 * Captures a wall-clock anchor and a monotonic anchor at the same instant.
 * now() = wall anchor + (monotonic now - monotonic anchor), so timestamps
 * keep advancing at the monotonic rate even if the system clock is stepped
 * (NTP correction, manual date change) between samples.
 *
 * The raw clock reads are virtual so tests can drive both clocks.
 */
class PreciseClock {
public:
    PreciseClock();
    virtual ~PreciseClock() = default;

    // Capture both anchors; called at startup and on every resync request
    void synchronize();
    Timestamp now() const;

    bool isSynchronized() const { return synchronized; }
    Timestamp getWallAnchor() const { return timestampFromEpochMs(wallAnchorMs); }
    unsigned long getSyncCount() const { return syncCount; }

    // Unanchored system time, for log lines and phase alignment
    static Timestamp systemNow();

protected:
    virtual int64_t readWallClockMs() const;
    virtual int64_t readMonotonicNs() const;

private:
    int64_t wallAnchorMs;
    int64_t monotonicAnchorNs;
    bool synchronized;
    unsigned long syncCount;
};
