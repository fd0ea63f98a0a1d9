#pragma once

#include <stdint.h>
#include <functional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

/**
 * @brief Emits the poll command on sample-period boundaries
 *
 * The first tick is aligned to the next multiple of the period within the
 * current wall-clock minute; after that the timer free-runs every period
 * (expiry += period). Periods that elapsed while the event loop was blocked
 * are skipped, not replayed, so a slow handler never causes a burst of polls.
 */
class PollScheduler {
public:
    typedef std::function<void()> PollHandler;

    explicit PollScheduler(boost::asio::io_context& io);

    void setPeriodMs(uint32_t periodMs) { samplePeriodMs = periodMs; }
    uint32_t getPeriodMs() const { return samplePeriodMs; }
    void setPollHandler(PollHandler handler) { pollHandler = handler; }

    // periodMs - (millisIntoMinute % periodMs), always in (0, periodMs]
    static uint32_t computeInitialDelayMs(uint32_t periodMs, uint32_t millisIntoMinute);

    bool begin();
    // Cancel the running timer and align again from the current wall clock
    void resynchronize();
    void stop();

    bool isRunning() const { return running; }
    unsigned long getTicks() const { return ticks; }
    unsigned long getSkippedTicks() const { return skippedTicks; }

private:
    boost::asio::steady_timer timer;
    PollHandler pollHandler;
    uint32_t samplePeriodMs;
    bool running;
    unsigned long ticks;
    unsigned long skippedTicks;
    // Bumped on every (re)start; stale completions compare unequal and exit
    unsigned long generation;

    void scheduleAligned();
    void arm();
    void onTimer(const boost::system::error_code& ec, unsigned long armedGeneration);
};
