#include "poll_scheduler.h"
#include "logger.h"
#include "precise_clock.h"

PollScheduler::PollScheduler(boost::asio::io_context& io)
    : timer(io)
    , samplePeriodMs(0)
    , running(false)
    , ticks(0)
    , skippedTicks(0)
    , generation(0) {
}

uint32_t PollScheduler::computeInitialDelayMs(uint32_t periodMs, uint32_t millisIntoMinute) {
    if (periodMs == 0) return 0;
    return periodMs - (millisIntoMinute % periodMs);
}

bool PollScheduler::begin() {
    if (samplePeriodMs == 0) {
        LOG_ERROR("PollScheduler: Sample period not set");
        return false;
    }
    if (!pollHandler) {
        LOG_ERROR("PollScheduler: No poll handler");
        return false;
    }

    running = true;
    scheduleAligned();
    return true;
}

void PollScheduler::resynchronize() {
    if (!running) return;
    LOG_INFO("PollScheduler: Resynchronizing poll phase");
    scheduleAligned();
}

void PollScheduler::stop() {
    running = false;
    generation++;
    timer.cancel();
}

void PollScheduler::scheduleAligned() {
    generation++;

    int64_t nowMs = timestampToEpochMs(PreciseClock::systemNow());
    uint32_t millisIntoMinute = (uint32_t)(((nowMs % 60000) + 60000) % 60000);
    uint32_t delayMs = computeInitialDelayMs(samplePeriodMs, millisIntoMinute);

    // expires_after cancels any pending wait
    timer.expires_after(std::chrono::milliseconds(delayMs));
    arm();

    LOG_INFO("PollScheduler: First poll in %u ms, then every %u ms", delayMs, samplePeriodMs);
}

void PollScheduler::arm() {
    unsigned long armedGeneration = generation;
    timer.async_wait([this, armedGeneration](const boost::system::error_code& ec) {
        onTimer(ec, armedGeneration);
    });
}

void PollScheduler::onTimer(const boost::system::error_code& ec, unsigned long armedGeneration) {
    if (ec == boost::asio::error::operation_aborted || armedGeneration != generation || !running) {
        return;
    }
    if (ec) {
        LOG_ERROR("PollScheduler: Timer failed: %s", ec.message().c_str());
        running = false;
        return;
    }

    ticks++;

    // Keep the phase of the previous expiry but never replay periods already past
    std::chrono::milliseconds period(samplePeriodMs);
    boost::asio::steady_timer::time_point next = timer.expiry() + period;
    boost::asio::steady_timer::time_point now = boost::asio::steady_timer::clock_type::now();
    unsigned long overdue = 0;
    while (next <= now) {
        next += period;
        overdue++;
    }
    if (overdue > 0) {
        skippedTicks += overdue;
        LOG_WARN("PollScheduler: Event loop stalled, skipped %lu polls", overdue);
    }
    timer.expires_at(next);
    arm();

    pollHandler();
}
