#pragma once

#include <chrono>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include "constants.h"
#include "daily_logger.h"
#include "delivery_pipeline.h"
#include "frame_decoder.h"
#include "monitor_config.h"
#include "network_manager.h"
#include "poll_scheduler.h"
#include "precise_clock.h"
#include "serial_bridge.h"
#include "system_status.h"

/**
 * @brief Owns the monitoring chain and its process-wide state
 *
 * poll timer -> serial bridge -> frame decoder -> delivery pipeline
 *
 * Everything runs on the io_context thread. SIGHUP re-anchors the clock and
 * re-aligns polling; SIGINT/SIGTERM stop every source of work so run() returns.
 */
class MonitorSystem : public FrameListener {
public:
    MonitorSystem(boost::asio::io_context& io, const MonitorConfigManager& configManager, NetworkManager& network);

    bool begin();
    void stop();
    void resynchronize();

    // FrameListener
    void onReading(const Reading& reading) override;
    void onFrameError(const ErrorRecord& error) override;

    // System monitoring
    unsigned long getUptime() const;
    void setSystemState(SystemState state);

    // Status reporting
    void getStatusString(char* buffer, size_t bufferSize);
    void publishStatus();

private:
    const MonitorConfigManager& config;
    NetworkManager& networkManager;

    // System state
    SystemState currentState;
    std::chrono::steady_clock::time_point systemStartTime;

    PreciseClock preciseClock;
    FrameDecoder frameDecoder;
    SystemStatus systemStatus;
    DailyLogger dailyLogger;
    DeliveryPipeline deliveryPipeline;
    SerialBridge serialBridge;
    PollScheduler pollScheduler;

    boost::asio::signal_set signals;
    boost::asio::steady_timer statusTimer;
    unsigned long publishInterval;

    void waitForSignal();
    void onSignal(const boost::system::error_code& ec, int signalNumber);
    void scheduleStatus();
};
