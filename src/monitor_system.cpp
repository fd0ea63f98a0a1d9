#include "monitor_system.h"
#include "logger.h"
#include <signal.h>
#include <stdio.h>

MonitorSystem::MonitorSystem(boost::asio::io_context& io, const MonitorConfigManager& configManager, NetworkManager& network)
    : config(configManager)
    , networkManager(network)
    , currentState(SYS_INITIALIZING)
    , systemStartTime(std::chrono::steady_clock::now())
    , frameDecoder(preciseClock)
    , dailyLogger(configManager.getSensorLogDir())
    , deliveryPipeline(network, systemStatus, dailyLogger)
    , serialBridge(io)
    , pollScheduler(io)
    , signals(io, SIGINT, SIGTERM, SIGHUP)
    , statusTimer(io)
    , publishInterval(STATUS_PUBLISH_INTERVAL_MS) {
}

bool MonitorSystem::begin() {
    systemStartTime = std::chrono::steady_clock::now();

    preciseClock.synchronize();
    LOG_INFO("MonitorSystem: Clock anchored at %s", formatIsoTimestamp(preciseClock.getWallAnchor()).c_str());

    frameDecoder.setDeviceId(config.getDeviceId());
    frameDecoder.setListener(this);

    deliveryPipeline.setSamplePeriodMs(config.getSampleRateMs());
    if (config.isBackupTcpEnabled()) {
        deliveryPipeline.setBackupSink(&networkManager);
        LOG_INFO("MonitorSystem: Backup mirroring to %s:%u enabled",
            config.getBackupTcpHost().c_str(), (unsigned)config.getBackupTcpPort());
    } else {
        deliveryPipeline.setBackupSink(nullptr);
    }
    LOG_INFO("MonitorSystem: Archiving to %s", dailyLogger.getDirectory().c_str());

    waitForSignal();
    scheduleStatus();

    serialBridge.setFrameDecoder(&frameDecoder);
    if (!serialBridge.begin(config.getSerialPortPath())) {
        // Keep running without input; status lines and signals still work
        setSystemState(SYS_ERROR);
        return false;
    }

    pollScheduler.setPeriodMs(config.getSampleRateMs());
    pollScheduler.setPollHandler([this]() { serialBridge.sendCommand(); });
    if (!pollScheduler.begin()) {
        setSystemState(SYS_ERROR);
        return false;
    }

    setSystemState(SYS_MONITORING);
    return true;
}

void MonitorSystem::stop() {
    if (currentState == SYS_STOPPING) return;
    setSystemState(SYS_STOPPING);

    pollScheduler.stop();
    serialBridge.stop();
    statusTimer.cancel();

    boost::system::error_code ec;
    signals.cancel(ec);

    publishStatus();
}

void MonitorSystem::resynchronize() {
    preciseClock.synchronize();
    LOG_INFO("MonitorSystem: Clock re-anchored at %s (sync #%lu)",
        formatIsoTimestamp(preciseClock.getWallAnchor()).c_str(), preciseClock.getSyncCount());
    pollScheduler.resynchronize();
}

void MonitorSystem::onReading(const Reading& reading) {
    deliveryPipeline.handleReading(reading);
}

void MonitorSystem::onFrameError(const ErrorRecord& error) {
    LOG_WARN("MonitorSystem: Frame error at %s: %s",
        formatIsoTimestamp(error.sensingTime).c_str(), error.reason.c_str());
    deliveryPipeline.handleError(error);
}

void MonitorSystem::waitForSignal() {
    signals.async_wait([this](const boost::system::error_code& ec, int signalNumber) {
        onSignal(ec, signalNumber);
    });
}

void MonitorSystem::onSignal(const boost::system::error_code& ec, int signalNumber) {
    if (ec) {
        return;  // Cancelled by stop()
    }

    if (signalNumber == SIGHUP) {
        LOG_INFO("MonitorSystem: SIGHUP received, resynchronizing");
        resynchronize();
        waitForSignal();
        return;
    }

    LOG_INFO("MonitorSystem: Signal %d received, shutting down", signalNumber);
    stop();
}

void MonitorSystem::scheduleStatus() {
    statusTimer.expires_after(std::chrono::milliseconds(publishInterval));
    statusTimer.async_wait([this](const boost::system::error_code& ec) {
        if (ec) return;
        publishStatus();
        scheduleStatus();
    });
}

unsigned long MonitorSystem::getUptime() const {
    return (unsigned long)std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - systemStartTime).count();
}

void MonitorSystem::setSystemState(SystemState state) {
    if (currentState != state) {
        LOG_INFO("MonitorSystem: State %s -> %s", getSystemStateString(currentState), getSystemStateString(state));
        currentState = state;
    }
}

void MonitorSystem::getStatusString(char* buffer, size_t bufferSize) {
    snprintf(buffer, bufferSize, "state=%s uptime=%lus ticks=%lu skipped=%lu",
        getSystemStateString(currentState), getUptime(),
        pollScheduler.getTicks(), pollScheduler.getSkippedTicks());
}

void MonitorSystem::publishStatus() {
    char systemBuffer[96];
    char decoderBuffer[160];
    char pipelineBuffer[256];
    char bridgeBuffer[128];
    char networkBuffer[128];

    getStatusString(systemBuffer, sizeof(systemBuffer));
    frameDecoder.getStatistics(decoderBuffer, sizeof(decoderBuffer));
    deliveryPipeline.getStatistics(pipelineBuffer, sizeof(pipelineBuffer));
    serialBridge.getStatistics(bridgeBuffer, sizeof(bridgeBuffer));
    networkManager.getHealthString(networkBuffer, sizeof(networkBuffer));

    LOG_INFO("Status: %s | %s | %s | %s | %s archive=%lu/%lu syslog_drops=%lu",
        systemBuffer, bridgeBuffer, decoderBuffer, pipelineBuffer, networkBuffer,
        dailyLogger.getEntriesWritten(), dailyLogger.getWriteErrors(), Logger::getSyslogDrops());
}
