#include <stdio.h>
#include <exception>
#include <boost/asio/io_context.hpp>
#include "constants.h"
#include "logger.h"
#include "monitor_config.h"
#include "monitor_system.h"
#include "network_manager.h"

int main(int argc, char* argv[]) {
    boost::asio::io_context io;

    // Logger first so configuration errors reach stderr; syslog joins once configured
    NetworkManager networkManager(io);
    Logger::begin(&networkManager);
    Logger::setLogLevel(LOG_INFO);  // Default to INFO level

    LOG_INFO("%s v%s starting", APP_NAME, APP_VERSION);

    MonitorConfigManager configManager;
    if (!configManager.begin(argc > 1 ? argv[1] : DEFAULT_CONFIG_FILE)) {
        LOG_CRITICAL("Configuration invalid, exiting");
        return 1;
    }
    configManager.applyToLogger();
    configManager.applyToNetworkManager(&networkManager);
    configManager.printConfiguration();

    if (!networkManager.begin()) {
        LOG_CRITICAL("Network setup failed, exiting");
        return 1;
    }

    MonitorSystem monitorSystem(io, configManager, networkManager);
    if (!monitorSystem.begin()) {
        LOG_ERROR("Monitoring not started, waiting for shutdown signal");
    }

    try {
        io.run();
    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled error in event loop: %s", e.what());
        return 1;
    }

    LOG_INFO("%s stopped", APP_NAME);
    return 0;
}
