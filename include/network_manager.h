#pragma once

#include <stdint.h>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/ssl/context.hpp>
#include "constants.h"
#include "telemetry_sink.h"

// Parsed form of the primary sink URL
struct Endpoint {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;
};

// Accepts http://host[:port][/path] and https://host[:port][/path]
bool parseEndpointUrl(const std::string& url, Endpoint& endpoint);

/**
 * @brief Network I/O for the monitor
 *
 * Primary sink (HTTP POST of JSON), secondary sink (one-shot TCP record) and
 * the syslog transport used by Logger. All sends are synchronous and run on
 * the caller's thread.
 */
class NetworkManager : public TelemetrySink, public BackupSink {
public:
    explicit NetworkManager(boost::asio::io_context& io);

    bool begin();

    // Primary sink
    bool setApiUrl(const std::string& url);
    const std::string& getApiUrl() const { return apiUrl; }
    DeliveryResult postJson(const nlohmann::json& payload) override;

    // Secondary sink
    void setBackupTarget(const std::string& host, uint16_t port);
    DeliveryResult sendRecord(const std::string& record) override;

    // Syslog functionality
    bool sendSyslog(const char* message, int level = 6);  // Default to INFO level
    void setSyslogServer(const char* server, int port = SYSLOG_PORT);
    bool isSyslogEnabled() const { return syslogServer[0] != '\0'; }

    // Hostname configuration
    void setHostname(const char* hostname);

    // Status reporting
    void getHealthString(char* buffer, size_t bufferSize);

private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    boost::asio::ip::udp::socket syslogSocket;

    // Primary sink
    std::string apiUrl;
    Endpoint apiEndpoint;
    bool apiConfigured;

    // Secondary sink
    std::string backupHost;
    uint16_t backupPort;

    // Health tracking
    unsigned long postCount;
    unsigned long failedPostCount;
    unsigned long backupSentCount;
    unsigned long backupFailedCount;

    // Syslog configuration
    char syslogServer[64];
    int syslogPort;
    bool lastSyslogSuccess;
    bool syslogResolved;
    boost::asio::ip::udp::endpoint syslogEndpoint;

    // Hostname
    char hostname[64];

    bool resolveSyslogServer();
    DeliveryResult postPlain(const std::string& body);
    DeliveryResult postSecure(const std::string& body);
};
