#include "network_manager.h"
#include "logger.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

bool parseEndpointUrl(const std::string& url, Endpoint& endpoint) {
    Endpoint parsed;
    size_t pos;
    if (strncasecmp(url.c_str(), "https://", 8) == 0) {
        parsed.secure = true;
        pos = 8;
    } else if (strncasecmp(url.c_str(), "http://", 7) == 0) {
        parsed.secure = false;
        pos = 7;
    } else {
        return false;
    }

    size_t slash = url.find('/', pos);
    std::string authority = url.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    parsed.target = slash == std::string::npos ? "/" : url.substr(slash);

    // Bracketed IPv6 literal: [addr]:port
    size_t colon;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return false;
        parsed.host = authority.substr(1, close - 1);
        colon = (close + 1 < authority.size() && authority[close + 1] == ':') ? close + 1 : std::string::npos;
    } else {
        colon = authority.rfind(':');
        parsed.host = authority.substr(0, colon);
    }

    if (colon != std::string::npos) {
        parsed.port = authority.substr(colon + 1);
        if (parsed.port.empty() || parsed.port.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        unsigned long port = strtoul(parsed.port.c_str(), nullptr, 10);
        if (port == 0 || port > 65535) return false;
    } else {
        parsed.port = parsed.secure ? "443" : "80";
    }

    if (parsed.host.empty()) return false;

    endpoint = parsed;
    return true;
}

static http::request<http::string_body> buildPostRequest(const Endpoint& endpoint, const std::string& body) {
    http::request<http::string_body> request(http::verb::post, endpoint.target, 11);
    request.set(http::field::host, endpoint.host);
    request.set(http::field::user_agent, HTTP_USER_AGENT);
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();
    return request;
}

static DeliveryResult checkResponse(const http::response<http::string_body>& response) {
    unsigned status = response.result_int();
    if (status >= 200 && status < 300) {
        return DeliveryResult::ok();
    }
    char reason[96];
    snprintf(reason, sizeof(reason), "HTTP %u %.*s", status,
        (int)response.reason().size(), response.reason().data());
    return DeliveryResult::failed(reason);
}

NetworkManager::NetworkManager(boost::asio::io_context& io)
    : ioContext(io)
    , sslContext(ssl::context::tls_client)
    , syslogSocket(io)
    , apiConfigured(false)
    , backupPort(0)
    , postCount(0)
    , failedPostCount(0)
    , backupSentCount(0)
    , backupFailedCount(0)
    , syslogPort(SYSLOG_PORT)
    , lastSyslogSuccess(false)
    , syslogResolved(false) {

    syslogServer[0] = '\0';

    // Set default hostname
    strncpy(hostname, SYSLOG_HOSTNAME, sizeof(hostname) - 1);
    hostname[sizeof(hostname) - 1] = '\0';
}

bool NetworkManager::begin() {
    boost::system::error_code ec;
    sslContext.set_default_verify_paths(ec);
    if (ec) {
        LOG_WARN("NetworkManager: No default CA store (%s), https endpoints will fail", ec.message().c_str());
    }
    sslContext.set_verify_mode(ssl::verify_peer);

    if (!apiConfigured) {
        LOG_ERROR("NetworkManager: Primary endpoint not configured");
        return false;
    }

    LOG_INFO("NetworkManager: Primary sink %s://%s:%s%s",
        apiEndpoint.secure ? "https" : "http",
        apiEndpoint.host.c_str(), apiEndpoint.port.c_str(), apiEndpoint.target.c_str());
    if (!backupHost.empty()) {
        LOG_INFO("NetworkManager: Backup sink %s:%u", backupHost.c_str(), (unsigned)backupPort);
    }
    if (isSyslogEnabled()) {
        LOG_INFO("NetworkManager: Syslog to %s:%d as '%s'", syslogServer, syslogPort, hostname);
    }
    return true;
}

bool NetworkManager::setApiUrl(const std::string& url) {
    Endpoint endpoint;
    if (!parseEndpointUrl(url, endpoint)) {
        LOG_ERROR("NetworkManager: Invalid API URL '%s'", url.c_str());
        return false;
    }
    apiUrl = url;
    apiEndpoint = endpoint;
    apiConfigured = true;
    return true;
}

DeliveryResult NetworkManager::postJson(const nlohmann::json& payload) {
    postCount++;
    if (!apiConfigured) {
        failedPostCount++;
        return DeliveryResult::failed("primary endpoint not configured");
    }

    std::string body = payload.dump();
    DeliveryResult result = apiEndpoint.secure ? postSecure(body) : postPlain(body);
    if (!result.success) {
        failedPostCount++;
    }
    return result;
}

DeliveryResult NetworkManager::postPlain(const std::string& body) {
    beast::error_code ec;
    tcp::resolver resolver(ioContext);
    tcp::resolver::results_type results = resolver.resolve(apiEndpoint.host, apiEndpoint.port, ec);
    if (ec) {
        return DeliveryResult::failed("resolve " + apiEndpoint.host + ": " + ec.message());
    }

    beast::tcp_stream stream(ioContext);
    stream.connect(results, ec);
    if (ec) {
        return DeliveryResult::failed("connect: " + ec.message());
    }

    http::request<http::string_body> request = buildPostRequest(apiEndpoint, body);
    http::write(stream, request, ec);
    if (ec) {
        return DeliveryResult::failed("write: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(stream, buffer, response, ec);
    if (ec) {
        return DeliveryResult::failed("read: " + ec.message());
    }

    beast::error_code shutdownEc;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);
    if (shutdownEc && shutdownEc != beast::errc::not_connected) {
        LOG_DEBUG("NetworkManager: HTTP shutdown: %s", shutdownEc.message().c_str());
    }

    return checkResponse(response);
}

DeliveryResult NetworkManager::postSecure(const std::string& body) {
    beast::error_code ec;
    tcp::resolver resolver(ioContext);
    tcp::resolver::results_type results = resolver.resolve(apiEndpoint.host, apiEndpoint.port, ec);
    if (ec) {
        return DeliveryResult::failed("resolve " + apiEndpoint.host + ": " + ec.message());
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioContext, sslContext);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), apiEndpoint.host.c_str())) {
        return DeliveryResult::failed("cannot set TLS server name");
    }
    stream.set_verify_callback(ssl::host_name_verification(apiEndpoint.host));

    beast::get_lowest_layer(stream).connect(results, ec);
    if (ec) {
        return DeliveryResult::failed("connect: " + ec.message());
    }

    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        return DeliveryResult::failed("TLS handshake: " + ec.message());
    }

    http::request<http::string_body> request = buildPostRequest(apiEndpoint, body);
    http::write(stream, request, ec);
    if (ec) {
        return DeliveryResult::failed("write: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(stream, buffer, response, ec);
    if (ec) {
        return DeliveryResult::failed("read: " + ec.message());
    }

    // Servers commonly drop the connection instead of answering close_notify
    beast::error_code shutdownEc;
    stream.shutdown(shutdownEc);
    if (shutdownEc && shutdownEc != boost::asio::error::eof && shutdownEc != ssl::error::stream_truncated) {
        LOG_DEBUG("NetworkManager: TLS shutdown: %s", shutdownEc.message().c_str());
    }

    return checkResponse(response);
}

void NetworkManager::setBackupTarget(const std::string& host, uint16_t port) {
    backupHost = host;
    backupPort = port;
}

DeliveryResult NetworkManager::sendRecord(const std::string& record) {
    if (backupHost.empty() || backupPort == 0) {
        backupFailedCount++;
        return DeliveryResult::failed("backup target not configured");
    }

    boost::system::error_code ec;
    tcp::resolver resolver(ioContext);
    tcp::resolver::results_type results = resolver.resolve(backupHost, std::to_string(backupPort), ec);
    if (ec) {
        backupFailedCount++;
        return DeliveryResult::failed("resolve " + backupHost + ": " + ec.message());
    }

    tcp::socket socket(ioContext);
    boost::asio::connect(socket, results, ec);
    if (ec) {
        backupFailedCount++;
        return DeliveryResult::failed("connect: " + ec.message());
    }

    boost::asio::write(socket, boost::asio::buffer(record), ec);
    if (ec) {
        backupFailedCount++;
        return DeliveryResult::failed("write: " + ec.message());
    }

    boost::system::error_code closeEc;
    socket.shutdown(tcp::socket::shutdown_send, closeEc);
    socket.close(closeEc);
    if (closeEc) {
        LOG_DEBUG("NetworkManager: Backup close: %s", closeEc.message().c_str());
    }

    backupSentCount++;
    return DeliveryResult::ok();
}

bool NetworkManager::resolveSyslogServer() {
    boost::system::error_code ec;
    boost::asio::ip::udp::resolver resolver(ioContext);
    boost::asio::ip::udp::resolver::results_type results =
        resolver.resolve(syslogServer, std::to_string(syslogPort), ec);
    if (ec || results.empty()) {
        return false;
    }

    syslogEndpoint = results.begin()->endpoint();
    if (syslogSocket.is_open()) {
        syslogSocket.close(ec);
    }
    syslogSocket.open(syslogEndpoint.protocol(), ec);
    if (ec) {
        return false;
    }
    syslogResolved = true;
    return true;
}

// Called from Logger; must not log
bool NetworkManager::sendSyslog(const char* message, int level) {
    if (!isSyslogEnabled()) {
        lastSyslogSuccess = false;
        return false;
    }

    // Validate severity level (0-7 per RFC 3164)
    if (level < 0 || level > 7) {
        level = 6; // Default to INFO if invalid
    }

    if (!syslogResolved && !resolveSyslogServer()) {
        lastSyslogSuccess = false;
        return false;
    }

    // RFC 3164 syslog format: <PRI>HOSTNAME TAG: MESSAGE
    // PRI = Facility * 8 + Severity
    int priority = SYSLOG_FACILITY * 8 + level;

    char syslogMessage[1200];
    int length = snprintf(syslogMessage, sizeof(syslogMessage),
        "<%d>%s %s: %s", priority, hostname, SYSLOG_TAG, message);
    if (length < 0) {
        lastSyslogSuccess = false;
        return false;
    }
    if ((size_t)length >= sizeof(syslogMessage)) {
        length = sizeof(syslogMessage) - 1;
    }

    boost::system::error_code ec;
    syslogSocket.send_to(boost::asio::buffer(syslogMessage, (size_t)length), syslogEndpoint, 0, ec);
    lastSyslogSuccess = !ec;
    return lastSyslogSuccess;
}

void NetworkManager::setSyslogServer(const char* server, int port) {
    strncpy(syslogServer, server ? server : "", sizeof(syslogServer) - 1);
    syslogServer[sizeof(syslogServer) - 1] = '\0';
    syslogPort = port;
    syslogResolved = false;
    lastSyslogSuccess = false;
}

void NetworkManager::setHostname(const char* name) {
    if (!name || name[0] == '\0') return;
    strncpy(hostname, name, sizeof(hostname) - 1);
    hostname[sizeof(hostname) - 1] = '\0';
}

void NetworkManager::getHealthString(char* buffer, size_t bufferSize) {
    const char* syslogStatus = !isSyslogEnabled() ? "OFF" : (lastSyslogSuccess ? "OK" : "DOWN");

    snprintf(buffer, bufferSize,
        "posts=%lu failed=%lu backup_sent=%lu backup_failed=%lu syslog=%s",
        postCount, failedPostCount, backupSentCount, backupFailedCount, syslogStatus);
}
