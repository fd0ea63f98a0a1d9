#include "serial_bridge.h"
#include "logger.h"
#include <stdio.h>
#include <boost/asio/write.hpp>

SerialBridge::SerialBridge(boost::asio::io_context& io)
    : port(io)
    , frameDecoder(nullptr)
    , bridgeConnected(false)
    , bytesReceived(0)
    , chunksReceived(0)
    , commandsSent(0)
    , writeErrors(0) {
}

bool SerialBridge::begin(const std::string& path) {
    devicePath = path;

    boost::system::error_code ec;
    port.open(devicePath, ec);
    if (ec) {
        LOG_ERROR("SerialBridge: Cannot open %s: %s", devicePath.c_str(), ec.message().c_str());
        return false;
    }

    typedef boost::asio::serial_port_base base;
    port.set_option(base::baud_rate(SERIAL_BAUD_RATE), ec);
    if (!ec) port.set_option(base::character_size(8), ec);
    if (!ec) port.set_option(base::parity(base::parity::none), ec);
    if (!ec) port.set_option(base::stop_bits(base::stop_bits::one), ec);
    if (!ec) port.set_option(base::flow_control(base::flow_control::none), ec);
    if (ec) {
        LOG_ERROR("SerialBridge: Cannot configure %s: %s", devicePath.c_str(), ec.message().c_str());
        boost::system::error_code closeEc;
        port.close(closeEc);
        return false;
    }

    bridgeConnected = true;
    LOG_INFO("SerialBridge: Opened %s at %u baud", devicePath.c_str(), SERIAL_BAUD_RATE);

    startRead();
    return true;
}

void SerialBridge::stop() {
    if (!port.is_open()) return;

    bridgeConnected = false;
    boost::system::error_code ec;
    port.cancel(ec);
    port.close(ec);
    if (ec) {
        LOG_WARN("SerialBridge: Close of %s failed: %s", devicePath.c_str(), ec.message().c_str());
    }
}

bool SerialBridge::sendCommand() {
    if (!bridgeConnected) {
        writeErrors++;
        LOG_WARN("SerialBridge: Poll skipped, %s not connected", devicePath.c_str());
        return false;
    }

    boost::system::error_code ec;
    boost::asio::write(port, boost::asio::buffer(READ_ANGLE_COMMAND, READ_ANGLE_COMMAND_SIZE), ec);
    if (ec) {
        writeErrors++;
        LOG_ERROR("SerialBridge: Write to %s failed: %s", devicePath.c_str(), ec.message().c_str());
        return false;
    }

    commandsSent++;
    return true;
}

void SerialBridge::startRead() {
    port.async_read_some(boost::asio::buffer(readBuffer, sizeof(readBuffer)),
        [this](const boost::system::error_code& ec, size_t length) {
            onRead(ec, length);
        });
}

void SerialBridge::onRead(const boost::system::error_code& ec, size_t length) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    if (ec) {
        // No reconnect; the process keeps running without input
        bridgeConnected = false;
        LOG_CRITICAL("SerialBridge: Read from %s failed: %s", devicePath.c_str(), ec.message().c_str());
        return;
    }

    bytesReceived += length;
    chunksReceived++;

    if (frameDecoder && length > 0) {
        frameDecoder->process(readBuffer, length);
    }

    if (bridgeConnected) {
        startRead();
    }
}

void SerialBridge::getStatistics(char* buffer, size_t bufferSize) {
    snprintf(buffer, bufferSize,
        "serial=%s bytes=%lu chunks=%lu polls=%lu write_errors=%lu",
        bridgeConnected ? "UP" : "DOWN",
        bytesReceived, chunksReceived, commandsSent, writeErrors);
}
