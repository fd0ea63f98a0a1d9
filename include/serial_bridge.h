#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>
#include "constants.h"
#include "frame_decoder.h"

/*
 * OPERATION MODE: Poll / Response
 *
 * The bridge owns the inclinometer's serial device. sendCommand() writes the
 * read-angle command; responses arrive through one asynchronous read that is
 * always armed while connected. Each completed read is handed to the frame
 * decoder in full before the read is re-armed, so chunks are decoded in
 * arrival order.
 *
 * Baud rate: 115200 8N1 (fixed)
 */
class SerialBridge {
public:
    explicit SerialBridge(boost::asio::io_context& io);

    bool begin(const std::string& devicePath);
    void stop();

    // Configuration
    void setFrameDecoder(FrameDecoder* decoder) { frameDecoder = decoder; }

    // Write the poll command; false (and logged) on failure
    bool sendCommand();

    // Status
    bool isConnected() const { return bridgeConnected; }
    const std::string& getDevicePath() const { return devicePath; }
    unsigned long getBytesReceived() const { return bytesReceived; }
    unsigned long getChunksReceived() const { return chunksReceived; }
    unsigned long getCommandsSent() const { return commandsSent; }
    unsigned long getWriteErrors() const { return writeErrors; }

    // Statistics
    void getStatistics(char* buffer, size_t bufferSize);

private:
    boost::asio::serial_port port;
    FrameDecoder* frameDecoder;
    std::string devicePath;

    // Connection state
    bool bridgeConnected;

    // Statistics
    unsigned long bytesReceived;
    unsigned long chunksReceived;
    unsigned long commandsSent;
    unsigned long writeErrors;

    uint8_t readBuffer[SERIAL_READ_CHUNK_SIZE];

    void startRead();
    void onRead(const boost::system::error_code& ec, size_t length);
};
