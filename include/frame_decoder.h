#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "constants.h"
#include "precise_clock.h"

struct Reading {
    std::string deviceId;
    Timestamp sensingTime;
    int32_t rawX;
    int32_t rawY;
    int32_t rawZ;
    std::string angX;      // degrees, 3 decimals
    std::string angY;
    std::string angZ;
};

struct ErrorRecord {
    Timestamp sensingTime;
    std::string reason;
};

// Receives decoder output in generation order
class FrameListener {
public:
    virtual ~FrameListener() = default;
    virtual void onReading(const Reading& reading) = 0;
    virtual void onFrameError(const ErrorRecord& error) = 0;
};

// CRC16/Modbus: reflected poly 0xA001, init 0xFFFF, no final xor
uint16_t crc16Modbus(const uint8_t* data, size_t length);

/*
 * Axis values are 32-bit signed, sent as two 16-bit registers low word first,
 * each register big-endian:
 *
 *   frame[offset+0] frame[offset+1]  low word  (bits 15..0)
 *   frame[offset+2] frame[offset+3]  high word (bits 31..16)
 *
 * so the big-endian integer is {offset+2, offset+3, offset+0, offset+1}.
 */
int32_t decodeAxis(const uint8_t* frame, size_t offset);

// raw / 1000 with exactly three decimals, e.g. 100 -> "0.100", -1500 -> "-1.500"
std::string formatAngle(int32_t raw);

/**
 * @brief Deframes the inclinometer byte stream
 *
 * Bytes are appended as they arrive and drained while a full frame
 * (FRAME_SIZE bytes) is buffered:
 *  - magic + good CRC      -> Reading, 17 bytes consumed
 *  - magic + bad CRC       -> ErrorRecord, 17 bytes consumed (no finer resync)
 *  - no magic              -> skip to next 0x50 at offset >= 1, or clear the
 *                             whole buffer with an ErrorRecord if there is none
 *
 * Every record is delivered to the listener before the next frame is examined.
 * Never performs I/O.
 */
class FrameDecoder {
public:
    explicit FrameDecoder(PreciseClock& clock);

    void setListener(FrameListener* frameListener) { listener = frameListener; }
    void setDeviceId(const std::string& id) { deviceId = id; }

    // Append a chunk and drain; returns the number of records emitted
    size_t process(const uint8_t* data, size_t length);
    void reset();

    size_t getBufferedBytes() const { return buffer.size(); }

    // Statistics
    unsigned long getFramesDecoded() const { return framesDecoded; }
    unsigned long getCrcErrors() const { return crcErrors; }
    unsigned long getBytesDiscarded() const { return bytesDiscarded; }
    unsigned long getBufferClears() const { return bufferClears; }
    void getStatistics(char* out, size_t outSize) const;

private:
    PreciseClock& preciseClock;
    FrameListener* listener;
    std::string deviceId;
    std::vector<uint8_t> buffer;

    unsigned long framesDecoded;
    unsigned long crcErrors;
    unsigned long bytesDiscarded;
    unsigned long bufferClears;

    bool hasMagicAtFront() const;
    bool frontFrameCrcValid() const;
    void consume(size_t count);
    void emitReading();
    void emitError(const char* reason);
};
