#include "frame_decoder.h"
#include "logger.h"
#include <stdio.h>
#include <string.h>

uint16_t crc16Modbus(const uint8_t* data, size_t length) {
    uint16_t crc = CRC16_MODBUS_INIT;
    for (size_t i = 0; i < length; i++) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; bit++) {
            if (crc & 0x0001) {
                crc = (crc >> 1) ^ CRC16_MODBUS_POLY;
            } else {
                crc >>= 1;
            }
        }
    }
    return crc;
}

int32_t decodeAxis(const uint8_t* frame, size_t offset) {
    uint32_t value = ((uint32_t)frame[offset + 2] << 24) |
                     ((uint32_t)frame[offset + 3] << 16) |
                     ((uint32_t)frame[offset + 0] << 8) |
                     ((uint32_t)frame[offset + 1]);
    return (int32_t)value;
}

std::string formatAngle(int32_t raw) {
    int64_t magnitude = raw < 0 ? -(int64_t)raw : (int64_t)raw;
    char text[24];
    snprintf(text, sizeof(text), "%s%lld.%03lld",
        raw < 0 ? "-" : "",
        (long long)(magnitude / 1000),
        (long long)(magnitude % 1000));
    return std::string(text);
}

FrameDecoder::FrameDecoder(PreciseClock& clock)
    : preciseClock(clock)
    , listener(nullptr)
    , framesDecoded(0)
    , crcErrors(0)
    , bytesDiscarded(0)
    , bufferClears(0) {
    buffer.reserve(SERIAL_READ_CHUNK_SIZE + FRAME_SIZE);
}

void FrameDecoder::reset() {
    buffer.clear();
}

bool FrameDecoder::hasMagicAtFront() const {
    return memcmp(buffer.data(), FRAME_MAGIC, FRAME_MAGIC_SIZE) == 0;
}

bool FrameDecoder::frontFrameCrcValid() const {
    uint16_t calculated = crc16Modbus(buffer.data(), FRAME_CRC_OFFSET);
    // Trailer is little-endian
    uint16_t received = (uint16_t)buffer[FRAME_CRC_OFFSET] |
                        ((uint16_t)buffer[FRAME_CRC_OFFSET + 1] << 8);
    return calculated == received;
}

void FrameDecoder::consume(size_t count) {
    if (count >= buffer.size()) {
        buffer.clear();
    } else {
        buffer.erase(buffer.begin(), buffer.begin() + count);
    }
}

void FrameDecoder::emitReading() {
    Reading reading;
    reading.deviceId = deviceId;
    reading.sensingTime = preciseClock.now();
    reading.rawX = decodeAxis(buffer.data(), FRAME_AXIS_X_OFFSET);
    reading.rawY = decodeAxis(buffer.data(), FRAME_AXIS_Y_OFFSET);
    reading.rawZ = decodeAxis(buffer.data(), FRAME_AXIS_Z_OFFSET);
    reading.angX = formatAngle(reading.rawX);
    reading.angY = formatAngle(reading.rawY);
    reading.angZ = formatAngle(reading.rawZ);

    framesDecoded++;
    LOG_DEBUG("FrameDecoder: x=%s y=%s z=%s", reading.angX.c_str(), reading.angY.c_str(), reading.angZ.c_str());

    if (listener) {
        listener->onReading(reading);
    }
}

void FrameDecoder::emitError(const char* reason) {
    ErrorRecord error;
    error.sensingTime = preciseClock.now();
    error.reason = reason;

    if (listener) {
        listener->onFrameError(error);
    }
}

size_t FrameDecoder::process(const uint8_t* data, size_t length) {
    if (data && length > 0) {
        buffer.insert(buffer.end(), data, data + length);
    }

    size_t emitted = 0;
    while (buffer.size() >= FRAME_SIZE) {
        if (hasMagicAtFront()) {
            if (frontFrameCrcValid()) {
                emitReading();
            } else {
                crcErrors++;
                LOG_WARN("FrameDecoder: CRC validation failed, discarding %u bytes", (unsigned)FRAME_SIZE);
                emitError(FRAME_ERROR_CRC);
            }
            consume(FRAME_SIZE);
            emitted++;
            continue;
        }

        // Resync on the next candidate header byte
        size_t next = 0;
        for (size_t i = 1; i < buffer.size(); i++) {
            if (buffer[i] == FRAME_MAGIC[0]) {
                next = i;
                break;
            }
        }

        if (next > 0) {
            LOG_DEBUG("FrameDecoder: Discarding %u bytes to find the next valid frame", (unsigned)next);
            bytesDiscarded += next;
            consume(next);
        } else {
            LOG_WARN("FrameDecoder: No valid frame found, clearing %u buffered bytes", (unsigned)buffer.size());
            bytesDiscarded += buffer.size();
            bufferClears++;
            buffer.clear();
            emitError(FRAME_ERROR_NO_FRAME);
            emitted++;
            break;
        }
    }

    return emitted;
}

void FrameDecoder::getStatistics(char* out, size_t outSize) const {
    snprintf(out, outSize,
        "frames=%lu crc_errors=%lu discarded=%lu clears=%lu buffered=%u",
        framesDecoded, crcErrors, bytesDiscarded, bufferClears, (unsigned)buffer.size());
}
