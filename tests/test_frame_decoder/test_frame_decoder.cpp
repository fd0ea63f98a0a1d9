/**
 * test_frame_decoder.cpp - Inclinometer frame decoding
 *
 * Covers CRC16/Modbus, the mixed-endian axis layout, angle formatting and the
 * decoder's buffer policy: accept on magic + CRC, drop 17 bytes on a bad CRC,
 * resync on the next 0x50, clear the buffer when there is none.
 */

#include <unity.h>
#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>
#include "frame_decoder.h"
#include "logger.h"
#include "test_support.h"

class RecordingListener : public FrameListener {
public:
    std::vector<Reading> readings;
    std::vector<ErrorRecord> errors;
    // 'R' or 'E' per record, in arrival order
    std::string order;

    void onReading(const Reading& reading) override {
        readings.push_back(reading);
        order += 'R';
    }
    void onFrameError(const ErrorRecord& error) override {
        errors.push_back(error);
        order += 'E';
    }
};

static ManualClock* clock_;
static FrameDecoder* decoder;
static RecordingListener* listener;

void setUp(void)
{
    Logger::setLogLevel(LOG_CRITICAL);
    clock_ = new ManualClock();
    clock_->setWallMs(1714551330250LL);  // 2024-05-01T08:15:30.250Z
    clock_->synchronize();
    decoder = new FrameDecoder(*clock_);
    listener = new RecordingListener();
    decoder->setListener(listener);
    decoder->setDeviceId("tilt-07");
}

void tearDown(void)
{
    delete decoder;
    delete listener;
    delete clock_;
}

// ============================================================================
// CRC and field decoding
// ============================================================================

void test_crc16_modbus_check_value(void)
{
    const uint8_t text[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    TEST_ASSERT_EQUAL_HEX16(0x4B37, crc16Modbus(text, sizeof(text)));
}

void test_crc16_matches_poll_command_trailer(void)
{
    uint16_t crc = crc16Modbus(READ_ANGLE_COMMAND, 6);
    TEST_ASSERT_EQUAL_HEX8(READ_ANGLE_COMMAND[6], crc & 0xFF);
    TEST_ASSERT_EQUAL_HEX8(READ_ANGLE_COMMAND[7], crc >> 8);
}

void test_decode_axis_low_word_first(void)
{
    const uint8_t group[] = {0x00, 0x64, 0x00, 0x00};
    TEST_ASSERT_EQUAL_INT32(100, decodeAxis(group, 0));
    TEST_ASSERT_EQUAL_STRING("0.100", formatAngle(decodeAxis(group, 0)).c_str());
}

void test_decode_axis_high_word_and_sign(void)
{
    // high word 0x0001, low word 0x86A0 -> 0x000186A0 = 100000
    const uint8_t big[] = {0x86, 0xA0, 0x00, 0x01};
    TEST_ASSERT_EQUAL_INT32(100000, decodeAxis(big, 0));

    // -1500 = 0xFFFFFA24
    const uint8_t negative[] = {0xFA, 0x24, 0xFF, 0xFF};
    TEST_ASSERT_EQUAL_INT32(-1500, decodeAxis(negative, 0));
}

void test_format_angle_three_decimals(void)
{
    TEST_ASSERT_EQUAL_STRING("0.000", formatAngle(0).c_str());
    TEST_ASSERT_EQUAL_STRING("-0.001", formatAngle(-1).c_str());
    TEST_ASSERT_EQUAL_STRING("-1.500", formatAngle(-1500).c_str());
    TEST_ASSERT_EQUAL_STRING("123.456", formatAngle(123456).c_str());
    TEST_ASSERT_EQUAL_STRING("-2147483.648", formatAngle(INT32_MIN).c_str());
}

// ============================================================================
// Decoder buffer policy
// ============================================================================

void test_valid_frame_emits_reading(void)
{
    uint8_t frame[FRAME_SIZE];
    buildFrame(100, -1500, 45000, frame);

    TEST_ASSERT_EQUAL_UINT32(1, decoder->process(frame, sizeof(frame)));
    TEST_ASSERT_EQUAL_UINT32(1, listener->readings.size());
    TEST_ASSERT_EQUAL_UINT32(0, listener->errors.size());

    const Reading& reading = listener->readings[0];
    TEST_ASSERT_EQUAL_STRING("tilt-07", reading.deviceId.c_str());
    TEST_ASSERT_EQUAL_STRING("0.100", reading.angX.c_str());
    TEST_ASSERT_EQUAL_STRING("-1.500", reading.angY.c_str());
    TEST_ASSERT_EQUAL_STRING("45.000", reading.angZ.c_str());
    TEST_ASSERT_EQUAL_STRING("2024-05-01T08:15:30.250Z", formatIsoTimestamp(reading.sensingTime).c_str());
    TEST_ASSERT_EQUAL_UINT32(0, decoder->getBufferedBytes());
    TEST_ASSERT_EQUAL_UINT32(1, decoder->getFramesDecoded());
}

void test_partial_frame_waits_for_more_bytes(void)
{
    uint8_t frame[FRAME_SIZE];
    buildFrame(1, 2, 3, frame);

    TEST_ASSERT_EQUAL_UINT32(0, decoder->process(frame, FRAME_SIZE - 1));
    TEST_ASSERT_EQUAL_UINT32(FRAME_SIZE - 1, decoder->getBufferedBytes());
    TEST_ASSERT_EQUAL_UINT32(0, listener->order.size());

    TEST_ASSERT_EQUAL_UINT32(1, decoder->process(frame + FRAME_SIZE - 1, 1));
    TEST_ASSERT_EQUAL_STRING("R", listener->order.c_str());
    TEST_ASSERT_EQUAL_STRING("0.003", listener->readings[0].angZ.c_str());
}

void test_bad_crc_consumes_whole_frame(void)
{
    uint8_t frame[FRAME_SIZE];
    buildFrame(10, 20, 30, frame);
    frame[FRAME_CRC_OFFSET] ^= 0xFF;

    TEST_ASSERT_EQUAL_UINT32(1, decoder->process(frame, sizeof(frame)));
    TEST_ASSERT_EQUAL_STRING("E", listener->order.c_str());
    TEST_ASSERT_EQUAL_STRING(FRAME_ERROR_CRC, listener->errors[0].reason.c_str());
    TEST_ASSERT_EQUAL_UINT32(0, decoder->getBufferedBytes());
    TEST_ASSERT_EQUAL_UINT32(1, decoder->getCrcErrors());
}

void test_single_bit_flip_in_payload_is_rejected(void)
{
    uint8_t good[FRAME_SIZE];
    buildFrame(12345, -678, 9, good);

    for (size_t byte = FRAME_MAGIC_SIZE; byte < FRAME_CRC_OFFSET; byte++) {
        for (int bit = 0; bit < 8; bit++) {
            uint8_t frame[FRAME_SIZE];
            memcpy(frame, good, sizeof(frame));
            frame[byte] ^= (uint8_t)(1 << bit);
            decoder->process(frame, sizeof(frame));
        }
    }

    TEST_ASSERT_EQUAL_UINT32(0, listener->readings.size());
    TEST_ASSERT_EQUAL_UINT32((FRAME_CRC_OFFSET - FRAME_MAGIC_SIZE) * 8, listener->errors.size());
}

void test_resync_discards_exactly_the_garbage(void)
{
    const uint8_t garbage[] = {0x01, 0xFF, 0x03, 0x0C, 0x99};
    uint8_t frame[FRAME_SIZE];
    buildFrame(500, 600, 700, frame);

    std::vector<uint8_t> stream(garbage, garbage + sizeof(garbage));
    stream.insert(stream.end(), frame, frame + sizeof(frame));

    TEST_ASSERT_EQUAL_UINT32(1, decoder->process(stream.data(), stream.size()));
    TEST_ASSERT_EQUAL_STRING("R", listener->order.c_str());
    TEST_ASSERT_EQUAL_UINT32(sizeof(garbage), decoder->getBytesDiscarded());
    TEST_ASSERT_EQUAL_STRING("0.500", listener->readings[0].angX.c_str());
}

void test_no_header_byte_clears_buffer(void)
{
    uint8_t noise[20];
    memset(noise, 0xAA, sizeof(noise));

    TEST_ASSERT_EQUAL_UINT32(1, decoder->process(noise, sizeof(noise)));
    TEST_ASSERT_EQUAL_STRING("E", listener->order.c_str());
    TEST_ASSERT_EQUAL_STRING(FRAME_ERROR_NO_FRAME, listener->errors[0].reason.c_str());
    TEST_ASSERT_EQUAL_UINT32(0, decoder->getBufferedBytes());
    TEST_ASSERT_EQUAL_UINT32(1, decoder->getBufferClears());
}

void test_records_arrive_in_stream_order(void)
{
    uint8_t first[FRAME_SIZE];
    uint8_t corrupt[FRAME_SIZE];
    uint8_t last[FRAME_SIZE];
    buildFrame(1, 1, 1, first);
    buildFrame(2, 2, 2, corrupt);
    corrupt[5] ^= 0x10;
    buildFrame(3, 3, 3, last);

    std::vector<uint8_t> stream;
    stream.insert(stream.end(), first, first + FRAME_SIZE);
    stream.insert(stream.end(), corrupt, corrupt + FRAME_SIZE);
    stream.insert(stream.end(), last, last + FRAME_SIZE);

    TEST_ASSERT_EQUAL_UINT32(3, decoder->process(stream.data(), stream.size()));
    TEST_ASSERT_EQUAL_STRING("RER", listener->order.c_str());
    TEST_ASSERT_EQUAL_STRING("0.003", listener->readings[1].angX.c_str());
}

void test_buffer_never_left_holding_a_full_frame(void)
{
    // Deterministic mix of noise, header bytes and valid frames
    uint32_t seed = 12345;
    for (int round = 0; round < 200; round++) {
        uint8_t chunk[40];
        size_t length = 0;
        seed = seed * 1103515245u + 12345u;
        if ((seed >> 16) % 3 == 0) {
            buildFrame((int32_t)round, -(int32_t)round, 0, chunk);
            length = FRAME_SIZE;
        } else {
            length = 1 + (seed >> 8) % sizeof(chunk);
            for (size_t i = 0; i < length; i++) {
                seed = seed * 1103515245u + 12345u;
                chunk[i] = (seed >> 24) % 4 == 0 ? 0x50 : (uint8_t)(seed >> 16);
            }
        }
        decoder->process(chunk, length);
        TEST_ASSERT_TRUE(decoder->getBufferedBytes() < FRAME_SIZE);
    }
}

int main(int argc, char **argv)
{
    UNITY_BEGIN();

    RUN_TEST(test_crc16_modbus_check_value);
    RUN_TEST(test_crc16_matches_poll_command_trailer);
    RUN_TEST(test_decode_axis_low_word_first);
    RUN_TEST(test_decode_axis_high_word_and_sign);
    RUN_TEST(test_format_angle_three_decimals);
    RUN_TEST(test_valid_frame_emits_reading);
    RUN_TEST(test_partial_frame_waits_for_more_bytes);
    RUN_TEST(test_bad_crc_consumes_whole_frame);
    RUN_TEST(test_single_bit_flip_in_payload_is_rejected);
    RUN_TEST(test_resync_discards_exactly_the_garbage);
    RUN_TEST(test_no_header_byte_clears_buffer);
    RUN_TEST(test_records_arrive_in_stream_order);
    RUN_TEST(test_buffer_never_left_holding_a_full_frame);

    return UNITY_END();
}
