#include "test_support.h"
#include "frame_decoder.h"
#include <stdlib.h>
#include <string.h>
#include <filesystem>
#include <fstream>
#include <sstream>

void encodeAxis(int32_t raw, uint8_t* out) {
    uint32_t value = (uint32_t)raw;
    out[0] = (uint8_t)(value >> 8);
    out[1] = (uint8_t)(value);
    out[2] = (uint8_t)(value >> 24);
    out[3] = (uint8_t)(value >> 16);
}

void buildFrame(int32_t x, int32_t y, int32_t z, uint8_t* frame) {
    memcpy(frame, FRAME_MAGIC, FRAME_MAGIC_SIZE);
    encodeAxis(x, frame + FRAME_AXIS_X_OFFSET);
    encodeAxis(y, frame + FRAME_AXIS_Y_OFFSET);
    encodeAxis(z, frame + FRAME_AXIS_Z_OFFSET);
    uint16_t crc = crc16Modbus(frame, FRAME_CRC_OFFSET);
    frame[FRAME_CRC_OFFSET] = (uint8_t)(crc & 0xFF);
    frame[FRAME_CRC_OFFSET + 1] = (uint8_t)(crc >> 8);
}

std::string makeTempDir(const char* tag) {
    std::string pattern = std::string("/tmp/tiltmonitor_") + tag + "_XXXXXX";
    char buffer[256];
    strncpy(buffer, pattern.c_str(), sizeof(buffer) - 1);
    buffer[sizeof(buffer) - 1] = '\0';
    if (!mkdtemp(buffer)) {
        return std::string();
    }
    return std::string(buffer);
}

void removeTree(const std::string& path) {
    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

bool writeTextFile(const std::string& path, const std::string& text) {
    std::ofstream file(path.c_str(), std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file << text;
    return file.good();
}

std::string readTextFile(const std::string& path) {
    std::ifstream file(path.c_str(), std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}
