#include "system_status.h"
#include "constants.h"
#include "logger.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/statvfs.h>
#include <fstream>
#include <sstream>

SystemStatus::SystemStatus()
    : cpuTemperaturePath(CPU_TEMPERATURE_PATH)
    , wirelessStatusPath(WIRELESS_STATUS_PATH)
    , meminfoPath(MEMINFO_PATH)
    , diskPath(DISK_USAGE_PATH)
    , cpuVoltageCommand(CPU_VOLTAGE_COMMAND)
    , probeFailures(0) {
}

bool SystemStatus::readTextFile(const std::string& path, std::string& contents) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    contents = ss.str();
    return !file.bad();
}

AuxMetrics SystemStatus::collect() {
    AuxMetrics metrics;
    metrics.hasCpuTemperature = readCpuTemperature(metrics.cpuTemperature);
    metrics.hasCpuVoltage = readCpuVoltage(metrics.cpuVoltage);
    metrics.hasRssi = readRssi(metrics.rssi);
    metrics.hasMemoryUsage = readMemoryUsage(metrics.memoryUsage);
    metrics.hasDiskUsage = readDiskUsage(metrics.diskUsage);
    return metrics;
}

bool SystemStatus::readCpuTemperature(double& celsius) {
    std::string text;
    if (!readTextFile(cpuTemperaturePath, text)) {
        probeFailures++;
        LOG_DEBUG("SystemStatus: Cannot read %s", cpuTemperaturePath.c_str());
        return false;
    }

    char* end = nullptr;
    long milliDegrees = strtol(text.c_str(), &end, 10);
    if (end == text.c_str()) {
        probeFailures++;
        LOG_DEBUG("SystemStatus: Unexpected thermal zone value '%s'", text.c_str());
        return false;
    }

    celsius = milliDegrees / 1000.0;
    return true;
}

bool SystemStatus::parseVoltageOutput(const char* text, double& volts) {
    // vcgencmd prints "volt=1.2000V"
    const char* p = strstr(text, "volt=");
    if (!p) return false;

    char* end = nullptr;
    double value = strtod(p + 5, &end);
    if (end == p + 5) return false;

    volts = value;
    return true;
}

bool SystemStatus::readCpuVoltage(double& volts) {
    FILE* pipe = popen(cpuVoltageCommand.c_str(), "r");
    if (!pipe) {
        probeFailures++;
        LOG_DEBUG("SystemStatus: Cannot run '%s'", cpuVoltageCommand.c_str());
        return false;
    }

    char output[128];
    size_t length = fread(output, 1, sizeof(output) - 1, pipe);
    output[length] = '\0';
    int status = pclose(pipe);

    if (status != 0 || !parseVoltageOutput(output, volts)) {
        probeFailures++;
        LOG_DEBUG("SystemStatus: CPU voltage unavailable (status=%d)", status);
        return false;
    }
    return true;
}

bool SystemStatus::parseWirelessLevel(const char* text, int& dbm) {
    // Two header lines, then "wlan0: 0000   70.  -40.  -256 ..."
    const char* line = text;
    for (int skip = 0; skip < 2 && line; skip++) {
        line = strchr(line, '\n');
        if (line) line++;
    }
    if (!line || *line == '\0') return false;

    const char* colon = strchr(line, ':');
    if (!colon) return false;

    unsigned int status;
    float link;
    float level;
    if (sscanf(colon + 1, " %x %f %f", &status, &link, &level) != 3) {
        return false;
    }

    dbm = (int)level;
    return true;
}

bool SystemStatus::readRssi(int& dbm) {
    std::string text;
    if (!readTextFile(wirelessStatusPath, text) || !parseWirelessLevel(text.c_str(), dbm)) {
        probeFailures++;
        LOG_DEBUG("SystemStatus: No wireless link level in %s", wirelessStatusPath.c_str());
        return false;
    }
    return true;
}

bool SystemStatus::parseMeminfo(const char* text, double& percent) {
    unsigned long long total = 0;
    unsigned long long available = 0;
    bool haveTotal = false;
    bool haveAvailable = false;

    const char* line = text;
    while (line && *line) {
        unsigned long long value;
        if (sscanf(line, "MemTotal: %llu", &value) == 1) {
            total = value;
            haveTotal = true;
        } else if (sscanf(line, "MemAvailable: %llu", &value) == 1) {
            available = value;
            haveAvailable = true;
        }
        line = strchr(line, '\n');
        if (line) line++;
    }

    if (!haveTotal || !haveAvailable || total == 0 || available > total) {
        return false;
    }

    percent = (total - available) * 100.0 / total;
    return true;
}

bool SystemStatus::readMemoryUsage(double& percent) {
    std::string text;
    if (!readTextFile(meminfoPath, text) || !parseMeminfo(text.c_str(), percent)) {
        probeFailures++;
        LOG_DEBUG("SystemStatus: Memory usage unavailable from %s", meminfoPath.c_str());
        return false;
    }
    return true;
}

bool SystemStatus::readDiskUsage(double& percent) {
    struct statvfs fs;
    if (statvfs(diskPath.c_str(), &fs) != 0 || fs.f_blocks == 0) {
        probeFailures++;
        LOG_DEBUG("SystemStatus: statvfs(%s) failed", diskPath.c_str());
        return false;
    }

    // Same figure as df: used / (used + available to unprivileged users)
    unsigned long long used = (unsigned long long)(fs.f_blocks - fs.f_bfree);
    unsigned long long usable = used + (unsigned long long)fs.f_bavail;
    if (usable == 0) {
        probeFailures++;
        return false;
    }

    percent = used * 100.0 / usable;
    return true;
}
