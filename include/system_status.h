#pragma once

#include <stddef.h>
#include <string>

// Auxiliary metrics attached to every reading; each field is independently null
struct AuxMetrics {
    bool hasCpuTemperature = false;
    double cpuTemperature = 0.0;     // degrees C
    bool hasCpuVoltage = false;
    double cpuVoltage = 0.0;         // volts
    bool hasRssi = false;
    int rssi = 0;                    // dBm
    bool hasMemoryUsage = false;
    double memoryUsage = 0.0;        // percent
    bool hasDiskUsage = false;
    double diskUsage = 0.0;          // percent
};

class MetricsProvider {
public:
    virtual ~MetricsProvider() = default;
    virtual AuxMetrics collect() = 0;
};

/**
 * @brief Host health probes (Raspberry Pi class boards)
 *
 * Every probe is independent: a missing file, a missing tool or an unparsable
 * value makes that probe return false and nothing else. collect() never fails.
 */
class SystemStatus : public MetricsProvider {
public:
    SystemStatus();

    AuxMetrics collect() override;

    bool readCpuTemperature(double& celsius);
    bool readCpuVoltage(double& volts);
    bool readRssi(int& dbm);
    bool readMemoryUsage(double& percent);
    bool readDiskUsage(double& percent);

    // Source overrides (tests, non-Pi hosts)
    void setCpuTemperaturePath(const std::string& path) { cpuTemperaturePath = path; }
    void setWirelessStatusPath(const std::string& path) { wirelessStatusPath = path; }
    void setMeminfoPath(const std::string& path) { meminfoPath = path; }
    void setDiskPath(const std::string& path) { diskPath = path; }
    void setCpuVoltageCommand(const std::string& command) { cpuVoltageCommand = command; }

    unsigned long getProbeFailures() const { return probeFailures; }

    // Parsers, exposed for unit tests
    static bool parseVoltageOutput(const char* text, double& volts);
    static bool parseWirelessLevel(const char* text, int& dbm);
    static bool parseMeminfo(const char* text, double& percent);

private:
    std::string cpuTemperaturePath;
    std::string wirelessStatusPath;
    std::string meminfoPath;
    std::string diskPath;
    std::string cpuVoltageCommand;
    unsigned long probeFailures;

    static bool readTextFile(const std::string& path, std::string& contents);
};
