#pragma once

#include <stdint.h>
#include <map>
#include <string>
#include "logger.h"

// Keys that must be present (and non-empty) for the monitor to start
#define CONFIG_KEY_API_URL             "API_URL"
#define CONFIG_KEY_DEVICE_ID           "DEVICE_ID"
#define CONFIG_KEY_ANGLE_THRESHOLD     "ANGLE_DIFFERENT_THERSHOLD"
#define CONFIG_KEY_BACKUP_TCP_HOST     "BACKUP_TCP_HOST"
#define CONFIG_KEY_BACKUP_TCP_PORT     "BACKUP_TCP_PORT"
#define CONFIG_KEY_BACKUP_TCP_TEST     "BACKUP_TCP_TEST"
#define CONFIG_KEY_SAMPLE_RATE         "SAMPLE_RATE"
#define CONFIG_KEY_SERIALPORT_PATH     "SERIALPORT_PATH"

// Optional keys
#define CONFIG_KEY_SENSOR_LOG_DIR      "SENSOR_LOG_DIR"
#define CONFIG_KEY_LOG_LEVEL           "LOG_LEVEL"
#define CONFIG_KEY_SYSLOG_SERVER       "SYSLOG_SERVER"
#define CONFIG_KEY_SYSLOG_PORT         "SYSLOG_PORT"
#define CONFIG_KEY_SYSLOG_HOSTNAME     "SYSLOG_HOSTNAME"

struct MonitorConfig {
    // Primary sink
    std::string apiUrl;                // http:// or https:// endpoint
    std::string deviceId;              // Reported in every reading
    double angleThreshold;             // Validated and reported only

    // Backup sink
    std::string backupTcpHost;
    uint16_t backupTcpPort;
    bool backupTcpEnabled;             // Mirror readings when set

    // Sampling
    uint32_t sampleRateMs;             // Poll period P
    std::string serialPortPath;        // Inclinometer device

    // Archive
    std::string sensorLogDir;          // Daily JSON logs

    // Logging Configuration
    uint8_t logLevel;                  // Current log level (0-7)
    std::string syslogServer;          // Empty disables syslog
    uint16_t syslogPort;               // Syslog UDP port (514)
    std::string syslogHostname;        // Hostname for syslog messages
};

class MonitorConfigManager {
private:
    MonitorConfig config;
    bool configValid = false;
    std::string sourcePath;

    // Validation helpers
    static bool parseUnsigned(const std::string& text, unsigned long maxValue, unsigned long& value);
    static bool parseNumber(const std::string& text, double& value);

public:
    typedef std::map<std::string, std::string> ValueMap;

    MonitorConfigManager();

    // Initialization: read the dotenv file (optional), overlay the process
    // environment, validate. False if any required key is missing or invalid.
    bool begin(const char* path);

    // Validate and adopt an already merged key/value set
    bool load(const ValueMap& values);

    // dotenv parsing: KEY=VALUE, '#' comments, optional quotes and 'export '
    static bool readDotEnvFile(const std::string& path, ValueMap& values);
    static void parseDotEnv(const std::string& text, ValueMap& values);
    static void overlayEnvironment(ValueMap& values);
    // true/1/yes/on (case-insensitive)
    static bool parseFlag(const std::string& text);

    // Reset to defaults (optional keys only; required keys are cleared)
    void resetToDefaults();

    bool isConfigValid() const { return configValid; }

    // Primary sink
    const std::string& getApiUrl() const { return config.apiUrl; }
    const std::string& getDeviceId() const { return config.deviceId; }
    double getAngleThreshold() const { return config.angleThreshold; }

    // Backup sink
    const std::string& getBackupTcpHost() const { return config.backupTcpHost; }
    uint16_t getBackupTcpPort() const { return config.backupTcpPort; }
    bool isBackupTcpEnabled() const { return config.backupTcpEnabled; }

    // Sampling
    uint32_t getSampleRateMs() const { return config.sampleRateMs; }
    const std::string& getSerialPortPath() const { return config.serialPortPath; }

    // Archive
    const std::string& getSensorLogDir() const { return config.sensorLogDir; }

    // Logging Configuration
    uint8_t getLogLevel() const { return config.logLevel; }
    const std::string& getSyslogServer() const { return config.syslogServer; }
    uint16_t getSyslogPort() const { return config.syslogPort; }
    const std::string& getSyslogHostname() const { return config.syslogHostname; }

    bool setLogLevel(uint8_t level);

    // Status and debugging
    void getStatusString(char* buffer, size_t bufferSize);
    void printConfiguration();

    // Apply configuration to other components
    void applyToNetworkManager(class NetworkManager* networkManager);
    void applyToLogger();
};
