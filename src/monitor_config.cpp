#include "monitor_config.h"
#include "constants.h"
#include "network_manager.h"
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

static const char* const REQUIRED_KEYS[] = {
    CONFIG_KEY_API_URL,
    CONFIG_KEY_DEVICE_ID,
    CONFIG_KEY_ANGLE_THRESHOLD,
    CONFIG_KEY_BACKUP_TCP_HOST,
    CONFIG_KEY_BACKUP_TCP_PORT,
    CONFIG_KEY_BACKUP_TCP_TEST,
    CONFIG_KEY_SAMPLE_RATE,
    CONFIG_KEY_SERIALPORT_PATH
};

static const char* const OPTIONAL_KEYS[] = {
    CONFIG_KEY_SENSOR_LOG_DIR,
    CONFIG_KEY_LOG_LEVEL,
    CONFIG_KEY_SYSLOG_SERVER,
    CONFIG_KEY_SYSLOG_PORT,
    CONFIG_KEY_SYSLOG_HOSTNAME
};

static std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::string();
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

static const std::string* findValue(const MonitorConfigManager::ValueMap& values, const char* key) {
    MonitorConfigManager::ValueMap::const_iterator it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

MonitorConfigManager::MonitorConfigManager() {
    resetToDefaults();
}

void MonitorConfigManager::resetToDefaults() {
    config = MonitorConfig();

    config.angleThreshold = 0.0;
    config.backupTcpPort = 0;
    config.backupTcpEnabled = false;
    config.sampleRateMs = 0;

    // Optional keys (from constants.h)
    config.sensorLogDir = DEFAULT_SENSOR_LOG_DIR;
    config.logLevel = LOG_INFO;  // Default to INFO level
    config.syslogPort = SYSLOG_PORT;
    config.syslogHostname = SYSLOG_HOSTNAME;

    configValid = false;
}

bool MonitorConfigManager::parseUnsigned(const std::string& text, unsigned long maxValue, unsigned long& value) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    errno = 0;
    unsigned long parsed = strtoul(text.c_str(), nullptr, 10);
    if (errno != 0 || parsed > maxValue) {
        return false;
    }
    value = parsed;
    return true;
}

bool MonitorConfigManager::parseNumber(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    double parsed = strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

bool MonitorConfigManager::parseFlag(const std::string& text) {
    return strcasecmp(text.c_str(), "true") == 0 || text == "1" ||
           strcasecmp(text.c_str(), "yes") == 0 || strcasecmp(text.c_str(), "on") == 0;
}

void MonitorConfigManager::parseDotEnv(const std::string& text, ValueMap& values) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t equals = line.find('=');
        if (equals == std::string::npos) continue;

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 && (value[0] == '"' || value[0] == '\'')) {
            size_t close = value.find(value[0], 1);
            if (close != std::string::npos) {
                value = value.substr(1, close - 1);
            }
        } else {
            // Unquoted values may carry a trailing " # comment"
            size_t comment = value.find(" #");
            if (comment == std::string::npos) comment = value.find("\t#");
            if (comment != std::string::npos) {
                value = trim(value.substr(0, comment));
            }
        }

        values[key] = value;
    }
}

bool MonitorConfigManager::readDotEnvFile(const std::string& path, ValueMap& values) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    parseDotEnv(ss.str(), values);
    return true;
}

void MonitorConfigManager::overlayEnvironment(ValueMap& values) {
    for (size_t i = 0; i < sizeof(REQUIRED_KEYS) / sizeof(REQUIRED_KEYS[0]); i++) {
        const char* value = getenv(REQUIRED_KEYS[i]);
        if (value) values[REQUIRED_KEYS[i]] = value;
    }
    for (size_t i = 0; i < sizeof(OPTIONAL_KEYS) / sizeof(OPTIONAL_KEYS[0]); i++) {
        const char* value = getenv(OPTIONAL_KEYS[i]);
        if (value) values[OPTIONAL_KEYS[i]] = value;
    }
}

bool MonitorConfigManager::begin(const char* path) {
    sourcePath = (path && path[0]) ? path : DEFAULT_CONFIG_FILE;

    ValueMap values;
    if (readDotEnvFile(sourcePath, values)) {
        LOG_INFO("MonitorConfig: Loaded %u keys from %s", (unsigned)values.size(), sourcePath.c_str());
    } else {
        LOG_WARN("MonitorConfig: %s not found, using environment only", sourcePath.c_str());
    }

    overlayEnvironment(values);
    return load(values);
}

bool MonitorConfigManager::load(const ValueMap& values) {
    resetToDefaults();

    bool ok = true;
    for (size_t i = 0; i < sizeof(REQUIRED_KEYS) / sizeof(REQUIRED_KEYS[0]); i++) {
        if (!findValue(values, REQUIRED_KEYS[i])) {
            LOG_ERROR("MonitorConfig: Missing required setting %s", REQUIRED_KEYS[i]);
            ok = false;
        }
    }
    if (!ok) {
        return false;
    }

    config.apiUrl = *findValue(values, CONFIG_KEY_API_URL);
    Endpoint endpoint;
    if (!parseEndpointUrl(config.apiUrl, endpoint)) {
        LOG_ERROR("MonitorConfig: %s '%s' is not an http(s) URL", CONFIG_KEY_API_URL, config.apiUrl.c_str());
        ok = false;
    }

    config.deviceId = *findValue(values, CONFIG_KEY_DEVICE_ID);
    if (config.deviceId == PLACEHOLDER_DEVICE_ID) {
        LOG_ERROR("MonitorConfig: %s is still the placeholder '%s'", CONFIG_KEY_DEVICE_ID, PLACEHOLDER_DEVICE_ID);
        ok = false;
    }
    // Every record carries the id as a JSON string, so it must be valid UTF-8
    try {
        nlohmann::json(config.deviceId).dump();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("MonitorConfig: %s is not valid UTF-8: %s", CONFIG_KEY_DEVICE_ID, e.what());
        ok = false;
    }

    const std::string& threshold = *findValue(values, CONFIG_KEY_ANGLE_THRESHOLD);
    if (!parseNumber(threshold, config.angleThreshold)) {
        LOG_ERROR("MonitorConfig: %s '%s' is not a number", CONFIG_KEY_ANGLE_THRESHOLD, threshold.c_str());
        ok = false;
    }

    config.backupTcpHost = *findValue(values, CONFIG_KEY_BACKUP_TCP_HOST);

    unsigned long number = 0;
    const std::string& backupPort = *findValue(values, CONFIG_KEY_BACKUP_TCP_PORT);
    if (!parseUnsigned(backupPort, 65535, number) || number == 0) {
        LOG_ERROR("MonitorConfig: Invalid %s '%s'", CONFIG_KEY_BACKUP_TCP_PORT, backupPort.c_str());
        ok = false;
    } else {
        config.backupTcpPort = (uint16_t)number;
    }

    config.backupTcpEnabled = parseFlag(*findValue(values, CONFIG_KEY_BACKUP_TCP_TEST));

    const std::string& sampleRate = *findValue(values, CONFIG_KEY_SAMPLE_RATE);
    if (!parseUnsigned(sampleRate, 0xFFFFFFFFUL, number) || number == 0) {
        LOG_ERROR("MonitorConfig: Invalid %s '%s' (milliseconds, > 0)", CONFIG_KEY_SAMPLE_RATE, sampleRate.c_str());
        ok = false;
    } else {
        config.sampleRateMs = (uint32_t)number;
    }

    config.serialPortPath = *findValue(values, CONFIG_KEY_SERIALPORT_PATH);

    // Optional keys
    const std::string* value = findValue(values, CONFIG_KEY_SENSOR_LOG_DIR);
    if (value) config.sensorLogDir = *value;

    value = findValue(values, CONFIG_KEY_LOG_LEVEL);
    if (value) {
        LogLevel level;
        if (!Logger::parseLevel(value->c_str(), level)) {
            LOG_ERROR("MonitorConfig: Invalid %s '%s'", CONFIG_KEY_LOG_LEVEL, value->c_str());
            ok = false;
        } else {
            config.logLevel = (uint8_t)level;
        }
    }

    value = findValue(values, CONFIG_KEY_SYSLOG_SERVER);
    if (value) config.syslogServer = *value;

    value = findValue(values, CONFIG_KEY_SYSLOG_PORT);
    if (value) {
        if (!parseUnsigned(*value, 65535, number) || number == 0) {
            LOG_ERROR("MonitorConfig: Invalid %s '%s'", CONFIG_KEY_SYSLOG_PORT, value->c_str());
            ok = false;
        } else {
            config.syslogPort = (uint16_t)number;
        }
    }

    value = findValue(values, CONFIG_KEY_SYSLOG_HOSTNAME);
    if (value) config.syslogHostname = *value;

    configValid = ok;
    return ok;
}

bool MonitorConfigManager::setLogLevel(uint8_t level) {
    if (level > LOG_DEBUG) return false;

    config.logLevel = level;
    return true;
}

void MonitorConfigManager::getStatusString(char* buffer, size_t bufferSize) {
    snprintf(buffer, bufferSize,
        "Config: valid=%s, device=%s, period=%lums, serial=%s, backup=%s, log=%d",
        configValid ? "YES" : "NO",
        config.deviceId.c_str(),
        (unsigned long)config.sampleRateMs,
        config.serialPortPath.c_str(),
        config.backupTcpEnabled ? "ON" : "OFF",
        config.logLevel
    );
}

void MonitorConfigManager::printConfiguration() {
    LOG_INFO("MonitorConfig: source=%s valid=%s", sourcePath.c_str(), configValid ? "YES" : "NO");
    LOG_INFO("MonitorConfig: device=%s api=%s", config.deviceId.c_str(), config.apiUrl.c_str());
    LOG_INFO("MonitorConfig: serial=%s period=%lums angle_threshold=%.3f",
        config.serialPortPath.c_str(), (unsigned long)config.sampleRateMs, config.angleThreshold);
    LOG_INFO("MonitorConfig: backup=%s:%u (%s)", config.backupTcpHost.c_str(),
        (unsigned)config.backupTcpPort, config.backupTcpEnabled ? "enabled" : "disabled");
    LOG_INFO("MonitorConfig: sensor_log=%s log_level=%d syslog=%s:%u (%s)",
        config.sensorLogDir.c_str(), config.logLevel,
        config.syslogServer.empty() ? "-" : config.syslogServer.c_str(),
        (unsigned)config.syslogPort, config.syslogHostname.c_str());
}

void MonitorConfigManager::applyToNetworkManager(NetworkManager* networkManager) {
    if (!networkManager || !configValid) {
        return;
    }

    networkManager->setHostname(config.syslogHostname.c_str());
    networkManager->setSyslogServer(config.syslogServer.c_str(), config.syslogPort);
    networkManager->setApiUrl(config.apiUrl);
    networkManager->setBackupTarget(config.backupTcpHost, config.backupTcpPort);

    LOG_DEBUG("MonitorConfig: NetworkManager configuration applied");
}

void MonitorConfigManager::applyToLogger() {
    if (!configValid) {
        return;
    }

    // Apply log level
    Logger::setLogLevel((LogLevel)config.logLevel);

    LOG_DEBUG("MonitorConfig: Logger configuration applied (level=%d)", config.logLevel);
}
