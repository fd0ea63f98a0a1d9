#include "logger.h"
#include "network_manager.h"
#include "precise_clock.h"
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <string>

NetworkManager* Logger::networkManager = nullptr;
LogLevel Logger::currentLogLevel = LOG_INFO;
unsigned long Logger::syslogDrops = 0;
char Logger::logBuffer[1024];

static const struct {
    const char* name;
    LogLevel level;
} LEVEL_NAMES[] = {
    {"emerg", LOG_EMERGENCY}, {"emergency", LOG_EMERGENCY},
    {"alert", LOG_ALERT},
    {"crit", LOG_CRITICAL}, {"critical", LOG_CRITICAL},
    {"err", LOG_ERROR}, {"error", LOG_ERROR},
    {"warn", LOG_WARNING}, {"warning", LOG_WARNING},
    {"notice", LOG_NOTICE},
    {"info", LOG_INFO},
    {"debug", LOG_DEBUG}
};

static const char* const LEVEL_LABELS[] = {
    "EMERG", "ALERT", "CRIT", "ERROR", "WARN", "NOTICE", "INFO", "DEBUG"
};

void Logger::begin(NetworkManager* netMgr) {
    networkManager = netMgr;
}

void Logger::setLogLevel(LogLevel minLevel) {
    currentLogLevel = minLevel;
}

bool Logger::parseLevel(const char* text, LogLevel& level) {
    if (!text || text[0] == '\0') return false;

    if (text[0] >= '0' && text[0] <= '7' && text[1] == '\0') {
        level = (LogLevel)(text[0] - '0');
        return true;
    }

    for (size_t i = 0; i < sizeof(LEVEL_NAMES) / sizeof(LEVEL_NAMES[0]); i++) {
        if (strcasecmp(text, LEVEL_NAMES[i].name) == 0) {
            level = LEVEL_NAMES[i].level;
            return true;
        }
    }
    return false;
}

const char* Logger::getLevelString(LogLevel level) {
    if (level < LOG_EMERGENCY || level > LOG_DEBUG) {
        return "UNKNOWN";
    }
    return LEVEL_LABELS[level];
}

void Logger::write(LogLevel level, const char* message) {
    bool syslogConfigured = networkManager && networkManager->isSyslogEnabled();
    bool syslogSent = syslogConfigured && networkManager->sendSyslog(message, level);
    if (syslogConfigured && !syslogSent) {
        syslogDrops++;
    }

    if (syslogSent && level > LOG_ERROR) {
        return;
    }

    std::string ts = formatIsoTimestamp(PreciseClock::systemNow());
    fprintf(stderr, "[%s] [%s] %s%s\n",
        ts.c_str(), getLevelString(level),
        (syslogConfigured && !syslogSent) ? "[SYSLOG_FAIL] " : "",
        message);
    fflush(stderr);
}

void Logger::vlog(LogLevel level, const char* fmt, va_list args) {
    if (level > currentLogLevel) {
        return;
    }
    vsnprintf(logBuffer, sizeof(logBuffer), fmt, args);
    write(level, logBuffer);
}

void Logger::log(LogLevel level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, fmt, args);
    va_end(args);
}
