#pragma once

#include <stdarg.h>
#include <stddef.h>

// RFC 3164 severities; a message is emitted when its level <= the threshold
enum LogLevel {
    LOG_EMERGENCY = 0,
    LOG_ALERT = 1,
    LOG_CRITICAL = 2,   // serial link lost, event loop failure
    LOG_ERROR = 3,      // delivery failed, archive write failed
    LOG_WARNING = 4,    // frame errors, backfill skips
    LOG_NOTICE = 5,
    LOG_INFO = 6,       // lifecycle and periodic status
    LOG_DEBUG = 7       // per-reading detail
};

/**
 * Process-wide logger.
 *
 * Messages go to the syslog collector through NetworkManager when one is
 * configured. stderr takes anything syslog could not deliver, and always
 * takes ERROR and worse so a supervisor (systemd, docker) keeps them.
 */
class Logger {
public:
    static void begin(class NetworkManager* netMgr);
    static void setLogLevel(LogLevel minLevel);
    static LogLevel getLogLevel() { return currentLogLevel; }

    // Accepts "0".."7" or a level name ("info", "WARN", ...)
    static bool parseLevel(const char* text, LogLevel& level);
    static const char* getLevelString(LogLevel level);

    static void log(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    static void vlog(LogLevel level, const char* fmt, va_list args);

    // Messages syslog refused since startup
    static unsigned long getSyslogDrops() { return syslogDrops; }

private:
    static class NetworkManager* networkManager;
    static LogLevel currentLogLevel;
    static unsigned long syslogDrops;
    static char logBuffer[1024];

    static void write(LogLevel level, const char* message);
};

#define LOG_CRITICAL(...) Logger::log(LOG_CRITICAL, __VA_ARGS__)
#define LOG_ERROR(...) Logger::log(LOG_ERROR, __VA_ARGS__)
#define LOG_WARN(...) Logger::log(LOG_WARNING, __VA_ARGS__)
#define LOG_NOTICE(...) Logger::log(LOG_NOTICE, __VA_ARGS__)
#define LOG_INFO(...) Logger::log(LOG_INFO, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::log(LOG_DEBUG, __VA_ARGS__)
