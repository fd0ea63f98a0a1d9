#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "constants.h"
#include "precise_clock.h"

// UTC day keys from day(from) to day(to), both inclusive; empty if from > to
std::vector<std::string> listDaysInclusive(Timestamp from, Timestamp to);

/**
 * @brief Per-day JSON archive of every reading and frame error
 *
 * One file per UTC day, <dir>/sensor_log_YYYY-MM-DD.json, holding a JSON
 * array in arrival order. Entries are appended in place by rewriting only the
 * closing bracket, so the file stays a valid array between writes and older
 * entries are never touched.
 */
class DailyLogger {
public:
    explicit DailyLogger(const std::string& directory = DEFAULT_SENSOR_LOG_DIR);

    const std::string& getDirectory() const { return logDirectory; }

    // Append to the file of sensingTime's day
    bool save(const nlohmann::json& entry, Timestamp sensingTime);

    // False if the file is missing, unreadable or not a JSON array
    bool readDay(const std::string& day, std::vector<nlohmann::json>& entries) const;

    std::string getPathForDay(const std::string& day) const;

    unsigned long getEntriesWritten() const { return entriesWritten; }
    unsigned long getWriteErrors() const { return writeErrors; }

private:
    std::string logDirectory;
    unsigned long entriesWritten;
    unsigned long writeErrors;

    bool ensureDirectory();
    bool createFile(const std::string& path, const std::string& line);
    bool appendToArray(const std::string& path, const std::string& line);
};
