#include "daily_logger.h"
#include "logger.h"
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>

static const int64_t MS_PER_DAY = 86400000LL;

std::vector<std::string> listDaysInclusive(Timestamp from, Timestamp to) {
    std::vector<std::string> days;
    if (from > to) {
        return days;
    }

    // Walk UTC midnights
    int64_t fromMs = timestampToEpochMs(from);
    int64_t toMs = timestampToEpochMs(to);
    int64_t day = fromMs - (((fromMs % MS_PER_DAY) + MS_PER_DAY) % MS_PER_DAY);
    for (; day <= toMs; day += MS_PER_DAY) {
        days.push_back(formatDay(timestampFromEpochMs(day)));
    }
    return days;
}

DailyLogger::DailyLogger(const std::string& directory)
    : logDirectory(directory)
    , entriesWritten(0)
    , writeErrors(0) {
}

std::string DailyLogger::getPathForDay(const std::string& day) const {
    std::string path = logDirectory;
    if (!path.empty() && path[path.size() - 1] != '/') {
        path += '/';
    }
    path += SENSOR_LOG_PREFIX;
    path += day;
    path += SENSOR_LOG_SUFFIX;
    return path;
}

bool DailyLogger::ensureDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);
    if (ec) {
        LOG_ERROR("DailyLogger: Cannot create %s: %s", logDirectory.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool DailyLogger::createFile(const std::string& path, const std::string& line) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("DailyLogger: Cannot create %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    bool ok = fprintf(file, "[\n%s\n]\n", line.c_str()) > 0;
    ok = (fclose(file) == 0) && ok;
    if (!ok) {
        LOG_ERROR("DailyLogger: Write to %s failed", path.c_str());
    }
    return ok;
}

bool DailyLogger::appendToArray(const std::string& path, const std::string& line) {
    FILE* file = fopen(path.c_str(), "r+b");
    if (!file) {
        LOG_ERROR("DailyLogger: Cannot open %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    // Locate the closing bracket and whatever precedes it
    long closing = -1;
    int previous = 0;
    if (fseek(file, 0, SEEK_END) == 0) {
        long pos = ftell(file);
        while (pos > 0) {
            pos--;
            fseek(file, pos, SEEK_SET);
            int c = fgetc(file);
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
            if (closing < 0) {
                if (c != ']') break;
                closing = pos;
                continue;
            }
            previous = c;
            break;
        }
    }

    if (closing < 0 || previous == 0) {
        fclose(file);
        // Not an array we can extend; keep it aside and start a fresh one
        std::string aside = path + ".corrupt";
        LOG_ERROR("DailyLogger: %s is not a JSON array, moving it to %s", path.c_str(), aside.c_str());
        if (rename(path.c_str(), aside.c_str()) != 0) {
            LOG_ERROR("DailyLogger: rename failed: %s", strerror(errno));
            return false;
        }
        return createFile(path, line);
    }

    bool ok = fseek(file, closing, SEEK_SET) == 0;
    if (ok) {
        ok = fprintf(file, "%s%s\n]\n", previous == '[' ? "" : ",\n", line.c_str()) > 0;
    }
    if (ok) {
        ok = fflush(file) == 0;
    }
    if (ok) {
        long end = ftell(file);
        ok = end >= 0 && ftruncate(fileno(file), end) == 0;
    }
    ok = (fclose(file) == 0) && ok;

    if (!ok) {
        LOG_ERROR("DailyLogger: Append to %s failed", path.c_str());
    }
    return ok;
}

bool DailyLogger::save(const nlohmann::json& entry, Timestamp sensingTime) {
    if (!ensureDirectory()) {
        writeErrors++;
        return false;
    }

    std::string path = getPathForDay(formatDay(sensingTime));
    std::string line = entry.dump();

    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec) && std::filesystem::file_size(path, ec) > 0 && !ec;

    bool ok = exists ? appendToArray(path, line) : createFile(path, line);
    if (ok) {
        entriesWritten++;
    } else {
        writeErrors++;
    }
    return ok;
}

bool DailyLogger::readDay(const std::string& day, std::vector<nlohmann::json>& entries) const {
    std::string path = getPathForDay(day);
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        LOG_WARN("DailyLogger: No log file for %s (%s)", day.c_str(), path.c_str());
        return false;
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("DailyLogger: Cannot parse %s: %s", path.c_str(), e.what());
        return false;
    }

    if (!document.is_array()) {
        LOG_ERROR("DailyLogger: %s does not contain a JSON array", path.c_str());
        return false;
    }

    entries.clear();
    entries.reserve(document.size());
    for (auto& entry : document) {
        entries.push_back(std::move(entry));
    }
    return true;
}
