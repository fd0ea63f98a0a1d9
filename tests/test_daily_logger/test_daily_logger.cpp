/**
 * test_daily_logger.cpp - Per-day JSON archive
 *
 * Files are keyed by the UTC day of the entry's sensing time, always hold a
 * parseable JSON array, and keep arrival order.
 */

#include <unity.h>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "daily_logger.h"
#include "logger.h"
#include "test_support.h"

static std::string tempDir;

static Timestamp at(const char* iso)
{
    Timestamp ts;
    parseIsoTimestamp(iso, ts);
    return ts;
}

static nlohmann::json entry(const char* iso, const char* angX)
{
    nlohmann::json value;
    value["sensing_time"] = iso;
    value["ang_x"] = angX;
    value["ang_y"] = "0.000";
    value["ang_z"] = "0.000";
    return value;
}

void setUp(void)
{
    Logger::setLogLevel(LOG_CRITICAL);
    tempDir = makeTempDir("dailylog");
}

void tearDown(void)
{
    removeTree(tempDir);
}

void test_list_days_inclusive(void)
{
    std::vector<std::string> days = listDaysInclusive(
        at("2024-05-01T23:59:00.000Z"), at("2024-05-03T00:01:00.000Z"));
    TEST_ASSERT_EQUAL_UINT32(3, days.size());
    TEST_ASSERT_EQUAL_STRING("2024-05-01", days[0].c_str());
    TEST_ASSERT_EQUAL_STRING("2024-05-02", days[1].c_str());
    TEST_ASSERT_EQUAL_STRING("2024-05-03", days[2].c_str());

    days = listDaysInclusive(at("2024-05-01T01:00:00Z"), at("2024-05-01T02:00:00Z"));
    TEST_ASSERT_EQUAL_UINT32(1, days.size());

    days = listDaysInclusive(at("2024-05-02T00:00:00Z"), at("2024-05-01T00:00:00Z"));
    TEST_ASSERT_EQUAL_UINT32(0, days.size());
}

void test_save_creates_directory_and_file(void)
{
    DailyLogger logger(tempDir + "/nested/logs");
    TEST_ASSERT_TRUE(logger.save(entry("2024-05-01T08:00:00.000Z", "1.000"), at("2024-05-01T08:00:00.000Z")));

    std::string path = logger.getPathForDay("2024-05-01");
    TEST_ASSERT_EQUAL_STRING((tempDir + "/nested/logs/sensor_log_2024-05-01.json").c_str(), path.c_str());
    TEST_ASSERT_TRUE(std::filesystem::exists(path));

    nlohmann::json document = nlohmann::json::parse(readTextFile(path));
    TEST_ASSERT_TRUE(document.is_array());
    TEST_ASSERT_EQUAL_UINT32(1, document.size());
    TEST_ASSERT_EQUAL_UINT32(1, logger.getEntriesWritten());
}

void test_appends_keep_arrival_order(void)
{
    DailyLogger logger(tempDir);
    TEST_ASSERT_TRUE(logger.save(entry("2024-05-01T08:00:02.000Z", "2.000"), at("2024-05-01T08:00:02.000Z")));
    TEST_ASSERT_TRUE(logger.save(entry("2024-05-01T08:00:01.000Z", "1.000"), at("2024-05-01T08:00:01.000Z")));
    TEST_ASSERT_TRUE(logger.save(entry("2024-05-01T08:00:03.000Z", "3.000"), at("2024-05-01T08:00:03.000Z")));

    std::vector<nlohmann::json> entries;
    TEST_ASSERT_TRUE(logger.readDay("2024-05-01", entries));
    TEST_ASSERT_EQUAL_UINT32(3, entries.size());
    TEST_ASSERT_EQUAL_STRING("2.000", entries[0]["ang_x"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("1.000", entries[1]["ang_x"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("3.000", entries[2]["ang_x"].get<std::string>().c_str());
}

void test_entries_split_at_utc_midnight(void)
{
    DailyLogger logger(tempDir);
    TEST_ASSERT_TRUE(logger.save(entry("2024-05-01T23:59:59.900Z", "1.000"), at("2024-05-01T23:59:59.900Z")));
    TEST_ASSERT_TRUE(logger.save(entry("2024-05-02T00:00:00.400Z", "2.000"), at("2024-05-02T00:00:00.400Z")));

    std::vector<nlohmann::json> first;
    std::vector<nlohmann::json> second;
    TEST_ASSERT_TRUE(logger.readDay("2024-05-01", first));
    TEST_ASSERT_TRUE(logger.readDay("2024-05-02", second));
    TEST_ASSERT_EQUAL_UINT32(1, first.size());
    TEST_ASSERT_EQUAL_UINT32(1, second.size());
}

void test_read_missing_day_fails(void)
{
    DailyLogger logger(tempDir);
    std::vector<nlohmann::json> entries;
    TEST_ASSERT_FALSE(logger.readDay("2024-05-01", entries));
}

void test_unparsable_day_fails_to_read(void)
{
    DailyLogger logger(tempDir);
    TEST_ASSERT_TRUE(writeTextFile(logger.getPathForDay("2024-05-01"), "[\n{\"ang_x\": \"1.0\"},\n"));
    TEST_ASSERT_TRUE(writeTextFile(logger.getPathForDay("2024-05-02"), "{\"ang_x\": \"1.0\"}\n"));

    std::vector<nlohmann::json> entries;
    TEST_ASSERT_FALSE(logger.readDay("2024-05-01", entries));
    TEST_ASSERT_FALSE(logger.readDay("2024-05-02", entries));
}

void test_append_to_empty_array(void)
{
    DailyLogger logger(tempDir);
    TEST_ASSERT_TRUE(writeTextFile(logger.getPathForDay("2024-05-01"), "[]"));
    TEST_ASSERT_TRUE(logger.save(entry("2024-05-01T08:00:00.000Z", "1.000"), at("2024-05-01T08:00:00.000Z")));

    std::vector<nlohmann::json> entries;
    TEST_ASSERT_TRUE(logger.readDay("2024-05-01", entries));
    TEST_ASSERT_EQUAL_UINT32(1, entries.size());
}

void test_corrupt_file_is_moved_aside(void)
{
    DailyLogger logger(tempDir);
    std::string path = logger.getPathForDay("2024-05-01");
    TEST_ASSERT_TRUE(writeTextFile(path, "[\n{\"ang_x\": \"1.0\"},\n"));

    TEST_ASSERT_TRUE(logger.save(entry("2024-05-01T08:00:00.000Z", "5.000"), at("2024-05-01T08:00:00.000Z")));

    TEST_ASSERT_TRUE(std::filesystem::exists(path + ".corrupt"));
    std::vector<nlohmann::json> entries;
    TEST_ASSERT_TRUE(logger.readDay("2024-05-01", entries));
    TEST_ASSERT_EQUAL_UINT32(1, entries.size());
    TEST_ASSERT_EQUAL_STRING("5.000", entries[0]["ang_x"].get<std::string>().c_str());
}

int main(int argc, char **argv)
{
    UNITY_BEGIN();

    RUN_TEST(test_list_days_inclusive);
    RUN_TEST(test_save_creates_directory_and_file);
    RUN_TEST(test_appends_keep_arrival_order);
    RUN_TEST(test_entries_split_at_utc_midnight);
    RUN_TEST(test_read_missing_day_fails);
    RUN_TEST(test_unparsable_day_fails_to_read);
    RUN_TEST(test_append_to_empty_array);
    RUN_TEST(test_corrupt_file_is_moved_aside);

    return UNITY_END();
}
