#include "delivery_pipeline.h"
#include "constants.h"
#include "logger.h"
#include <stdio.h>
#include <algorithm>

DeliveryPipeline::DeliveryPipeline(TelemetrySink& primary, MetricsProvider& metrics, DailyLogger& archive)
    : primarySink(primary)
    , metricsProvider(metrics)
    , dailyLogger(archive)
    , backupSink(nullptr)
    , samplePeriodMs(0)
    , lastSuccessValid(false)
    , readingsDelivered(0)
    , deliveryFailures(0)
    , errorsReported(0)
    , backfillEpisodes(0)
    , backfillResent(0)
    , backfillSkippedDays(0)
    , backupSent(0)
    , backupFailed(0) {
}

bool DeliveryPipeline::isGapExceeded(int64_t diffMs, uint32_t periodMs) {
    // diff > 1.5 * P without floating point
    return diffMs * 2 > (int64_t)periodMs * 3;
}

nlohmann::json DeliveryPipeline::buildPayload(const Reading& reading, const AuxMetrics& metrics) {
    nlohmann::json payload;
    payload["sensing_time"] = formatIsoTimestamp(reading.sensingTime);
    payload["ang_x"] = reading.angX;
    payload["ang_y"] = reading.angY;
    payload["ang_z"] = reading.angZ;
    payload["device_id"] = reading.deviceId;

    // Key spellings are fixed by the receiving server
    payload["cpu_temperture"] = metrics.hasCpuTemperature ? nlohmann::json(metrics.cpuTemperature) : nlohmann::json();
    payload["cpu_voltage"] = metrics.hasCpuVoltage ? nlohmann::json(metrics.cpuVoltage) : nlohmann::json();
    payload["rssi"] = metrics.hasRssi ? nlohmann::json(metrics.rssi) : nlohmann::json();
    payload["memUsage"] = metrics.hasMemoryUsage ? nlohmann::json(metrics.memoryUsage) : nlohmann::json();
    payload["diskUsage"] = metrics.hasDiskUsage ? nlohmann::json(metrics.diskUsage) : nlohmann::json();
    return payload;
}

nlohmann::json DeliveryPipeline::buildErrorPayload(const ErrorRecord& error) {
    nlohmann::json payload;
    payload["sensing_time"] = formatIsoTimestamp(error.sensingTime);
    payload["error"] = error.reason;
    return payload;
}

static std::string recordField(const nlohmann::json& payload, const char* key) {
    nlohmann::json::const_iterator it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return "null";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::string DeliveryPipeline::buildBackupRecord(const nlohmann::json& payload) {
    static const char* const fields[] = {
        "device_id", "sensing_time", "ang_x", "ang_y", "ang_z",
        "cpu_temperture", "cpu_voltage", "rssi"
    };

    std::string record = BACKUP_RECORD_PREFIX;
    for (size_t i = 0; i < sizeof(fields) / sizeof(fields[0]); i++) {
        if (i > 0) record += ',';
        record += recordField(payload, fields[i]);
    }
    record += BACKUP_RECORD_SUFFIX;
    return record;
}

void DeliveryPipeline::handleReading(const Reading& reading) {
    AuxMetrics metrics = metricsProvider.collect();
    nlohmann::json payload = buildPayload(reading, metrics);
    std::string sensingTime = payload["sensing_time"].get<std::string>();

    DeliveryResult result = primarySink.postJson(payload);
    if (!result.success) {
        deliveryFailures++;
        LOG_ERROR("DeliveryPipeline: Delivery of %s failed: %s", sensingTime.c_str(), result.message.c_str());
        archive(payload, reading.sensingTime);
        return;
    }

    readingsDelivered++;
    LOG_DEBUG("DeliveryPipeline: Delivered %s x=%s y=%s z=%s",
        sensingTime.c_str(), reading.angX.c_str(), reading.angY.c_str(), reading.angZ.c_str());

    if (lastSuccessValid) {
        int64_t diffMs = timestampToEpochMs(reading.sensingTime) - timestampToEpochMs(lastSuccessTime);
        if (isGapExceeded(diffMs, samplePeriodMs)) {
            LOG_WARN("DeliveryPipeline: Gap of %lld ms since %s exceeds %u ms, starting backfill",
                (long long)diffMs, formatIsoTimestamp(lastSuccessTime).c_str(), samplePeriodMs * 3 / 2);
            lastBackfillReport = runBackfill(lastSuccessTime, reading.sensingTime);
        }
    }

    // Unconditional, even after a partial episode
    lastSuccessTime = reading.sensingTime;
    lastSuccessValid = true;

    if (backupSink) {
        mirrorToBackup(payload);
    }

    archive(payload, reading.sensingTime);
}

void DeliveryPipeline::handleError(const ErrorRecord& error) {
    nlohmann::json payload = buildErrorPayload(error);

    DeliveryResult result = primarySink.postJson(payload);
    if (result.success) {
        errorsReported++;
        LOG_WARN("DeliveryPipeline: Reported frame error '%s'", error.reason.c_str());
    } else {
        LOG_ERROR("DeliveryPipeline: Report of frame error '%s' failed: %s",
            error.reason.c_str(), result.message.c_str());
    }

    archive(payload, error.sensingTime);
}

std::vector<BackfillCandidate> DeliveryPipeline::collectBackfillCandidates(Timestamp from, Timestamp to) {
    std::vector<BackfillCandidate> candidates;

    std::vector<std::string> days = listDaysInclusive(from, to);
    for (size_t d = 0; d < days.size(); d++) {
        std::vector<nlohmann::json> entries;
        if (!dailyLogger.readDay(days[d], entries)) {
            backfillSkippedDays++;
            LOG_WARN("DeliveryPipeline: Backfill skipping %s", days[d].c_str());
            continue;
        }

        for (size_t i = 0; i < entries.size(); i++) {
            const nlohmann::json& entry = entries[i];
            // Error records carry no angles
            if (!entry.is_object() || !entry.contains("ang_x") || !entry.contains("ang_y") || !entry.contains("ang_z")) {
                continue;
            }

            nlohmann::json::const_iterator time = entry.find("sensing_time");
            Timestamp sensingTime;
            if (time == entry.end() || !time->is_string() || !parseIsoTimestamp(time->get<std::string>(), sensingTime)) {
                LOG_DEBUG("DeliveryPipeline: Entry %u of %s has no usable sensing_time", (unsigned)i, days[d].c_str());
                continue;
            }

            if (sensingTime > from && sensingTime <= to) {
                BackfillCandidate candidate;
                candidate.sensingTime = sensingTime;
                candidate.entry = entry;
                candidates.push_back(candidate);
            }
        }
    }

    // Newest first
    std::reverse(candidates.begin(), candidates.end());
    return candidates;
}

BackfillReport DeliveryPipeline::runBackfill(Timestamp from, Timestamp to) {
    BackfillReport report;
    backfillEpisodes++;

    std::vector<BackfillCandidate> candidates = collectBackfillCandidates(from, to);
    report.candidates = candidates.size();
    LOG_INFO("DeliveryPipeline: Backfill found %u entries between %s and %s",
        (unsigned)candidates.size(), formatIsoTimestamp(from).c_str(), formatIsoTimestamp(to).c_str());

    for (size_t i = 0; i < candidates.size(); i++) {
        DeliveryResult result = primarySink.postJson(candidates[i].entry);
        if (!result.success) {
            report.aborted = true;
            LOG_ERROR("DeliveryPipeline: Backfill aborted at %s after %u of %u: %s",
                formatIsoTimestamp(candidates[i].sensingTime).c_str(),
                (unsigned)report.delivered, (unsigned)report.candidates, result.message.c_str());
            break;
        }

        report.delivered++;
        backfillResent++;
        lastSuccessTime = candidates[i].sensingTime;
        lastSuccessValid = true;
        report.advanced = true;
        report.lastAdvancedTime = candidates[i].sensingTime;
    }

    if (!report.aborted) {
        LOG_INFO("DeliveryPipeline: Backfill resent %u entries", (unsigned)report.delivered);
    }
    return report;
}

void DeliveryPipeline::mirrorToBackup(const nlohmann::json& payload) {
    std::string record = buildBackupRecord(payload);
    DeliveryResult result = backupSink->sendRecord(record);
    if (result.success) {
        backupSent++;
        LOG_DEBUG("DeliveryPipeline: Backup record sent (%u bytes)", (unsigned)record.size());
    } else {
        backupFailed++;
        LOG_WARN("DeliveryPipeline: Backup record failed: %s", result.message.c_str());
    }
}

void DeliveryPipeline::archive(const nlohmann::json& entry, Timestamp sensingTime) {
    if (!dailyLogger.save(entry, sensingTime)) {
        LOG_ERROR("DeliveryPipeline: Entry %s lost from archive", formatIsoTimestamp(sensingTime).c_str());
    }
}

void DeliveryPipeline::getStatistics(char* buffer, size_t bufferSize) const {
    snprintf(buffer, bufferSize,
        "delivered=%lu failed=%lu errors=%lu backfills=%lu resent=%lu skipped_days=%lu backup=%lu/%lu last=%s",
        readingsDelivered, deliveryFailures, errorsReported,
        backfillEpisodes, backfillResent, backfillSkippedDays,
        backupSent, backupSent + backupFailed,
        lastSuccessValid ? formatIsoTimestamp(lastSuccessTime).c_str() : "none");
}
