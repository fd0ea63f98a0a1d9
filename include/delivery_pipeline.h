#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "daily_logger.h"
#include "frame_decoder.h"
#include "precise_clock.h"
#include "system_status.h"
#include "telemetry_sink.h"

// One archived reading eligible for resend
struct BackfillCandidate {
    Timestamp sensingTime;
    nlohmann::json entry;
};

// Outcome of one backfill episode
struct BackfillReport {
    size_t candidates = 0;
    size_t delivered = 0;
    bool aborted = false;
    bool advanced = false;         // lastAdvancedTime is meaningful
    Timestamp lastAdvancedTime;
};

/**
 * @brief Delivers readings and frame errors, repairing gaps from the archive
 *
 * Per reading: metrics, primary send, then on success a gap check against the
 * last confirmed delivery. A gap longer than 1.5 sample periods starts a
 * backfill episode that resends archived readings newest first until the
 * first failure. Successful readings are then mirrored to the backup sink
 * when one is set. Every record is archived after its delivery step.
 *
 * The last-success time lives here and nowhere else.
 */
class DeliveryPipeline {
public:
    DeliveryPipeline(TelemetrySink& primary, MetricsProvider& metrics, DailyLogger& archive);

    void setSamplePeriodMs(uint32_t periodMs) { samplePeriodMs = periodMs; }

    // nullptr disables mirroring
    void setBackupSink(BackupSink* sink) { backupSink = sink; }

    void handleReading(const Reading& reading);
    void handleError(const ErrorRecord& error);

    // Strict: diffMs > 1.5 * periodMs
    static bool isGapExceeded(int64_t diffMs, uint32_t periodMs);

    // Archived readings in (from, to], newest first
    std::vector<BackfillCandidate> collectBackfillCandidates(Timestamp from, Timestamp to);
    BackfillReport runBackfill(Timestamp from, Timestamp to);

    // Wire formats
    static nlohmann::json buildPayload(const Reading& reading, const AuxMetrics& metrics);
    static nlohmann::json buildErrorPayload(const ErrorRecord& error);
    static std::string buildBackupRecord(const nlohmann::json& payload);

    bool hasLastSuccessTime() const { return lastSuccessValid; }
    Timestamp getLastSuccessTime() const { return lastSuccessTime; }
    const BackfillReport& getLastBackfillReport() const { return lastBackfillReport; }

    // Statistics
    unsigned long getReadingsDelivered() const { return readingsDelivered; }
    unsigned long getDeliveryFailures() const { return deliveryFailures; }
    unsigned long getErrorsReported() const { return errorsReported; }
    unsigned long getBackfillEpisodes() const { return backfillEpisodes; }
    unsigned long getBackfillResent() const { return backfillResent; }
    unsigned long getBackfillSkippedDays() const { return backfillSkippedDays; }
    unsigned long getBackupSent() const { return backupSent; }
    unsigned long getBackupFailed() const { return backupFailed; }
    void getStatistics(char* buffer, size_t bufferSize) const;

private:
    TelemetrySink& primarySink;
    MetricsProvider& metricsProvider;
    DailyLogger& dailyLogger;
    BackupSink* backupSink;
    uint32_t samplePeriodMs;

    // Delivery state
    bool lastSuccessValid;
    Timestamp lastSuccessTime;
    BackfillReport lastBackfillReport;

    unsigned long readingsDelivered;
    unsigned long deliveryFailures;
    unsigned long errorsReported;
    unsigned long backfillEpisodes;
    unsigned long backfillResent;
    unsigned long backfillSkippedDays;
    unsigned long backupSent;
    unsigned long backupFailed;

    void mirrorToBackup(const nlohmann::json& payload);
    void archive(const nlohmann::json& entry, Timestamp sensingTime);
};
