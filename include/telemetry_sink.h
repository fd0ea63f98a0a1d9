#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Outcome of one network send; consumed by the next pipeline step
struct DeliveryResult {
    bool success;
    std::string message;

    static DeliveryResult ok() { return DeliveryResult{true, std::string()}; }
    static DeliveryResult failed(const std::string& why) { return DeliveryResult{false, why}; }
};

// Primary sink: one JSON document per request
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    virtual DeliveryResult postJson(const nlohmann::json& payload) = 0;
};

// Secondary sink: one ASCII record per connection
class BackupSink {
public:
    virtual ~BackupSink() = default;
    virtual DeliveryResult sendRecord(const std::string& record) = 0;
};
