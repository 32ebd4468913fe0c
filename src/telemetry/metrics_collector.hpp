/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "failover/failover_types.hpp"
#include "transfer/transfer_types.hpp"

#include <json/json.h>

#include <memory>
#include <mutex>
#include <string_view>

namespace model_mesh {

/**
 * @brief Collects and writes structured telemetry events as NDJSON.
 *
 * Each record is one line with an "event" field and a unix-ms "ts".
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_transfer_session(const TransferSession& session);
    void record_allocation(const ResourceAllocation& allocation, AllocationEvent event);
    void record_health_transition(const std::string& id, HealthStatus old_status,
                                  HealthStatus new_status);
    void record_failover(const FailoverEvent& event);
    void record_degradation(DegradationLevel old_level, DegradationLevel new_level,
                            const std::string& reason);
    void record_custom(std::string_view event, const Json::Value& payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view event, Json::Value record);
};

}  // namespace model_mesh
