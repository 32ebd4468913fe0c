/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include "core/json_util.hpp"
#include "core/quota.hpp"

#include <algorithm>
#include <chrono>

namespace model_mesh {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_transfer_session(const TransferSession& session) {
    const auto completed = std::count_if(session.blocks.begin(), session.blocks.end(),
        [](const BlockTransferInfo& b) { return b.status == TransferStatus::Completed; });

    Json::Value record(Json::objectValue);
    record["session"] = session.session_id;
    record["client"] = session.client_node_id;
    record["model"] = session.model_id;
    record["status"] = std::string{to_string(session.status)};
    record["blocks_total"] = Json::UInt64{session.blocks.size()};
    record["blocks_completed"] = Json::Int64{completed};
    if (session.started_at && session.completed_at) {
        record["duration_ms"] = Json::Int64{std::chrono::duration_cast<std::chrono::milliseconds>(
            *session.completed_at - *session.started_at).count()};
    }
    emit("transfer_session", std::move(record));
}

void MetricsCollector::record_allocation(const ResourceAllocation& allocation,
                                         AllocationEvent event) {
    Json::Value record(Json::objectValue);
    record["allocation"] = allocation.allocation_id;
    record["network"] = allocation.network_id;
    record["request"] = allocation.request_id;
    record["kind"] = std::string{to_string(event)};
    record["granted"] = quota_to_json(allocation.granted);
    emit("allocation", std::move(record));
}

void MetricsCollector::record_health_transition(const std::string& id, HealthStatus old_status,
                                                HealthStatus new_status) {
    Json::Value record(Json::objectValue);
    record["id"] = id;
    record["from"] = std::string{to_string(old_status)};
    record["to"] = std::string{to_string(new_status)};
    emit("health_transition", std::move(record));
}

void MetricsCollector::record_failover(const FailoverEvent& event) {
    emit("failover", event_to_json(event));
}

void MetricsCollector::record_degradation(DegradationLevel old_level, DegradationLevel new_level,
                                          const std::string& reason) {
    Json::Value record(Json::objectValue);
    record["from"] = std::string{to_string(old_level)};
    record["to"] = std::string{to_string(new_level)};
    record["reason"] = reason;
    emit("degradation", std::move(record));
}

void MetricsCollector::record_custom(std::string_view event, const Json::Value& payload) {
    Json::Value record(Json::objectValue);
    record["data"] = payload;
    emit(event, std::move(record));
}

void MetricsCollector::emit(std::string_view event, Json::Value record) {
    record["event"] = std::string{event};
    record["ts"] = Json::Int64{to_unix_ms(std::chrono::system_clock::now())};
    const auto line = json::write_compact(record);

    std::lock_guard lock(write_mutex_);
    sink_->write(line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace model_mesh
