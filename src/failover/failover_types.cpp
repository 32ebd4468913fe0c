/**
 * @file failover_types.cpp
 * @brief Degradation thresholds and JSON conversion of failover records.
 */

#include "failover/failover_types.hpp"

#include "core/json_util.hpp"

namespace model_mesh {

DegradationLevel degradation_for_critical_ratio(double ratio) noexcept {
    if (ratio > 0.5) return DegradationLevel::MaintenanceMode;
    if (ratio > 0.3) return DegradationLevel::EssentialOnly;
    if (ratio > 0.2) return DegradationLevel::ReducedCapacity;
    if (ratio > 0.1) return DegradationLevel::ReducedQuality;
    return DegradationLevel::None;
}

Json::Value assignment_to_json(const BlockAssignment& a) {
    Json::Value v(Json::objectValue);
    v["block_id"] = a.block_id;
    v["network_id"] = a.network_id;
    v["assigned_worker"] = a.assigned_worker;
    v["priority"] = a.priority;
    v["last_updated"] = Json::Int64{to_unix_ms(a.last_updated)};
    return v;
}

Result<BlockAssignment> assignment_from_json(const Json::Value& value) {
    auto block_id = json::get_string(value, "block_id");
    auto network_id = json::get_string(value, "network_id");
    auto worker = json::get_string(value, "assigned_worker");
    auto updated = json::get_int(value, "last_updated");
    if (!block_id || !network_id || !worker || !updated) {
        return Error{"assignment record is missing fields", ErrorKind::InvalidInput};
    }
    auto priority = json::get_int(value, "priority");
    return BlockAssignment{
        .block_id = *block_id,
        .network_id = *network_id,
        .assigned_worker = *worker,
        .priority = static_cast<int32_t>(priority.value_or(1)),
        .last_updated = from_unix_ms(*updated),
    };
}

Json::Value event_to_json(const FailoverEvent& e) {
    Json::Value v(Json::objectValue);
    v["event_id"] = e.event_id;
    v["type"] = e.event_type;
    v["source"] = e.source_id;
    v["target"] = e.target_id.empty() ? Json::Value{} : Json::Value{e.target_id};
    v["strategy"] = std::string{to_string(e.strategy)};
    v["success"] = e.success;
    v["timestamp"] = Json::Int64{to_unix_ms(e.timestamp)};
    v["duration"] = e.duration_seconds;
    if (!e.details.empty()) v["details"] = e.details;
    return v;
}

}  // namespace model_mesh
