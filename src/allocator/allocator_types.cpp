/**
 * @file allocator_types.cpp
 * @brief Profile interpolation, priority parsing and JSON rendering.
 */

#include "allocator/allocator_types.hpp"

#include <algorithm>

namespace model_mesh {

Result<RequestPriority> parse_request_priority(std::string_view text) {
    if (text == "low") return RequestPriority::Low;
    if (text == "normal") return RequestPriority::Normal;
    if (text == "high") return RequestPriority::High;
    if (text == "critical") return RequestPriority::Critical;
    return Error{"unknown priority: " + std::string{text}, ErrorKind::InvalidInput};
}

ResourceQuota NetworkResourceProfile::dynamic_requirements(double load_factor) const noexcept {
    const double f = std::clamp(load_factor, 0.0, 1.0);
    const auto& b = base_requirements;
    const auto& p = peak_requirements;
    auto lerp = [f](double lo, double hi) { return lo + (hi - lo) * f; };

    return ResourceQuota{
        .cpu_cores = lerp(b.cpu_cores, p.cpu_cores),
        .memory_gb = lerp(b.memory_gb, p.memory_gb),
        .gpu_memory_gb = lerp(b.gpu_memory_gb, p.gpu_memory_gb),
        .network_bandwidth_mbps = lerp(b.network_bandwidth_mbps, p.network_bandwidth_mbps),
        .worker_slots = static_cast<int32_t>(lerp(b.worker_slots, p.worker_slots)),
        .client_connections = static_cast<int32_t>(lerp(b.client_connections,
                                                         p.client_connections)),
    };
}

std::array<ResourceUsage, RESOURCE_DIMENSIONS> usage_table(const ResourceQuota& total,
                                                           const ResourceQuota& allocated) {
    auto row = [](std::string_view name, double t, double a) {
        ResourceUsage usage{.resource = name, .total = t, .allocated = a};
        usage.available = std::max(0.0, t - a);
        usage.utilization_percent = t > 0.0 ? a / t * 100.0 : 0.0;
        return usage;
    };
    return {
        row("cpu_cores", total.cpu_cores, allocated.cpu_cores),
        row("memory_gb", total.memory_gb, allocated.memory_gb),
        row("gpu_memory_gb", total.gpu_memory_gb, allocated.gpu_memory_gb),
        row("network_bandwidth_mbps", total.network_bandwidth_mbps,
            allocated.network_bandwidth_mbps),
        row("worker_slots", total.worker_slots, allocated.worker_slots),
        row("client_connections", total.client_connections, allocated.client_connections),
    };
}

Json::Value UtilizationReport::to_json() const {
    Json::Value root(Json::objectValue);
    Json::Value table(Json::objectValue);
    for (const auto& usage : resources) {
        Json::Value entry(Json::objectValue);
        entry["total"] = usage.total;
        entry["allocated"] = usage.allocated;
        entry["available"] = usage.available;
        entry["utilization_percent"] = usage.utilization_percent;
        table[std::string{usage.resource}] = entry;
    }
    root["resources"] = table;
    root["active_allocations"] = Json::UInt64{active_allocations};
    root["pending_requests"] = Json::UInt64{pending_requests};

    Json::Value stats(Json::objectValue);
    stats["total_requests"] = Json::UInt64{statistics.total_requests};
    stats["satisfied_requests"] = Json::UInt64{statistics.satisfied_requests};
    stats["rejected_requests"] = Json::UInt64{statistics.rejected_requests};
    stats["conflicts_resolved"] = Json::UInt64{statistics.conflicts_resolved};
    stats["allocations_released"] = Json::UInt64{statistics.allocations_released};
    stats["allocations_expired"] = Json::UInt64{statistics.allocations_expired};
    root["statistics"] = stats;
    return root;
}

Json::Value quota_to_json(const ResourceQuota& quota) {
    Json::Value v(Json::objectValue);
    v["cpu_cores"] = quota.cpu_cores;
    v["memory_gb"] = quota.memory_gb;
    v["gpu_memory_gb"] = quota.gpu_memory_gb;
    v["network_bandwidth_mbps"] = quota.network_bandwidth_mbps;
    v["worker_slots"] = quota.worker_slots;
    v["client_connections"] = quota.client_connections;
    return v;
}

Result<ResourceQuota> quota_from_json(const Json::Value& value) {
    if (!value.isObject()) {
        return Error{"quota must be a JSON object", ErrorKind::InvalidInput};
    }
    ResourceQuota quota;
    auto number = [&value](const char* key, double& out) {
        const auto& field = value[key];
        if (field.isNull()) return true;
        if (!field.isNumeric()) return false;
        out = field.asDouble();
        return true;
    };
    auto integer = [&value](const char* key, int32_t& out) {
        const auto& field = value[key];
        if (field.isNull()) return true;
        if (!field.isInt()) return false;
        out = field.asInt();
        return true;
    };
    if (!number("cpu_cores", quota.cpu_cores) || !number("memory_gb", quota.memory_gb)
        || !number("gpu_memory_gb", quota.gpu_memory_gb)
        || !number("network_bandwidth_mbps", quota.network_bandwidth_mbps)
        || !integer("worker_slots", quota.worker_slots)
        || !integer("client_connections", quota.client_connections)) {
        return Error{"quota field has the wrong type", ErrorKind::InvalidInput};
    }
    if (!quota.is_non_negative()) {
        return Error{"quota components must be non-negative", ErrorKind::InvalidInput};
    }
    return quota;
}

}  // namespace model_mesh
