/**
 * @file allocator_types.hpp
 * @brief Requests, allocations, network profiles and the utilization report.
 */

#pragma once

#include "core/quota.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <json/json.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace model_mesh {

// ─────────────────────────────────────────────
// Priority & status
// ─────────────────────────────────────────────

/// Ordered by urgency: Critical outranks everything.
enum class RequestPriority : uint8_t {
    Low,
    Normal,
    High,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(RequestPriority priority) noexcept {
    switch (priority) {
        case RequestPriority::Low:      return "low";
        case RequestPriority::Normal:   return "normal";
        case RequestPriority::High:     return "high";
        case RequestPriority::Critical: return "critical";
    }
    return "unknown";
}

Result<RequestPriority> parse_request_priority(std::string_view text);

enum class RequestStatus : uint8_t {
    Pending,
    Granted,
    Rejected,
    Expired,
    Withdrawn
};

[[nodiscard]] constexpr std::string_view to_string(RequestStatus status) noexcept {
    switch (status) {
        case RequestStatus::Pending:   return "pending";
        case RequestStatus::Granted:   return "granted";
        case RequestStatus::Rejected:  return "rejected";
        case RequestStatus::Expired:   return "expired";
        case RequestStatus::Withdrawn: return "withdrawn";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Requests & allocations
// ─────────────────────────────────────────────

struct ResourceRequest {
    RequestId request_id;                   ///< Generated when empty
    NetworkId network_id;
    ResourceQuota required;
    RequestPriority priority{RequestPriority::Normal};
    Timestamp requested_at{};               ///< Stamped on submission when unset
    std::chrono::seconds timeout{300};

    [[nodiscard]] bool is_expired(Timestamp now) const noexcept {
        return now > requested_at + timeout;
    }
};

struct ResourceAllocation {
    AllocationId allocation_id;
    NetworkId network_id;
    RequestId request_id;
    ResourceQuota granted;
    Timestamp granted_at;
    Timestamp expires_at;

    [[nodiscard]] bool is_expired(Timestamp now) const noexcept { return now >= expires_at; }
};

/**
 * @brief Base and peak demand of one model-serving network.
 *
 * Callers re-request as load changes; the allocator never renegotiates
 * on its own.
 */
struct NetworkResourceProfile {
    NetworkId network_id;
    ResourceQuota base_requirements;
    ResourceQuota peak_requirements;
    RequestPriority priority{RequestPriority::Normal};

    /// base + load * (peak - base), load clamped to [0, 1], slots truncated.
    [[nodiscard]] ResourceQuota dynamic_requirements(double load_factor) const noexcept;
};

// ─────────────────────────────────────────────
// Reporting
// ─────────────────────────────────────────────

struct AllocatorStats {
    uint64_t total_requests{0};
    uint64_t satisfied_requests{0};
    uint64_t rejected_requests{0};
    uint64_t conflicts_resolved{0};
    uint64_t allocations_released{0};
    uint64_t allocations_expired{0};
};

struct ResourceUsage {
    std::string_view resource;
    double total{0.0};
    double allocated{0.0};
    double available{0.0};
    double utilization_percent{0.0};
};

inline constexpr size_t RESOURCE_DIMENSIONS = 6;

struct UtilizationReport {
    std::array<ResourceUsage, RESOURCE_DIMENSIONS> resources{};
    size_t active_allocations{0};
    size_t pending_requests{0};
    AllocatorStats statistics;

    [[nodiscard]] Json::Value to_json() const;
};

/// Build the per-dimension usage table from total and allocated quotas.
[[nodiscard]] std::array<ResourceUsage, RESOURCE_DIMENSIONS> usage_table(
    const ResourceQuota& total, const ResourceQuota& allocated);

[[nodiscard]] Json::Value quota_to_json(const ResourceQuota& quota);
Result<ResourceQuota> quota_from_json(const Json::Value& value);

}  // namespace model_mesh
