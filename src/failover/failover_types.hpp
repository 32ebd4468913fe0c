/**
 * @file failover_types.hpp
 * @brief Backup workers, block assignments and failover audit records.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <json/json.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace model_mesh {

enum class FailoverStrategy : uint8_t {
    Immediate,
    Graceful,
    Scheduled
};

[[nodiscard]] constexpr std::string_view to_string(FailoverStrategy strategy) noexcept {
    switch (strategy) {
        case FailoverStrategy::Immediate: return "immediate";
        case FailoverStrategy::Graceful:  return "graceful";
        case FailoverStrategy::Scheduled: return "scheduled";
    }
    return "unknown";
}

/// Strictly ordered by severity.
enum class DegradationLevel : uint8_t {
    None = 0,
    ReducedQuality = 1,
    ReducedCapacity = 2,
    EssentialOnly = 3,
    MaintenanceMode = 4
};

[[nodiscard]] constexpr std::string_view to_string(DegradationLevel level) noexcept {
    switch (level) {
        case DegradationLevel::None:            return "NONE";
        case DegradationLevel::ReducedQuality:  return "REDUCED_QUALITY";
        case DegradationLevel::ReducedCapacity: return "REDUCED_CAPACITY";
        case DegradationLevel::EssentialOnly:   return "ESSENTIAL_ONLY";
        case DegradationLevel::MaintenanceMode: return "MAINTENANCE_MODE";
    }
    return "UNKNOWN";
}

/// Level implied by the share of networks in Critical state.
[[nodiscard]] DegradationLevel degradation_for_critical_ratio(double ratio) noexcept;

enum class BackupStatus : uint8_t {
    Standby,
    Activating,
    Active,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(BackupStatus status) noexcept {
    switch (status) {
        case BackupStatus::Standby:    return "standby";
        case BackupStatus::Activating: return "activating";
        case BackupStatus::Active:     return "active";
        case BackupStatus::Failed:     return "failed";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Backups & assignments
// ─────────────────────────────────────────────

struct BackupWorker {
    WorkerId worker_id;
    NetworkId network_id;
    std::string host;
    uint16_t port{0};
    std::vector<BlockId> model_blocks;
    int32_t priority{1};                    ///< Lower value is activated first
    BackupStatus status{BackupStatus::Standby};
    std::optional<Timestamp> activation_time;
    AllocationId allocation_id;             ///< Held while Active
    WorkerId replaces;                      ///< Failed worker this backup stands in for
};

/// Authoritative owner of one model block.
struct BlockAssignment {
    BlockId block_id;
    NetworkId network_id;
    WorkerId assigned_worker;
    int32_t priority{1};
    Timestamp last_updated;
};

[[nodiscard]] Json::Value assignment_to_json(const BlockAssignment& assignment);
Result<BlockAssignment> assignment_from_json(const Json::Value& value);

// ─────────────────────────────────────────────
// Audit records
// ─────────────────────────────────────────────

struct FailoverEvent {
    std::string event_id;
    std::string event_type;                 ///< "worker_failure", "network_failure"
    std::string source_id;
    std::string target_id;
    FailoverStrategy strategy{FailoverStrategy::Immediate};
    bool success{false};
    Timestamp timestamp;
    double duration_seconds{0.0};
    std::string details;
};

struct WorkloadTransfer {
    std::string transfer_id;
    WorkerId source_worker;
    WorkerId target_worker;
    std::vector<BlockId> model_blocks;
    std::vector<SessionId> sessions;
    Timestamp started_at;
    std::optional<Timestamp> completed_at;
    bool success{false};
    std::string error_message;
};

using RedistributionPlan = std::map<WorkerId, std::vector<BlockId>>;

struct BlockRedistribution {
    std::string redistribution_id;
    NetworkId network_id;
    WorkerId failed_worker;
    std::vector<BlockId> affected_blocks;
    RedistributionPlan plan;
    Timestamp started_at;
    std::optional<Timestamp> completed_at;
    bool success{false};
    uint32_t conflicts_resolved{0};
    std::string error_message;
};

struct DegradationRecord {
    Timestamp timestamp;
    DegradationLevel level{DegradationLevel::None};
    std::string reason;
};

struct FailoverStats {
    uint64_t total_failovers{0};
    uint64_t successful_failovers{0};
    uint64_t failed_failovers{0};
    double average_failover_time{0.0};      ///< Seconds
    uint64_t backup_activations{0};
    uint64_t degradation_events{0};
    uint64_t redistributions{0};
};

[[nodiscard]] Json::Value event_to_json(const FailoverEvent& event);

}  // namespace model_mesh
