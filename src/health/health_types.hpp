/**
 * @file health_types.hpp
 * @brief Health records, admin notifications and the probe interface.
 */

#pragma once

#include "core/types.hpp"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace model_mesh {

// ─────────────────────────────────────────────
// Health records
// ─────────────────────────────────────────────

struct NetworkHealthInfo {
    NetworkId network_id;
    std::string host;
    uint16_t port{0};
    HealthStatus status{HealthStatus::Unknown};
    std::optional<Timestamp> last_heartbeat;
    Duration response_time{0};
    uint32_t consecutive_failures{0};
    uint64_t request_count{0};
    uint64_t error_count{0};
};

struct WorkerHealthInfo {
    WorkerId worker_id;
    NetworkId network_id;
    std::string host;
    uint16_t port{0};
    HealthStatus status{HealthStatus::Unknown};
    std::optional<Timestamp> last_heartbeat;
    Duration response_time{0};
    uint32_t consecutive_failures{0};
    uint64_t request_count{0};
    uint64_t error_count{0};
    std::vector<BlockId> model_blocks;
};

// ─────────────────────────────────────────────
// Admin notifications
// ─────────────────────────────────────────────

enum class NotificationSeverity : uint8_t {
    Info,
    Warning,
    Error,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(NotificationSeverity severity) noexcept {
    switch (severity) {
        case NotificationSeverity::Info:     return "info";
        case NotificationSeverity::Warning:  return "warning";
        case NotificationSeverity::Error:    return "error";
        case NotificationSeverity::Critical: return "critical";
    }
    return "unknown";
}

/// Immutable apart from the acknowledgment fields.
struct AdminNotification {
    NotificationId notification_id;
    NotificationSeverity severity{NotificationSeverity::Info};
    std::string source;
    std::string message;
    Json::Value details{Json::objectValue};
    Timestamp timestamp;
    bool acknowledged{false};
    std::string acknowledged_by;
    std::optional<Timestamp> acknowledged_at;
};

[[nodiscard]] Json::Value notification_to_json(const AdminNotification& notification);

// ─────────────────────────────────────────────
// Probing
// ─────────────────────────────────────────────

struct ProbeResult {
    bool success{false};
    Duration response_time{0};
    std::string error;
};

/**
 * @brief Liveness check of one network or worker endpoint.
 *
 * Implementations must be safe to call from the monitoring thread while
 * other threads call them on demand.
 */
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;
    virtual ProbeResult probe(const std::string& id, const std::string& host, uint16_t port,
                              Duration timeout) = 0;
};

// ─────────────────────────────────────────────
// Summary
// ─────────────────────────────────────────────

struct HealthSummary {
    HealthStatus overall{HealthStatus::Unknown};
    size_t tracked_networks{0};
    size_t tracked_workers{0};
    size_t healthy{0};
    size_t warning{0};
    size_t critical{0};
    size_t unknown{0};
    double average_response_ms{0.0};
    size_t unacknowledged_notifications{0};
};

}  // namespace model_mesh
