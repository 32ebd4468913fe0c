/**
 * @file types.hpp
 * @brief Fundamental types used throughout ModelMesh.
 *
 * Defines identity aliases, time types and the small shared vocabulary
 * (priorities, health states, license tiers) used by more than one subsystem.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace model_mesh {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using ModelId = std::string;
using BlockId = std::string;
using KeyId = std::string;
using SessionId = std::string;
using NetworkId = std::string;
using WorkerId = std::string;
using RequestId = std::string;
using AllocationId = std::string;
using NotificationId = std::string;

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using Bytes = std::vector<uint8_t>;

// ─────────────────────────────────────────────
// License Tier
// ─────────────────────────────────────────────

enum class LicenseTier : uint8_t {
    Free,
    Pro,
    Enterprise
};

[[nodiscard]] constexpr std::string_view to_string(LicenseTier tier) noexcept {
    switch (tier) {
        case LicenseTier::Free:       return "FREE";
        case LicenseTier::Pro:        return "PRO";
        case LicenseTier::Enterprise: return "ENT";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<LicenseTier> parse_license_tier(std::string_view name) {
    if (name == "FREE" || name == "free") return LicenseTier::Free;
    if (name == "PRO" || name == "pro") return LicenseTier::Pro;
    if (name == "ENT" || name == "ent" || name == "ENTERPRISE" || name == "enterprise") {
        return LicenseTier::Enterprise;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Health Status
// ─────────────────────────────────────────────

enum class HealthStatus : uint8_t {
    Unknown,
    Healthy,
    Warning,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Unknown:  return "unknown";
        case HealthStatus::Healthy:  return "healthy";
        case HealthStatus::Warning:  return "warning";
        case HealthStatus::Critical: return "critical";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Time helpers
// ─────────────────────────────────────────────

[[nodiscard]] inline int64_t to_unix_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_ms(int64_t ms) noexcept {
    return Timestamp{std::chrono::milliseconds{ms}};
}

}  // namespace model_mesh
