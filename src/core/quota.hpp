/**
 * @file quota.hpp
 * @brief ResourceQuota: the capacity vector arbitrated by the allocator.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>

namespace model_mesh {

/**
 * @brief A vector of resource capacities.
 *
 * Pure value type. Subtraction clamps every component at zero so a release
 * of more than was recorded never produces negative capacity.
 */
struct ResourceQuota {
    double cpu_cores{0.0};
    double memory_gb{0.0};
    double gpu_memory_gb{0.0};
    double network_bandwidth_mbps{0.0};
    int32_t worker_slots{0};
    int32_t client_connections{0};

    bool operator==(const ResourceQuota&) const = default;

    [[nodiscard]] ResourceQuota operator+(const ResourceQuota& other) const noexcept;
    [[nodiscard]] ResourceQuota operator-(const ResourceQuota& other) const noexcept;
    ResourceQuota& operator+=(const ResourceQuota& other) noexcept;
    ResourceQuota& operator-=(const ResourceQuota& other) noexcept;

    /// True if every component of this quota is >= the matching component of @p other.
    [[nodiscard]] bool can_satisfy(const ResourceQuota& other) const noexcept;

    [[nodiscard]] bool is_non_negative() const noexcept;
    [[nodiscard]] bool is_zero() const noexcept;
};

/// Component-wise minimum.
[[nodiscard]] ResourceQuota min_quota(const ResourceQuota& a, const ResourceQuota& b) noexcept;

/**
 * @brief Default capacity granted by a license tier.
 *
 * FREE: 2 cores, 4 GB, 2 GB GPU, 100 Mbps, 2 worker slots, 3 clients.
 * PRO: 8 / 16 / 8 / 1000 / 10 / 20. ENT: 32 / 64 / 32 / 10000 / 50 / 100.
 */
[[nodiscard]] ResourceQuota default_quota_for_tier(LicenseTier tier) noexcept;

}  // namespace model_mesh
