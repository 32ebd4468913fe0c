/**
 * @file quota.cpp
 * @brief ResourceQuota arithmetic.
 */

#include "core/quota.hpp"

#include <algorithm>

namespace model_mesh {

namespace {

double clamp_sub(double a, double b) noexcept { return std::max(0.0, a - b); }
int32_t clamp_sub(int32_t a, int32_t b) noexcept { return std::max<int32_t>(0, a - b); }

}  // anonymous namespace

ResourceQuota ResourceQuota::operator+(const ResourceQuota& other) const noexcept {
    ResourceQuota sum = *this;
    sum += other;
    return sum;
}

ResourceQuota ResourceQuota::operator-(const ResourceQuota& other) const noexcept {
    ResourceQuota diff = *this;
    diff -= other;
    return diff;
}

ResourceQuota& ResourceQuota::operator+=(const ResourceQuota& other) noexcept {
    cpu_cores += other.cpu_cores;
    memory_gb += other.memory_gb;
    gpu_memory_gb += other.gpu_memory_gb;
    network_bandwidth_mbps += other.network_bandwidth_mbps;
    worker_slots += other.worker_slots;
    client_connections += other.client_connections;
    return *this;
}

ResourceQuota& ResourceQuota::operator-=(const ResourceQuota& other) noexcept {
    cpu_cores = clamp_sub(cpu_cores, other.cpu_cores);
    memory_gb = clamp_sub(memory_gb, other.memory_gb);
    gpu_memory_gb = clamp_sub(gpu_memory_gb, other.gpu_memory_gb);
    network_bandwidth_mbps = clamp_sub(network_bandwidth_mbps, other.network_bandwidth_mbps);
    worker_slots = clamp_sub(worker_slots, other.worker_slots);
    client_connections = clamp_sub(client_connections, other.client_connections);
    return *this;
}

bool ResourceQuota::can_satisfy(const ResourceQuota& other) const noexcept {
    return cpu_cores >= other.cpu_cores
        && memory_gb >= other.memory_gb
        && gpu_memory_gb >= other.gpu_memory_gb
        && network_bandwidth_mbps >= other.network_bandwidth_mbps
        && worker_slots >= other.worker_slots
        && client_connections >= other.client_connections;
}

bool ResourceQuota::is_non_negative() const noexcept {
    return cpu_cores >= 0.0 && memory_gb >= 0.0 && gpu_memory_gb >= 0.0
        && network_bandwidth_mbps >= 0.0 && worker_slots >= 0 && client_connections >= 0;
}

bool ResourceQuota::is_zero() const noexcept {
    return *this == ResourceQuota{};
}

ResourceQuota min_quota(const ResourceQuota& a, const ResourceQuota& b) noexcept {
    return ResourceQuota{
        .cpu_cores = std::min(a.cpu_cores, b.cpu_cores),
        .memory_gb = std::min(a.memory_gb, b.memory_gb),
        .gpu_memory_gb = std::min(a.gpu_memory_gb, b.gpu_memory_gb),
        .network_bandwidth_mbps = std::min(a.network_bandwidth_mbps, b.network_bandwidth_mbps),
        .worker_slots = std::min(a.worker_slots, b.worker_slots),
        .client_connections = std::min(a.client_connections, b.client_connections),
    };
}

ResourceQuota default_quota_for_tier(LicenseTier tier) noexcept {
    switch (tier) {
        case LicenseTier::Free:
            return {.cpu_cores = 2.0, .memory_gb = 4.0, .gpu_memory_gb = 2.0,
                    .network_bandwidth_mbps = 100.0, .worker_slots = 2, .client_connections = 3};
        case LicenseTier::Pro:
            return {.cpu_cores = 8.0, .memory_gb = 16.0, .gpu_memory_gb = 8.0,
                    .network_bandwidth_mbps = 1000.0, .worker_slots = 10, .client_connections = 20};
        case LicenseTier::Enterprise:
            return {.cpu_cores = 32.0, .memory_gb = 64.0, .gpu_memory_gb = 32.0,
                    .network_bandwidth_mbps = 10000.0, .worker_slots = 50, .client_connections = 100};
    }
    return {};
}

}  // namespace model_mesh
