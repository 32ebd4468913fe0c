/**
 * @file resource_allocator.hpp
 * @brief ResourceAllocator: license-capped quota arbitration across networks.
 *
 * Tracks total vs. allocated capacity, queues requests, grants them on an
 * allocation cycle and reclaims capacity on a cleanup cycle. All mutations
 * of the allocated quota happen under one mutex so a grant can never be
 * made twice against the same free capacity.
 *
 * Effective capacity is the hardware capacity with worker_slots and
 * client_connections capped by the license tier's default quota.
 */

#pragma once

#include "allocator/allocator_types.hpp"
#include "allocator/conflict_resolver.hpp"
#include "core/config.hpp"
#include "core/license_gate.hpp"
#include "core/logger.hpp"
#include "core/quota.hpp"
#include "core/result.hpp"

#include <json/json.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace model_mesh {

enum class AllocationEvent : uint8_t {
    Granted,
    Released,
    Expired
};

[[nodiscard]] constexpr std::string_view to_string(AllocationEvent event) noexcept {
    switch (event) {
        case AllocationEvent::Granted:  return "granted";
        case AllocationEvent::Released: return "released";
        case AllocationEvent::Expired:  return "expired";
    }
    return "unknown";
}

class ResourceAllocator {
public:
    using AllocationCallback = std::function<void(const ResourceAllocation&, AllocationEvent)>;

    /// Fails with InvalidInput on an unknown conflict strategy or negative capacity.
    static Result<std::unique_ptr<ResourceAllocator>> create(AllocatorConfig config,
                                                             ResourceQuota hardware_capacity,
                                                             const LicenseGate& license,
                                                             Logger& logger);

    ResourceAllocator(AllocatorConfig config,
                      ResourceQuota hardware_capacity,
                      std::unique_ptr<ConflictPolicy> policy,
                      const LicenseGate& license,
                      Logger& logger);
    ~ResourceAllocator();

    // Non-copyable, non-movable
    ResourceAllocator(const ResourceAllocator&) = delete;
    ResourceAllocator& operator=(const ResourceAllocator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Launch the allocation and cleanup loops.
    void start();

    /// Stop the loops. Callers blocked in allocate() return CapacityUnavailable.
    void stop();
    [[nodiscard]] bool is_running() const noexcept;

    // ── Requests ─────────────────────────────

    /**
     * @brief Queue a request for the next allocation cycle.
     *
     * Rejected immediately with LicenseDenied when the license is invalid,
     * and with InvalidInput when the request can never be satisfied
     * (negative components, above effective capacity, no network id).
     */
    Result<RequestId> request_resources(ResourceRequest request);

    /**
     * @brief Blocking form: queue, run a cycle and wait up to @p timeout for a grant.
     *
     * On timeout, or when the allocator is stopped while waiting, the request
     * is withdrawn and CapacityUnavailable is returned.
     */
    Result<ResourceAllocation> allocate(ResourceRequest request,
                                        std::chrono::milliseconds timeout);

    /// Remove a still-pending request. False if it is not pending.
    bool withdraw_request(const RequestId& request_id);

    [[nodiscard]] std::optional<RequestStatus> request_status(const RequestId& request_id) const;
    [[nodiscard]] std::optional<ResourceAllocation> allocation_for_request(
        const RequestId& request_id) const;

    // ── Release ──────────────────────────────

    /// Return an allocation's quota to the free pool and run an allocation
    /// cycle for the waiting requests. False for unknown ids.
    bool release_resources(const AllocationId& allocation_id);

    /// Release every allocation held by @p network_id; returns the count released.
    size_t release_network(const NetworkId& network_id);

    /// Networks marked stopped lose their allocations on the next cleanup cycle.
    void mark_network_stopped(const NetworkId& network_id);
    void mark_network_running(const NetworkId& network_id);

    // ── Cycles (also driven by the background loops) ──

    /// Grant what fits; returns the number of requests granted.
    size_t run_allocation_cycle();

    /// Drop expired requests, reclaim expired or orphaned allocations and
    /// forget request ids finished longer than request_retention_s ago.
    size_t run_cleanup_cycle();

    // ── Profiles ─────────────────────────────
    void register_profile(NetworkResourceProfile profile);
    [[nodiscard]] std::optional<NetworkResourceProfile> profile(const NetworkId& network_id) const;

    /// A request sized for @p load_factor of the network's registered profile.
    [[nodiscard]] Result<ResourceRequest> request_for_load(const NetworkId& network_id,
                                                           double load_factor) const;

    // ── Queries ──────────────────────────────
    [[nodiscard]] ResourceQuota total_capacity() const noexcept { return total_; }
    [[nodiscard]] ResourceQuota allocated() const;
    [[nodiscard]] ResourceQuota available() const;
    [[nodiscard]] std::optional<ResourceAllocation> allocation(const AllocationId& id) const;
    [[nodiscard]] std::vector<ResourceAllocation> active_allocations() const;
    [[nodiscard]] std::vector<ResourceAllocation> network_allocations(
        const NetworkId& network_id) const;
    [[nodiscard]] size_t pending_count() const;
    /// Request ids still answered by request_status().
    [[nodiscard]] size_t tracked_request_count() const;
    [[nodiscard]] AllocatorStats statistics() const;
    [[nodiscard]] UtilizationReport utilization() const;
    [[nodiscard]] Json::Value utilization_json() const;
    [[nodiscard]] std::string_view conflict_strategy() const noexcept { return policy_->name(); }

    void on_allocation_event(AllocationCallback callback);

private:
    using Notification = std::pair<ResourceAllocation, AllocationEvent>;

    [[nodiscard]] ResourceQuota allocated_locked() const;
    ResourceAllocation grant_locked(const ResourceRequest& request, Timestamp now);
    bool release_locked(const AllocationId& allocation_id, AllocationEvent event,
                        std::vector<Notification>& fired, Timestamp now);
    void finish_locked(const RequestId& request_id, RequestStatus status, Timestamp now);
    void forget_finished_locked(Timestamp now);
    void fire(const std::vector<Notification>& fired);
    void allocation_loop(std::stop_token stop);
    void cleanup_loop(std::stop_token stop);

    AllocatorConfig config_;
    ResourceQuota total_;
    std::unique_ptr<ConflictPolicy> policy_;
    const LicenseGate& license_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable grant_cv_;
    std::condition_variable_any loop_cv_;
    std::vector<ResourceRequest> pending_;
    std::unordered_map<RequestId, RequestStatus> request_status_;
    std::unordered_map<RequestId, AllocationId> request_allocation_;
    std::unordered_map<RequestId, Timestamp> finished_at_;
    std::unordered_map<AllocationId, ResourceAllocation> allocations_;
    std::unordered_map<NetworkId, NetworkResourceProfile> profiles_;
    std::unordered_set<NetworkId> stopped_networks_;
    AllocatorStats stats_;
    uint64_t next_request_{0};
    uint64_t next_allocation_{0};
    bool stopping_{false};

    std::mutex callback_mutex_;
    std::vector<AllocationCallback> callbacks_;

    std::jthread allocation_thread_;
    std::jthread cleanup_thread_;
};

/// Hardware capacity with slot and connection counts capped by @p tier.
[[nodiscard]] ResourceQuota effective_capacity(const ResourceQuota& hardware, LicenseTier tier);

}  // namespace model_mesh
