/**
 * @file resource_allocator.cpp
 * @brief ResourceAllocator implementation.
 */

#include "allocator/resource_allocator.hpp"

#include <algorithm>
#include <exception>

namespace model_mesh {

ResourceQuota effective_capacity(const ResourceQuota& hardware, LicenseTier tier) {
    const auto cap = default_quota_for_tier(tier);
    ResourceQuota effective = hardware;
    effective.worker_slots = std::min(hardware.worker_slots, cap.worker_slots);
    effective.client_connections = std::min(hardware.client_connections, cap.client_connections);
    return effective;
}

// ─────────────────────────────────────────────
// Construction & lifecycle
// ─────────────────────────────────────────────

Result<std::unique_ptr<ResourceAllocator>> ResourceAllocator::create(
    AllocatorConfig config, ResourceQuota hardware_capacity,
    const LicenseGate& license, Logger& logger) {
    if (!hardware_capacity.is_non_negative()) {
        return Error{"hardware capacity must be non-negative", ErrorKind::InvalidInput};
    }
    auto policy = make_conflict_policy(config.conflict_strategy);
    if (!policy) return policy.error();

    return std::make_unique<ResourceAllocator>(std::move(config), hardware_capacity,
                                               std::move(*policy), license, logger);
}

ResourceAllocator::ResourceAllocator(AllocatorConfig config,
                                     ResourceQuota hardware_capacity,
                                     std::unique_ptr<ConflictPolicy> policy,
                                     const LicenseGate& license,
                                     Logger& logger)
    : config_(std::move(config))
    , total_(effective_capacity(hardware_capacity, license.tier()))
    , policy_(policy ? std::move(policy) : std::make_unique<PriorityBasedPolicy>())
    , license_(license)
    , logger_(logger) {
    logger_.info("Resource allocator ready: " + std::to_string(total_.cpu_cores) + " cores, "
                 + std::to_string(total_.memory_gb) + " GB, "
                 + std::to_string(total_.worker_slots) + " worker slots, "
                 + std::to_string(total_.client_connections) + " clients ("
                 + std::string{to_string(license.tier())} + ", "
                 + std::string{policy_->name()} + ")");
}

ResourceAllocator::~ResourceAllocator() {
    stop();
}

void ResourceAllocator::start() {
    if (is_running()) return;
    {
        std::lock_guard lock(mutex_);
        stopping_ = false;
    }
    allocation_thread_ = std::jthread([this](std::stop_token stop) { allocation_loop(stop); });
    cleanup_thread_ = std::jthread([this](std::stop_token stop) { cleanup_loop(stop); });
    logger_.info("Resource allocator started");
}

void ResourceAllocator::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    grant_cv_.notify_all();
    if (!is_running()) return;
    allocation_thread_.request_stop();
    cleanup_thread_.request_stop();
    loop_cv_.notify_all();
    if (allocation_thread_.joinable()) allocation_thread_.join();
    if (cleanup_thread_.joinable()) cleanup_thread_.join();
    logger_.info("Resource allocator stopped");
}

bool ResourceAllocator::is_running() const noexcept {
    return allocation_thread_.joinable() || cleanup_thread_.joinable();
}

void ResourceAllocator::allocation_loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds{config_.allocation_interval_ms};
    while (!stop.stop_requested()) {
        try {
            run_allocation_cycle();
        } catch (const std::exception& e) {
            logger_.error(std::string{"Allocation cycle failed: "} + e.what());
        }
        std::unique_lock lock(mutex_);
        loop_cv_.wait_for(lock, stop, interval, [] { return false; });
    }
}

void ResourceAllocator::cleanup_loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds{config_.cleanup_interval_ms};
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            loop_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;
        try {
            run_cleanup_cycle();
        } catch (const std::exception& e) {
            logger_.error(std::string{"Cleanup cycle failed: "} + e.what());
        }
    }
}

// ─────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────

Result<RequestId> ResourceAllocator::request_resources(ResourceRequest request) {
    std::lock_guard lock(mutex_);

    auto reject = [this](std::string message, ErrorKind kind) {
        ++stats_.rejected_requests;
        logger_.warn("Resource request rejected: " + message);
        return Error{std::move(message), kind};
    };

    if (!license_.is_valid()) {
        return reject("license is not valid", ErrorKind::LicenseDenied);
    }
    if (request.network_id.empty()) {
        return reject("request has no network id", ErrorKind::InvalidInput);
    }
    if (!request.required.is_non_negative()) {
        return reject("negative requirement from " + request.network_id,
                      ErrorKind::InvalidInput);
    }
    if (!total_.can_satisfy(request.required)) {
        return reject("requirement of " + request.network_id
                      + " exceeds total system capacity", ErrorKind::InvalidInput);
    }

    if (request.request_id.empty()) {
        request.request_id = "req_" + request.network_id + "_" + std::to_string(++next_request_);
    } else if (request_status_.contains(request.request_id)) {
        return reject("duplicate request id " + request.request_id, ErrorKind::InvalidInput);
    }
    if (request.requested_at == Timestamp{}) {
        request.requested_at = std::chrono::system_clock::now();
    }

    ++stats_.total_requests;
    request_status_[request.request_id] = RequestStatus::Pending;
    auto id = request.request_id;
    logger_.info("Resource request queued: " + id + " for " + request.network_id + " ("
                 + std::string{to_string(request.priority)} + ")");
    pending_.push_back(std::move(request));
    return id;
}

Result<ResourceAllocation> ResourceAllocator::allocate(ResourceRequest request,
                                                       std::chrono::milliseconds timeout) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return Error{"allocator is stopped", ErrorKind::CapacityUnavailable};
        }
    }
    auto id = request_resources(std::move(request));
    if (!id) return id.error();

    run_allocation_cycle();

    std::unique_lock lock(mutex_);
    grant_cv_.wait_for(lock, timeout, [this, &id] {
        if (stopping_) return true;
        auto it = request_status_.find(*id);
        return it == request_status_.end() || it->second != RequestStatus::Pending;
    });

    auto status_it = request_status_.find(*id);
    if (status_it == request_status_.end()) {
        return Error{"request " + *id + " is no longer tracked", ErrorKind::CapacityUnavailable};
    }
    const auto status = status_it->second;
    if (status == RequestStatus::Granted) {
        auto alloc_it = request_allocation_.find(*id);
        if (alloc_it != request_allocation_.end()) {
            auto it = allocations_.find(alloc_it->second);
            if (it != allocations_.end()) return it->second;
        }
        return Error{"allocation for " + *id + " was already released",
                     ErrorKind::CapacityUnavailable};
    }

    if (status == RequestStatus::Pending) {
        std::erase_if(pending_, [&id](const ResourceRequest& r) {
            return r.request_id == *id;
        });
        finish_locked(*id, RequestStatus::Withdrawn, std::chrono::system_clock::now());
        if (stopping_) {
            return Error{"allocator stopped while " + *id + " was waiting",
                         ErrorKind::CapacityUnavailable};
        }
        return Error{"capacity not available for " + *id + " within "
                     + std::to_string(timeout.count()) + "ms",
                     ErrorKind::CapacityUnavailable};
    }
    return Error{"request " + *id + " ended " + std::string{to_string(status)},
                 ErrorKind::CapacityUnavailable};
}

bool ResourceAllocator::withdraw_request(const RequestId& request_id) {
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(pending_, [&request_id](const ResourceRequest& r) {
        return r.request_id == request_id;
    });
    if (removed == 0) return false;
    finish_locked(request_id, RequestStatus::Withdrawn, std::chrono::system_clock::now());
    grant_cv_.notify_all();
    return true;
}

std::optional<RequestStatus> ResourceAllocator::request_status(const RequestId& request_id) const {
    std::lock_guard lock(mutex_);
    auto it = request_status_.find(request_id);
    if (it == request_status_.end()) return std::nullopt;
    return it->second;
}

std::optional<ResourceAllocation> ResourceAllocator::allocation_for_request(
    const RequestId& request_id) const {
    std::lock_guard lock(mutex_);
    auto it = request_allocation_.find(request_id);
    if (it == request_allocation_.end()) return std::nullopt;
    auto alloc = allocations_.find(it->second);
    if (alloc == allocations_.end()) return std::nullopt;
    return alloc->second;
}

// ─────────────────────────────────────────────
// Allocation cycle
// ─────────────────────────────────────────────

size_t ResourceAllocator::run_allocation_cycle() {
    std::vector<Notification> fired;
    size_t granted_count = 0;
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();

        auto expired = std::erase_if(pending_, [this, now](const ResourceRequest& r) {
            if (!r.is_expired(now)) return false;
            finish_locked(r.request_id, RequestStatus::Expired, now);
            return true;
        });
        if (expired > 0) {
            stats_.rejected_requests += expired;
            logger_.info("Removed " + std::to_string(expired) + " expired request(s)");
            grant_cv_.notify_all();
        }
        if (pending_.empty()) return 0;

        if (!license_.is_valid()) {
            logger_.warn("License invalid; " + std::to_string(pending_.size())
                         + " pending request(s) held");
            return 0;
        }

        ResourceQuota available = total_ - allocated_locked();
        ResourceQuota demand;
        for (const auto& r : pending_) demand += r.required;

        std::vector<RequestId> to_grant;
        const bool contended = !available.can_satisfy(demand);
        if (contended) {
            to_grant = policy_->resolve(pending_, available);
        } else {
            for (const auto& r : pending_) to_grant.push_back(r.request_id);
        }
        const size_t competing = pending_.size();

        std::unordered_set<RequestId> granted_ids;
        for (const auto& id : to_grant) {
            auto it = std::find_if(pending_.begin(), pending_.end(),
                                   [&id](const ResourceRequest& r) { return r.request_id == id; });
            if (it == pending_.end() || !available.can_satisfy(it->required)) continue;
            available -= it->required;
            fired.emplace_back(grant_locked(*it, now), AllocationEvent::Granted);
            granted_ids.insert(id);
        }

        std::erase_if(pending_, [&granted_ids](const ResourceRequest& r) {
            return granted_ids.contains(r.request_id);
        });
        granted_count = granted_ids.size();
        if (granted_count > 0) grant_cv_.notify_all();

        // A conflict is only resolved when the policy picked some of several
        // competing requests over the others.
        if (contended && competing > 1 && granted_count > 0 && granted_count < competing) {
            ++stats_.conflicts_resolved;
            logger_.info("Resolved conflict among " + std::to_string(competing)
                         + " request(s) with " + std::string{policy_->name()} + ": "
                         + std::to_string(granted_count) + " granted");
        }
    }
    fire(fired);
    return granted_count;
}

ResourceAllocation ResourceAllocator::grant_locked(const ResourceRequest& request,
                                                   Timestamp now) {
    ResourceAllocation allocation{
        .allocation_id = "alloc_" + request.network_id + "_" + std::to_string(++next_allocation_),
        .network_id = request.network_id,
        .request_id = request.request_id,
        .granted = request.required,
        .granted_at = now,
        .expires_at = now + std::chrono::seconds{config_.allocation_ttl_s},
    };
    allocations_.emplace(allocation.allocation_id, allocation);
    request_status_[request.request_id] = RequestStatus::Granted;
    request_allocation_[request.request_id] = allocation.allocation_id;
    stopped_networks_.erase(request.network_id);
    ++stats_.satisfied_requests;
    logger_.info("Created allocation " + allocation.allocation_id + " for " + request.network_id);
    return allocation;
}

// ─────────────────────────────────────────────
// Release & cleanup
// ─────────────────────────────────────────────

bool ResourceAllocator::release_resources(const AllocationId& allocation_id) {
    std::vector<Notification> fired;
    bool released = false;
    {
        std::lock_guard lock(mutex_);
        released = release_locked(allocation_id, AllocationEvent::Released, fired,
                                  std::chrono::system_clock::now());
    }
    if (!released) {
        logger_.warn("Allocation not found: " + allocation_id);
        return false;
    }
    fire(fired);
    run_allocation_cycle();
    return true;
}

size_t ResourceAllocator::release_network(const NetworkId& network_id) {
    std::vector<Notification> fired;
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        std::vector<AllocationId> ids;
        for (const auto& [id, alloc] : allocations_) {
            if (alloc.network_id == network_id) ids.push_back(id);
        }
        for (const auto& id : ids) release_locked(id, AllocationEvent::Released, fired, now);
    }
    fire(fired);
    if (!fired.empty()) run_allocation_cycle();
    return fired.size();
}

bool ResourceAllocator::release_locked(const AllocationId& allocation_id, AllocationEvent event,
                                       std::vector<Notification>& fired, Timestamp now) {
    auto it = allocations_.find(allocation_id);
    if (it == allocations_.end()) return false;

    auto allocation = std::move(it->second);
    allocations_.erase(it);
    finished_at_[allocation.request_id] = now;
    if (event == AllocationEvent::Expired) {
        ++stats_.allocations_expired;
    } else {
        ++stats_.allocations_released;
    }
    logger_.info("Resources " + std::string{to_string(event)} + ": " + allocation_id
                 + " for " + allocation.network_id);
    fired.emplace_back(std::move(allocation), event);
    return true;
}

void ResourceAllocator::finish_locked(const RequestId& request_id, RequestStatus status,
                                      Timestamp now) {
    request_status_[request_id] = status;
    finished_at_[request_id] = now;
}

void ResourceAllocator::forget_finished_locked(Timestamp now) {
    const auto retention = std::chrono::seconds{config_.request_retention_s};
    for (auto it = finished_at_.begin(); it != finished_at_.end();) {
        if (it->second + retention > now) {
            ++it;
            continue;
        }
        request_status_.erase(it->first);
        request_allocation_.erase(it->first);
        it = finished_at_.erase(it);
    }
}

void ResourceAllocator::mark_network_stopped(const NetworkId& network_id) {
    std::lock_guard lock(mutex_);
    stopped_networks_.insert(network_id);
}

void ResourceAllocator::mark_network_running(const NetworkId& network_id) {
    std::lock_guard lock(mutex_);
    stopped_networks_.erase(network_id);
}

size_t ResourceAllocator::run_cleanup_cycle() {
    std::vector<Notification> fired;
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();

        auto expired_requests = std::erase_if(pending_, [this, now](const ResourceRequest& r) {
            if (!r.is_expired(now)) return false;
            finish_locked(r.request_id, RequestStatus::Expired, now);
            return true;
        });
        stats_.rejected_requests += expired_requests;
        if (expired_requests > 0) grant_cv_.notify_all();

        std::vector<std::pair<AllocationId, AllocationEvent>> doomed;
        for (const auto& [id, alloc] : allocations_) {
            if (alloc.is_expired(now)) {
                doomed.emplace_back(id, AllocationEvent::Expired);
            } else if (stopped_networks_.contains(alloc.network_id)) {
                doomed.emplace_back(id, AllocationEvent::Released);
            }
        }
        for (const auto& [id, event] : doomed) release_locked(id, event, fired, now);
        forget_finished_locked(now);
    }

    if (!fired.empty()) {
        logger_.info("Cleaned up " + std::to_string(fired.size()) + " allocation(s)");
    }
    fire(fired);
    if (!fired.empty()) run_allocation_cycle();
    return fired.size();
}

// ─────────────────────────────────────────────
// Profiles
// ─────────────────────────────────────────────

void ResourceAllocator::register_profile(NetworkResourceProfile profile) {
    std::lock_guard lock(mutex_);
    auto id = profile.network_id;
    profiles_.insert_or_assign(std::move(id), std::move(profile));
}

std::optional<NetworkResourceProfile> ResourceAllocator::profile(
    const NetworkId& network_id) const {
    std::lock_guard lock(mutex_);
    auto it = profiles_.find(network_id);
    if (it == profiles_.end()) return std::nullopt;
    return it->second;
}

Result<ResourceRequest> ResourceAllocator::request_for_load(const NetworkId& network_id,
                                                            double load_factor) const {
    auto p = profile(network_id);
    if (!p) {
        return Error{"no profile registered for network " + network_id, ErrorKind::NotFound};
    }
    return ResourceRequest{
        .request_id = {},
        .network_id = network_id,
        .required = p->dynamic_requirements(load_factor),
        .priority = p->priority,
        .requested_at = {},
        .timeout = std::chrono::seconds{config_.request_timeout_s},
    };
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

ResourceQuota ResourceAllocator::allocated_locked() const {
    ResourceQuota sum;
    for (const auto& [id, alloc] : allocations_) sum += alloc.granted;
    return sum;
}

ResourceQuota ResourceAllocator::allocated() const {
    std::lock_guard lock(mutex_);
    return allocated_locked();
}

ResourceQuota ResourceAllocator::available() const {
    std::lock_guard lock(mutex_);
    return total_ - allocated_locked();
}

std::optional<ResourceAllocation> ResourceAllocator::allocation(const AllocationId& id) const {
    std::lock_guard lock(mutex_);
    auto it = allocations_.find(id);
    if (it == allocations_.end()) return std::nullopt;
    return it->second;
}

std::vector<ResourceAllocation> ResourceAllocator::active_allocations() const {
    std::lock_guard lock(mutex_);
    std::vector<ResourceAllocation> out;
    out.reserve(allocations_.size());
    for (const auto& [id, alloc] : allocations_) out.push_back(alloc);
    return out;
}

std::vector<ResourceAllocation> ResourceAllocator::network_allocations(
    const NetworkId& network_id) const {
    std::lock_guard lock(mutex_);
    std::vector<ResourceAllocation> out;
    for (const auto& [id, alloc] : allocations_) {
        if (alloc.network_id == network_id) out.push_back(alloc);
    }
    return out;
}

size_t ResourceAllocator::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

size_t ResourceAllocator::tracked_request_count() const {
    std::lock_guard lock(mutex_);
    return request_status_.size();
}

AllocatorStats ResourceAllocator::statistics() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

UtilizationReport ResourceAllocator::utilization() const {
    std::lock_guard lock(mutex_);
    return UtilizationReport{
        .resources = usage_table(total_, allocated_locked()),
        .active_allocations = allocations_.size(),
        .pending_requests = pending_.size(),
        .statistics = stats_,
    };
}

Json::Value ResourceAllocator::utilization_json() const {
    auto root = utilization().to_json();
    root["conflict_strategy"] = std::string{policy_->name()};
    return root;
}

// ─────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────

void ResourceAllocator::on_allocation_event(AllocationCallback callback) {
    std::lock_guard lock(callback_mutex_);
    callbacks_.push_back(std::move(callback));
}

void ResourceAllocator::fire(const std::vector<Notification>& fired) {
    if (fired.empty()) return;
    std::vector<AllocationCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& [allocation, event] : fired) {
        for (const auto& callback : callbacks) {
            try {
                callback(allocation, event);
            } catch (const std::exception& e) {
                logger_.warn("Allocation callback failed for " + allocation.allocation_id
                             + ": " + e.what());
            }
        }
    }
}

}  // namespace model_mesh
