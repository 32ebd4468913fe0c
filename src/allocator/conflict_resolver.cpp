/**
 * @file conflict_resolver.cpp
 * @brief Conflict policy implementations.
 */

#include "allocator/conflict_resolver.hpp"

#include <algorithm>

namespace model_mesh {

namespace {

std::vector<RequestId> grant_greedily(const std::vector<const ResourceRequest*>& ordered,
                                      ResourceQuota remaining) {
    std::vector<RequestId> granted;
    for (const auto* request : ordered) {
        if (remaining.can_satisfy(request->required)) {
            granted.push_back(request->request_id);
            remaining -= request->required;
        }
    }
    return granted;
}

std::vector<const ResourceRequest*> pointers_to(const std::vector<ResourceRequest>& requests) {
    std::vector<const ResourceRequest*> out;
    out.reserve(requests.size());
    for (const auto& r : requests) out.push_back(&r);
    return out;
}

}  // anonymous namespace

std::vector<RequestId> PriorityBasedPolicy::resolve(const std::vector<ResourceRequest>& requests,
                                                    const ResourceQuota& available) const {
    auto ordered = pointers_to(requests);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ResourceRequest* a, const ResourceRequest* b) {
                         if (a->priority != b->priority) return a->priority > b->priority;
                         return a->requested_at < b->requested_at;
                     });
    return grant_greedily(ordered, available);
}

std::vector<RequestId> FairSharePolicy::resolve(const std::vector<ResourceRequest>& requests,
                                                const ResourceQuota& available) const {
    if (requests.empty()) return {};

    const auto n = static_cast<int32_t>(requests.size());
    const auto d = static_cast<double>(requests.size());
    const ResourceQuota share{
        .cpu_cores = available.cpu_cores / d,
        .memory_gb = available.memory_gb / d,
        .gpu_memory_gb = available.gpu_memory_gb / d,
        .network_bandwidth_mbps = available.network_bandwidth_mbps / d,
        .worker_slots = available.worker_slots / n,
        .client_connections = available.client_connections / n,
    };

    std::vector<RequestId> granted;
    for (const auto& request : requests) {
        if (share.can_satisfy(request.required)) {
            granted.push_back(request.request_id);
        }
    }
    return granted;
}

std::vector<RequestId> FirstComeFirstServedPolicy::resolve(
    const std::vector<ResourceRequest>& requests, const ResourceQuota& available) const {
    auto ordered = pointers_to(requests);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ResourceRequest* a, const ResourceRequest* b) {
                         return a->requested_at < b->requested_at;
                     });
    return grant_greedily(ordered, available);
}

Result<std::unique_ptr<ConflictPolicy>> make_conflict_policy(std::string_view name) {
    if (name == "priority_based") {
        return std::unique_ptr<ConflictPolicy>(std::make_unique<PriorityBasedPolicy>());
    }
    if (name == "fair_share") {
        return std::unique_ptr<ConflictPolicy>(std::make_unique<FairSharePolicy>());
    }
    if (name == "fcfs" || name == "first_come_first_serve") {
        return std::unique_ptr<ConflictPolicy>(std::make_unique<FirstComeFirstServedPolicy>());
    }
    return Error{"unknown conflict strategy: " + std::string{name}, ErrorKind::InvalidInput};
}

}  // namespace model_mesh
