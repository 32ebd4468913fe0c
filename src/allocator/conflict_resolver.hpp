/**
 * @file conflict_resolver.hpp
 * @brief Conflict policies picking which contending requests are granted.
 *
 * A policy is consulted only when the pending requests together exceed the
 * available capacity. It returns the ids to grant, in grant order; requests
 * it leaves out stay pending for a later cycle.
 */

#pragma once

#include "allocator/allocator_types.hpp"
#include "core/quota.hpp"
#include "core/result.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace model_mesh {

class ConflictPolicy {
public:
    virtual ~ConflictPolicy() = default;

    [[nodiscard]] virtual std::vector<RequestId> resolve(
        const std::vector<ResourceRequest>& requests,
        const ResourceQuota& available) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Highest priority first, earlier arrival breaking ties.
 *
 * Greedy: each request is granted if it still fits the running remainder.
 */
class PriorityBasedPolicy : public ConflictPolicy {
public:
    std::vector<RequestId> resolve(const std::vector<ResourceRequest>& requests,
                                   const ResourceQuota& available) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "priority_based"; }
};

/**
 * @brief Split capacity evenly per request; grant those fitting their share.
 *
 * Slot and connection shares use integer division.
 */
class FairSharePolicy : public ConflictPolicy {
public:
    std::vector<RequestId> resolve(const std::vector<ResourceRequest>& requests,
                                   const ResourceQuota& available) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "fair_share"; }
};

/// Arrival order only.
class FirstComeFirstServedPolicy : public ConflictPolicy {
public:
    std::vector<RequestId> resolve(const std::vector<ResourceRequest>& requests,
                                   const ResourceQuota& available) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "fcfs"; }
};

/// "priority_based", "fair_share" or "fcfs".
Result<std::unique_ptr<ConflictPolicy>> make_conflict_policy(std::string_view name);

}  // namespace model_mesh
