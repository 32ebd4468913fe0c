/**
 * @file failover_manager.hpp
 * @brief FailoverManager: backup activation, block redistribution and
 *        graceful degradation in reaction to health failures.
 *
 * Subscribes to the HealthMonitor (one-directional: the monitor knows
 * nothing of failover). Failure handling runs on a bounded WorkerPool so
 * the monitoring thread is never blocked by allocator waits or transfers.
 *
 * Block moves are delegated to the BlockTransferEngine: blocks held by the
 * admin's block source are re-sent to the new owner, and blocks it does not
 * hold move by ownership only. Completed moves are never rolled back.
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/config.hpp"
#include "core/license_gate.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/worker_pool.hpp"
#include "failover/failover_types.hpp"
#include "health/health_monitor.hpp"
#include "storage/block_repository.hpp"
#include "transfer/transfer_engine.hpp"

#include <json/json.h>

#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace model_mesh {

class FailoverManager {
public:
    using EventCallback = std::function<void(const FailoverEvent&)>;
    using DegradationCallback =
        std::function<void(DegradationLevel old_level, DegradationLevel new_level,
                           const std::string& reason)>;

    FailoverManager(FailoverConfig config,
                    NodeId admin_id,
                    HealthMonitor& monitor,
                    ResourceAllocator& allocator,
                    BlockTransferEngine& engine,
                    const IBlockSource& blocks,
                    const LicenseGate& license,
                    Logger& logger);
    ~FailoverManager();

    // Non-copyable
    FailoverManager(const FailoverManager&) = delete;
    FailoverManager& operator=(const FailoverManager&) = delete;

    // ── Registration ─────────────────────────
    Result<void> register_backup_worker(BackupWorker backup);
    void assign_block(const BlockId& block_id, const NetworkId& network_id,
                      const WorkerId& worker_id, int32_t priority = 1);

    // ── Failover operations ──────────────────

    /**
     * @brief Bring up the best Standby backup of the failed worker's network.
     *
     * NotFound when the worker is unknown or no backup is on standby,
     * LicenseDenied when the license is invalid or FREE, and
     * CapacityUnavailable when the allocator refuses the backup's quota
     * (the backup then returns to Standby).
     */
    Result<BackupWorker> activate_backup_worker(const WorkerId& failed_worker_id);

    /// Move the backup's blocks back to the worker it replaced and stand it down.
    bool deactivate_backup_worker(const WorkerId& backup_id);

    /// Move @p blocks from @p source to @p target through the transfer engine.
    bool transfer_workload(const WorkerId& source, const WorkerId& target,
                           const std::vector<BlockId>& blocks);

    /// Spread the failed worker's blocks over the least-loaded live workers.
    bool redistribute_blocks(const WorkerId& failed_worker_id, const NetworkId& network_id);

    /// Record a new degradation level. Setting the current level is a no-op.
    void graceful_degradation(DegradationLevel level, const std::string& reason);

    /// Recompute the level from the share of Critical networks.
    DegradationLevel evaluate_network_degradation();

    /// Synchronous handlers; the monitor subscriptions queue these on the pool.
    void handle_worker_failure(const WorkerId& worker_id, const std::string& message);
    void handle_network_failure(const NetworkId& network_id, const std::string& message);
    void handle_recovery(const std::string& id);

    /// Block until queued failure handling has finished.
    void wait_idle();

    // ── Persistence ──────────────────────────
    Result<void> save_assignments() const;
    Result<size_t> load_assignments();

    // ── Queries ──────────────────────────────
    [[nodiscard]] DegradationLevel degradation_level() const;
    [[nodiscard]] std::vector<DegradationRecord> degradation_history() const;
    [[nodiscard]] std::optional<BackupWorker> backup_worker(const WorkerId& id) const;
    [[nodiscard]] std::vector<BackupWorker> backup_workers() const;
    [[nodiscard]] std::optional<BlockAssignment> assignment(const BlockId& block_id) const;
    [[nodiscard]] std::vector<BlockAssignment> assignments(const NetworkId& network_id = {}) const;
    [[nodiscard]] std::vector<WorkerId> available_workers(const NetworkId& network_id,
                                                          const WorkerId& exclude) const;
    [[nodiscard]] std::vector<FailoverEvent> events() const;
    [[nodiscard]] std::vector<WorkloadTransfer> workload_transfers() const;
    [[nodiscard]] std::vector<BlockRedistribution> redistributions() const;
    [[nodiscard]] FailoverStats statistics() const;
    [[nodiscard]] Json::Value status_json() const;

    // ── Callbacks ────────────────────────────
    void on_failover_event(EventCallback callback);
    void on_degradation(DegradationCallback callback);

private:
    /// Guards monitor callbacks against firing into a destroyed manager.
    struct Subscription {
        std::mutex mutex;
        bool active{true};
    };

    [[nodiscard]] std::vector<BlockId> blocks_of(const WorkerId& worker_id,
                                                 const NetworkId& network_id) const;
    [[nodiscard]] size_t load_locked(const WorkerId& worker_id) const;
    RedistributionPlan build_plan(const std::vector<BlockId>& blocks,
                                  const std::vector<WorkerId>& candidates) const;
    uint32_t resolve_conflicts(RedistributionPlan& plan, const WorkerId& failed_worker,
                               Timestamp started);
    void apply_assignments(const WorkerId& target, const std::vector<BlockId>& blocks,
                           const NetworkId& network_id);
    void sync_monitor_blocks(const WorkerId& worker_id);
    void record_event(FailoverEvent event);
    void persist();
    void submit(std::function<void()> task);

    FailoverConfig config_;
    NodeId admin_id_;
    HealthMonitor& monitor_;
    ResourceAllocator& allocator_;
    BlockTransferEngine& engine_;
    const IBlockSource& blocks_;
    const LicenseGate& license_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::map<WorkerId, BackupWorker> backups_;
    std::map<BlockId, BlockAssignment> assignments_;
    std::vector<FailoverEvent> events_;
    std::vector<WorkloadTransfer> transfers_;
    std::vector<BlockRedistribution> redistributions_;
    std::vector<DegradationRecord> degradation_history_;
    DegradationLevel level_{DegradationLevel::None};
    FailoverStats stats_;
    std::unordered_set<std::string> in_flight_;
    uint64_t sequence_{0};

    std::mutex callback_mutex_;
    std::vector<EventCallback> event_callbacks_;
    std::vector<DegradationCallback> degradation_callbacks_;

    std::mutex futures_mutex_;
    std::vector<std::future<void>> futures_;

    std::shared_ptr<Subscription> subscription_;
    WorkerPool pool_;
};

}  // namespace model_mesh
