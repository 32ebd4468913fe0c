/**
 * @file failover_manager.cpp
 * @brief FailoverManager implementation.
 */

#include "failover/failover_manager.hpp"

#include "core/json_util.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace model_mesh {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string join(const std::vector<BlockId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ",";
        out += id;
    }
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

FailoverManager::FailoverManager(FailoverConfig config,
                                 NodeId admin_id,
                                 HealthMonitor& monitor,
                                 ResourceAllocator& allocator,
                                 BlockTransferEngine& engine,
                                 const IBlockSource& blocks,
                                 const LicenseGate& license,
                                 Logger& logger)
    : config_(std::move(config))
    , admin_id_(std::move(admin_id))
    , monitor_(monitor)
    , allocator_(allocator)
    , engine_(engine)
    , blocks_(blocks)
    , license_(license)
    , logger_(logger)
    , subscription_(std::make_shared<Subscription>())
    , pool_(config_.max_concurrent_failovers) {
    std::weak_ptr<Subscription> weak = subscription_;

    monitor_.on_failure([this, weak](const std::string& id, const std::string& message) {
        auto sub = weak.lock();
        if (!sub) return;
        std::lock_guard lock(sub->mutex);
        if (!sub->active) return;

        if (monitor_.is_worker(id)) {
            submit([this, id, message] { handle_worker_failure(id, message); });
        } else if (monitor_.is_network(id)) {
            submit([this, id, message] { handle_network_failure(id, message); });
        }
    });

    monitor_.on_health_change([this, weak](const std::string& id, HealthStatus old_status,
                                           HealthStatus new_status) {
        if (new_status != HealthStatus::Healthy) return;
        if (old_status != HealthStatus::Critical && old_status != HealthStatus::Warning) return;
        auto sub = weak.lock();
        if (!sub) return;
        std::lock_guard lock(sub->mutex);
        if (!sub->active) return;
        submit([this, id] { handle_recovery(id); });
    });
}

FailoverManager::~FailoverManager() {
    {
        std::lock_guard lock(subscription_->mutex);
        subscription_->active = false;
    }
    pool_.shutdown();
}

void FailoverManager::submit(std::function<void()> task) {
    auto future = pool_.submit([this, task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& e) {
            logger_.error(std::string{"Failover task failed: "} + e.what());
        }
    });

    std::lock_guard lock(futures_mutex_);
    std::erase_if(futures_, [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
    });
    futures_.push_back(std::move(future));
}

void FailoverManager::wait_idle() {
    for (;;) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock(futures_mutex_);
            pending.swap(futures_);
        }
        if (pending.empty()) return;
        for (auto& f : pending) {
            try {
                f.get();
            } catch (const std::exception& e) {
                logger_.error(std::string{"Failover task rejected: "} + e.what());
            }
        }
    }
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

Result<void> FailoverManager::register_backup_worker(BackupWorker backup) {
    if (backup.worker_id.empty() || backup.network_id.empty()) {
        return Error{"backup worker needs an id and a network", ErrorKind::InvalidInput};
    }
    std::lock_guard lock(mutex_);
    if (backups_.contains(backup.worker_id)) {
        return Error{"backup worker already registered: " + backup.worker_id,
                     ErrorKind::InvalidInput};
    }
    backup.status = BackupStatus::Standby;
    logger_.info("Backup worker registered: " + backup.worker_id + " for network "
                 + backup.network_id + " (priority " + std::to_string(backup.priority) + ")");
    auto id = backup.worker_id;
    backups_.emplace(std::move(id), std::move(backup));
    return Result<void>{};
}

void FailoverManager::assign_block(const BlockId& block_id, const NetworkId& network_id,
                                   const WorkerId& worker_id, int32_t priority) {
    std::lock_guard lock(mutex_);
    assignments_.insert_or_assign(block_id, BlockAssignment{
        .block_id = block_id,
        .network_id = network_id,
        .assigned_worker = worker_id,
        .priority = priority,
        .last_updated = std::chrono::system_clock::now(),
    });
}

// ─────────────────────────────────────────────
// Backup activation
// ─────────────────────────────────────────────

Result<BackupWorker> FailoverManager::activate_backup_worker(const WorkerId& failed_worker_id) {
    auto failed = monitor_.worker_health(failed_worker_id);
    if (!failed) {
        return Error{"cannot find network for failed worker " + failed_worker_id,
                     ErrorKind::NotFound};
    }
    if (!license_.is_valid()) {
        return Error{"license invalid for failover", ErrorKind::LicenseDenied};
    }
    if (license_.tier() == LicenseTier::Free) {
        return Error{"FREE tier does not support backup workers", ErrorKind::LicenseDenied};
    }

    BackupWorker chosen;
    {
        std::lock_guard lock(mutex_);
        BackupWorker* best = nullptr;
        for (auto& [id, backup] : backups_) {
            if (backup.network_id != failed->network_id
                || backup.status != BackupStatus::Standby) {
                continue;
            }
            // std::map iterates by id, so strict < keeps the smallest id on ties.
            if (!best || backup.priority < best->priority) best = &backup;
        }
        if (!best) {
            return Error{"no standby backup for network " + failed->network_id,
                         ErrorKind::NotFound};
        }
        best->status = BackupStatus::Activating;
        best->activation_time = std::chrono::system_clock::now();
        best->replaces = failed_worker_id;
        chosen = *best;
    }

    logger_.info("Activating backup " + chosen.worker_id + " for " + failed_worker_id);

    ResourceRequest request{
        .request_id = {},
        .network_id = chosen.network_id,
        .required = config_.backup_requirements,
        .priority = RequestPriority::Critical,
        .requested_at = {},
        .timeout = std::chrono::seconds{config_.failover_timeout_ms / 1000 + 1},
    };
    auto allocation = allocator_.allocate(std::move(request),
                                          std::chrono::milliseconds{config_.failover_timeout_ms});
    if (!allocation) {
        {
            std::lock_guard lock(mutex_);
            auto& backup = backups_.at(chosen.worker_id);
            backup.status = BackupStatus::Standby;
            backup.activation_time.reset();
            backup.replaces.clear();
        }
        logger_.warn("Resources refused for backup " + chosen.worker_id + ": "
                     + allocation.error().message);
        auto kind = allocation.error().kind == ErrorKind::LicenseDenied
                  ? ErrorKind::LicenseDenied : ErrorKind::CapacityUnavailable;
        return Error{allocation.error().message, kind};
    }

    std::vector<BlockId> owned;
    {
        std::lock_guard lock(mutex_);
        auto& backup = backups_.at(chosen.worker_id);
        backup.status = BackupStatus::Active;
        backup.allocation_id = allocation->allocation_id;
        ++stats_.backup_activations;
        chosen = backup;
        for (const auto& [id, a] : assignments_) {
            if (a.assigned_worker == chosen.worker_id) owned.push_back(id);
        }
    }
    if (owned.empty()) owned = chosen.model_blocks;

    monitor_.add_worker(chosen.worker_id, chosen.network_id, chosen.host, chosen.port,
                        std::move(owned));
    logger_.info("Backup worker activated: " + chosen.worker_id + " (allocation "
                 + chosen.allocation_id + ")");
    return chosen;
}

bool FailoverManager::deactivate_backup_worker(const WorkerId& backup_id) {
    BackupWorker backup;
    std::vector<BlockId> owned;
    {
        std::lock_guard lock(mutex_);
        auto it = backups_.find(backup_id);
        if (it == backups_.end() || it->second.status != BackupStatus::Active) return false;
        backup = it->second;
        for (const auto& [id, a] : assignments_) {
            if (a.assigned_worker == backup_id) owned.push_back(id);
        }
    }

    if (!backup.replaces.empty() && !owned.empty()
        && !transfer_workload(backup_id, backup.replaces, owned)) {
        logger_.warn("Backup " + backup_id + " stays active: blocks could not move back to "
                     + backup.replaces);
        return false;
    }

    if (!backup.allocation_id.empty()) allocator_.release_resources(backup.allocation_id);
    monitor_.remove_worker(backup_id);

    {
        std::lock_guard lock(mutex_);
        auto& b = backups_.at(backup_id);
        b.status = BackupStatus::Standby;
        b.allocation_id.clear();
        b.replaces.clear();
        b.activation_time.reset();
    }
    logger_.info("Backup worker " + backup_id + " returned to standby");
    return true;
}

// ─────────────────────────────────────────────
// Workload movement
// ─────────────────────────────────────────────

bool FailoverManager::transfer_workload(const WorkerId& source, const WorkerId& target,
                                        const std::vector<BlockId>& blocks) {
    const auto started = std::chrono::steady_clock::now();
    WorkloadTransfer record;
    {
        std::lock_guard lock(mutex_);
        record.transfer_id = "transfer_" + source + "_" + target + "_"
                           + std::to_string(++sequence_);
    }
    record.source_worker = source;
    record.target_worker = target;
    record.model_blocks = blocks;
    record.started_at = std::chrono::system_clock::now();

    bool ok = !target.empty() && !blocks.empty();
    if (!ok) record.error_message = "nothing to transfer";

    std::map<ModelId, std::vector<EncryptedBlock>> by_model;
    size_t ownership_only = 0;
    if (ok) {
        for (const auto& id : blocks) {
            if (auto block = blocks_.find_block(id)) {
                by_model[block->model_id].push_back(std::move(*block));
            } else {
                ++ownership_only;
            }
        }
    }

    for (auto& [model_id, list] : by_model) {
        if (!ok) break;
        auto session = engine_.start_session(admin_id_, target, model_id, list);
        if (!session) {
            ok = false;
            record.error_message = session.error().message;
            break;
        }
        record.sessions.push_back(*session);
        if (!engine_.transfer_blocks(*session)) {
            ok = false;
            record.error_message = "transfer session " + *session + " did not complete";
        }
    }

    if (ok) {
        NetworkId network_id;
        if (auto info = monitor_.worker_health(target)) {
            network_id = info->network_id;
        } else if (auto backup = backup_worker(target)) {
            network_id = backup->network_id;
        }
        apply_assignments(target, blocks, network_id);
    }

    record.completed_at = std::chrono::system_clock::now();
    record.success = ok;
    if (ok) {
        logger_.info("Workload transfer " + record.transfer_id + " completed: "
                     + std::to_string(blocks.size()) + " block(s), "
                     + std::to_string(ownership_only) + " by ownership only, "
                     + std::to_string(seconds_since(started)) + "s");
    } else {
        logger_.error("Workload transfer " + record.transfer_id + " failed: "
                      + record.error_message);
    }

    std::lock_guard lock(mutex_);
    transfers_.push_back(std::move(record));
    return ok;
}

void FailoverManager::apply_assignments(const WorkerId& target, const std::vector<BlockId>& blocks,
                                        const NetworkId& network_id) {
    std::unordered_set<WorkerId> touched{target};
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        for (const auto& block_id : blocks) {
            auto& a = assignments_[block_id];
            if (!a.assigned_worker.empty()) touched.insert(a.assigned_worker);
            a.block_id = block_id;
            if (a.network_id.empty()) a.network_id = network_id;
            a.assigned_worker = target;
            a.last_updated = now;
        }
    }
    for (const auto& worker : touched) sync_monitor_blocks(worker);
    persist();
}

void FailoverManager::sync_monitor_blocks(const WorkerId& worker_id) {
    std::vector<BlockId> owned;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, a] : assignments_) {
            if (a.assigned_worker == worker_id) owned.push_back(id);
        }
    }
    monitor_.set_worker_blocks(worker_id, std::move(owned));
}

// ─────────────────────────────────────────────
// Redistribution
// ─────────────────────────────────────────────

std::vector<BlockId> FailoverManager::blocks_of(const WorkerId& worker_id,
                                                const NetworkId& network_id) const {
    if (auto info = monitor_.worker_health(worker_id); info && !info->model_blocks.empty()) {
        return info->model_blocks;
    }
    std::lock_guard lock(mutex_);
    std::vector<BlockId> out;
    for (const auto& [id, a] : assignments_) {
        if (a.assigned_worker == worker_id && (network_id.empty() || a.network_id == network_id)) {
            out.push_back(id);
        }
    }
    return out;
}

std::vector<WorkerId> FailoverManager::available_workers(const NetworkId& network_id,
                                                         const WorkerId& exclude) const {
    std::vector<WorkerId> out;
    for (const auto& info : monitor_.network_workers(network_id)) {
        if (info.worker_id != exclude && info.status == HealthStatus::Healthy) {
            out.push_back(info.worker_id);
        }
    }
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, backup] : backups_) {
            if (backup.network_id == network_id && backup.status == BackupStatus::Active
                && id != exclude) {
                out.push_back(id);
            }
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

size_t FailoverManager::load_locked(const WorkerId& worker_id) const {
    return static_cast<size_t>(std::count_if(
        assignments_.begin(), assignments_.end(),
        [&worker_id](const auto& entry) { return entry.second.assigned_worker == worker_id; }));
}

RedistributionPlan FailoverManager::build_plan(const std::vector<BlockId>& blocks,
                                               const std::vector<WorkerId>& candidates) const {
    std::map<WorkerId, size_t> load;
    for (const auto& c : candidates) load[c] = load_locked(c);

    RedistributionPlan plan;
    for (const auto& block_id : blocks) {
        auto target = load.begin();
        for (auto it = load.begin(); it != load.end(); ++it) {
            if (it->second < target->second) target = it;
        }
        plan[target->first].push_back(block_id);
        ++target->second;
    }
    return plan;
}

uint32_t FailoverManager::resolve_conflicts(RedistributionPlan& plan,
                                            const WorkerId& failed_worker,
                                            Timestamp started) {
    uint32_t conflicts = 0;
    std::lock_guard lock(mutex_);
    for (auto& [target, blocks] : plan) {
        std::erase_if(blocks, [&](const BlockId& block_id) {
            auto it = assignments_.find(block_id);
            if (it == assignments_.end()) return false;
            const auto& a = it->second;
            if (a.assigned_worker == failed_worker || a.assigned_worker == target) return false;

            ++conflicts;
            if (a.last_updated > started) {
                logger_.warn("Block " + block_id + " was reassigned to " + a.assigned_worker
                             + " during redistribution; keeping the newer assignment");
                return true;
            }
            logger_.warn("Block assignment conflict: " + block_id + " assigned to "
                         + a.assigned_worker + ", reassigning to " + target);
            return false;
        });
    }
    std::erase_if(plan, [](const auto& entry) { return entry.second.empty(); });
    return conflicts;
}

bool FailoverManager::redistribute_blocks(const WorkerId& failed_worker_id,
                                          const NetworkId& network_id) {
    BlockRedistribution record;
    record.network_id = network_id;
    record.failed_worker = failed_worker_id;
    record.started_at = std::chrono::system_clock::now();
    {
        std::lock_guard lock(mutex_);
        record.redistribution_id = "redist_" + failed_worker_id + "_"
                                 + std::to_string(++sequence_);
    }

    auto finish = [this, &record](bool success, std::string error = {}) {
        record.success = success;
        record.error_message = std::move(error);
        record.completed_at = std::chrono::system_clock::now();
        if (success) {
            logger_.info("Block redistribution " + record.redistribution_id + " completed ("
                         + std::to_string(record.conflicts_resolved) + " conflict(s) resolved)");
        } else {
            logger_.error("Block redistribution " + record.redistribution_id + " failed: "
                          + record.error_message);
        }
        std::lock_guard lock(mutex_);
        ++stats_.redistributions;
        redistributions_.push_back(record);
        return success;
    };

    record.affected_blocks = blocks_of(failed_worker_id, network_id);
    if (record.affected_blocks.empty()) {
        logger_.warn("No blocks found for failed worker " + failed_worker_id);
        return finish(true);
    }
    logger_.info("Redistributing " + std::to_string(record.affected_blocks.size())
                 + " block(s) of " + failed_worker_id + ": " + join(record.affected_blocks));

    if (!license_.is_valid()) {
        return finish(false, "license validation failed");
    }

    auto candidates = available_workers(network_id, failed_worker_id);
    if (candidates.empty()) {
        return finish(false, "no available workers in network " + network_id);
    }

    {
        std::lock_guard lock(mutex_);
        record.plan = build_plan(record.affected_blocks, candidates);
    }
    record.conflicts_resolved = resolve_conflicts(record.plan, failed_worker_id,
                                                  record.started_at);

    bool ok = true;
    for (const auto& [target, blocks] : record.plan) {
        if (!transfer_workload(failed_worker_id, target, blocks)) ok = false;
    }
    return finish(ok, ok ? std::string{} : "one or more block moves failed");
}

// ─────────────────────────────────────────────
// Degradation
// ─────────────────────────────────────────────

void FailoverManager::graceful_degradation(DegradationLevel level, const std::string& reason) {
    DegradationLevel old_level;
    {
        std::lock_guard lock(mutex_);
        if (level == level_) return;
        old_level = level_;
        level_ = level;
        degradation_history_.push_back(DegradationRecord{
            .timestamp = std::chrono::system_clock::now(),
            .level = level,
            .reason = reason,
        });
        ++stats_.degradation_events;
    }

    logger_.warn("Graceful degradation: " + std::string{to_string(old_level)} + " -> "
                 + std::string{to_string(level)} + " (" + reason + ")");

    Json::Value details(Json::objectValue);
    details["old_level"] = std::string{to_string(old_level)};
    details["new_level"] = std::string{to_string(level)};
    details["reason"] = reason;
    monitor_.create_admin_notification(
        level <= DegradationLevel::ReducedCapacity ? NotificationSeverity::Warning
                                                   : NotificationSeverity::Critical,
        "FailoverManager",
        "Graceful degradation applied: " + std::string{to_string(level)},
        std::move(details));

    std::vector<DegradationCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = degradation_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(old_level, level, reason);
        } catch (const std::exception& e) {
            logger_.error(std::string{"Degradation callback failed: "} + e.what());
        }
    }
}

DegradationLevel FailoverManager::evaluate_network_degradation() {
    const auto nets = monitor_.networks();
    if (nets.empty()) return degradation_level();

    const auto critical = std::count_if(nets.begin(), nets.end(), [](const auto& n) {
        return n.status == HealthStatus::Critical;
    });
    const double ratio = static_cast<double>(critical) / static_cast<double>(nets.size());
    const auto level = degradation_for_critical_ratio(ratio);
    graceful_degradation(level, std::to_string(critical) + "/" + std::to_string(nets.size())
                                + " networks critical");
    return level;
}

// ─────────────────────────────────────────────
// Failure handling
// ─────────────────────────────────────────────

void FailoverManager::handle_worker_failure(const WorkerId& worker_id,
                                            const std::string& message) {
    {
        std::lock_guard lock(mutex_);
        if (!in_flight_.insert(worker_id).second) {
            logger_.info("Failover for " + worker_id + " already in progress");
            return;
        }
    }

    const auto started = std::chrono::steady_clock::now();
    FailoverEvent event{
        .event_id = "worker_failover_" + worker_id + "_"
                  + std::to_string(to_unix_ms(std::chrono::system_clock::now())),
        .event_type = "worker_failure",
        .source_id = worker_id,
        .target_id = {},
        .strategy = FailoverStrategy::Immediate,
        .success = false,
        .timestamp = std::chrono::system_clock::now(),
        .duration_seconds = 0.0,
        .details = message,
    };
    logger_.warn("Handling worker failure: " + worker_id + " (" + message + ")");

    auto info = monitor_.worker_health(worker_id);
    const NetworkId network_id = info ? info->network_id : NetworkId{};
    const auto affected = blocks_of(worker_id, network_id);

    bool success = false;
    auto backup = activate_backup_worker(worker_id);
    if (backup) {
        event.target_id = backup->worker_id;
        success = affected.empty() || transfer_workload(worker_id, backup->worker_id, affected);
    } else {
        logger_.warn("No backup activated for " + worker_id + ": " + backup.error().message);
    }

    if (!success && !network_id.empty()) {
        success = redistribute_blocks(worker_id, network_id);
    }
    if (!success) {
        graceful_degradation(DegradationLevel::ReducedCapacity,
                             "Worker failure: " + worker_id + ", no backup available");
    }

    event.success = success;
    event.duration_seconds = seconds_since(started);
    record_event(std::move(event));

    std::lock_guard lock(mutex_);
    in_flight_.erase(worker_id);
}

void FailoverManager::handle_network_failure(const NetworkId& network_id,
                                             const std::string& message) {
    const auto started = std::chrono::steady_clock::now();
    logger_.warn("Handling network failure: " + network_id + " (" + message + ")");

    const auto level = evaluate_network_degradation();

    record_event(FailoverEvent{
        .event_id = "network_failover_" + network_id + "_"
                  + std::to_string(to_unix_ms(std::chrono::system_clock::now())),
        .event_type = "network_failure",
        .source_id = network_id,
        .target_id = {},
        .strategy = FailoverStrategy::Graceful,
        .success = level != DegradationLevel::MaintenanceMode,
        .timestamp = std::chrono::system_clock::now(),
        .duration_seconds = seconds_since(started),
        .details = message,
    });
}

void FailoverManager::handle_recovery(const std::string& id) {
    if (monitor_.is_network(id)) {
        logger_.info("Network " + id + " recovered");
        evaluate_network_degradation();
        return;
    }

    std::vector<WorkerId> standing_in;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [backup_id, backup] : backups_) {
            if (backup.status == BackupStatus::Active && backup.replaces == id) {
                standing_in.push_back(backup_id);
            }
        }
    }
    for (const auto& backup_id : standing_in) {
        logger_.info("Worker " + id + " recovered; standing down backup " + backup_id);
        deactivate_backup_worker(backup_id);
    }
}

void FailoverManager::record_event(FailoverEvent event) {
    {
        std::lock_guard lock(mutex_);
        ++stats_.total_failovers;
        if (event.success) ++stats_.successful_failovers; else ++stats_.failed_failovers;
        const auto n = static_cast<double>(stats_.total_failovers);
        stats_.average_failover_time += (event.duration_seconds - stats_.average_failover_time) / n;
        events_.push_back(event);
    }

    std::vector<EventCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = event_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            logger_.error(std::string{"Failover event callback failed: "} + e.what());
        }
    }
}

// ─────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────

Result<void> FailoverManager::save_assignments() const {
    if (config_.assignments_path.empty()) return Result<void>{};

    Json::Value root(Json::objectValue);
    Json::Value list(Json::arrayValue);
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, a] : assignments_) list.append(assignment_to_json(a));
    }
    root["assignments"] = list;
    return json::write_file(config_.assignments_path, root);
}

Result<size_t> FailoverManager::load_assignments() {
    if (config_.assignments_path.empty()) return size_t{0};

    auto root = json::read_file(config_.assignments_path);
    if (!root) return root.error();
    const auto& list = (*root)["assignments"];
    if (!list.isArray()) {
        return Error{"assignments file has no assignments array", ErrorKind::InvalidInput};
    }

    std::vector<BlockAssignment> loaded;
    for (const auto& entry : list) {
        auto a = assignment_from_json(entry);
        if (!a) return a.error();
        loaded.push_back(std::move(*a));
    }

    std::lock_guard lock(mutex_);
    for (auto& a : loaded) {
        auto id = a.block_id;
        assignments_.insert_or_assign(std::move(id), std::move(a));
    }
    return loaded.size();
}

void FailoverManager::persist() {
    if (auto saved = save_assignments(); !saved) {
        logger_.warn("Could not persist block assignments: " + saved.error().message);
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

DegradationLevel FailoverManager::degradation_level() const {
    std::lock_guard lock(mutex_);
    return level_;
}

std::vector<DegradationRecord> FailoverManager::degradation_history() const {
    std::lock_guard lock(mutex_);
    return degradation_history_;
}

std::optional<BackupWorker> FailoverManager::backup_worker(const WorkerId& id) const {
    std::lock_guard lock(mutex_);
    auto it = backups_.find(id);
    if (it == backups_.end()) return std::nullopt;
    return it->second;
}

std::vector<BackupWorker> FailoverManager::backup_workers() const {
    std::lock_guard lock(mutex_);
    std::vector<BackupWorker> out;
    for (const auto& [id, b] : backups_) out.push_back(b);
    return out;
}

std::optional<BlockAssignment> FailoverManager::assignment(const BlockId& block_id) const {
    std::lock_guard lock(mutex_);
    auto it = assignments_.find(block_id);
    if (it == assignments_.end()) return std::nullopt;
    return it->second;
}

std::vector<BlockAssignment> FailoverManager::assignments(const NetworkId& network_id) const {
    std::lock_guard lock(mutex_);
    std::vector<BlockAssignment> out;
    for (const auto& [id, a] : assignments_) {
        if (network_id.empty() || a.network_id == network_id) out.push_back(a);
    }
    return out;
}

std::vector<FailoverEvent> FailoverManager::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

std::vector<WorkloadTransfer> FailoverManager::workload_transfers() const {
    std::lock_guard lock(mutex_);
    return transfers_;
}

std::vector<BlockRedistribution> FailoverManager::redistributions() const {
    std::lock_guard lock(mutex_);
    return redistributions_;
}

FailoverStats FailoverManager::statistics() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

Json::Value FailoverManager::status_json() const {
    std::lock_guard lock(mutex_);
    Json::Value root(Json::objectValue);
    root["current_degradation_level"] = std::string{to_string(level_)};
    root["block_assignments"] = Json::UInt64{assignments_.size()};
    root["in_flight_failovers"] = Json::UInt64{in_flight_.size()};

    Json::Value backups(Json::objectValue);
    for (const auto& [id, b] : backups_) {
        Json::Value v(Json::objectValue);
        v["network_id"] = b.network_id;
        v["host"] = b.host;
        v["port"] = b.port;
        v["priority"] = b.priority;
        v["status"] = std::string{to_string(b.status)};
        v["activation_time"] = b.activation_time
            ? Json::Value{Json::Int64{to_unix_ms(*b.activation_time)}} : Json::Value{};
        backups[id] = v;
    }
    root["backup_workers"] = backups;

    Json::Value stats(Json::objectValue);
    stats["total_failovers"] = Json::UInt64{stats_.total_failovers};
    stats["successful_failovers"] = Json::UInt64{stats_.successful_failovers};
    stats["failed_failovers"] = Json::UInt64{stats_.failed_failovers};
    stats["average_failover_time"] = stats_.average_failover_time;
    stats["backup_activations"] = Json::UInt64{stats_.backup_activations};
    stats["degradation_events"] = Json::UInt64{stats_.degradation_events};
    stats["redistributions"] = Json::UInt64{stats_.redistributions};
    root["statistics"] = stats;

    Json::Value recent(Json::arrayValue);
    const size_t first = events_.size() > 10 ? events_.size() - 10 : 0;
    for (size_t i = first; i < events_.size(); ++i) recent.append(event_to_json(events_[i]));
    root["recent_events"] = recent;
    return root;
}

// ─────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────

void FailoverManager::on_failover_event(EventCallback callback) {
    std::lock_guard lock(callback_mutex_);
    event_callbacks_.push_back(std::move(callback));
}

void FailoverManager::on_degradation(DegradationCallback callback) {
    std::lock_guard lock(callback_mutex_);
    degradation_callbacks_.push_back(std::move(callback));
}

}  // namespace model_mesh
