/**
 * @file test_failover_manager.cpp
 * @brief Unit tests for FailoverManager: backups, redistribution, degradation and persistence.
 */

#include "failover/failover_manager.hpp"
#include "health/heartbeat_probe.hpp"
#include "telemetry/json_sink.hpp"
#include "transfer/block_channel.hpp"
#include "transfer/block_receiver.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <set>

using namespace model_mesh;
using namespace std::chrono_literals;

namespace {

/// In-process worker node: its own block store behind a loopback channel.
struct Peer {
    BlockRepository store;
    BlockReceiver receiver;
    std::shared_ptr<LoopbackChannel> channel;

    Peer(BlockReceiver::KeyResolver resolver, Logger& logger)
        : receiver(store, std::move(resolver), logger)
        , channel(std::make_shared<LoopbackChannel>(receiver)) {}
};

ResourceQuota hardware() {
    return ResourceQuota{.cpu_cores = 16.0, .memory_gb = 32.0, .gpu_memory_gb = 8.0,
                         .network_bandwidth_mbps = 1000.0, .worker_slots = 64,
                         .client_connections = 64};
}

}  // namespace

class FailoverManagerTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    MockHealthProbe probe_;
    StaticLicenseGate license_{true, LicenseTier::Pro, {"*"}, 20};
    BlockRepository source_;
    std::filesystem::path temp_dir_;

    std::mutex peers_mutex_;
    std::map<NodeId, std::unique_ptr<Peer>> peers_;
    std::set<NodeId> unreachable_;

    std::unique_ptr<HealthMonitor> monitor_;
    std::unique_ptr<ResourceAllocator> allocator_;
    std::unique_ptr<BlockTransferEngine> engine_;
    std::unique_ptr<FailoverManager> manager_;
    std::vector<BlockId> blocks_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "mm_test_failover";
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);

        Bytes plain(600);
        std::iota(plain.begin(), plain.end(), uint8_t{7});
        auto exported = source_.export_model("llm", plain, 256);
        ASSERT_TRUE(exported.has_value());
        for (const auto& b : *exported) blocks_.push_back(b.block_id);

        monitor_ = std::make_unique<HealthMonitor>(
            HealthConfig{.heartbeat_interval_ms = 10, .probe_timeout_ms = 50,
                         .warning_threshold = 2, .failure_threshold = 3,
                         .max_notifications = 100},
            probe_, logger_);

        auto allocator = ResourceAllocator::create(AllocatorConfig{}, hardware(), license_, logger_);
        ASSERT_TRUE(allocator.has_value());
        allocator_ = std::move(*allocator);

        TransferConfig transfer;
        transfer.retry_base_delay_ms = 1;
        transfer.max_retry_delay_ms = 2;
        transfer.max_retries = 1;
        engine_ = std::make_unique<BlockTransferEngine>(
            transfer, source_, license_,
            [this](const NodeId& client) { return channel_to(client); }, logger_);

        build_manager(config());

        monitor_->add_network("net-1", "127.0.0.1", 5311);
        monitor_->add_worker("w1", "net-1", "127.0.0.1", 5311, blocks_);
        monitor_->add_worker("w2", "net-1", "127.0.0.1", 5312, {});
        monitor_->add_worker("w3", "net-1", "127.0.0.1", 5313, {});
        for (const auto& id : blocks_) manager_->assign_block(id, "net-1", "w1");
        monitor_->sample_all();
    }

    void TearDown() override {
        manager_.reset();
        std::filesystem::remove_all(temp_dir_);
    }

    FailoverConfig config() {
        FailoverConfig c;
        c.failover_timeout_ms = 200;
        c.assignments_path = temp_dir_ / "assignments.json";
        return c;
    }

    void build_manager(FailoverConfig c) {
        manager_.reset();
        manager_ = std::make_unique<FailoverManager>(std::move(c), "admin", *monitor_,
                                                     *allocator_, *engine_, source_, license_,
                                                     logger_);
    }

    std::shared_ptr<IBlockChannel> channel_to(const NodeId& client) {
        std::lock_guard lock(peers_mutex_);
        if (unreachable_.contains(client)) return nullptr;
        auto& peer = peers_[client];
        if (!peer) {
            peer = std::make_unique<Peer>(
                [this](const SessionId& id) { return engine_->session_key(id); }, logger_);
        }
        return peer->channel;
    }

    size_t stored_on(const NodeId& node) {
        std::lock_guard lock(peers_mutex_);
        auto it = peers_.find(node);
        return it == peers_.end() ? 0 : it->second->store.block_count();
    }

    void register_backups() {
        ASSERT_TRUE(manager_->register_backup_worker(BackupWorker{
            .worker_id = "b-slow", .network_id = "net-1", .host = "127.0.0.1", .port = 5321,
            .priority = 2}));
        ASSERT_TRUE(manager_->register_backup_worker(BackupWorker{
            .worker_id = "b-fast", .network_id = "net-1", .host = "127.0.0.1", .port = 5322,
            .priority = 1}));
    }

    void kill(const std::string& id) {
        probe_.set_alive(id, false);
        for (int i = 0; i < 3; ++i) monitor_->sample_all();
        if (manager_) manager_->wait_idle();
    }
};

// ═══════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════

TEST_F(FailoverManagerTest, RegisterBackupValidation) {
    auto missing = manager_->register_backup_worker(BackupWorker{.worker_id = "b"});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::InvalidInput);

    register_backups();
    auto dup = manager_->register_backup_worker(
        BackupWorker{.worker_id = "b-fast", .network_id = "net-1"});
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().kind, ErrorKind::InvalidInput);

    auto b = manager_->backup_worker("b-fast");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->status, BackupStatus::Standby);
    EXPECT_EQ(manager_->backup_workers().size(), 2u);
}

// ═══════════════════════════════════════════════
// Backup activation
// ═══════════════════════════════════════════════

TEST_F(FailoverManagerTest, ActivatesLowestPriorityBackupFirst) {
    register_backups();

    auto first = manager_->activate_backup_worker("w1");
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first->worker_id, "b-fast");
    EXPECT_EQ(first->status, BackupStatus::Active);
    EXPECT_EQ(first->replaces, "w1");
    EXPECT_FALSE(first->allocation_id.empty());
    EXPECT_TRUE(allocator_->allocation(first->allocation_id).has_value());
    EXPECT_TRUE(monitor_->is_worker("b-fast"));

    auto second = manager_->activate_backup_worker("w1");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->worker_id, "b-slow");

    auto none = manager_->activate_backup_worker("w1");
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(manager_->statistics().backup_activations, 2u);
}

TEST_F(FailoverManagerTest, ActivationOfUnknownWorker) {
    register_backups();
    auto result = manager_->activate_backup_worker("ghost");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(FailoverManagerTest, FreeTierCannotActivateBackups) {
    register_backups();
    license_.set_tier(LicenseTier::Free);

    auto result = manager_->activate_backup_worker("w1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::LicenseDenied);
    EXPECT_EQ(manager_->backup_worker("b-fast")->status, BackupStatus::Standby);
}

TEST_F(FailoverManagerTest, InvalidLicenseCannotActivateBackups) {
    register_backups();
    license_.set_valid(false);
    auto result = manager_->activate_backup_worker("w1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::LicenseDenied);
}

TEST_F(FailoverManagerTest, RefusedCapacityReturnsBackupToStandby) {
    auto c = config();
    c.backup_requirements.cpu_cores = 1000.0;
    build_manager(c);
    register_backups();

    auto result = manager_->activate_backup_worker("w1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::CapacityUnavailable);

    auto b = manager_->backup_worker("b-fast");
    EXPECT_EQ(b->status, BackupStatus::Standby);
    EXPECT_TRUE(b->replaces.empty());
    EXPECT_FALSE(monitor_->is_worker("b-fast"));
}

// ═══════════════════════════════════════════════
// Worker failure
// ═══════════════════════════════════════════════

TEST_F(FailoverManagerTest, WorkerFailureMovesBlocksToBackup) {
    register_backups();
    manager_->handle_worker_failure("w1", "Worker w1 is in critical state");

    EXPECT_EQ(stored_on("b-fast"), 3u);
    for (const auto& id : blocks_) {
        auto a = manager_->assignment(id);
        ASSERT_TRUE(a.has_value());
        EXPECT_EQ(a->assigned_worker, "b-fast");
        EXPECT_EQ(a->network_id, "net-1");
    }
    EXPECT_EQ(monitor_->worker_health("b-fast")->model_blocks.size(), 3u);
    EXPECT_TRUE(monitor_->worker_health("w1")->model_blocks.empty());

    auto events = manager_->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].success);
    EXPECT_EQ(events[0].event_type, "worker_failure");
    EXPECT_EQ(events[0].target_id, "b-fast");
    EXPECT_EQ(events[0].strategy, FailoverStrategy::Immediate);
    EXPECT_EQ(events[0].event_id.rfind("worker_failover_w1_", 0), 0u);

    auto stats = manager_->statistics();
    EXPECT_EQ(stats.total_failovers, 1u);
    EXPECT_EQ(stats.successful_failovers, 1u);
    EXPECT_EQ(manager_->degradation_level(), DegradationLevel::None);

    auto transfers = manager_->workload_transfers();
    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_TRUE(transfers[0].success);
    EXPECT_EQ(transfers[0].sessions.size(), 1u);
}

TEST_F(FailoverManagerTest, WorkerFailureRedistributesWithoutBackups) {
    manager_->handle_worker_failure("w1", "down");

    // Least-loaded first, smaller id on ties
    EXPECT_EQ(manager_->assignment(blocks_[0])->assigned_worker, "w2");
    EXPECT_EQ(manager_->assignment(blocks_[1])->assigned_worker, "w3");
    EXPECT_EQ(manager_->assignment(blocks_[2])->assigned_worker, "w2");
    EXPECT_EQ(stored_on("w2"), 2u);
    EXPECT_EQ(stored_on("w3"), 1u);

    auto redist = manager_->redistributions();
    ASSERT_EQ(redist.size(), 1u);
    EXPECT_TRUE(redist[0].success);
    EXPECT_EQ(redist[0].affected_blocks.size(), 3u);
    EXPECT_EQ(redist[0].plan.size(), 2u);
    EXPECT_EQ(redist[0].conflicts_resolved, 0u);
    EXPECT_TRUE(manager_->events().back().success);
}

TEST_F(FailoverManagerTest, WorkerFailureDegradesWhenNothingCanTakeOver) {
    kill("w2");
    kill("w3");
    std::vector<std::tuple<DegradationLevel, DegradationLevel, std::string>> seen;
    manager_->on_degradation([&](DegradationLevel from, DegradationLevel to,
                                 const std::string& reason) {
        seen.emplace_back(from, to, reason);
    });

    manager_->handle_worker_failure("w1", "down");

    EXPECT_EQ(manager_->degradation_level(), DegradationLevel::ReducedCapacity);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(std::get<2>(seen[0]), "Worker failure: w1, no backup available");
    EXPECT_FALSE(manager_->events().back().success);
    EXPECT_EQ(manager_->statistics().failed_failovers, 1u);
    EXPECT_EQ(manager_->assignment(blocks_[0])->assigned_worker, "w1");
}

TEST_F(FailoverManagerTest, UnreachableTargetLeavesAssignmentsUnchanged) {
    unreachable_.insert("w2");
    unreachable_.insert("w3");
    EXPECT_FALSE(manager_->redistribute_blocks("w1", "net-1"));
    for (const auto& id : blocks_) {
        EXPECT_EQ(manager_->assignment(id)->assigned_worker, "w1");
    }
    EXPECT_FALSE(manager_->workload_transfers().back().success);
}

TEST_F(FailoverManagerTest, RedistributionWithoutBlocksSucceeds) {
    EXPECT_TRUE(manager_->redistribute_blocks("w3", "net-1"));
    EXPECT_TRUE(manager_->workload_transfers().empty());
}

TEST_F(FailoverManagerTest, RedistributionRequiresValidLicense) {
    license_.set_valid(false);
    EXPECT_FALSE(manager_->redistribute_blocks("w1", "net-1"));
    EXPECT_EQ(manager_->redistributions().back().error_message, "license validation failed");
}

TEST_F(FailoverManagerTest, BlocksMissingFromSourceMoveByOwnership) {
    monitor_->set_worker_blocks("w3", {"external_block"});
    manager_->assign_block("external_block", "net-1", "w3");
    EXPECT_TRUE(manager_->transfer_workload("w3", "w2", {"external_block"}));
    EXPECT_EQ(manager_->assignment("external_block")->assigned_worker, "w2");
    EXPECT_EQ(stored_on("w2"), 0u);
    EXPECT_TRUE(manager_->workload_transfers().back().sessions.empty());
}

TEST_F(FailoverManagerTest, StaleAssignmentConflictIsOverwritten) {
    // Monitor still lists the block on w1 but the ledger names an untracked owner
    manager_->assign_block(blocks_[0], "net-1", "w9");

    EXPECT_TRUE(manager_->redistribute_blocks("w1", "net-1"));
    auto redist = manager_->redistributions().back();
    EXPECT_EQ(redist.conflicts_resolved, 1u);
    EXPECT_EQ(manager_->assignment(blocks_[0])->assigned_worker, "w2");
}

TEST_F(FailoverManagerTest, ConcurrentFailureIsHandledOnce) {
    register_backups();
    std::thread a([this] { manager_->handle_worker_failure("w1", "down"); });
    std::thread b([this] { manager_->handle_worker_failure("w1", "down"); });
    a.join();
    b.join();
    EXPECT_LE(manager_->events().size(), 2u);
    EXPECT_GE(manager_->events().size(), 1u);
    for (const auto& id : blocks_) {
        EXPECT_NE(manager_->assignment(id)->assigned_worker, "w1");
    }
}

// ═══════════════════════════════════════════════
// Recovery
// ═══════════════════════════════════════════════

TEST_F(FailoverManagerTest, RecoveryStandsBackupDown) {
    register_backups();
    manager_->handle_worker_failure("w1", "down");
    auto active = manager_->backup_worker("b-fast");
    ASSERT_EQ(active->status, BackupStatus::Active);
    auto allocation_id = active->allocation_id;

    manager_->handle_recovery("w1");

    auto b = manager_->backup_worker("b-fast");
    EXPECT_EQ(b->status, BackupStatus::Standby);
    EXPECT_TRUE(b->allocation_id.empty());
    EXPECT_FALSE(allocator_->allocation(allocation_id).has_value());
    EXPECT_FALSE(monitor_->is_worker("b-fast"));
    for (const auto& id : blocks_) {
        EXPECT_EQ(manager_->assignment(id)->assigned_worker, "w1");
    }
    EXPECT_EQ(stored_on("w1"), 3u);
}

TEST_F(FailoverManagerTest, BackupStaysActiveWhenBlocksCannotReturn) {
    register_backups();
    manager_->handle_worker_failure("w1", "down");
    unreachable_.insert("w1");

    EXPECT_FALSE(manager_->deactivate_backup_worker("b-fast"));
    EXPECT_EQ(manager_->backup_worker("b-fast")->status, BackupStatus::Active);
    EXPECT_FALSE(manager_->deactivate_backup_worker("b-slow"));
}

// ═══════════════════════════════════════════════
// Degradation
// ═══════════════════════════════════════════════

TEST(DegradationRatioTest, Thresholds) {
    EXPECT_EQ(degradation_for_critical_ratio(0.0), DegradationLevel::None);
    EXPECT_EQ(degradation_for_critical_ratio(0.1), DegradationLevel::None);
    EXPECT_EQ(degradation_for_critical_ratio(0.15), DegradationLevel::ReducedQuality);
    EXPECT_EQ(degradation_for_critical_ratio(0.25), DegradationLevel::ReducedCapacity);
    EXPECT_EQ(degradation_for_critical_ratio(0.4), DegradationLevel::EssentialOnly);
    EXPECT_EQ(degradation_for_critical_ratio(0.5), DegradationLevel::EssentialOnly);
    EXPECT_EQ(degradation_for_critical_ratio(0.51), DegradationLevel::MaintenanceMode);
}

TEST_F(FailoverManagerTest, DegradationSequenceIsRecorded) {
    int callbacks = 0;
    manager_->on_degradation([&](DegradationLevel, DegradationLevel, const std::string&) {
        ++callbacks;
    });

    manager_->graceful_degradation(DegradationLevel::ReducedQuality, "one");
    manager_->graceful_degradation(DegradationLevel::ReducedQuality, "repeat");
    manager_->graceful_degradation(DegradationLevel::MaintenanceMode, "two");
    manager_->graceful_degradation(DegradationLevel::ReducedCapacity, "three");
    manager_->graceful_degradation(DegradationLevel::None, "four");

    auto history = manager_->degradation_history();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].level, DegradationLevel::ReducedQuality);
    EXPECT_EQ(history[1].level, DegradationLevel::MaintenanceMode);
    EXPECT_EQ(history[2].level, DegradationLevel::ReducedCapacity);
    EXPECT_EQ(history[3].level, DegradationLevel::None);
    EXPECT_EQ(history[3].reason, "four");
    EXPECT_EQ(callbacks, 4);
    EXPECT_EQ(manager_->statistics().degradation_events, 4u);

    auto notes = monitor_->notifications();
    std::vector<NotificationSeverity> severities;
    for (const auto& n : notes) {
        if (n.source == "FailoverManager") severities.push_back(n.severity);
    }
    ASSERT_EQ(severities.size(), 4u);
    EXPECT_EQ(severities[0], NotificationSeverity::Warning);
    EXPECT_EQ(severities[1], NotificationSeverity::Critical);
    EXPECT_EQ(severities[2], NotificationSeverity::Warning);
}

TEST_F(FailoverManagerTest, NetworkDegradationFollowsCriticalShare) {
    for (int i = 2; i <= 5; ++i) {
        monitor_->add_network("net-" + std::to_string(i), "127.0.0.1", 0);
    }
    monitor_->sample_all();
    EXPECT_EQ(manager_->evaluate_network_degradation(), DegradationLevel::None);

    kill("net-2");
    kill("net-3");
    // 2 of 5 networks critical
    EXPECT_EQ(manager_->evaluate_network_degradation(), DegradationLevel::EssentialOnly);

    manager_->handle_network_failure("net-3", "Network net-3 is in critical state");
    auto event = manager_->events().back();
    EXPECT_EQ(event.event_type, "network_failure");
    EXPECT_EQ(event.strategy, FailoverStrategy::Graceful);
    EXPECT_TRUE(event.success);

    kill("net-4");
    manager_->handle_network_failure("net-4", "down");
    EXPECT_EQ(manager_->degradation_level(), DegradationLevel::MaintenanceMode);
    EXPECT_FALSE(manager_->events().back().success);
}

TEST_F(FailoverManagerTest, NoNetworksKeepsCurrentLevel) {
    monitor_->remove_network("net-1");
    manager_->graceful_degradation(DegradationLevel::EssentialOnly, "manual");
    EXPECT_EQ(manager_->evaluate_network_degradation(), DegradationLevel::EssentialOnly);
}

// ═══════════════════════════════════════════════
// Monitor subscription
// ═══════════════════════════════════════════════

TEST_F(FailoverManagerTest, MonitorFailureTriggersFailover) {
    register_backups();
    std::atomic<int> events{0};
    manager_->on_failover_event([&](const FailoverEvent& e) {
        if (e.source_id == "w1") ++events;
    });

    kill("w1");
    manager_->wait_idle();

    EXPECT_EQ(events.load(), 1);
    EXPECT_EQ(manager_->assignment(blocks_[0])->assigned_worker, "b-fast");

    probe_.set_alive("w1", true);
    monitor_->sample_all();
    manager_->wait_idle();
    EXPECT_EQ(manager_->backup_worker("b-fast")->status, BackupStatus::Standby);
    EXPECT_EQ(manager_->assignment(blocks_[0])->assigned_worker, "w1");
}

TEST_F(FailoverManagerTest, DestroyedManagerIgnoresLaterFailures) {
    manager_.reset();
    kill("w1");
    EXPECT_EQ(monitor_->worker_health("w1")->status, HealthStatus::Critical);
}

// ═══════════════════════════════════════════════
// Persistence & reporting
// ═══════════════════════════════════════════════

TEST_F(FailoverManagerTest, AssignmentsSurviveRestart) {
    manager_->handle_worker_failure("w1", "down");
    ASSERT_TRUE(std::filesystem::exists(temp_dir_ / "assignments.json"));

    build_manager(config());
    EXPECT_TRUE(manager_->assignments().empty());
    auto loaded = manager_->load_assignments();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, 3u);
    EXPECT_EQ(manager_->assignment(blocks_[0])->assigned_worker, "w2");
    EXPECT_EQ(manager_->assignments("net-1").size(), 3u);
    EXPECT_TRUE(manager_->assignments("net-9").empty());
}

TEST_F(FailoverManagerTest, LoadRejectsMalformedFile) {
    {
        std::ofstream out(temp_dir_ / "assignments.json");
        out << R"({"assignments":[{"block_id":"x"}]})";
    }
    auto loaded = manager_->load_assignments();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().kind, ErrorKind::InvalidInput);
}

TEST_F(FailoverManagerTest, PersistenceDisabledWithoutPath) {
    auto c = config();
    c.assignments_path.clear();
    build_manager(c);
    EXPECT_TRUE(manager_->save_assignments().has_value());
    auto loaded = manager_->load_assignments();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 0u);
}

TEST_F(FailoverManagerTest, StatusJson) {
    register_backups();
    manager_->handle_worker_failure("w1", "down");

    auto status = manager_->status_json();
    EXPECT_EQ(status["current_degradation_level"].asString(), "NONE");
    EXPECT_EQ(status["block_assignments"].asUInt64(), 3u);
    EXPECT_EQ(status["in_flight_failovers"].asUInt64(), 0u);
    EXPECT_EQ(status["backup_workers"]["b-fast"]["status"].asString(), "active");
    EXPECT_TRUE(status["backup_workers"]["b-slow"]["activation_time"].isNull());
    EXPECT_EQ(status["statistics"]["backup_activations"].asUInt64(), 1u);
    ASSERT_EQ(status["recent_events"].size(), 1u);
    EXPECT_EQ(status["recent_events"][0]["target"].asString(), "b-fast");
}
