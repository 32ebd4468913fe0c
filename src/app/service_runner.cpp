/**
 * @file service_runner.cpp
 * @brief ServiceRunner implementation.
 */

#include "app/service_runner.hpp"

#include "core/json_util.hpp"
#include "health/heartbeat_probe.hpp"
#include "resource_monitor/host_capacity.hpp"
#include "storage/block_codec.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace model_mesh {

namespace {

bool has_suffix(const std::string& name, std::string_view suffix) {
    return name.size() >= suffix.size()
        && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::filesystem::path key_file(const std::filesystem::path& dir, const KeyId& key_id) {
    return dir / (key_id + ".key.json");
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

ServiceRunner::ServiceRunner(Config config,
                             Logger& logger,
                             std::unique_ptr<ILogSink> metrics_sink,
                             std::unique_ptr<IHealthProbe> probe)
    : config_(std::move(config))
    , logger_(logger)
    , license_(config_.license.valid,
               parse_license_tier(config_.license.tier).value_or(LicenseTier::Free),
               config_.license.allowed_models,
               config_.license.max_clients)
    , metrics_(std::move(metrics_sink))
    , probe_(probe ? std::move(probe) : std::make_unique<TcpHeartbeatProbe>())
    , receiver_(repository_,
                [this](const SessionId& id) { return resolve_session_key(id); },
                logger_,
                Duration{config_.transfer.ack_timeout_ms})
    , engine_(config_.transfer, repository_, license_,
              [this](const NodeId& id) { return channel_for(id); },
              logger_)
    , monitor_(config_.health, *probe_, logger_) {
    for (const auto& net : config_.networks) {
        for (const auto& w : net.workers) addresses_[w.id] = {w.host, w.port};
        for (const auto& b : net.backups) addresses_[b.id] = {b.host, b.port};
    }
}

ServiceRunner::~ServiceRunner() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> ServiceRunner::start() {
    if (running_.load()) return Result<void>{};

    auto started = is_admin() ? start_admin() : start_worker();
    if (!started) {
        logger_.error("Service start failed: " + started.error().message);
        return started;
    }
    running_ = true;
    return Result<void>{};
}

Result<void> ServiceRunner::start_admin() {
    if (auto loaded = load_storage(); !loaded) {
        logger_.warn("Block storage not loaded: " + loaded.error().message);
    } else {
        logger_.info("Loaded " + std::to_string(*loaded) + " block(s) from "
                     + config_.transfer.storage_dir.string());
    }

    ResourceQuota hardware;
    if (config_.allocator.capacity) {
        hardware = *config_.allocator.capacity;
    } else {
        auto detected = detect_host_capacity(license_.tier());
        if (!detected) return detected.error();
        hardware = *detected;
    }

    auto allocator = ResourceAllocator::create(config_.allocator, hardware, license_, logger_);
    if (!allocator) return allocator.error();
    allocator_ = std::move(*allocator);

    failover_ = std::make_unique<FailoverManager>(config_.failover, config_.node.id, monitor_,
                                                  *allocator_, engine_, repository_, license_,
                                                  logger_);

    std::error_code ec;
    std::filesystem::create_directories(config_.transfer.session_key_dir, ec);
    if (ec) {
        return Error{"cannot create session key directory: " + ec.message(),
                     ErrorKind::InvalidInput};
    }
    engine_.on_session_started([this](const TransferSession& s) { publish_session_key(s); });

    register_topology();
    wire_telemetry();

    allocator_->start();
    request_base_quotas();
    monitor_.start();

    logger_.info("Admin node " + config_.node.id + " started: "
                 + std::to_string(config_.networks.size()) + " network(s), "
                 + std::to_string(repository_.block_count()) + " block(s)");
    return Result<void>{};
}

Result<void> ServiceRunner::start_worker() {
    if (auto loaded = load_storage(); !loaded) {
        logger_.warn("Block storage not loaded: " + loaded.error().message);
    }

    auto listening = server_.listen(config_.node.port);
    if (!listening) return listening.error();
    server_.serve([this](const Bytes& request) { return handle_request(request); });

    logger_.info("Worker node " + config_.node.id + " listening on port "
                 + std::to_string(server_.bound_port()));
    return Result<void>{};
}

void ServiceRunner::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Stopping node " + config_.node.id);
    monitor_.stop();
    if (allocator_) allocator_->stop();
    if (failover_) failover_->wait_idle();
    server_.stop_serving();
    metrics_.flush();
    logger_.flush();
}

// ─────────────────────────────────────────────
// Topology
// ─────────────────────────────────────────────

void ServiceRunner::register_topology() {
    for (const auto& net : config_.networks) {
        monitor_.add_network(net.id, net.host, net.port);
        allocator_->register_profile(NetworkResourceProfile{
            .network_id = net.id,
            .base_requirements = net.base,
            .peak_requirements = net.peak,
            .priority = RequestPriority::Normal,
        });

        for (const auto& w : net.workers) {
            monitor_.add_worker(w.id, net.id, w.host, w.port, w.blocks);
            for (const auto& block_id : w.blocks) failover_->assign_block(block_id, net.id, w.id);
        }
        for (const auto& b : net.backups) {
            auto registered = failover_->register_backup_worker(BackupWorker{
                .worker_id = b.id,
                .network_id = net.id,
                .host = b.host,
                .port = b.port,
                .model_blocks = b.blocks,
                .priority = b.priority,
            });
            if (!registered) {
                logger_.warn("Backup " + b.id + " not registered: " + registered.error().message);
            }
        }
    }

    std::error_code ec;
    const auto& path = config_.failover.assignments_path;
    if (path.empty() || !std::filesystem::exists(path, ec)) return;

    auto loaded = failover_->load_assignments();
    if (!loaded) {
        logger_.warn("Block assignments not restored: " + loaded.error().message);
        return;
    }
    logger_.info("Restored " + std::to_string(*loaded) + " block assignment(s)");

    std::map<WorkerId, std::vector<BlockId>> owned;
    for (const auto& a : failover_->assignments()) owned[a.assigned_worker].push_back(a.block_id);
    for (const auto& info : monitor_.workers()) {
        monitor_.set_worker_blocks(info.worker_id, owned[info.worker_id]);
    }
}

void ServiceRunner::request_base_quotas() {
    for (const auto& net : config_.networks) {
        auto request = allocator_->request_for_load(net.id, net.load_factor);
        if (!request) {
            logger_.warn("No quota request for " + net.id + ": " + request.error().message);
            continue;
        }
        if (auto id = allocator_->request_resources(std::move(*request)); !id) {
            logger_.warn("Quota request for " + net.id + " refused: " + id.error().message);
        }
    }
    allocator_->run_allocation_cycle();
}

void ServiceRunner::wire_telemetry() {
    engine_.on_session_finished([this](const TransferSession& s) {
        metrics_.record_transfer_session(s);
        std::error_code ec;
        std::filesystem::remove(key_file(config_.transfer.session_key_dir,
                                         s.encryption_key.key_id), ec);
    });
    allocator_->on_allocation_event([this](const ResourceAllocation& a, AllocationEvent e) {
        metrics_.record_allocation(a, e);
    });
    monitor_.on_health_change([this](const std::string& id, HealthStatus from, HealthStatus to) {
        metrics_.record_health_transition(id, from, to);
    });
    failover_->on_failover_event([this](const FailoverEvent& e) { metrics_.record_failover(e); });
    failover_->on_degradation([this](DegradationLevel from, DegradationLevel to,
                                     const std::string& reason) {
        metrics_.record_degradation(from, to, reason);
    });
}

// ─────────────────────────────────────────────
// Transfer plumbing
// ─────────────────────────────────────────────

std::shared_ptr<IBlockChannel> ServiceRunner::channel_for(const NodeId& node_id) const {
    auto it = addresses_.find(node_id);
    if (it == addresses_.end()) return nullptr;
    return std::make_shared<TcpBlockChannel>(it->second.first, it->second.second);
}

void ServiceRunner::publish_session_key(const TransferSession& session) {
    auto path = key_file(config_.transfer.session_key_dir, session.encryption_key.key_id);
    if (auto written = json::write_file(path, key_to_json(session.encryption_key)); !written) {
        logger_.error("Session key for " + session.session_id + " not published: "
                      + written.error().message);
        return;
    }
    std::error_code ec;
    std::filesystem::permissions(path, std::filesystem::perms::owner_read
                                     | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
}

std::optional<EncryptionKey> ServiceRunner::resolve_session_key(const SessionId& session_id) {
    if (auto key = engine_.session_key(session_id)) return key;

    const KeyId key_id = "session_" + session_id;
    if (auto key = repository_.find_key(key_id)) return key;

    std::error_code ec;
    auto path = key_file(config_.transfer.session_key_dir, key_id);
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    auto loaded = repository_.load_key(path);
    if (!loaded) {
        logger_.warn("Session key file unreadable: " + loaded.error().message);
        return std::nullopt;
    }
    return repository_.find_key(*loaded);
}

Bytes ServiceRunner::handle_request(const Bytes& request) {
    std::string_view text{reinterpret_cast<const char*>(request.data()), request.size()};
    std::string reply = is_heartbeat(text) ? encode_heartbeat_ack(config_.node.id)
                                           : receiver_.handle_message(text);
    return Bytes(reply.begin(), reply.end());
}

// ─────────────────────────────────────────────
// Model storage
// ─────────────────────────────────────────────

Result<std::vector<EncryptedBlock>> ServiceRunner::export_model(
    const ModelId& model_id, const std::filesystem::path& model_file) {
    std::ifstream in(model_file, std::ios::binary);
    if (!in) {
        return Error{"cannot open model file " + model_file.string(), ErrorKind::InvalidInput};
    }
    Bytes data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (data.empty()) {
        return Error{"model file is empty: " + model_file.string(), ErrorKind::InvalidInput};
    }

    auto blocks = repository_.export_model(model_id, data, config_.transfer.block_size_bytes);
    if (!blocks) return blocks.error();

    const auto& dir = config_.transfer.storage_dir;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{"cannot create storage directory: " + ec.message(), ErrorKind::InvalidInput};
    }
    auto manifest = repository_.save_manifest(model_id, dir);
    if (!manifest) return manifest.error();
    auto key = repository_.save_key(model_id + "_key", dir);
    if (!key) return key.error();

    logger_.info("Exported model " + model_id + ": " + std::to_string(blocks->size())
                 + " block(s) to " + manifest->string());
    return blocks;
}

Result<size_t> ServiceRunner::load_storage() {
    const auto& dir = config_.transfer.storage_dir;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return size_t{0};

    std::vector<std::filesystem::path> keys;
    std::vector<std::filesystem::path> manifests;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if (has_suffix(name, ".key.json")) keys.push_back(entry.path());
        else if (has_suffix(name, ".manifest.json")) manifests.push_back(entry.path());
    }
    if (ec) return Error{"cannot list " + dir.string() + ": " + ec.message(), ErrorKind::NotFound};

    for (const auto& path : keys) {
        if (auto loaded = repository_.load_key(path); !loaded) {
            logger_.warn("Skipping key file " + path.string() + ": " + loaded.error().message);
        }
    }

    size_t blocks = 0;
    for (const auto& path : manifests) {
        auto loaded = repository_.load_manifest(path);
        if (!loaded) {
            logger_.warn("Skipping manifest " + path.string() + ": " + loaded.error().message);
            continue;
        }
        blocks += *loaded;
    }
    return blocks;
}

// ─────────────────────────────────────────────
// Reporting
// ─────────────────────────────────────────────

Json::Value ServiceRunner::status_json() const {
    Json::Value root(Json::objectValue);
    root["node_id"] = config_.node.id;
    root["role"] = config_.node.role;
    root["running"] = running_.load();
    root["stored_blocks"] = Json::UInt64{repository_.block_count()};

    if (!is_admin()) {
        root["blocks_received"] = Json::UInt64{receiver_.blocks_received()};
        root["pending_transfers"] = Json::UInt64{receiver_.pending_transfers()};
        return root;
    }

    const auto stats = engine_.statistics();
    Json::Value transfer(Json::objectValue);
    transfer["total_sessions"] = Json::UInt64{stats.total_sessions};
    transfer["completed_sessions"] = Json::UInt64{stats.completed_sessions};
    transfer["failed_sessions"] = Json::UInt64{stats.failed_sessions};
    transfer["total_bytes_transferred"] = Json::UInt64{stats.total_bytes_transferred};
    transfer["total_blocks_transferred"] = Json::UInt64{stats.total_blocks_transferred};
    transfer["retry_attempts"] = Json::UInt64{stats.retry_attempts};
    transfer["integrity_failures"] = Json::UInt64{stats.integrity_failures};
    root["transfer"] = transfer;

    root["health"] = monitor_.summary_json();
    if (allocator_) root["allocator"] = allocator_->utilization_json();
    if (failover_) root["failover"] = failover_->status_json();
    return root;
}

void ServiceRunner::log_summary() {
    if (!is_admin()) {
        logger_.info("Worker " + config_.node.id + ": "
                     + std::to_string(receiver_.blocks_received()) + " block(s) received, "
                     + std::to_string(repository_.block_count()) + " stored");
        return;
    }

    const auto health = monitor_.summary();
    logger_.info("Health: overall " + std::string{to_string(health.overall)} + ", "
                 + std::to_string(health.healthy) + " healthy, "
                 + std::to_string(health.warning) + " warning, "
                 + std::to_string(health.critical) + " critical, "
                 + std::to_string(health.unacknowledged_notifications)
                 + " unacknowledged notification(s)");

    if (allocator_) {
        const auto report = allocator_->utilization();
        std::string line = "Utilization:";
        for (const auto& usage : report.resources) {
            line += " " + std::string{usage.resource} + "="
                  + std::to_string(static_cast<int>(usage.utilization_percent)) + "%";
        }
        line += ", " + std::to_string(report.active_allocations) + " allocation(s), "
              + std::to_string(report.pending_requests) + " pending";
        logger_.info(line);
    }
    if (failover_) {
        logger_.info("Degradation level: "
                     + std::string{to_string(failover_->degradation_level())});
    }
}

}  // namespace model_mesh
