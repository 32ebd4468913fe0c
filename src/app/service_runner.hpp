/**
 * @file service_runner.hpp
 * @brief ServiceRunner: owns and wires every ModelMesh component.
 *
 * Admin role: block repository, transfer engine, resource allocator, health
 * monitor and failover manager, configured from the [[networks]] topology.
 * Worker role: block receiver and heartbeat responder on node.port.
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/config.hpp"
#include "core/license_gate.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "failover/failover_manager.hpp"
#include "health/health_monitor.hpp"
#include "network/transport.hpp"
#include "storage/block_repository.hpp"
#include "telemetry/metrics_collector.hpp"
#include "transfer/block_receiver.hpp"
#include "transfer/transfer_engine.hpp"

#include <json/json.h>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <utility>

namespace model_mesh {

class ServiceRunner {
public:
    /// @p probe defaults to a TcpHeartbeatProbe when null.
    ServiceRunner(Config config,
                  Logger& logger,
                  std::unique_ptr<ILogSink> metrics_sink,
                  std::unique_ptr<IHealthProbe> probe = nullptr);
    ~ServiceRunner();

    // Non-copyable
    ServiceRunner(const ServiceRunner&) = delete;
    ServiceRunner& operator=(const ServiceRunner&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Model storage ────────────────────────

    /// Split @p model_file into encrypted blocks and write manifest and key to storage_dir.
    Result<std::vector<EncryptedBlock>> export_model(const ModelId& model_id,
                                                     const std::filesystem::path& model_file);

    /// Load every key and manifest found in storage_dir. Returns the number of blocks loaded.
    Result<size_t> load_storage();

    // ── Reporting ────────────────────────────
    [[nodiscard]] Json::Value status_json() const;
    void log_summary();

    // ── Component access ─────────────────────
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] StaticLicenseGate& license() noexcept { return license_; }
    [[nodiscard]] BlockRepository& repository() noexcept { return repository_; }
    [[nodiscard]] BlockTransferEngine& engine() noexcept { return engine_; }
    [[nodiscard]] HealthMonitor& monitor() noexcept { return monitor_; }
    [[nodiscard]] ResourceAllocator* allocator() noexcept { return allocator_.get(); }
    [[nodiscard]] FailoverManager* failover() noexcept { return failover_.get(); }
    [[nodiscard]] uint16_t bound_port() const noexcept { return server_.bound_port(); }

private:
    [[nodiscard]] bool is_admin() const noexcept { return config_.node.role == "admin"; }

    Result<void> start_admin();
    Result<void> start_worker();
    void register_topology();
    void request_base_quotas();
    void wire_telemetry();

    std::shared_ptr<IBlockChannel> channel_for(const NodeId& node_id) const;
    std::optional<EncryptionKey> resolve_session_key(const SessionId& session_id);
    void publish_session_key(const TransferSession& session);
    Bytes handle_request(const Bytes& request);

    Config config_;
    Logger& logger_;
    StaticLicenseGate license_;
    BlockRepository repository_;
    MetricsCollector metrics_;
    std::unique_ptr<IHealthProbe> probe_;
    std::map<NodeId, std::pair<std::string, uint16_t>> addresses_;

    BlockReceiver receiver_;
    BlockTransferEngine engine_;
    HealthMonitor monitor_;
    std::unique_ptr<ResourceAllocator> allocator_;
    std::unique_ptr<FailoverManager> failover_;
    TcpTransport server_;

    std::atomic<bool> running_{false};
};

}  // namespace model_mesh
