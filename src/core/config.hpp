/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include "core/quota.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace model_mesh {

struct NodeConfig {
    std::string id = "admin-01";
    std::string role = "admin";         ///< "admin" or "worker"
    uint16_t port = 5301;               ///< Block receiver / heartbeat listener
};

struct LicenseConfig {
    bool valid = true;
    std::string tier = "PRO";           ///< "FREE", "PRO", "ENT"
    std::vector<std::string> allowed_models{"*"};
    uint32_t max_clients = 20;
};

struct TransferConfig {
    uint32_t max_concurrent_transfers = 3;
    uint32_t max_retries = 3;
    uint32_t retry_base_delay_ms = 1000;
    uint32_t max_retry_delay_ms = 30000;
    uint32_t chunk_size_bytes = 64 * 1024;
    uint32_t ack_timeout_ms = 300000;
    uint32_t session_retention_s = 3600;   ///< How long Completed/Cancelled sessions stay queryable
    uint64_t block_size_bytes = 1024 * 1024;
    std::filesystem::path storage_dir = "./blocks";
    std::filesystem::path session_key_dir = "./session_keys";   ///< Shared with worker nodes
};

struct AllocatorConfig {
    uint32_t allocation_interval_ms = 10000;
    uint32_t cleanup_interval_ms = 60000;
    uint32_t allocation_ttl_s = 86400;
    uint32_t request_timeout_s = 300;
    uint32_t request_retention_s = 3600;   ///< How long finished request ids stay queryable
    std::string conflict_strategy = "priority_based";  ///< "priority_based", "fair_share", "fcfs"
    std::optional<ResourceQuota> capacity;              ///< Hardware override; detected when absent
};

struct HealthConfig {
    uint32_t heartbeat_interval_ms = 30000;
    uint32_t probe_timeout_ms = 5000;
    uint32_t warning_threshold = 2;
    uint32_t failure_threshold = 3;
    uint32_t max_notifications = 100;
};

struct FailoverConfig {
    uint32_t max_concurrent_failovers = 3;
    uint32_t failover_timeout_ms = 60000;
    std::filesystem::path assignments_path;             ///< Empty = not persisted
    ResourceQuota backup_requirements{
        .cpu_cores = 2.0, .memory_gb = 4.0, .gpu_memory_gb = 2.0,
        .network_bandwidth_mbps = 0.0, .worker_slots = 1, .client_connections = 5};
};

struct WorkerEntry {
    WorkerId id;
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    std::vector<BlockId> blocks;
};

struct BackupEntry {
    WorkerId id;
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    int32_t priority = 1;               ///< Lower value is activated first
    std::vector<BlockId> blocks;
};

struct NetworkEntry {
    NetworkId id;
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    double load_factor = 0.0;
    ResourceQuota base;
    ResourceQuota peak;
    std::vector<WorkerEntry> workers;
    std::vector<BackupEntry> backups;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    NodeConfig node;
    LicenseConfig license;
    TransferConfig transfer;
    AllocatorConfig allocator;
    HealthConfig health;
    FailoverConfig failover;
    std::vector<NetworkEntry> networks;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Fails on unreadable or malformed files
 * and on semantically invalid values (unknown tier, zero thresholds).
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace model_mesh
