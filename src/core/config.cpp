/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace model_mesh {

namespace {

ResourceQuota read_quota(toml::node_view<toml::node> node, const ResourceQuota& fallback) {
    ResourceQuota q = fallback;
    if (!node.is_table()) return q;
    q.cpu_cores = node["cpu_cores"].value_or(fallback.cpu_cores);
    q.memory_gb = node["memory_gb"].value_or(fallback.memory_gb);
    q.gpu_memory_gb = node["gpu_memory_gb"].value_or(fallback.gpu_memory_gb);
    q.network_bandwidth_mbps =
        node["network_bandwidth_mbps"].value_or(fallback.network_bandwidth_mbps);
    q.worker_slots = static_cast<int32_t>(
        node["worker_slots"].value_or(int64_t{fallback.worker_slots}));
    q.client_connections = static_cast<int32_t>(
        node["client_connections"].value_or(int64_t{fallback.client_connections}));
    return q;
}

std::vector<std::string> read_strings(toml::node_view<toml::node> node) {
    std::vector<std::string> out;
    if (auto* arr = node.as_array()) {
        for (const auto& item : *arr) {
            if (auto s = item.value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

uint16_t read_port(toml::node_view<toml::node> node) {
    return static_cast<uint16_t>(node["port"].value_or(int64_t{0}));
}

NetworkEntry read_network(toml::node_view<toml::node> net) {
    NetworkEntry entry;
    entry.id = net["id"].value_or(std::string{});
    entry.host = net["host"].value_or(std::string{"127.0.0.1"});
    entry.port = read_port(net);
    entry.load_factor = net["load_factor"].value_or(0.0);
    entry.base = read_quota(net["base"], {});
    entry.peak = read_quota(net["peak"], entry.base);

    if (auto* workers = net["workers"].as_array()) {
        for (auto& item : *workers) {
            toml::node_view<toml::node> w{item};
            WorkerEntry worker;
            worker.id = w["id"].value_or(std::string{});
            worker.host = w["host"].value_or(std::string{"127.0.0.1"});
            worker.port = read_port(w);
            worker.blocks = read_strings(w["blocks"]);
            entry.workers.push_back(std::move(worker));
        }
    }

    if (auto* backups = net["backups"].as_array()) {
        for (auto& item : *backups) {
            toml::node_view<toml::node> b{item};
            BackupEntry backup;
            backup.id = b["id"].value_or(std::string{});
            backup.host = b["host"].value_or(std::string{"127.0.0.1"});
            backup.port = read_port(b);
            backup.priority = static_cast<int32_t>(b["priority"].value_or(int64_t{1}));
            backup.blocks = read_strings(b["blocks"]);
            entry.backups.push_back(std::move(backup));
        }
    }
    return entry;
}

Result<void> validate(const Config& config) {
    if (config.node.id.empty()) {
        return Error{"node.id must not be empty", ErrorKind::InvalidInput};
    }
    if (config.node.role != "admin" && config.node.role != "worker") {
        return Error{"node.role must be 'admin' or 'worker': " + config.node.role,
                     ErrorKind::InvalidInput};
    }
    if (!parse_license_tier(config.license.tier)) {
        return Error{"Unknown license tier: " + config.license.tier, ErrorKind::InvalidInput};
    }
    if (config.transfer.max_concurrent_transfers == 0 || config.transfer.chunk_size_bytes == 0) {
        return Error{"transfer concurrency and chunk size must be positive",
                     ErrorKind::InvalidInput};
    }
    if (config.health.warning_threshold == 0
        || config.health.failure_threshold < config.health.warning_threshold) {
        return Error{"health thresholds must satisfy 0 < warning <= failure",
                     ErrorKind::InvalidInput};
    }
    for (const auto& net : config.networks) {
        if (net.id.empty()) {
            return Error{"every [[networks]] entry needs an id", ErrorKind::InvalidInput};
        }
    }
    return Result<void>{};
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorKind::NotFound};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.id = node["id"].value_or(std::string{"admin-01"});
            config.node.role = node["role"].value_or(std::string{"admin"});
            config.node.port = static_cast<uint16_t>(node["port"].value_or(int64_t{5301}));
        }

        // [license]
        if (auto license = tbl["license"]; license.is_table()) {
            config.license.valid = license["valid"].value_or(true);
            config.license.tier = license["tier"].value_or(std::string{"PRO"});
            if (license["allowed_models"].is_array()) {
                config.license.allowed_models = read_strings(license["allowed_models"]);
            }
            config.license.max_clients = static_cast<uint32_t>(
                license["max_clients"].value_or(int64_t{20}));
        }

        // [transfer]
        if (auto transfer = tbl["transfer"]; transfer.is_table()) {
            auto& t = config.transfer;
            t.max_concurrent_transfers = static_cast<uint32_t>(
                transfer["max_concurrent_transfers"].value_or(int64_t{3}));
            t.max_retries = static_cast<uint32_t>(transfer["max_retries"].value_or(int64_t{3}));
            t.retry_base_delay_ms = static_cast<uint32_t>(
                transfer["retry_base_delay_ms"].value_or(int64_t{1000}));
            t.max_retry_delay_ms = static_cast<uint32_t>(
                transfer["max_retry_delay_ms"].value_or(int64_t{30000}));
            t.chunk_size_bytes = static_cast<uint32_t>(
                transfer["chunk_size_bytes"].value_or(int64_t{64 * 1024}));
            t.ack_timeout_ms = static_cast<uint32_t>(
                transfer["ack_timeout_ms"].value_or(int64_t{300000}));
            t.session_retention_s = static_cast<uint32_t>(
                transfer["session_retention_s"].value_or(int64_t{3600}));
            t.block_size_bytes = static_cast<uint64_t>(
                transfer["block_size_bytes"].value_or(int64_t{1024 * 1024}));
            t.storage_dir = transfer["storage_dir"].value_or(std::string{"./blocks"});
            t.session_key_dir = transfer["session_key_dir"].value_or(std::string{"./session_keys"});
        }

        // [allocator]
        if (auto allocator = tbl["allocator"]; allocator.is_table()) {
            auto& a = config.allocator;
            a.allocation_interval_ms = static_cast<uint32_t>(
                allocator["allocation_interval_ms"].value_or(int64_t{10000}));
            a.cleanup_interval_ms = static_cast<uint32_t>(
                allocator["cleanup_interval_ms"].value_or(int64_t{60000}));
            a.allocation_ttl_s = static_cast<uint32_t>(
                allocator["allocation_ttl_s"].value_or(int64_t{86400}));
            a.request_timeout_s = static_cast<uint32_t>(
                allocator["request_timeout_s"].value_or(int64_t{300}));
            a.request_retention_s = static_cast<uint32_t>(
                allocator["request_retention_s"].value_or(int64_t{3600}));
            a.conflict_strategy =
                allocator["conflict_strategy"].value_or(std::string{"priority_based"});

            // [allocator.capacity]
            if (allocator["capacity"].is_table()) {
                a.capacity = read_quota(allocator["capacity"], {});
            }
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            auto& h = config.health;
            h.heartbeat_interval_ms = static_cast<uint32_t>(
                health["heartbeat_interval_ms"].value_or(int64_t{30000}));
            h.probe_timeout_ms = static_cast<uint32_t>(
                health["probe_timeout_ms"].value_or(int64_t{5000}));
            h.warning_threshold = static_cast<uint32_t>(
                health["warning_threshold"].value_or(int64_t{2}));
            h.failure_threshold = static_cast<uint32_t>(
                health["failure_threshold"].value_or(int64_t{3}));
            h.max_notifications = static_cast<uint32_t>(
                health["max_notifications"].value_or(int64_t{100}));
        }

        // [failover]
        if (auto failover = tbl["failover"]; failover.is_table()) {
            auto& f = config.failover;
            f.max_concurrent_failovers = static_cast<uint32_t>(
                failover["max_concurrent_failovers"].value_or(int64_t{3}));
            f.failover_timeout_ms = static_cast<uint32_t>(
                failover["failover_timeout_ms"].value_or(int64_t{60000}));
            f.assignments_path = failover["assignments_path"].value_or(std::string{});

            // [failover.backup_requirements]
            f.backup_requirements =
                read_quota(failover["backup_requirements"], f.backup_requirements);
        }

        // [[networks]]
        if (auto* networks = tbl["networks"].as_array()) {
            for (auto& item : *networks) {
                config.networks.push_back(read_network(toml::node_view<toml::node>{item}));
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (auto valid = validate(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorKind::InvalidInput};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace model_mesh
