/**
 * @file health_monitor.cpp
 * @brief HealthMonitor implementation.
 */

#include "health/health_monitor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <type_traits>

namespace model_mesh {

namespace {

NotificationSeverity severity_for(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Critical: return NotificationSeverity::Critical;
        case HealthStatus::Warning:  return NotificationSeverity::Warning;
        default:                     return NotificationSeverity::Info;
    }
}

int severity_rank(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Critical: return 2;
        case HealthStatus::Warning:  return 1;
        default:                     return 0;
    }
}

template <typename Info>
Json::Value health_to_json(const Info& info) {
    Json::Value v(Json::objectValue);
    v["status"] = std::string{to_string(info.status)};
    v["host"] = info.host;
    v["port"] = info.port;
    v["consecutive_failures"] = info.consecutive_failures;
    v["request_count"] = Json::UInt64{info.request_count};
    v["error_count"] = Json::UInt64{info.error_count};
    v["response_time_ms"] = Json::Int64{info.response_time.count()};
    if (info.last_heartbeat) {
        v["last_heartbeat"] = Json::Int64{to_unix_ms(*info.last_heartbeat)};
    }
    return v;
}

}  // anonymous namespace

Json::Value notification_to_json(const AdminNotification& n) {
    Json::Value v(Json::objectValue);
    v["notification_id"] = n.notification_id;
    v["severity"] = std::string{to_string(n.severity)};
    v["source"] = n.source;
    v["message"] = n.message;
    v["details"] = n.details;
    v["timestamp"] = Json::Int64{to_unix_ms(n.timestamp)};
    v["acknowledged"] = n.acknowledged;
    if (n.acknowledged) {
        v["acknowledged_by"] = n.acknowledged_by;
        if (n.acknowledged_at) {
            v["acknowledged_at"] = Json::Int64{to_unix_ms(*n.acknowledged_at)};
        }
    } else {
        v["acknowledged_by"] = Json::Value{};
    }
    return v;
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

HealthMonitor::HealthMonitor(HealthConfig config, IHealthProbe& probe, Logger& logger)
    : config_(std::move(config)), probe_(probe), logger_(logger) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (is_running()) return;
    monitor_thread_ = std::jthread([this](std::stop_token stop) { monitoring_loop(stop); });
    logger_.info("Health monitor started (interval "
                 + std::to_string(config_.heartbeat_interval_ms) + "ms)");
}

void HealthMonitor::stop() {
    if (!monitor_thread_.joinable()) return;
    monitor_thread_.request_stop();
    wake_.notify_all();
    monitor_thread_.join();
    logger_.info("Health monitor stopped");
}

bool HealthMonitor::is_running() const noexcept {
    return monitor_thread_.joinable();
}

void HealthMonitor::monitoring_loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds{config_.heartbeat_interval_ms};
    while (!stop.stop_requested()) {
        try {
            sample_all();
        } catch (const std::exception& e) {
            logger_.error(std::string{"Heartbeat round failed: "} + e.what());
        }
        std::unique_lock lock(wake_mutex_);
        wake_.wait_for(lock, stop, interval, [] { return false; });
    }
}

// ─────────────────────────────────────────────
// Tracked entities
// ─────────────────────────────────────────────

void HealthMonitor::add_network(const NetworkId& network_id, std::string host, uint16_t port) {
    std::unique_lock lock(state_mutex_);
    auto& info = networks_[network_id];
    info.network_id = network_id;
    info.host = std::move(host);
    info.port = port;
}

bool HealthMonitor::remove_network(const NetworkId& network_id) {
    std::unique_lock lock(state_mutex_);
    return networks_.erase(network_id) > 0;
}

void HealthMonitor::add_worker(const WorkerId& worker_id, const NetworkId& network_id,
                               std::string host, uint16_t port, std::vector<BlockId> blocks) {
    std::unique_lock lock(state_mutex_);
    auto& info = workers_[worker_id];
    info.worker_id = worker_id;
    info.network_id = network_id;
    info.host = std::move(host);
    info.port = port;
    info.model_blocks = std::move(blocks);
}

bool HealthMonitor::remove_worker(const WorkerId& worker_id) {
    std::unique_lock lock(state_mutex_);
    return workers_.erase(worker_id) > 0;
}

bool HealthMonitor::set_worker_blocks(const WorkerId& worker_id, std::vector<BlockId> blocks) {
    std::unique_lock lock(state_mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return false;
    it->second.model_blocks = std::move(blocks);
    return true;
}

// ─────────────────────────────────────────────
// Sampling
// ─────────────────────────────────────────────

void HealthMonitor::sample_all() {
    std::vector<Target> targets;
    {
        std::shared_lock lock(state_mutex_);
        targets.reserve(networks_.size() + workers_.size());
        for (const auto& [id, info] : networks_) {
            targets.push_back({.id = id, .host = info.host, .port = info.port, .is_worker = false});
        }
        for (const auto& [id, info] : workers_) {
            targets.push_back({.id = id, .host = info.host, .port = info.port, .is_worker = true});
        }
    }
    for (const auto& target : targets) probe_target(target);
}

void HealthMonitor::probe_target(const Target& target) {
    auto result = probe_.probe(target.id, target.host, target.port,
                               Duration{config_.probe_timeout_ms});
    if (!result.success) {
        logger_.debug("Heartbeat to " + target.id + " failed: " + result.error);
    }
    if (auto transition = apply(target.id, result)) dispatch(*transition);
}

bool HealthMonitor::record_heartbeat(const std::string& id, Duration response_time) {
    if (!is_worker(id) && !is_network(id)) return false;
    auto transition = apply(id, ProbeResult{.success = true, .response_time = response_time,
                                            .error = {}});
    if (transition) dispatch(*transition);
    return true;
}

std::optional<WorkerHealthInfo> HealthMonitor::monitor_worker_health(const WorkerId& worker_id) {
    Target target;
    {
        std::shared_lock lock(state_mutex_);
        auto it = workers_.find(worker_id);
        if (it == workers_.end()) return std::nullopt;
        target = {.id = worker_id, .host = it->second.host, .port = it->second.port,
                  .is_worker = true};
    }
    probe_target(target);
    return worker_health(worker_id);
}

std::optional<NetworkHealthInfo> HealthMonitor::monitor_network_health(
    const NetworkId& network_id) {
    Target target;
    {
        std::shared_lock lock(state_mutex_);
        auto it = networks_.find(network_id);
        if (it == networks_.end()) return std::nullopt;
        target = {.id = network_id, .host = it->second.host, .port = it->second.port,
                  .is_worker = false};
    }
    probe_target(target);
    return network_health(network_id);
}

template <typename Info>
std::optional<HealthMonitor::Transition> HealthMonitor::apply_locked(Info& info,
                                                                     const ProbeResult& result) {
    const auto old_status = info.status;
    ++info.request_count;

    if (result.success) {
        info.consecutive_failures = 0;
        info.last_heartbeat = std::chrono::system_clock::now();
        info.response_time = result.response_time;
        info.status = HealthStatus::Healthy;
    } else {
        ++info.consecutive_failures;
        ++info.error_count;
        if (info.consecutive_failures >= config_.failure_threshold) {
            info.status = HealthStatus::Critical;
        } else if (info.consecutive_failures >= config_.warning_threshold) {
            info.status = HealthStatus::Warning;
        }
    }

    if (info.status == old_status) return std::nullopt;

    Transition t;
    t.old_status = old_status;
    t.new_status = info.status;
    t.consecutive_failures = info.consecutive_failures;
    t.response_time = info.response_time;
    if constexpr (std::is_same_v<Info, WorkerHealthInfo>) {
        t.id = info.worker_id;
        t.is_worker = true;
        t.network_id = info.network_id;
    } else {
        t.id = info.network_id;
        t.network_id = info.network_id;
    }
    return t;
}

std::optional<HealthMonitor::Transition> HealthMonitor::apply(const std::string& id,
                                                              const ProbeResult& result) {
    std::unique_lock lock(state_mutex_);
    if (auto it = workers_.find(id); it != workers_.end()) {
        return apply_locked(it->second, result);
    }
    if (auto it = networks_.find(id); it != networks_.end()) {
        return apply_locked(it->second, result);
    }
    return std::nullopt;
}

void HealthMonitor::dispatch(const Transition& t) {
    const std::string kind = t.is_worker ? "Worker" : "Network";
    const std::string change = std::string{to_string(t.old_status)} + " -> "
                             + std::string{to_string(t.new_status)};
    if (t.new_status == HealthStatus::Critical || t.new_status == HealthStatus::Warning) {
        logger_.warn(kind + " " + t.id + " health " + change);
    } else {
        logger_.info(kind + " " + t.id + " health " + change);
    }

    std::vector<HealthChangeCallback> changes;
    std::vector<FailureCallback> failures;
    {
        std::lock_guard lock(callback_mutex_);
        changes = change_callbacks_;
        failures = failure_callbacks_;
    }

    for (const auto& callback : changes) {
        try {
            callback(t.id, t.old_status, t.new_status);
        } catch (const std::exception& e) {
            logger_.error("Health change callback failed for " + t.id + ": " + e.what());
        }
    }

    if (t.new_status == HealthStatus::Critical) {
        const auto message = kind + " " + t.id + " is in critical state";
        for (const auto& callback : failures) {
            try {
                callback(t.id, message);
            } catch (const std::exception& e) {
                logger_.error("Failure callback failed for " + t.id + ": " + e.what());
            }
        }
    }

    if (t.is_worker) {
        Json::Value details(Json::objectValue);
        details["worker_id"] = t.id;
        details["network_id"] = t.network_id;
        details["old_status"] = std::string{to_string(t.old_status)};
        details["new_status"] = std::string{to_string(t.new_status)};
        details["consecutive_failures"] = t.consecutive_failures;
        details["response_time_ms"] = Json::Int64{t.response_time.count()};
        create_admin_notification(severity_for(t.new_status), "Worker " + t.id,
                                  "Worker status changed from "
                                  + std::string{to_string(t.old_status)} + " to "
                                  + std::string{to_string(t.new_status)},
                                  std::move(details));
    }
}

// ─────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────

std::optional<WorkerHealthInfo> HealthMonitor::worker_health(const WorkerId& worker_id) const {
    std::shared_lock lock(state_mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return std::nullopt;
    return it->second;
}

std::optional<NetworkHealthInfo> HealthMonitor::network_health(const NetworkId& network_id) const {
    std::shared_lock lock(state_mutex_);
    auto it = networks_.find(network_id);
    if (it == networks_.end()) return std::nullopt;
    return it->second;
}

std::vector<WorkerHealthInfo> HealthMonitor::workers() const {
    std::shared_lock lock(state_mutex_);
    std::vector<WorkerHealthInfo> out;
    out.reserve(workers_.size());
    for (const auto& [id, info] : workers_) out.push_back(info);
    return out;
}

std::vector<WorkerHealthInfo> HealthMonitor::network_workers(const NetworkId& network_id) const {
    std::shared_lock lock(state_mutex_);
    std::vector<WorkerHealthInfo> out;
    for (const auto& [id, info] : workers_) {
        if (info.network_id == network_id) out.push_back(info);
    }
    return out;
}

std::vector<NetworkHealthInfo> HealthMonitor::networks() const {
    std::shared_lock lock(state_mutex_);
    std::vector<NetworkHealthInfo> out;
    out.reserve(networks_.size());
    for (const auto& [id, info] : networks_) out.push_back(info);
    return out;
}

bool HealthMonitor::is_worker(const std::string& id) const {
    std::shared_lock lock(state_mutex_);
    return workers_.contains(id);
}

bool HealthMonitor::is_network(const std::string& id) const {
    std::shared_lock lock(state_mutex_);
    return networks_.contains(id);
}

HealthStatus HealthMonitor::overall_status() const {
    std::shared_lock lock(state_mutex_);
    if (networks_.empty() && workers_.empty()) return HealthStatus::Unknown;

    int worst = 0;
    for (const auto& [id, info] : networks_) worst = std::max(worst, severity_rank(info.status));
    for (const auto& [id, info] : workers_) worst = std::max(worst, severity_rank(info.status));

    if (worst == 2) return HealthStatus::Critical;
    if (worst == 1) return HealthStatus::Warning;
    return HealthStatus::Healthy;
}

HealthSummary HealthMonitor::summary() const {
    HealthSummary s;
    s.overall = overall_status();
    {
        std::shared_lock lock(state_mutex_);
        s.tracked_networks = networks_.size();
        s.tracked_workers = workers_.size();

        double total_ms = 0.0;
        size_t sampled = 0;
        auto count = [&](HealthStatus status, const std::optional<Timestamp>& last,
                         Duration rtt) {
            switch (status) {
                case HealthStatus::Healthy:  ++s.healthy; break;
                case HealthStatus::Warning:  ++s.warning; break;
                case HealthStatus::Critical: ++s.critical; break;
                case HealthStatus::Unknown:  ++s.unknown; break;
            }
            if (last) {
                total_ms += static_cast<double>(rtt.count());
                ++sampled;
            }
        };
        for (const auto& [id, info] : networks_) {
            count(info.status, info.last_heartbeat, info.response_time);
        }
        for (const auto& [id, info] : workers_) {
            count(info.status, info.last_heartbeat, info.response_time);
        }
        s.average_response_ms = sampled > 0 ? total_ms / static_cast<double>(sampled) : 0.0;
    }
    {
        std::lock_guard lock(notification_mutex_);
        for (const auto& n : notifications_) {
            if (!n.acknowledged) ++s.unacknowledged_notifications;
        }
    }
    return s;
}

Json::Value HealthMonitor::summary_json() const {
    const auto s = summary();
    Json::Value root(Json::objectValue);
    root["overall_status"] = std::string{to_string(s.overall)};
    root["tracked_networks"] = Json::UInt64{s.tracked_networks};
    root["tracked_workers"] = Json::UInt64{s.tracked_workers};
    root["healthy"] = Json::UInt64{s.healthy};
    root["warning"] = Json::UInt64{s.warning};
    root["critical"] = Json::UInt64{s.critical};
    root["unknown"] = Json::UInt64{s.unknown};
    root["average_response_ms"] = s.average_response_ms;
    root["unacknowledged_notifications"] = Json::UInt64{s.unacknowledged_notifications};

    Json::Value nets(Json::objectValue);
    for (const auto& info : networks()) nets[info.network_id] = health_to_json(info);
    root["networks"] = nets;

    Json::Value workers_json(Json::objectValue);
    for (const auto& info : workers()) {
        auto entry = health_to_json(info);
        entry["network_id"] = info.network_id;
        Json::Value blocks(Json::arrayValue);
        for (const auto& b : info.model_blocks) blocks.append(b);
        entry["model_blocks"] = blocks;
        workers_json[info.worker_id] = entry;
    }
    root["workers"] = workers_json;
    return root;
}

// ─────────────────────────────────────────────
// Admin notifications
// ─────────────────────────────────────────────

NotificationId HealthMonitor::create_admin_notification(NotificationSeverity severity,
                                                        std::string source,
                                                        std::string message,
                                                        Json::Value details) {
    AdminNotification notification;
    {
        std::lock_guard lock(notification_mutex_);
        const auto now = std::chrono::system_clock::now();
        notification.notification_id = "notif_" + std::to_string(to_unix_ms(now)) + "_"
                                      + std::to_string(notification_seq_++);
        notification.severity = severity;
        notification.source = std::move(source);
        notification.message = std::move(message);
        notification.details = std::move(details);
        notification.timestamp = now;

        notifications_.push_back(notification);
        while (notifications_.size() > config_.max_notifications) {
            notifications_.pop_front();
        }
    }

    logger_.info("Admin notification " + std::string{to_string(severity)} + ": "
                 + notification.message);

    std::vector<NotificationCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = notification_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(notification);
        } catch (const std::exception& e) {
            logger_.error("Notification callback failed: " + std::string{e.what()});
        }
    }
    return notification.notification_id;
}

bool HealthMonitor::acknowledge_notification(const NotificationId& notification_id,
                                             const std::string& admin_id) {
    std::lock_guard lock(notification_mutex_);
    for (auto& n : notifications_) {
        if (n.notification_id == notification_id) {
            n.acknowledged = true;
            n.acknowledged_by = admin_id;
            n.acknowledged_at = std::chrono::system_clock::now();
            logger_.info("Notification acknowledged: " + notification_id + " by " + admin_id);
            return true;
        }
    }
    return false;
}

std::vector<AdminNotification> HealthMonitor::notifications(bool unacknowledged_only) const {
    std::lock_guard lock(notification_mutex_);
    std::vector<AdminNotification> out;
    for (const auto& n : notifications_) {
        if (!unacknowledged_only || !n.acknowledged) out.push_back(n);
    }
    return out;
}

Json::Value HealthMonitor::notifications_json(bool unacknowledged_only) const {
    Json::Value arr(Json::arrayValue);
    for (const auto& n : notifications(unacknowledged_only)) arr.append(notification_to_json(n));
    return arr;
}

// ─────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────

void HealthMonitor::on_health_change(HealthChangeCallback callback) {
    std::lock_guard lock(callback_mutex_);
    change_callbacks_.push_back(std::move(callback));
}

void HealthMonitor::on_failure(FailureCallback callback) {
    std::lock_guard lock(callback_mutex_);
    failure_callbacks_.push_back(std::move(callback));
}

void HealthMonitor::on_notification(NotificationCallback callback) {
    std::lock_guard lock(callback_mutex_);
    notification_callbacks_.push_back(std::move(callback));
}

}  // namespace model_mesh
