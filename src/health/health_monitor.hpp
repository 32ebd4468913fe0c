/**
 * @file health_monitor.hpp
 * @brief HealthMonitor: liveness state machines for networks and workers.
 *
 * A background std::jthread probes every tracked entity each heartbeat
 * interval. Status rules per entity:
 *   success                                 -> Healthy
 *   consecutive_failures >= failure_threshold -> Critical
 *   consecutive_failures >= warning_threshold -> Warning
 *   otherwise the previous status is kept (initially Unknown)
 *
 * Transitions fire callbacks outside the state lock; a throwing callback
 * is logged and the loop continues. The monitor knows nothing of failover:
 * consumers subscribe through on_failure / on_health_change.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "health/health_types.hpp"

#include <json/json.h>

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace model_mesh {

class HealthMonitor {
public:
    using HealthChangeCallback =
        std::function<void(const std::string& id, HealthStatus old_status, HealthStatus new_status)>;
    using FailureCallback = std::function<void(const std::string& id, const std::string& message)>;
    using NotificationCallback = std::function<void(const AdminNotification&)>;

    HealthMonitor(HealthConfig config, IHealthProbe& probe, Logger& logger);
    ~HealthMonitor();

    // Non-copyable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // ── Lifecycle ────────────────────────────
    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept;

    // ── Tracked entities ─────────────────────
    void add_network(const NetworkId& network_id, std::string host, uint16_t port);
    bool remove_network(const NetworkId& network_id);
    void add_worker(const WorkerId& worker_id, const NetworkId& network_id,
                    std::string host, uint16_t port, std::vector<BlockId> blocks);
    bool remove_worker(const WorkerId& worker_id);
    bool set_worker_blocks(const WorkerId& worker_id, std::vector<BlockId> blocks);

    // ── Sampling ─────────────────────────────

    /// One heartbeat round over every tracked entity.
    void sample_all();

    /// Apply a heartbeat pushed by the entity itself. False if untracked.
    bool record_heartbeat(const std::string& id, Duration response_time);

    /// Probe @p worker_id now and return the updated snapshot.
    std::optional<WorkerHealthInfo> monitor_worker_health(const WorkerId& worker_id);
    std::optional<NetworkHealthInfo> monitor_network_health(const NetworkId& network_id);

    // ── Snapshots ────────────────────────────
    [[nodiscard]] std::optional<WorkerHealthInfo> worker_health(const WorkerId& worker_id) const;
    [[nodiscard]] std::optional<NetworkHealthInfo> network_health(const NetworkId& network_id) const;
    [[nodiscard]] std::vector<WorkerHealthInfo> workers() const;
    [[nodiscard]] std::vector<WorkerHealthInfo> network_workers(const NetworkId& network_id) const;
    [[nodiscard]] std::vector<NetworkHealthInfo> networks() const;
    [[nodiscard]] bool is_worker(const std::string& id) const;
    [[nodiscard]] bool is_network(const std::string& id) const;

    /// Unknown with nothing tracked; otherwise the worst tracked status.
    [[nodiscard]] HealthStatus overall_status() const;
    [[nodiscard]] HealthSummary summary() const;
    [[nodiscard]] Json::Value summary_json() const;

    // ── Admin notifications ──────────────────
    NotificationId create_admin_notification(NotificationSeverity severity, std::string source,
                                             std::string message,
                                             Json::Value details = Json::Value{Json::objectValue});
    bool acknowledge_notification(const NotificationId& notification_id,
                                  const std::string& admin_id);
    [[nodiscard]] std::vector<AdminNotification> notifications(bool unacknowledged_only = false) const;
    [[nodiscard]] Json::Value notifications_json(bool unacknowledged_only = false) const;

    // ── Callbacks ────────────────────────────
    void on_health_change(HealthChangeCallback callback);
    void on_failure(FailureCallback callback);
    void on_notification(NotificationCallback callback);

private:
    struct Target {
        std::string id;
        std::string host;
        uint16_t port{0};
        bool is_worker{false};
    };

    struct Transition {
        std::string id;
        bool is_worker{false};
        NetworkId network_id;
        HealthStatus old_status{HealthStatus::Unknown};
        HealthStatus new_status{HealthStatus::Unknown};
        uint32_t consecutive_failures{0};
        Duration response_time{0};
    };

    void monitoring_loop(std::stop_token stop);
    void probe_target(const Target& target);

    /// Update one entity; returns a transition if its status changed.
    template <typename Info>
    std::optional<Transition> apply_locked(Info& info, const ProbeResult& result);

    std::optional<Transition> apply(const std::string& id, const ProbeResult& result);
    void dispatch(const Transition& transition);

    HealthConfig config_;
    IHealthProbe& probe_;
    Logger& logger_;

    mutable std::shared_mutex state_mutex_;
    std::map<NetworkId, NetworkHealthInfo> networks_;
    std::map<WorkerId, WorkerHealthInfo> workers_;

    mutable std::mutex notification_mutex_;
    std::deque<AdminNotification> notifications_;
    uint64_t notification_seq_{0};

    std::mutex callback_mutex_;
    std::vector<HealthChangeCallback> change_callbacks_;
    std::vector<FailureCallback> failure_callbacks_;
    std::vector<NotificationCallback> notification_callbacks_;

    std::jthread monitor_thread_;
    std::condition_variable_any wake_;
    std::mutex wake_mutex_;
};

}  // namespace model_mesh
