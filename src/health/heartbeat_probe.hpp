/**
 * @file heartbeat_probe.hpp
 * @brief Heartbeat probes: TCP request/response and a scripted mock.
 *
 * Heartbeat wire messages ride the framed TCP transport:
 *   request  {"type":"heartbeat","target":<id>}
 *   response {"type":"heartbeat_ack","node":<responder id>}
 */

#pragma once

#include "health/health_types.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace model_mesh {

inline constexpr std::string_view HEARTBEAT_TYPE = "heartbeat";
inline constexpr std::string_view HEARTBEAT_ACK_TYPE = "heartbeat_ack";

[[nodiscard]] std::string encode_heartbeat(const std::string& target);
[[nodiscard]] std::string encode_heartbeat_ack(const NodeId& responder);

/// True if @p message is a heartbeat request.
[[nodiscard]] bool is_heartbeat(std::string_view message);

class TcpHeartbeatProbe : public IHealthProbe {
public:
    ProbeResult probe(const std::string& id, const std::string& host, uint16_t port,
                      Duration timeout) override;
};

/**
 * @brief Probe returning scripted results for testing and simulation.
 *
 * Per-id queued results are consumed first; afterwards the id's sticky
 * result (default: success, 1 ms) is returned.
 */
class MockHealthProbe : public IHealthProbe {
public:
    ProbeResult probe(const std::string& id, const std::string& host, uint16_t port,
                      Duration timeout) override;

    void set_alive(const std::string& id, bool alive);
    void push_result(const std::string& id, ProbeResult result);
    [[nodiscard]] size_t probe_count(const std::string& id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<ProbeResult>> queued_;
    std::unordered_map<std::string, ProbeResult> sticky_;
    std::unordered_map<std::string, size_t> counts_;
};

}  // namespace model_mesh
