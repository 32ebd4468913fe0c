/**
 * @file heartbeat_probe.cpp
 * @brief TcpHeartbeatProbe and MockHealthProbe.
 */

#include "health/heartbeat_probe.hpp"

#include "core/json_util.hpp"
#include "network/transport.hpp"

#include <chrono>

namespace model_mesh {

std::string encode_heartbeat(const std::string& target) {
    Json::Value v(Json::objectValue);
    v["type"] = std::string{HEARTBEAT_TYPE};
    v["target"] = target;
    return json::write_compact(v);
}

std::string encode_heartbeat_ack(const NodeId& responder) {
    Json::Value v(Json::objectValue);
    v["type"] = std::string{HEARTBEAT_ACK_TYPE};
    v["node"] = responder;
    return json::write_compact(v);
}

bool is_heartbeat(std::string_view message) {
    auto parsed = json::parse(message);
    if (!parsed) return false;
    auto type = json::get_string(*parsed, "type");
    return type && *type == HEARTBEAT_TYPE;
}

// ─────────────────────────────────────────────
// TcpHeartbeatProbe
// ─────────────────────────────────────────────

ProbeResult TcpHeartbeatProbe::probe(const std::string& id, const std::string& host,
                                     uint16_t port, Duration timeout) {
    const auto payload = encode_heartbeat(id);
    const auto start = std::chrono::steady_clock::now();

    auto reply = TcpTransport::request(host, port, Bytes(payload.begin(), payload.end()),
                                       static_cast<uint32_t>(timeout.count()));
    const auto rtt = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);

    if (!reply) {
        return ProbeResult{.success = false, .response_time = rtt,
                           .error = reply.error().message};
    }

    auto parsed = json::parse(std::string_view{reinterpret_cast<const char*>(reply->data()),
                                               reply->size()});
    if (!parsed) {
        return ProbeResult{.success = false, .response_time = rtt,
                           .error = "malformed heartbeat reply"};
    }
    auto type = json::get_string(*parsed, "type");
    if (!type || *type != HEARTBEAT_ACK_TYPE) {
        return ProbeResult{.success = false, .response_time = rtt,
                           .error = "unexpected heartbeat reply"};
    }
    return ProbeResult{.success = true, .response_time = rtt, .error = {}};
}

// ─────────────────────────────────────────────
// MockHealthProbe
// ─────────────────────────────────────────────

ProbeResult MockHealthProbe::probe(const std::string& id, const std::string& /*host*/,
                                   uint16_t /*port*/, Duration /*timeout*/) {
    std::lock_guard lock(mutex_);
    ++counts_[id];

    auto queued = queued_.find(id);
    if (queued != queued_.end() && !queued->second.empty()) {
        auto result = std::move(queued->second.front());
        queued->second.pop_front();
        return result;
    }
    auto sticky = sticky_.find(id);
    if (sticky != sticky_.end()) return sticky->second;
    return ProbeResult{.success = true, .response_time = Duration{1}, .error = {}};
}

void MockHealthProbe::set_alive(const std::string& id, bool alive) {
    std::lock_guard lock(mutex_);
    sticky_[id] = alive
        ? ProbeResult{.success = true, .response_time = Duration{1}, .error = {}}
        : ProbeResult{.success = false, .response_time = Duration{0}, .error = "unreachable"};
}

void MockHealthProbe::push_result(const std::string& id, ProbeResult result) {
    std::lock_guard lock(mutex_);
    queued_[id].push_back(std::move(result));
}

size_t MockHealthProbe::probe_count(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = counts_.find(id);
    return it == counts_.end() ? 0 : it->second;
}

}  // namespace model_mesh
