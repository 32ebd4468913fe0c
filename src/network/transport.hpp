/**
 * @file transport.hpp
 * @brief TCP transport with length-prefixed framing.
 *
 * Carries the block-transfer envelope and heartbeat messages between nodes.
 * Messages are framed as [4-byte big-endian length][payload]. Uses
 * non-blocking sockets with poll() so every wait is bounded by a timeout.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace model_mesh {

/**
 * @brief Length-prefixed TCP transport.
 *
 * Wire format per message:
 *   [uint32_t big-endian length][payload bytes]
 *
 * All I/O failures are reported with ErrorKind::TransientTransport so the
 * caller's retry policy can treat them uniformly.
 */
class TcpTransport {
public:
    static constexpr uint32_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16 MB
    static constexpr int DEFAULT_BACKLOG = 16;

    TcpTransport();
    ~TcpTransport();

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // ── Client-side ──────────────────────────
    /// @p host may be a dotted IPv4 address or a resolvable host name.
    Result<void> connect(const std::string& host, uint16_t port,
                         uint32_t timeout_ms = 5000);
    Result<void> send(const Bytes& data, uint32_t timeout_ms = 5000);
    Result<Bytes> receive(uint32_t timeout_ms = 10000);
    void disconnect();

    /// Connect, send one request, wait for one response, disconnect.
    static Result<Bytes> request(const std::string& host, uint16_t port,
                                 const Bytes& payload, uint32_t timeout_ms);

    // ── Server-side ──────────────────────────
    using MessageHandler = std::function<Bytes(const Bytes&)>;

    /// Port 0 asks the OS for a free port; see bound_port().
    Result<void> listen(uint16_t port, int backlog = DEFAULT_BACKLOG);

    /// Accept connections on a background thread. Each connection may carry
    /// any number of request/response exchanges until the peer closes it.
    void serve(MessageHandler handler);
    void stop_serving();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }

private:
    void handle_connection(int fd, const MessageHandler& handler, std::stop_token stop);

    // Wire helpers
    static Result<void> send_on_fd(int fd, const Bytes& data, uint32_t timeout_ms);
    static Result<Bytes> recv_on_fd(int fd, uint32_t timeout_ms);
    static bool send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms);
    static bool recv_all(int fd, void* buf, size_t len, uint32_t timeout_ms);

    int client_fd_ = -1;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::jthread serve_thread_;
    std::atomic<bool> serving_{false};
};

}  // namespace model_mesh
