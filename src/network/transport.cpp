/**
 * @file transport.cpp
 * @brief TcpTransport implementation: length-prefixed TCP messaging.
 *
 * Wire format: [uint32_t big-endian length][payload bytes]
 * Uses poll() for non-blocking I/O with timeouts.
 */

#include "network/transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace model_mesh {

namespace {

constexpr uint32_t SERVER_IO_TIMEOUT_MS = 10000;
constexpr int ACCEPT_POLL_MS = 100;

/**
 * @brief Set TCP_NODELAY and keepalive on a connected socket.
 */
void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
}

void encode_u32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>((val >> 24) & 0xFF);
    buf[1] = static_cast<uint8_t>((val >> 16) & 0xFF);
    buf[2] = static_cast<uint8_t>((val >> 8) & 0xFF);
    buf[3] = static_cast<uint8_t>(val & 0xFF);
}

uint32_t decode_u32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24)
         | (static_cast<uint32_t>(buf[1]) << 16)
         | (static_cast<uint32_t>(buf[2]) << 8)
         | static_cast<uint32_t>(buf[3]);
}

Error transport_error(std::string message) {
    return Error{std::move(message), ErrorKind::TransientTransport};
}

/**
 * @brief Resolve @p host to an IPv4 socket address.
 */
Result<sockaddr_in> resolve(const std::string& host, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
        return transport_error("Cannot resolve " + host + ": " + ::gai_strerror(rc));
    }
    addr.sin_addr = reinterpret_cast<const sockaddr_in*>(found->ai_addr)->sin_addr;
    ::freeaddrinfo(found);
    return addr;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

TcpTransport::TcpTransport() = default;

TcpTransport::~TcpTransport() {
    stop_serving();
    disconnect();
}

// ─────────────────────────────────────────────
// Client Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::connect(const std::string& host, uint16_t port,
                                   uint32_t timeout_ms) {
    if (client_fd_ >= 0) {
        return Error{"Already connected", ErrorKind::InvalidInput};
    }

    auto server = resolve(host, port);
    if (!server) return server.error();

    client_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (client_fd_ < 0) {
        return transport_error("Failed to create socket: " + std::string(strerror(errno)));
    }

    int ret = ::connect(client_fd_, reinterpret_cast<const sockaddr*>(&*server), sizeof(sockaddr_in));
    if (ret < 0 && errno != EINPROGRESS) {
        auto err = transport_error("Connect failed: " + std::string(strerror(errno)));
        disconnect();
        return err;
    }

    if (ret < 0) {
        pollfd pfd{};
        pfd.fd = client_fd_;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) {
            disconnect();
            return transport_error("Connect to " + host + ":" + std::to_string(port)
                                   + " timed out");
        }

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(client_fd_, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            disconnect();
            return transport_error("Connect failed: " + std::string(strerror(err)));
        }
    }

    configure_socket(client_fd_);
    return Result<void>{};
}

Result<void> TcpTransport::send(const Bytes& data, uint32_t timeout_ms) {
    if (client_fd_ < 0) {
        return transport_error("Not connected");
    }
    return send_on_fd(client_fd_, data, timeout_ms);
}

Result<Bytes> TcpTransport::receive(uint32_t timeout_ms) {
    if (client_fd_ < 0) {
        return transport_error("Not connected");
    }
    return recv_on_fd(client_fd_, timeout_ms);
}

void TcpTransport::disconnect() {
    if (client_fd_ >= 0) {
        ::shutdown(client_fd_, SHUT_RDWR);
        ::close(client_fd_);
        client_fd_ = -1;
    }
}

Result<Bytes> TcpTransport::request(const std::string& host, uint16_t port,
                                    const Bytes& payload, uint32_t timeout_ms) {
    TcpTransport client;
    if (auto connected = client.connect(host, port, timeout_ms); !connected) {
        return connected.error();
    }
    if (auto sent = client.send(payload, timeout_ms); !sent) {
        return sent.error();
    }
    return client.receive(timeout_ms);
}

// ─────────────────────────────────────────────
// Server Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::listen(uint16_t port, int backlog) {
    if (server_fd_ >= 0) {
        return Error{"Already listening", ErrorKind::InvalidInput};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (server_fd_ < 0) {
        return transport_error("Failed to create server socket: " + std::string(strerror(errno)));
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = transport_error("Bind failed: " + std::string(strerror(errno)));
        ::close(server_fd_);
        server_fd_ = -1;
        return err;
    }

    if (::listen(server_fd_, backlog) < 0) {
        auto err = transport_error("Listen failed: " + std::string(strerror(errno)));
        ::close(server_fd_);
        server_fd_ = -1;
        return err;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }
    return Result<void>{};
}

void TcpTransport::serve(MessageHandler handler) {
    if (server_fd_ < 0 || serving_.exchange(true)) return;

    serve_thread_ = std::jthread([this, handler = std::move(handler)](std::stop_token stop) {
        while (!stop.stop_requested()) {
            pollfd pfd{};
            pfd.fd = server_fd_;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, ACCEPT_POLL_MS);
            if (ready <= 0) continue;

            sockaddr_in client_addr{};
            socklen_t addr_len = sizeof(client_addr);
            int client_fd = ::accept4(server_fd_,
                reinterpret_cast<sockaddr*>(&client_addr), &addr_len, SOCK_NONBLOCK);
            if (client_fd < 0) continue;

            configure_socket(client_fd);
            handle_connection(client_fd, handler, stop);

            ::shutdown(client_fd, SHUT_RDWR);
            ::close(client_fd);
        }
    });
}

void TcpTransport::handle_connection(int fd, const MessageHandler& handler,
                                     std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready == 0) continue;
        if (ready < 0 || (pfd.revents & (POLLERR | POLLNVAL))) return;

        auto request = recv_on_fd(fd, SERVER_IO_TIMEOUT_MS);
        if (!request) return;  // peer closed or sent a malformed frame

        auto response = handler(*request);
        if (!send_on_fd(fd, response, SERVER_IO_TIMEOUT_MS)) return;
    }
}

void TcpTransport::stop_serving() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    serving_ = false;
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────

bool TcpTransport::is_connected() const noexcept {
    return client_fd_ >= 0;
}

bool TcpTransport::is_listening() const noexcept {
    return server_fd_ >= 0;
}

// ─────────────────────────────────────────────
// Wire Protocol Helpers
// ─────────────────────────────────────────────

Result<void> TcpTransport::send_on_fd(int fd, const Bytes& data, uint32_t timeout_ms) {
    if (data.size() > MAX_MESSAGE_SIZE) {
        return Error{"Message too large: " + std::to_string(data.size()) + " bytes",
                     ErrorKind::InvalidInput};
    }

    uint8_t header[4];
    encode_u32(header, static_cast<uint32_t>(data.size()));
    if (!send_all(fd, header, 4, timeout_ms)) {
        return transport_error("Failed to send header");
    }

    if (!data.empty() && !send_all(fd, data.data(), data.size(), timeout_ms)) {
        return transport_error("Failed to send payload");
    }
    return Result<void>{};
}

Result<Bytes> TcpTransport::recv_on_fd(int fd, uint32_t timeout_ms) {
    uint8_t header[4];
    if (!recv_all(fd, header, 4, timeout_ms)) {
        return transport_error("Failed to receive header (timeout or connection closed)");
    }

    uint32_t length = decode_u32(header);
    if (length > MAX_MESSAGE_SIZE) {
        return transport_error("Message too large: " + std::to_string(length) + " bytes");
    }

    Bytes payload(length);
    if (length > 0 && !recv_all(fd, payload.data(), length, timeout_ms)) {
        return transport_error("Failed to receive payload");
    }
    return payload;
}

bool TcpTransport::send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms) {
    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return false;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return true;
}

bool TcpTransport::recv_all(int fd, void* buf, size_t len, uint32_t timeout_ms) {
    auto* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto received = ::recv(fd, ptr, remaining, 0);
        if (received <= 0) {
            if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) continue;
            return false;
        }

        ptr += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

}  // namespace model_mesh
