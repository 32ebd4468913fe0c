/**
 * @file block_channel.hpp
 * @brief Connection abstraction used by the transfer engine to reach a peer.
 */

#pragma once

#include "core/result.hpp"
#include "transfer/transfer_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace model_mesh {

class BlockReceiver;

/**
 * @brief One request/response exchange with a peer.
 *
 * Implementations must be safe to call from several transfer workers at
 * once. Transport failures are reported as ErrorKind::TransientTransport.
 */
class IBlockChannel {
public:
    virtual ~IBlockChannel() = default;

    virtual Result<std::string> exchange(std::string_view message,
                                         std::chrono::milliseconds timeout) = 0;
    [[nodiscard]] virtual TransferMethod method() const noexcept = 0;
};

/**
 * @brief Direct socket channel over the framed TCP transport.
 *
 * Opens one connection per exchange, so concurrent callers never share a socket.
 */
class TcpBlockChannel : public IBlockChannel {
public:
    TcpBlockChannel(std::string host, uint16_t port);

    Result<std::string> exchange(std::string_view message,
                                 std::chrono::milliseconds timeout) override;
    [[nodiscard]] TransferMethod method() const noexcept override {
        return TransferMethod::DirectStream;
    }

private:
    std::string host_;
    uint16_t port_;
};

/**
 * @brief Delivers messages straight to an in-process BlockReceiver.
 */
class LoopbackChannel : public IBlockChannel {
public:
    explicit LoopbackChannel(BlockReceiver& receiver);

    Result<std::string> exchange(std::string_view message,
                                 std::chrono::milliseconds timeout) override;
    [[nodiscard]] TransferMethod method() const noexcept override {
        return TransferMethod::Loopback;
    }

private:
    BlockReceiver& receiver_;
};

}  // namespace model_mesh
