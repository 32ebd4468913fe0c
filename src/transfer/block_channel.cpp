/**
 * @file block_channel.cpp
 * @brief TCP and loopback channel implementations.
 */

#include "transfer/block_channel.hpp"

#include "network/transport.hpp"
#include "transfer/block_receiver.hpp"

namespace model_mesh {

TcpBlockChannel::TcpBlockChannel(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

Result<std::string> TcpBlockChannel::exchange(std::string_view message,
                                              std::chrono::milliseconds timeout) {
    Bytes request(message.begin(), message.end());
    auto response = TcpTransport::request(host_, port_, request,
                                          static_cast<uint32_t>(timeout.count()));
    if (!response) return response.error();
    return std::string(response->begin(), response->end());
}

LoopbackChannel::LoopbackChannel(BlockReceiver& receiver) : receiver_(receiver) {}

Result<std::string> LoopbackChannel::exchange(std::string_view message,
                                              std::chrono::milliseconds /*timeout*/) {
    return receiver_.handle_message(message);
}

}  // namespace model_mesh
