/**
 * @file block_receiver.hpp
 * @brief Peer-side reassembly, decryption and verification of transferred blocks.
 */

#pragma once

#include "core/logger.hpp"
#include "crypto/encrypted_block.hpp"
#include "storage/block_repository.hpp"
#include "transfer/wire_codec.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace model_mesh {

/**
 * @brief Accepts chunk messages and stores completed blocks.
 *
 * Chunks of one transfer must arrive in order; chunk 0 always restarts the
 * transfer so a sender retry begins from a clean buffer. When the final
 * chunk arrives the payload is decrypted with the session key, parsed as an
 * EncryptedBlock and, if the at-rest key is known locally, run through the
 * integrity gate before being stored.
 *
 * A transfer that receives no chunk for longer than max_idle is abandoned
 * (sender cancelled, paused or gave up) and its buffer is evicted.
 */
class BlockReceiver {
public:
    using KeyResolver = std::function<std::optional<EncryptionKey>(const SessionId&)>;
    using SteadyClock = std::chrono::steady_clock;

    BlockReceiver(BlockRepository& store, KeyResolver resolver, Logger& logger,
                  Duration max_idle = std::chrono::minutes{5});

    /// Process one chunk message; returns the encoded acknowledgment.
    [[nodiscard]] std::string handle_message(std::string_view message);

    [[nodiscard]] uint64_t blocks_received() const noexcept { return blocks_received_.load(); }
    [[nodiscard]] size_t pending_transfers() const;

    /// Drop partial transfers idle since before @p now - max_idle; returns the count dropped.
    size_t evict_stale(SteadyClock::time_point now);

private:
    struct PartialTransfer {
        BlockId block_id;
        uint64_t total_size{0};
        uint32_t next_chunk{0};
        Bytes data;
        SteadyClock::time_point last_activity;
    };

    size_t evict_stale_locked(SteadyClock::time_point now);

    TransferAck accept_chunk(const ChunkMessage& chunk);
    TransferAck finish_transfer(const ChunkMessage& chunk, Bytes wire);

    BlockRepository& store_;
    KeyResolver resolver_;
    Logger& logger_;
    Duration max_idle_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PartialTransfer> partial_;
    std::atomic<uint64_t> blocks_received_{0};
};

}  // namespace model_mesh
