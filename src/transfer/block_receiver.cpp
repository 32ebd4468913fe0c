/**
 * @file block_receiver.cpp
 * @brief BlockReceiver implementation.
 */

#include "transfer/block_receiver.hpp"

#include "core/json_util.hpp"
#include "crypto/block_cipher.hpp"
#include "storage/block_codec.hpp"
#include "transfer/transfer_types.hpp"

namespace model_mesh {

BlockReceiver::BlockReceiver(BlockRepository& store, KeyResolver resolver, Logger& logger,
                             Duration max_idle)
    : store_(store), resolver_(std::move(resolver)), logger_(logger), max_idle_(max_idle) {}

std::string BlockReceiver::handle_message(std::string_view message) {
    auto chunk = decode_chunk(message);
    if (!chunk) {
        logger_.warn("Rejected malformed chunk message: " + chunk.error().message);
        return encode_ack(TransferAck::failure(chunk.error().message));
    }
    return encode_ack(accept_chunk(*chunk));
}

size_t BlockReceiver::pending_transfers() const {
    std::lock_guard lock(mutex_);
    return partial_.size();
}

size_t BlockReceiver::evict_stale(SteadyClock::time_point now) {
    std::lock_guard lock(mutex_);
    return evict_stale_locked(now);
}

size_t BlockReceiver::evict_stale_locked(SteadyClock::time_point now) {
    auto evicted = std::erase_if(partial_, [this, now](const auto& entry) {
        return now - entry.second.last_activity > max_idle_;
    });
    if (evicted > 0) {
        logger_.info("Evicted " + std::to_string(evicted) + " abandoned partial transfer(s)");
    }
    return evicted;
}

TransferAck BlockReceiver::accept_chunk(const ChunkMessage& chunk) {
    auto data = crypto::base64_decode(chunk.chunk_data);
    if (!data) {
        return TransferAck::failure("chunk_data is not valid base64");
    }

    Bytes completed;
    {
        std::lock_guard lock(mutex_);
        const auto now = SteadyClock::now();
        if (chunk.chunk_index == 0) {
            evict_stale_locked(now);
            partial_[chunk.transfer_id] = PartialTransfer{
                .block_id = chunk.block_id, .total_size = chunk.total_size};
        }

        auto it = partial_.find(chunk.transfer_id);
        if (it == partial_.end() || it->second.next_chunk != chunk.chunk_index
            || it->second.block_id != chunk.block_id) {
            partial_.erase(chunk.transfer_id);
            return TransferAck::failure("unexpected chunk " + std::to_string(chunk.chunk_index)
                                        + " for " + chunk.transfer_id);
        }

        auto& partial = it->second;
        partial.data.insert(partial.data.end(), data->begin(), data->end());
        ++partial.next_chunk;
        partial.last_activity = now;

        if (partial.data.size() > partial.total_size) {
            partial_.erase(it);
            return TransferAck::failure("received more bytes than announced");
        }
        if (!chunk.is_final_chunk) {
            return TransferAck::ok();
        }
        if (partial.data.size() != partial.total_size) {
            partial_.erase(it);
            return TransferAck::failure("final chunk arrived before all bytes");
        }
        completed = std::move(partial.data);
        partial_.erase(it);
    }

    return finish_transfer(chunk, std::move(completed));
}

TransferAck BlockReceiver::finish_transfer(const ChunkMessage& chunk, Bytes wire) {
    auto session_id = session_of_transfer(chunk.transfer_id);
    std::optional<EncryptionKey> session_key;
    if (session_id) session_key = resolver_(*session_id);
    if (!session_key) {
        return TransferAck::failure("unknown transfer session for " + chunk.transfer_id);
    }

    auto payload = crypto::decrypt_transport(*session_key, wire);
    if (!payload) {
        logger_.warn("Transport decryption failed for " + chunk.transfer_id + ": "
                     + payload.error().message);
        return TransferAck::failure("transport decryption failed");
    }

    auto doc = json::parse(std::string_view{reinterpret_cast<const char*>(payload->data()),
                                            payload->size()});
    if (!doc) {
        return TransferAck::failure("block payload is not valid JSON");
    }
    auto block = block_from_json(*doc);
    if (!block) {
        return TransferAck::failure(block.error().message);
    }

    bool consistent = block->block_id == chunk.block_id
                   && block->block_index == chunk.block_index
                   && block->encrypted_size == block->ciphertext.size()
                   && !block->ciphertext.empty();
    if (consistent) {
        if (auto at_rest_key = store_.find_key(block->key_id)) {
            consistent = verify_block_integrity(*block, *at_rest_key);
        }
    }
    if (!consistent) {
        logger_.error("Integrity check failed for received block " + chunk.block_id);
        return TransferAck::failure(std::string{INTEGRITY_FAILURE_MESSAGE});
    }

    logger_.debug("Stored block " + block->block_id + " (" +
                  std::to_string(block->encrypted_size) + " bytes)");
    store_.put_block(std::move(*block));
    ++blocks_received_;
    return TransferAck::ok();
}

}  // namespace model_mesh
