/**
 * @file wire_codec.hpp
 * @brief JSON envelope for chunked block transfer and its acknowledgment.
 *
 * Chunk:  {"transfer_id","block_id","block_index","total_size","chunk_index",
 *          "chunk_data"(base64),"is_final_chunk"}
 * Ack:    {"status":"success"|"error","error"?}
 *
 * The concatenated chunk_data of one block is nonce || ciphertext || tag
 * produced by the session's transport key; total_size is its length.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace model_mesh {

inline constexpr uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;

struct ChunkMessage {
    std::string transfer_id;
    BlockId block_id;
    uint32_t block_index{0};
    uint64_t total_size{0};
    uint32_t chunk_index{0};
    std::string chunk_data;     ///< base64
    bool is_final_chunk{false};
};

struct TransferAck {
    bool success{true};
    std::string error;

    static TransferAck ok() { return TransferAck{}; }
    static TransferAck failure(std::string message) {
        return TransferAck{.success = false, .error = std::move(message)};
    }
};

[[nodiscard]] std::string encode_chunk(const ChunkMessage& message);
Result<ChunkMessage> decode_chunk(std::string_view text);

[[nodiscard]] std::string encode_ack(const TransferAck& ack);
Result<TransferAck> decode_ack(std::string_view text);

/**
 * @brief Split @p data into views of at most @p chunk_size bytes.
 *
 * Always returns at least one (possibly empty) chunk.
 */
[[nodiscard]] std::vector<std::span<const uint8_t>> split_into_chunks(
    std::span<const uint8_t> data, size_t chunk_size);

/// transfer_id = <session_id>/<block_index>
[[nodiscard]] std::string make_transfer_id(const SessionId& session_id, uint32_t block_index);
[[nodiscard]] std::optional<SessionId> session_of_transfer(std::string_view transfer_id);

}  // namespace model_mesh
