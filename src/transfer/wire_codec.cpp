/**
 * @file wire_codec.cpp
 * @brief Chunk envelope and acknowledgment codec (jsoncpp).
 */

#include "transfer/wire_codec.hpp"

#include "core/json_util.hpp"

#include <algorithm>

namespace model_mesh {

std::string encode_chunk(const ChunkMessage& message) {
    Json::Value v(Json::objectValue);
    v["transfer_id"] = message.transfer_id;
    v["block_id"] = message.block_id;
    v["block_index"] = Json::UInt(message.block_index);
    v["total_size"] = Json::UInt64(message.total_size);
    v["chunk_index"] = Json::UInt(message.chunk_index);
    v["chunk_data"] = message.chunk_data;
    v["is_final_chunk"] = message.is_final_chunk;
    return json::write_compact(v);
}

Result<ChunkMessage> decode_chunk(std::string_view text) {
    auto doc = json::parse(text);
    if (!doc) return doc.error();

    auto transfer_id = json::get_string(*doc, "transfer_id");
    auto block_id = json::get_string(*doc, "block_id");
    auto block_index = json::get_uint(*doc, "block_index");
    auto total_size = json::get_uint(*doc, "total_size");
    auto chunk_index = json::get_uint(*doc, "chunk_index");
    auto chunk_data = json::get_string(*doc, "chunk_data");
    auto is_final = json::get_bool(*doc, "is_final_chunk");

    if (!transfer_id || !block_id || !block_index || !total_size
        || !chunk_index || !chunk_data || !is_final) {
        return Error{"chunk message is missing required fields", ErrorKind::InvalidInput};
    }
    if (transfer_id->empty() || block_id->empty()) {
        return Error{"chunk message has empty identifiers", ErrorKind::InvalidInput};
    }

    return ChunkMessage{
        .transfer_id = std::move(*transfer_id),
        .block_id = std::move(*block_id),
        .block_index = static_cast<uint32_t>(*block_index),
        .total_size = *total_size,
        .chunk_index = static_cast<uint32_t>(*chunk_index),
        .chunk_data = std::move(*chunk_data),
        .is_final_chunk = *is_final,
    };
}

std::string encode_ack(const TransferAck& ack) {
    Json::Value v(Json::objectValue);
    v["status"] = ack.success ? "success" : "error";
    if (!ack.success) {
        v["error"] = ack.error;
    }
    return json::write_compact(v);
}

Result<TransferAck> decode_ack(std::string_view text) {
    auto doc = json::parse(text);
    if (!doc) return doc.error();

    auto status = json::get_string(*doc, "status");
    if (!status || (*status != "success" && *status != "error")) {
        return Error{"acknowledgment has no valid status", ErrorKind::InvalidInput};
    }
    if (*status == "success") return TransferAck::ok();
    return TransferAck::failure(json::get_string(*doc, "error").value_or("unspecified error"));
}

std::vector<std::span<const uint8_t>> split_into_chunks(std::span<const uint8_t> data,
                                                        size_t chunk_size) {
    chunk_size = std::max<size_t>(chunk_size, 1);
    std::vector<std::span<const uint8_t>> chunks;
    if (data.empty()) {
        chunks.push_back(data);
        return chunks;
    }
    for (size_t offset = 0; offset < data.size(); offset += chunk_size) {
        chunks.push_back(data.subspan(offset, std::min(chunk_size, data.size() - offset)));
    }
    return chunks;
}

std::string make_transfer_id(const SessionId& session_id, uint32_t block_index) {
    return session_id + "/" + std::to_string(block_index);
}

std::optional<SessionId> session_of_transfer(std::string_view transfer_id) {
    auto slash = transfer_id.rfind('/');
    if (slash == std::string_view::npos || slash == 0) return std::nullopt;
    return SessionId{transfer_id.substr(0, slash)};
}

}  // namespace model_mesh
