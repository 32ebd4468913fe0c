/**
 * @file block_codec.hpp
 * @brief JSON representation of EncryptedBlock, EncryptionKey and manifests.
 *
 * Block layout:
 *   {"block_id","model_id","block_index","ciphertext"(base64),"nonce"(hex),
 *    "tag"(hex),"key_id","original_size","encrypted_size","checksum","created_at"(unix ms)}
 *
 * Manifest layout:
 *   {"model_id","total_blocks","blocks":[<block>, ...]}
 */

#pragma once

#include "core/result.hpp"
#include "crypto/encrypted_block.hpp"

#include <json/json.h>

#include <vector>

namespace model_mesh {

struct Manifest {
    ModelId model_id;
    std::vector<EncryptedBlock> blocks;   ///< Ordered by block_index
};

[[nodiscard]] Json::Value block_to_json(const EncryptedBlock& block);
Result<EncryptedBlock> block_from_json(const Json::Value& value);

[[nodiscard]] Json::Value key_to_json(const EncryptionKey& key);
Result<EncryptionKey> key_from_json(const Json::Value& value);

[[nodiscard]] Json::Value manifest_to_json(const Manifest& manifest);
Result<Manifest> manifest_from_json(const Json::Value& value);

}  // namespace model_mesh
