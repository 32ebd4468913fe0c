/**
 * @file block_codec.cpp
 * @brief EncryptedBlock / EncryptionKey / Manifest JSON codec.
 */

#include "storage/block_codec.hpp"

#include "core/json_util.hpp"
#include "crypto/block_cipher.hpp"

#include <algorithm>

namespace model_mesh {

namespace {

template <size_t N>
Result<std::array<uint8_t, N>> fixed_from_hex(const std::optional<std::string>& text,
                                              const char* field) {
    if (!text) {
        return Error{std::string{"missing field: "} + field, ErrorKind::InvalidInput};
    }
    auto bytes = crypto::from_hex(*text);
    if (!bytes) return bytes.error();
    if (bytes->size() != N) {
        return Error{std::string{"wrong length for "} + field, ErrorKind::InvalidInput};
    }
    std::array<uint8_t, N> out{};
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return out;
}

}  // anonymous namespace

Json::Value block_to_json(const EncryptedBlock& block) {
    Json::Value v(Json::objectValue);
    v["block_id"] = block.block_id;
    v["model_id"] = block.model_id;
    v["block_index"] = Json::UInt(block.block_index);
    v["ciphertext"] = crypto::base64_encode(block.ciphertext);
    v["nonce"] = crypto::to_hex(block.nonce);
    v["tag"] = crypto::to_hex(block.tag);
    v["key_id"] = block.key_id;
    v["original_size"] = Json::UInt64(block.original_size);
    v["encrypted_size"] = Json::UInt64(block.encrypted_size);
    v["checksum"] = block.checksum;
    v["created_at"] = Json::Int64(to_unix_ms(block.created_at));
    return v;
}

Result<EncryptedBlock> block_from_json(const Json::Value& value) {
    EncryptedBlock block;

    auto block_id = json::get_string(value, "block_id");
    auto model_id = json::get_string(value, "model_id");
    auto index = json::get_uint(value, "block_index");
    auto ciphertext = json::get_string(value, "ciphertext");
    auto key_id = json::get_string(value, "key_id");
    auto checksum = json::get_string(value, "checksum");
    if (!block_id || !model_id || !index || !ciphertext || !key_id || !checksum) {
        return Error{"block record is missing required fields", ErrorKind::InvalidInput};
    }

    auto decoded = crypto::base64_decode(*ciphertext);
    if (!decoded) return decoded.error();
    auto nonce = fixed_from_hex<NONCE_SIZE>(json::get_string(value, "nonce"), "nonce");
    if (!nonce) return nonce.error();
    auto tag = fixed_from_hex<TAG_SIZE>(json::get_string(value, "tag"), "tag");
    if (!tag) return tag.error();

    block.block_id = *block_id;
    block.model_id = *model_id;
    block.block_index = static_cast<uint32_t>(*index);
    block.ciphertext = std::move(*decoded);
    block.nonce = *nonce;
    block.tag = *tag;
    block.key_id = *key_id;
    block.original_size = json::get_uint(value, "original_size").value_or(0);
    block.encrypted_size = json::get_uint(value, "encrypted_size")
                               .value_or(block.ciphertext.size());
    block.checksum = *checksum;
    block.created_at = from_unix_ms(json::get_int(value, "created_at").value_or(0));
    return block;
}

Json::Value key_to_json(const EncryptionKey& key) {
    Json::Value v(Json::objectValue);
    v["key_id"] = key.key_id;
    v["algorithm"] = key.algorithm;
    v["key_bytes"] = crypto::to_hex(key.key_bytes);
    v["created_at"] = Json::Int64(to_unix_ms(key.created_at));
    return v;
}

Result<EncryptionKey> key_from_json(const Json::Value& value) {
    auto key_id = json::get_string(value, "key_id");
    if (!key_id || key_id->empty()) {
        return Error{"key record is missing key_id", ErrorKind::InvalidInput};
    }
    auto algorithm = json::get_string(value, "algorithm").value_or(std::string{KEY_ALGORITHM});
    if (algorithm != KEY_ALGORITHM) {
        return Error{"unsupported key algorithm: " + algorithm, ErrorKind::InvalidInput};
    }
    auto bytes = fixed_from_hex<KEY_SIZE>(json::get_string(value, "key_bytes"), "key_bytes");
    if (!bytes) return bytes.error();

    EncryptionKey key;
    key.key_id = *key_id;
    key.algorithm = algorithm;
    key.key_bytes = *bytes;
    key.created_at = from_unix_ms(json::get_int(value, "created_at").value_or(0));
    return key;
}

Json::Value manifest_to_json(const Manifest& manifest) {
    Json::Value v(Json::objectValue);
    v["model_id"] = manifest.model_id;
    v["total_blocks"] = Json::UInt64(manifest.blocks.size());
    Json::Value blocks(Json::arrayValue);
    for (const auto& block : manifest.blocks) {
        blocks.append(block_to_json(block));
    }
    v["blocks"] = std::move(blocks);
    return v;
}

Result<Manifest> manifest_from_json(const Json::Value& value) {
    auto model_id = json::get_string(value, "model_id");
    if (!model_id || !value.isMember("blocks") || !value["blocks"].isArray()) {
        return Error{"manifest is missing model_id or blocks", ErrorKind::InvalidInput};
    }

    Manifest manifest;
    manifest.model_id = *model_id;
    for (const auto& item : value["blocks"]) {
        auto block = block_from_json(item);
        if (!block) return block.error();
        if (block->model_id != manifest.model_id) {
            return Error{"block " + block->block_id + " belongs to another model",
                         ErrorKind::InvalidInput};
        }
        manifest.blocks.push_back(std::move(*block));
    }

    auto declared = json::get_uint(value, "total_blocks");
    if (declared && *declared != manifest.blocks.size()) {
        return Error{"manifest total_blocks does not match block list",
                     ErrorKind::InvalidInput};
    }

    std::sort(manifest.blocks.begin(), manifest.blocks.end(),
              [](const EncryptedBlock& a, const EncryptedBlock& b) {
                  return a.block_index < b.block_index;
              });
    return manifest;
}

}  // namespace model_mesh
