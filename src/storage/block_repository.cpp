/**
 * @file block_repository.cpp
 * @brief BlockRepository implementation.
 */

#include "storage/block_repository.hpp"

#include "core/json_util.hpp"
#include "crypto/block_cipher.hpp"

#include <algorithm>
#include <mutex>

namespace model_mesh {

std::optional<EncryptedBlock> BlockRepository::find_block(const BlockId& id) const {
    std::shared_lock lock(mutex_);
    auto it = blocks_.find(id);
    if (it == blocks_.end()) return std::nullopt;
    return it->second;
}

std::optional<EncryptionKey> BlockRepository::find_key(const KeyId& id) const {
    std::shared_lock lock(mutex_);
    auto it = keys_.find(id);
    if (it == keys_.end()) return std::nullopt;
    return it->second;
}

void BlockRepository::put_key(EncryptionKey key) {
    std::unique_lock lock(mutex_);
    auto id = key.key_id;
    keys_.insert_or_assign(std::move(id), std::move(key));
}

void BlockRepository::put_block(EncryptedBlock block) {
    std::unique_lock lock(mutex_);
    auto id = block.block_id;
    blocks_.insert_or_assign(std::move(id), std::move(block));
}

bool BlockRepository::remove_block(const BlockId& id) {
    std::unique_lock lock(mutex_);
    return blocks_.erase(id) > 0;
}

Result<std::vector<EncryptedBlock>> BlockRepository::export_model(
    const ModelId& model_id, std::span<const uint8_t> plaintext, size_t block_size) {
    if (model_id.empty() || plaintext.empty() || block_size == 0) {
        return Error{"export requires a model id, data and a positive block size",
                     ErrorKind::InvalidInput};
    }

    auto key_id = model_id + "_key";
    auto key = find_key(key_id);
    if (!key) {
        auto generated = crypto::generate_key(key_id);
        if (!generated) return generated.error();
        key = *generated;
        put_key(*key);
    }

    std::vector<EncryptedBlock> blocks;
    uint32_t index = 0;
    for (size_t offset = 0; offset < plaintext.size(); offset += block_size, ++index) {
        auto len = std::min(block_size, plaintext.size() - offset);
        auto block = encrypt_block(model_id, plaintext.subspan(offset, len), index, *key);
        if (!block) return block.error();
        blocks.push_back(std::move(*block));
    }

    std::unique_lock lock(mutex_);
    for (const auto& block : blocks) {
        blocks_.insert_or_assign(block.block_id, block);
    }
    return blocks;
}

size_t BlockRepository::revoke_key(const KeyId& key_id) {
    std::unique_lock lock(mutex_);
    keys_.erase(key_id);
    return std::erase_if(blocks_, [&](const auto& entry) {
        return entry.second.key_id == key_id;
    });
}

std::vector<EncryptedBlock> BlockRepository::blocks_for_model(const ModelId& model_id) const {
    std::vector<EncryptedBlock> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, block] : blocks_) {
            if (block.model_id == model_id) out.push_back(block);
        }
    }
    std::sort(out.begin(), out.end(), [](const EncryptedBlock& a, const EncryptedBlock& b) {
        return a.block_index < b.block_index;
    });
    return out;
}

std::vector<EncryptedBlock> BlockRepository::find_blocks(const std::vector<BlockId>& ids) const {
    std::vector<EncryptedBlock> out;
    std::shared_lock lock(mutex_);
    for (const auto& id : ids) {
        if (auto it = blocks_.find(id); it != blocks_.end()) out.push_back(it->second);
    }
    return out;
}

size_t BlockRepository::block_count() const {
    std::shared_lock lock(mutex_);
    return blocks_.size();
}

size_t BlockRepository::key_count() const {
    std::shared_lock lock(mutex_);
    return keys_.size();
}

Result<std::filesystem::path> BlockRepository::save_manifest(
    const ModelId& model_id, const std::filesystem::path& dir) const {
    Manifest manifest{.model_id = model_id, .blocks = blocks_for_model(model_id)};
    if (manifest.blocks.empty()) {
        return Error{"no blocks stored for model " + model_id, ErrorKind::NotFound};
    }
    auto path = dir / (model_id + ".manifest.json");
    if (auto written = json::write_file(path, manifest_to_json(manifest)); !written) {
        return written.error();
    }
    return path;
}

Result<size_t> BlockRepository::load_manifest(const std::filesystem::path& path) {
    auto doc = json::read_file(path);
    if (!doc) return doc.error();
    auto manifest = manifest_from_json(*doc);
    if (!manifest) return manifest.error();

    size_t count = manifest->blocks.size();
    std::unique_lock lock(mutex_);
    for (auto& block : manifest->blocks) {
        auto id = block.block_id;
        blocks_.insert_or_assign(std::move(id), std::move(block));
    }
    return count;
}

Result<std::filesystem::path> BlockRepository::save_key(
    const KeyId& key_id, const std::filesystem::path& dir) const {
    auto key = find_key(key_id);
    if (!key) {
        return Error{"unknown key " + key_id, ErrorKind::NotFound};
    }
    auto path = dir / (key_id + ".key.json");
    if (auto written = json::write_file(path, key_to_json(*key)); !written) {
        return written.error();
    }
    std::error_code ec;
    std::filesystem::permissions(path, std::filesystem::perms::owner_read
                                     | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    return path;
}

Result<KeyId> BlockRepository::load_key(const std::filesystem::path& path) {
    auto doc = json::read_file(path);
    if (!doc) return doc.error();
    auto key = key_from_json(*doc);
    if (!key) return key.error();
    auto id = key->key_id;
    put_key(std::move(*key));
    return id;
}

}  // namespace model_mesh
