/**
 * @file block_repository.hpp
 * @brief Thread-safe store of at-rest keys and encrypted model blocks.
 */

#pragma once

#include "core/result.hpp"
#include "crypto/encrypted_block.hpp"
#include "storage/block_codec.hpp"

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace model_mesh {

/**
 * @brief Read-only view used by the transfer engine to locate payloads.
 */
class IBlockSource {
public:
    virtual ~IBlockSource() = default;

    [[nodiscard]] virtual std::optional<EncryptedBlock> find_block(const BlockId& id) const = 0;
    [[nodiscard]] virtual std::optional<EncryptionKey> find_key(const KeyId& id) const = 0;
};

/**
 * @brief In-memory repository with manifest / key-file persistence.
 *
 * Readers take a shared lock; mutations take an exclusive lock.
 */
class BlockRepository : public IBlockSource {
public:
    BlockRepository() = default;

    // Non-copyable
    BlockRepository(const BlockRepository&) = delete;
    BlockRepository& operator=(const BlockRepository&) = delete;

    // ── IBlockSource ─────────────────────────
    [[nodiscard]] std::optional<EncryptedBlock> find_block(const BlockId& id) const override;
    [[nodiscard]] std::optional<EncryptionKey> find_key(const KeyId& id) const override;

    // ── Mutation ─────────────────────────────
    void put_key(EncryptionKey key);
    void put_block(EncryptedBlock block);
    bool remove_block(const BlockId& id);

    /**
     * @brief Split @p plaintext into blocks of @p block_size bytes and encrypt them.
     *
     * A key named <model>_key is generated unless one already exists.
     * Returns the new blocks ordered by block_index.
     */
    Result<std::vector<EncryptedBlock>> export_model(const ModelId& model_id,
                                                     std::span<const uint8_t> plaintext,
                                                     size_t block_size);

    /// Destroy a key and every block encrypted with it. Returns the number of blocks removed.
    size_t revoke_key(const KeyId& key_id);

    // ── Queries ──────────────────────────────
    [[nodiscard]] std::vector<EncryptedBlock> blocks_for_model(const ModelId& model_id) const;
    [[nodiscard]] std::vector<EncryptedBlock> find_blocks(const std::vector<BlockId>& ids) const;
    [[nodiscard]] size_t block_count() const;
    [[nodiscard]] size_t key_count() const;

    // ── Persistence ──────────────────────────
    /// Writes <dir>/<model>.manifest.json.
    Result<std::filesystem::path> save_manifest(const ModelId& model_id,
                                                const std::filesystem::path& dir) const;
    /// Loads every block listed in a manifest. Returns the number of blocks loaded.
    Result<size_t> load_manifest(const std::filesystem::path& path);

    /// Writes <dir>/<key_id>.key.json.
    Result<std::filesystem::path> save_key(const KeyId& key_id,
                                           const std::filesystem::path& dir) const;
    Result<KeyId> load_key(const std::filesystem::path& path);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<KeyId, EncryptionKey> keys_;
    std::unordered_map<BlockId, EncryptedBlock> blocks_;
};

}  // namespace model_mesh
