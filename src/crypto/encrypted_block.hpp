/**
 * @file encrypted_block.hpp
 * @brief EncryptionKey and EncryptedBlock value types.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace model_mesh {

inline constexpr size_t KEY_SIZE = 32;     ///< AES-256
inline constexpr size_t NONCE_SIZE = 12;   ///< GCM recommended IV length
inline constexpr size_t TAG_SIZE = 16;
inline constexpr std::string_view KEY_ALGORITHM = "AES-256-GCM";

/**
 * @brief A symmetric key. Immutable once created.
 */
struct EncryptionKey {
    KeyId key_id;
    std::string algorithm{KEY_ALGORITHM};
    std::array<uint8_t, KEY_SIZE> key_bytes{};
    Timestamp created_at;
};

/**
 * @brief One encrypted chunk of a serialized model.
 *
 * checksum is the lowercase hex SHA-256 of the plaintext and
 * encrypted_size always equals ciphertext.size().
 */
struct EncryptedBlock {
    BlockId block_id;
    ModelId model_id;
    uint32_t block_index{0};
    Bytes ciphertext;
    std::array<uint8_t, NONCE_SIZE> nonce{};
    std::array<uint8_t, TAG_SIZE> tag{};
    KeyId key_id;
    uint64_t original_size{0};
    uint64_t encrypted_size{0};
    std::string checksum;
    Timestamp created_at;
};

}  // namespace model_mesh
