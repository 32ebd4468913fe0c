/**
 * @file block_cipher.hpp
 * @brief AES-256-GCM block encryption, SHA-256 checksums and base64 via OpenSSL.
 *
 * Two independent encryption layers use these primitives: at-rest block
 * encryption (EncryptedBlock, keyed per model) and transport encryption
 * (keyed per transfer session, wire layout nonce || ciphertext || tag).
 */

#pragma once

#include "core/result.hpp"
#include "crypto/encrypted_block.hpp"

#include <array>
#include <span>
#include <string>
#include <string_view>

namespace model_mesh::crypto {

/// Output of one AES-256-GCM seal operation.
struct Sealed {
    Bytes ciphertext;
    std::array<uint8_t, NONCE_SIZE> nonce{};
    std::array<uint8_t, TAG_SIZE> tag{};
};

/// Cryptographically secure random bytes.
Result<Bytes> random_bytes(size_t count);

/// Generate a fresh 256-bit key.
Result<EncryptionKey> generate_key(KeyId key_id);

/// Lowercase hex SHA-256 digest.
[[nodiscard]] std::string sha256_hex(std::span<const uint8_t> data);

/// Encrypt with a freshly generated nonce.
Result<Sealed> seal(const EncryptionKey& key, std::span<const uint8_t> plaintext);

/// Decrypt and authenticate. A tag mismatch yields ErrorKind::IntegrityFailure.
Result<Bytes> open(const EncryptionKey& key, std::span<const uint8_t> ciphertext,
                   std::span<const uint8_t, NONCE_SIZE> nonce,
                   std::span<const uint8_t, TAG_SIZE> tag);

/// Transport layer: returns nonce || ciphertext || tag.
Result<Bytes> encrypt_for_transport(const EncryptionKey& key, std::span<const uint8_t> payload);

/// Inverse of encrypt_for_transport.
Result<Bytes> decrypt_transport(const EncryptionKey& key, std::span<const uint8_t> wire);

[[nodiscard]] std::string base64_encode(std::span<const uint8_t> data);
Result<Bytes> base64_decode(std::string_view text);

[[nodiscard]] std::string to_hex(std::span<const uint8_t> data);
Result<Bytes> from_hex(std::string_view text);

}  // namespace model_mesh::crypto

namespace model_mesh {

/**
 * @brief Encrypt one block of model plaintext under @p key.
 *
 * block_id has the form <model>_block_<index>_<8 hex chars>.
 */
Result<EncryptedBlock> encrypt_block(const ModelId& model_id, std::span<const uint8_t> plaintext,
                                     uint32_t block_index, const EncryptionKey& key);

/// Recover the plaintext of a block, verifying the GCM tag and checksum.
Result<Bytes> decrypt_block(const EncryptedBlock& block, const EncryptionKey& key);

/**
 * @brief The integrity gate used before send and after receive.
 *
 * True iff the ciphertext is present, encrypted_size matches, the tag
 * authenticates and SHA-256 of the recovered plaintext equals checksum.
 */
[[nodiscard]] bool verify_block_integrity(const EncryptedBlock& block, const EncryptionKey& key);

}  // namespace model_mesh
