/**
 * @file block_cipher.cpp
 * @brief OpenSSL EVP implementation of the block and transport ciphers.
 */

#include "crypto/block_cipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>

namespace model_mesh::crypto {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<Bytes> run_gcm_open(const EncryptionKey& key, std::span<const uint8_t> ciphertext,
                           const uint8_t* nonce, const uint8_t* tag) {
    CipherCtx ctx{EVP_CIPHER_CTX_new()};
    if (!ctx) return Error{"EVP_CIPHER_CTX_new failed"};

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                               static_cast<int>(NONCE_SIZE), nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.key_bytes.data(), nonce) != 1) {
        return Error{"AES-GCM decrypt init failed"};
    }

    Bytes plaintext(ciphertext.size() + TAG_SIZE);
    int len = 0;
    int total = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            return Error{"AES-GCM decrypt update failed", ErrorKind::IntegrityFailure};
        }
        total = len;
    }

    std::array<uint8_t, TAG_SIZE> tag_copy{};
    std::memcpy(tag_copy.data(), tag, TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(TAG_SIZE), tag_copy.data()) != 1) {
        return Error{"AES-GCM set tag failed"};
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) <= 0) {
        return Error{"authentication tag mismatch", ErrorKind::IntegrityFailure};
    }
    total += len;
    plaintext.resize(static_cast<size_t>(total));
    return plaintext;
}

}  // anonymous namespace

Result<Bytes> random_bytes(size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        return Error{"RAND_bytes failed"};
    }
    return out;
}

Result<EncryptionKey> generate_key(KeyId key_id) {
    auto bytes = random_bytes(KEY_SIZE);
    if (!bytes) return bytes.error();

    EncryptionKey key;
    key.key_id = std::move(key_id);
    std::copy(bytes->begin(), bytes->end(), key.key_bytes.begin());
    key.created_at = std::chrono::system_clock::now();
    return key;
}

std::string sha256_hex(std::span<const uint8_t> data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr);
    return to_hex(std::span<const uint8_t>{digest.data(), digest_len});
}

Result<Sealed> seal(const EncryptionKey& key, std::span<const uint8_t> plaintext) {
    Sealed out;
    if (RAND_bytes(out.nonce.data(), static_cast<int>(NONCE_SIZE)) != 1) {
        return Error{"RAND_bytes failed for nonce"};
    }

    CipherCtx ctx{EVP_CIPHER_CTX_new()};
    if (!ctx) return Error{"EVP_CIPHER_CTX_new failed"};

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                               static_cast<int>(NONCE_SIZE), nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr,
                              key.key_bytes.data(), out.nonce.data()) != 1) {
        return Error{"AES-GCM encrypt init failed"};
    }

    out.ciphertext.resize(plaintext.size() + TAG_SIZE);
    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.ciphertext.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            return Error{"AES-GCM encrypt update failed"};
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.ciphertext.data() + total, &len) != 1) {
        return Error{"AES-GCM encrypt final failed"};
    }
    total += len;
    out.ciphertext.resize(static_cast<size_t>(total));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(TAG_SIZE), out.tag.data()) != 1) {
        return Error{"AES-GCM get tag failed"};
    }
    return out;
}

Result<Bytes> open(const EncryptionKey& key, std::span<const uint8_t> ciphertext,
                   std::span<const uint8_t, NONCE_SIZE> nonce,
                   std::span<const uint8_t, TAG_SIZE> tag) {
    return run_gcm_open(key, ciphertext, nonce.data(), tag.data());
}

Result<Bytes> encrypt_for_transport(const EncryptionKey& key, std::span<const uint8_t> payload) {
    auto sealed = seal(key, payload);
    if (!sealed) return sealed.error();

    Bytes wire;
    wire.reserve(NONCE_SIZE + sealed->ciphertext.size() + TAG_SIZE);
    wire.insert(wire.end(), sealed->nonce.begin(), sealed->nonce.end());
    wire.insert(wire.end(), sealed->ciphertext.begin(), sealed->ciphertext.end());
    wire.insert(wire.end(), sealed->tag.begin(), sealed->tag.end());
    return wire;
}

Result<Bytes> decrypt_transport(const EncryptionKey& key, std::span<const uint8_t> wire) {
    if (wire.size() < NONCE_SIZE + TAG_SIZE) {
        return Error{"transport payload shorter than nonce and tag", ErrorKind::InvalidInput};
    }
    auto body = wire.subspan(NONCE_SIZE, wire.size() - NONCE_SIZE - TAG_SIZE);
    return run_gcm_open(key, body, wire.data(), wire.data() + wire.size() - TAG_SIZE);
}

std::string base64_encode(std::span<const uint8_t> data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(std::max(written, 0)));
    return out;
}

Result<Bytes> base64_decode(std::string_view text) {
    if (text.empty()) return Bytes{};
    if (text.size() % 4 != 0) {
        return Error{"base64 length is not a multiple of 4", ErrorKind::InvalidInput};
    }

    Bytes out(3 * (text.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return Error{"invalid base64 input", ErrorKind::InvalidInput};
    }

    // EVP_DecodeBlock counts padding characters as zero bytes.
    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string to_hex(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += HEX_DIGITS[b >> 4];
        out += HEX_DIGITS[b & 0x0F];
    }
    return out;
}

Result<Bytes> from_hex(std::string_view text) {
    if (text.size() % 2 != 0) {
        return Error{"hex string has odd length", ErrorKind::InvalidInput};
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{"invalid hex digit", ErrorKind::InvalidInput};
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace model_mesh::crypto

namespace model_mesh {

Result<EncryptedBlock> encrypt_block(const ModelId& model_id, std::span<const uint8_t> plaintext,
                                     uint32_t block_index, const EncryptionKey& key) {
    if (model_id.empty()) {
        return Error{"model_id must not be empty", ErrorKind::InvalidInput};
    }

    auto sealed = crypto::seal(key, plaintext);
    if (!sealed) return sealed.error();

    auto suffix = crypto::random_bytes(4);
    if (!suffix) return suffix.error();

    EncryptedBlock block;
    block.block_id = model_id + "_block_" + std::to_string(block_index) + "_"
                   + crypto::to_hex(*suffix);
    block.model_id = model_id;
    block.block_index = block_index;
    block.ciphertext = std::move(sealed->ciphertext);
    block.nonce = sealed->nonce;
    block.tag = sealed->tag;
    block.key_id = key.key_id;
    block.original_size = plaintext.size();
    block.encrypted_size = block.ciphertext.size();
    block.checksum = crypto::sha256_hex(plaintext);
    block.created_at = std::chrono::system_clock::now();
    return block;
}

Result<Bytes> decrypt_block(const EncryptedBlock& block, const EncryptionKey& key) {
    if (block.key_id != key.key_id) {
        return Error{"block " + block.block_id + " is not encrypted with key " + key.key_id,
                     ErrorKind::InvalidInput};
    }
    auto plaintext = crypto::open(key, block.ciphertext, block.nonce, block.tag);
    if (!plaintext) return plaintext.error();

    if (crypto::sha256_hex(*plaintext) != block.checksum) {
        return Error{"checksum mismatch for block " + block.block_id,
                     ErrorKind::IntegrityFailure};
    }
    return plaintext;
}

bool verify_block_integrity(const EncryptedBlock& block, const EncryptionKey& key) {
    if (block.ciphertext.empty() || block.encrypted_size != block.ciphertext.size()) {
        return false;
    }
    return decrypt_block(block, key).has_value();
}

}  // namespace model_mesh
