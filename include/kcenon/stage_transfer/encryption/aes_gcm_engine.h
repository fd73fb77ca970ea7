/**
 * @file aes_gcm_engine.h
 * @brief AES-GCM authenticated encryption with 128 or 256 bit keys
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_ENCRYPTION_AES_GCM_ENGINE_H
#define KCENON_STAGE_TRANSFER_ENCRYPTION_AES_GCM_ENGINE_H

#include "kcenon/stage_transfer/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace kcenon::stage_transfer {

/// 96-bit IV as recommended by NIST SP 800-38D
inline constexpr std::size_t gcm_iv_size = 12;

/// 128-bit authentication tag, appended to every ciphertext
inline constexpr std::size_t gcm_tag_size = 16;

/**
 * @brief Output of one encryption
 */
struct sealed_data {
    byte_buffer iv;
    /// Ciphertext followed by the authentication tag
    byte_buffer ciphertext;
};

/**
 * @brief Encryption statistics
 */
struct encryption_statistics {
    uint64_t bytes_encrypted = 0;
    uint64_t bytes_decrypted = 0;
    uint64_t encryption_ops = 0;
    uint64_t decryption_ops = 0;
    uint64_t errors = 0;
    std::chrono::microseconds total_encrypt_time{0};
    std::chrono::microseconds total_decrypt_time{0};
};

/**
 * @brief AES-GCM engine bound to one key
 *
 * The key length selects the cipher: 16 bytes for AES-128-GCM, 32 bytes
 * for AES-256-GCM. Each encrypt() call draws a fresh random IV. The key is
 * wiped from memory when the engine is destroyed.
 *
 * @code
 * auto engine = aes_gcm_engine::create(key);
 * auto sealed = engine.value()->encrypt(plaintext);
 * auto plain = engine.value()->decrypt(sealed.value().iv, sealed.value().ciphertext);
 * @endcode
 *
 * @note This engine is thread-safe for concurrent operations.
 */
class aes_gcm_engine {
public:
    /**
     * @brief Create an engine for a 16 or 32 byte key
     * @return invalid_parameter for any other key length, feature_unavailable
     *         when built without OpenSSL
     */
    [[nodiscard]] static auto create(std::span<const std::byte> key)
        -> result<std::unique_ptr<aes_gcm_engine>>;

    ~aes_gcm_engine();

    aes_gcm_engine(const aes_gcm_engine&) = delete;
    auto operator=(const aes_gcm_engine&) -> aes_gcm_engine& = delete;

    /**
     * @brief Encrypt with a random IV
     */
    [[nodiscard]] auto encrypt(std::span<const std::byte> plaintext) -> result<sealed_data>;

    /**
     * @brief Decrypt and authenticate
     * @return decryption_failed when the tag does not verify
     */
    [[nodiscard]] auto decrypt(std::span<const std::byte> iv,
                               std::span<const std::byte> ciphertext) -> result<byte_buffer>;

    [[nodiscard]] auto key_size() const -> std::size_t;

    [[nodiscard]] auto get_statistics() const -> encryption_statistics;

    /**
     * @brief Cryptographically secure random bytes
     */
    [[nodiscard]] static auto random_bytes(std::size_t count) -> result<byte_buffer>;

    [[nodiscard]] static auto is_available() -> bool;

private:
    aes_gcm_engine();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_ENCRYPTION_AES_GCM_ENGINE_H
