/**
 * @file aes_gcm_engine.cpp
 * @brief AES-GCM encryption engine implementation
 */

#include "kcenon/stage_transfer/encryption/aes_gcm_engine.h"

#include "kcenon/stage_transfer/config/feature_flags.h"

#ifdef STAGE_TRANS_ENABLE_ENCRYPTION
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#endif

#include <algorithm>
#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::stage_transfer {

#ifdef STAGE_TRANS_ENABLE_ENCRYPTION

namespace {

auto last_openssl_error() -> std::string {
    const auto code = ERR_get_error();
    if (code == 0) {
        return "no OpenSSL error queued";
    }
    std::array<char, 256> text{};
    ERR_error_string_n(code, text.data(), text.size());
    return text.data();
}

struct cipher_ctx_deleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using cipher_ctx = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

auto select_cipher(std::size_t key_size) -> const EVP_CIPHER* {
    return key_size == 16 ? EVP_aes_128_gcm() : EVP_aes_256_gcm();
}

auto as_uchar(const std::byte* data) -> const unsigned char* {
    return reinterpret_cast<const unsigned char*>(data);
}

auto as_uchar(std::byte* data) -> unsigned char* {
    return reinterpret_cast<unsigned char*>(data);
}

auto elapsed_since(std::chrono::steady_clock::time_point start) -> std::chrono::microseconds {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

#endif  // STAGE_TRANS_ENABLE_ENCRYPTION

// ============================================================================
// aes_gcm_engine::impl
// ============================================================================

struct aes_gcm_engine::impl {
    byte_buffer key;
    mutable std::mutex stats_mutex;
    encryption_statistics stats;

    ~impl() {
#ifdef STAGE_TRANS_ENABLE_ENCRYPTION
        if (!key.empty()) {
            OPENSSL_cleanse(key.data(), key.size());
        }
#endif
    }

    void record(bool encrypted, uint64_t bytes, std::chrono::microseconds took) {
        std::lock_guard<std::mutex> lock(stats_mutex);
        if (encrypted) {
            stats.bytes_encrypted += bytes;
            ++stats.encryption_ops;
            stats.total_encrypt_time += took;
        } else {
            stats.bytes_decrypted += bytes;
            ++stats.decryption_ops;
            stats.total_decrypt_time += took;
        }
    }

    /**
     * @brief Count the failure and build its error
     */
    auto fail(error_code code, std::string message) -> unexpected {
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            ++stats.errors;
        }
        return unexpected{error{code, std::move(message)}};
    }
};

// ============================================================================
// aes_gcm_engine
// ============================================================================

aes_gcm_engine::aes_gcm_engine() : impl_(std::make_unique<impl>()) {}

aes_gcm_engine::~aes_gcm_engine() = default;

auto aes_gcm_engine::is_available() -> bool {
#ifdef STAGE_TRANS_ENABLE_ENCRYPTION
    return true;
#else
    return false;
#endif
}

auto aes_gcm_engine::create(std::span<const std::byte> key)
    -> result<std::unique_ptr<aes_gcm_engine>> {
#ifndef STAGE_TRANS_ENABLE_ENCRYPTION
    (void)key;
    return unexpected{error{error_code::feature_unavailable,
        "client-side encryption requires OpenSSL support"}};
#else
    if (key.size() != 16 && key.size() != 32) {
        return unexpected{error{error_code::invalid_parameter,
            "AES-GCM key must be 16 or 32 bytes, got " + std::to_string(key.size())}};
    }
    auto engine = std::unique_ptr<aes_gcm_engine>(new aes_gcm_engine());
    engine->impl_->key.assign(key.begin(), key.end());
    return engine;
#endif
}

auto aes_gcm_engine::key_size() const -> std::size_t {
    return impl_->key.size();
}

auto aes_gcm_engine::get_statistics() const -> encryption_statistics {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->stats;
}

auto aes_gcm_engine::random_bytes(std::size_t count) -> result<byte_buffer> {
#ifndef STAGE_TRANS_ENABLE_ENCRYPTION
    (void)count;
    return unexpected{error{error_code::feature_unavailable,
        "secure random generation requires OpenSSL support"}};
#else
    byte_buffer bytes(count);
    if (count > 0 && RAND_bytes(as_uchar(bytes.data()), static_cast<int>(count)) != 1) {
        return unexpected{error{error_code::internal_error,
            "RAND_bytes failed: " + last_openssl_error()}};
    }
    return bytes;
#endif
}

auto aes_gcm_engine::encrypt(std::span<const std::byte> plaintext) -> result<sealed_data> {
#ifndef STAGE_TRANS_ENABLE_ENCRYPTION
    (void)plaintext;
    return unexpected{error{error_code::feature_unavailable,
        "client-side encryption requires OpenSSL support"}};
#else
    const auto started = std::chrono::steady_clock::now();

    auto iv = random_bytes(gcm_iv_size);
    if (!iv) {
        return impl_->fail(iv.error().code, iv.error().message);
    }

    cipher_ctx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return impl_->fail(error_code::internal_error, "EVP_CIPHER_CTX_new failed");
    }

    sealed_data sealed;
    sealed.iv = std::move(iv.value());

    const bool ready =
        EVP_EncryptInit_ex(ctx.get(), select_cipher(impl_->key.size()),
                           nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(gcm_iv_size), nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr,
                           as_uchar(impl_->key.data()), as_uchar(sealed.iv.data())) == 1;
    if (!ready) {
        return impl_->fail(error_code::internal_error,
                           "AES-GCM encrypt setup: " + last_openssl_error());
    }

    // GCM output is the same length as its input; the tag follows it
    sealed.ciphertext.resize(plaintext.size() + gcm_tag_size);
    auto* out = as_uchar(sealed.ciphertext.data());
    int written = 0;
    int chunk = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out, &chunk, as_uchar(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            return impl_->fail(error_code::internal_error,
                               "AES-GCM encrypt: " + last_openssl_error());
        }
        written = chunk;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), out + written, &chunk) != 1) {
        return impl_->fail(error_code::internal_error,
                           "AES-GCM encrypt final: " + last_openssl_error());
    }
    written += chunk;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(gcm_tag_size),
                            out + written) != 1) {
        return impl_->fail(error_code::internal_error, "AES-GCM tag could not be read");
    }
    sealed.ciphertext.resize(static_cast<std::size_t>(written) + gcm_tag_size);

    impl_->record(true, plaintext.size(), elapsed_since(started));
    return sealed;
#endif
}

auto aes_gcm_engine::decrypt(std::span<const std::byte> iv,
                             std::span<const std::byte> ciphertext) -> result<byte_buffer> {
#ifndef STAGE_TRANS_ENABLE_ENCRYPTION
    (void)iv;
    (void)ciphertext;
    return unexpected{error{error_code::feature_unavailable,
        "client-side encryption requires OpenSSL support"}};
#else
    const auto started = std::chrono::steady_clock::now();

    if (iv.size() != gcm_iv_size) {
        return impl_->fail(error_code::decryption_failed,
                           "Invalid IV length: " + std::to_string(iv.size()));
    }
    if (ciphertext.size() < gcm_tag_size) {
        return impl_->fail(error_code::decryption_failed,
                           "Ciphertext shorter than the authentication tag");
    }

    const auto body = ciphertext.first(ciphertext.size() - gcm_tag_size);
    std::array<unsigned char, gcm_tag_size> tag{};
    std::copy(ciphertext.end() - static_cast<std::ptrdiff_t>(gcm_tag_size), ciphertext.end(),
              reinterpret_cast<std::byte*>(tag.data()));

    cipher_ctx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return impl_->fail(error_code::internal_error, "EVP_CIPHER_CTX_new failed");
    }

    const bool ready =
        EVP_DecryptInit_ex(ctx.get(), select_cipher(impl_->key.size()),
                           nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(gcm_iv_size), nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr,
                           as_uchar(impl_->key.data()), as_uchar(iv.data())) == 1;
    if (!ready) {
        return impl_->fail(error_code::internal_error,
                           "AES-GCM decrypt setup: " + last_openssl_error());
    }

    byte_buffer plaintext(body.size() + gcm_tag_size);
    auto* out = as_uchar(plaintext.data());
    int written = 0;
    int chunk = 0;

    if (!body.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), out, &chunk, as_uchar(body.data()),
                              static_cast<int>(body.size())) != 1) {
            return impl_->fail(error_code::decryption_failed,
                               "AES-GCM decrypt: " + last_openssl_error());
        }
        written = chunk;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(gcm_tag_size), tag.data()) != 1) {
        return impl_->fail(error_code::internal_error, "AES-GCM tag could not be set");
    }

    // A tag mismatch surfaces here
    if (EVP_DecryptFinal_ex(ctx.get(), out + written, &chunk) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return impl_->fail(error_code::decryption_failed,
                           "Authentication failed - data may have been tampered");
    }
    written += chunk;
    plaintext.resize(static_cast<std::size_t>(written));

    impl_->record(false, plaintext.size(), elapsed_since(started));
    return plaintext;
#endif
}

}  // namespace kcenon::stage_transfer
