/**
 * @file envelope_codec.cpp
 * @brief Envelope encryption implementation
 */

#include "kcenon/stage_transfer/encryption/envelope_codec.h"

#include "kcenon/stage_transfer/cloud/cloud_utils.h"
#include "kcenon/stage_transfer/cloud/credential_resolver.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <sstream>

namespace kcenon::stage_transfer {

namespace {

auto encode(std::span<const std::byte> data) -> std::string {
    return cloud_utils::base64_encode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

auto decode(const object_metadata& metadata, std::string_view key) -> result<byte_buffer> {
    auto value = metadata.get(key);
    if (!value || value->empty()) {
        return unexpected{error{error_code::decryption_failed,
            "object has no " + std::string(key) + " metadata"}};
    }
    auto decoded = cloud_utils::base64_decode(*value);
    if (!decoded) {
        return unexpected{error{error_code::corrupted_payload,
            std::string(key) + " metadata is not valid base64"}};
    }
    return byte_buffer(reinterpret_cast<const std::byte*>(decoded->data()),
                       reinterpret_cast<const std::byte*>(decoded->data()) + decoded->size());
}

}  // namespace

struct envelope_codec::impl {
    std::optional<encryption_material> material;
    std::unique_ptr<aes_gcm_engine> master;
};

envelope_codec::envelope_codec() : impl_(std::make_unique<impl>()) {}

envelope_codec::~envelope_codec() = default;

auto envelope_codec::create(const std::optional<encryption_material>& material)
    -> result<std::shared_ptr<envelope_codec>> {
    auto codec = std::shared_ptr<envelope_codec>(new envelope_codec());
    if (!material || material->query_stage_master_key.empty()) {
        return codec;
    }

    auto key = credential_resolver::decode_master_key(material->query_stage_master_key);
    if (!key) {
        return unexpected{key.error()};
    }
    auto master = aes_gcm_engine::create(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(key.value().data()), key.value().size()));
    if (!master) {
        return unexpected{master.error()};
    }

    codec->impl_->material = material;
    codec->impl_->master = std::move(master.value());
    return codec;
}

auto envelope_codec::is_encrypting() const -> bool {
    return impl_->master != nullptr;
}

auto envelope_codec::compute_digest(std::span<const std::byte> payload) -> std::string {
    const auto hash = cloud_utils::sha256_bytes(payload);
    return cloud_utils::base64_encode(std::span<const uint8_t>(hash.data(), hash.size()));
}

auto envelope_codec::material_description(const encryption_material& material,
                                          std::size_t key_bytes) -> std::string {
    std::ostringstream oss;
    oss << "{\"queryId\":\"" << material.query_id << "\","
        << "\"smkId\":\"" << material.smk_id << "\","
        << "\"keySize\":\"" << key_bytes * 8 << "\"}";
    return oss.str();
}

auto envelope_codec::seal(std::span<const std::byte> payload,
                          object_metadata& metadata) const -> result<byte_buffer> {
    metadata.set(metadata_keys::digest, compute_digest(payload));

    if (!is_encrypting()) {
        return byte_buffer(payload.begin(), payload.end());
    }

    auto data_key = aes_gcm_engine::random_bytes(impl_->master->key_size());
    if (!data_key) {
        return unexpected{data_key.error()};
    }
    auto data_engine = aes_gcm_engine::create(data_key.value());
    if (!data_engine) {
        return unexpected{data_engine.error()};
    }

    auto sealed_payload = data_engine.value()->encrypt(payload);
    if (!sealed_payload) {
        return unexpected{sealed_payload.error()};
    }
    auto wrapped_key = impl_->master->encrypt(data_key.value());
    if (!wrapped_key) {
        return unexpected{wrapped_key.error()};
    }

    metadata.set(metadata_keys::wrapped_key, encode(wrapped_key.value().ciphertext));
    metadata.set(metadata_keys::key_iv, encode(wrapped_key.value().iv));
    metadata.set(metadata_keys::data_iv, encode(sealed_payload.value().iv));
    metadata.set(metadata_keys::material_description,
                 material_description(*impl_->material, impl_->master->key_size()));

    ST_LOG_TRACE(log_category::encryption,
        "Sealed " + std::to_string(payload.size()) + " bytes with a " +
        std::to_string(impl_->master->key_size() * 8) + "-bit data key");

    return std::move(sealed_payload.value().ciphertext);
}

auto envelope_codec::open(std::span<const std::byte> stored,
                          const object_metadata& metadata) const -> result<byte_buffer> {
    const bool object_encrypted = metadata.get(metadata_keys::wrapped_key).has_value();

    byte_buffer payload;
    if (!object_encrypted) {
        if (is_encrypting()) {
            return unexpected{error{error_code::decryption_failed,
                "object has no st_key metadata but the stage requires client-side encryption"}};
        }
        payload.assign(stored.begin(), stored.end());
    } else {
        if (!is_encrypting()) {
            return unexpected{error{error_code::decryption_failed,
                "object is encrypted but the stage has no master key"}};
        }

        auto wrapped_key = decode(metadata, metadata_keys::wrapped_key);
        if (!wrapped_key) {
            return unexpected{wrapped_key.error()};
        }
        auto key_iv = decode(metadata, metadata_keys::key_iv);
        if (!key_iv) {
            return unexpected{key_iv.error()};
        }
        auto data_iv = decode(metadata, metadata_keys::data_iv);
        if (!data_iv) {
            return unexpected{data_iv.error()};
        }

        auto data_key = impl_->master->decrypt(key_iv.value(), wrapped_key.value());
        if (!data_key) {
            return unexpected{error{error_code::decryption_failed,
                "failed to unwrap data key: " + data_key.error().message}};
        }
        auto data_engine = aes_gcm_engine::create(data_key.value());
        if (!data_engine) {
            return unexpected{error{error_code::decryption_failed,
                "unwrapped data key is unusable: " + data_engine.error().message}};
        }

        auto opened = data_engine.value()->decrypt(data_iv.value(), stored);
        if (!opened) {
            return unexpected{opened.error()};
        }
        payload = std::move(opened.value());
    }

    if (auto expected = metadata.get(metadata_keys::digest)) {
        const auto actual = compute_digest(payload);
        if (actual != *expected) {
            ST_LOG_WARN(log_category::encryption,
                "Digest mismatch: expected " + *expected + ", computed " + actual);
            return unexpected{error{error_code::digest_mismatch,
                "payload digest does not match st_digest"}};
        }
    }

    return payload;
}

}  // namespace kcenon::stage_transfer
