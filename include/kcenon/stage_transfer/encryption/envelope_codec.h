/**
 * @file envelope_codec.h
 * @brief Envelope encryption of stage payloads
 * @version 0.1.0
 *
 * Every object is encrypted with its own random data key. The data key is
 * wrapped by the stage master key and stored beside the object as
 * metadata, together with both IVs, a material description and the
 * SHA-256 digest of the plaintext payload.
 */

#ifndef KCENON_STAGE_TRANSFER_ENCRYPTION_ENVELOPE_CODEC_H
#define KCENON_STAGE_TRANSFER_ENCRYPTION_ENVELOPE_CODEC_H

#include "aes_gcm_engine.h"

#include "kcenon/stage_transfer/cloud/stage_info.h"
#include "kcenon/stage_transfer/core/transfer_types.h"
#include "kcenon/stage_transfer/core/types.h"

#include <memory>
#include <optional>
#include <span>
#include <string>

namespace kcenon::stage_transfer {

/**
 * @brief Seals payloads for upload and opens them after download
 *
 * Without encryption material the codec only attaches and verifies the
 * digest; the stage is then expected to encrypt on the server side.
 *
 * @note This codec is thread-safe for concurrent operations.
 */
class envelope_codec {
public:
    /**
     * @brief Create a codec for a stage's encryption material
     * @return credential_resolution_failed for an invalid master key
     */
    [[nodiscard]] static auto create(const std::optional<encryption_material>& material)
        -> result<std::shared_ptr<envelope_codec>>;

    ~envelope_codec();

    envelope_codec(const envelope_codec&) = delete;
    auto operator=(const envelope_codec&) -> envelope_codec& = delete;

    [[nodiscard]] auto is_encrypting() const -> bool;

    /**
     * @brief Produce the stored form of a payload
     *
     * Writes st_digest, and when encrypting also st_key, st_key_iv, st_iv
     * and st_matdesc, into the metadata.
     */
    [[nodiscard]] auto seal(std::span<const std::byte> payload,
                            object_metadata& metadata) const -> result<byte_buffer>;

    /**
     * @brief Recover and verify the payload of a stored object
     *
     * Nothing is returned unless the digest verifies, so callers never
     * write unverified bytes.
     *
     * @return decryption_failed for missing key material or a failed
     *         authentication, digest_mismatch when the digest differs,
     *         corrupted_payload for malformed metadata
     */
    [[nodiscard]] auto open(std::span<const std::byte> stored,
                            const object_metadata& metadata) const -> result<byte_buffer>;

    /**
     * @brief Base64 SHA-256 of a payload
     */
    [[nodiscard]] static auto compute_digest(std::span<const std::byte> payload) -> std::string;

    /**
     * @brief Material description JSON: {"queryId":"..","smkId":"..","keySize":".."}
     */
    [[nodiscard]] static auto material_description(const encryption_material& material,
                                                   std::size_t key_bytes) -> std::string;

private:
    envelope_codec();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_ENCRYPTION_ENVELOPE_CODEC_H
