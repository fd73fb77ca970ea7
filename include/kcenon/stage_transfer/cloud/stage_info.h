/**
 * @file stage_info.h
 * @brief Resolved stage descriptor and its credentials
 * @version 0.1.0
 *
 * A stage_info is produced once per command by the credential resolver and
 * is read-only afterwards. It is never cached across commands.
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_STAGE_INFO_H
#define KCENON_STAGE_TRANSFER_CLOUD_STAGE_INFO_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Storage provider behind a stage
 */
enum class provider_kind {
    s3,         ///< Amazon S3 or S3-compatible storage
    azure,      ///< Azure Blob Storage
    gcs,        ///< Google Cloud Storage
    local_fs    ///< Directory on the local filesystem
};

[[nodiscard]] constexpr auto to_string(provider_kind kind) -> const char* {
    switch (kind) {
        case provider_kind::s3: return "S3";
        case provider_kind::azure: return "AZURE";
        case provider_kind::gcs: return "GCS";
        case provider_kind::local_fs: return "LOCAL_FS";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Temporary AWS access keys
 */
struct temporary_keys {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
};

/**
 * @brief Azure shared access signature (query string without '?')
 */
struct sas_token {
    std::string token;
};

/**
 * @brief URL granting access to exactly one object
 */
struct presigned_url {
    std::string url;
};

/**
 * @brief Permission and time limited bearer token (GCS)
 */
struct downscoped_token {
    std::string token;
};

/**
 * @brief No credential material (local stages)
 */
struct no_credentials {};

using stage_credentials =
    std::variant<no_credentials, temporary_keys, sas_token, presigned_url, downscoped_token>;

[[nodiscard]] inline auto credential_kind_name(const stage_credentials& credentials)
    -> const char* {
    switch (credentials.index()) {
        case 0: return "none";
        case 1: return "temporary_keys";
        case 2: return "sas_token";
        case 3: return "presigned_url";
        case 4: return "downscoped_token";
        default: return "unknown";
    }
}

/**
 * @brief Client-side encryption material of a stage
 */
struct encryption_material {
    /// Base64 query stage master key (16 or 32 bytes once decoded)
    std::string query_stage_master_key;
    std::string query_id;
    int64_t smk_id = 0;
};

/**
 * @brief Resolved stage
 */
struct stage_info {
    provider_kind kind = provider_kind::s3;

    /// Raw location, "bucket/prefix/" or a local directory
    std::string location;
    /// Bucket, container or local root directory
    std::string bucket;
    /// Key prefix inside the bucket, empty or ending with '/'
    std::string prefix;

    std::string region;
    std::string endpoint;
    std::string storage_account;
    bool use_regional_url = false;

    stage_credentials credentials;
    std::optional<encryption_material> encryption;
    std::optional<std::chrono::system_clock::time_point> expires_at;

    /// Object names a presigned GET descriptor grants access to
    std::vector<std::string> source_locations;

    [[nodiscard]] auto is_presigned() const -> bool {
        return std::holds_alternative<presigned_url>(credentials);
    }

    [[nodiscard]] auto is_encrypted() const -> bool {
        return encryption.has_value() && !encryption->query_stage_master_key.empty();
    }

    [[nodiscard]] auto is_expired() const -> bool {
        return expires_at.has_value() && std::chrono::system_clock::now() >= *expires_at;
    }

    /**
     * @brief Full object key for a name relative to the stage path
     */
    [[nodiscard]] auto object_key(std::string_view name) const -> std::string {
        return prefix + std::string(name);
    }
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_STAGE_INFO_H
