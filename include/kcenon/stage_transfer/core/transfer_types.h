/**
 * @file transfer_types.h
 * @brief Value types shared by the command, agent and reporting layers
 */

#ifndef KCENON_STAGE_TRANSFER_CORE_TRANSFER_TYPES_H
#define KCENON_STAGE_TRANSFER_CORE_TRANSFER_TYPES_H

#include "types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Direction of a transfer command
 */
enum class transfer_direction {
    upload,    ///< PUT: local files to stage
    download   ///< GET: stage objects to local directory
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) -> const char* {
    switch (direction) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

/**
 * @brief Compression format of a source file
 */
enum class compression_format {
    auto_detect,
    none,
    gzip,
    bzip2,
    brotli,
    zstd,
    deflate,
    raw_deflate,
    lz4
};

[[nodiscard]] constexpr auto to_string(compression_format format) -> const char* {
    switch (format) {
        case compression_format::auto_detect: return "auto_detect";
        case compression_format::none: return "none";
        case compression_format::gzip: return "gzip";
        case compression_format::bzip2: return "bzip2";
        case compression_format::brotli: return "brotli";
        case compression_format::zstd: return "zstd";
        case compression_format::deflate: return "deflate";
        case compression_format::raw_deflate: return "raw_deflate";
        case compression_format::lz4: return "lz4";
        default: return "unknown";
    }
}

namespace detail {

[[nodiscard]] inline auto to_lower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

}  // namespace detail

/**
 * @brief Parse a source_compression option value (case-insensitive)
 */
[[nodiscard]] inline auto parse_compression_format(std::string_view value)
    -> std::optional<compression_format> {
    const auto lowered = detail::to_lower(value);
    for (auto format : {compression_format::auto_detect, compression_format::none,
                        compression_format::gzip, compression_format::bzip2,
                        compression_format::brotli, compression_format::zstd,
                        compression_format::deflate, compression_format::raw_deflate,
                        compression_format::lz4}) {
        if (lowered == to_string(format)) {
            return format;
        }
    }
    return std::nullopt;
}

/**
 * @brief Whether the format denotes an already compressed payload
 */
[[nodiscard]] constexpr auto is_compressed_format(compression_format format) -> bool {
    return format != compression_format::auto_detect &&
           format != compression_format::none;
}

/**
 * @brief Per-command transfer options
 *
 * Built from the session defaults and overridden by the options of one
 * command. Never shared between commands.
 */
struct transfer_options {
    static constexpr uint64_t default_threshold = 200ULL * 1024 * 1024;

    std::size_t parallel = 4;
    bool overwrite = false;
    bool auto_compress = true;
    compression_format source_compression = compression_format::auto_detect;
    uint64_t threshold = default_threshold;
    std::optional<std::string> destination_filename;

    /// GET only: regular expression filtering object names
    std::optional<std::string> pattern;
    /// GET only: decompress .lz4 objects after download
    bool decompress = false;

    // Session-derived settings carried with the intent
    std::size_t max_retries = 25;
    bool use_regional_url = false;
    bool gcs_use_downscoped_credential = false;
    std::chrono::milliseconds network_timeout{300000};
};

/**
 * @brief Parsed PUT/GET command
 */
struct transfer_intent {
    transfer_direction direction = transfer_direction::upload;

    /// PUT: local globs. GET: a single destination directory.
    std::vector<std::string> local_paths;

    /// Raw stage reference including the leading '@'
    std::string stage_reference;
    std::string stage_name;
    /// Path inside the stage without leading or trailing '/'
    std::string stage_path;

    transfer_options options;

    [[nodiscard]] auto is_upload() const -> bool {
        return direction == transfer_direction::upload;
    }

    [[nodiscard]] auto local_directory() const -> std::string {
        return local_paths.empty() ? std::string{} : local_paths.front();
    }
};

/**
 * @brief Transfer strategy chosen by size
 */
enum class transfer_strategy {
    single_shot,
    multipart
};

[[nodiscard]] constexpr auto to_string(transfer_strategy strategy) -> const char* {
    switch (strategy) {
        case transfer_strategy::single_shot: return "single_shot";
        case transfer_strategy::multipart: return "multipart";
        default: return "unknown";
    }
}

/**
 * @brief Files at or above the threshold go multipart
 */
[[nodiscard]] constexpr auto select_strategy(uint64_t size, uint64_t threshold)
    -> transfer_strategy {
    return size >= threshold ? transfer_strategy::multipart
                             : transfer_strategy::single_shot;
}

/**
 * @brief One physical file scheduled for transfer
 */
struct transfer_task {
    /// Local path (upload) or object key relative to the stage path (download)
    std::string source;
    /// Name reported in the result row
    std::string name;
    /// Object name (upload) or local file name (download)
    std::string target;
    uint64_t size = 0;

    /// Compression the source already carries
    compression_format source_compression = compression_format::none;
    /// Upload: LZ4 before encryption. Download: LZ4-decompress after decryption.
    bool compress = false;

    std::optional<std::string> ingest_client_name;
    std::optional<std::string> ingest_client_key;
};

/**
 * @brief Per-file outcome status
 */
enum class transfer_status {
    uploaded,
    downloaded,
    skipped,
    error
};

[[nodiscard]] constexpr auto to_string(transfer_status status) -> const char* {
    switch (status) {
        case transfer_status::uploaded: return "UPLOADED";
        case transfer_status::downloaded: return "DOWNLOADED";
        case transfer_status::skipped: return "SKIPPED";
        case transfer_status::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result of one file transfer
 */
struct transfer_result {
    std::string source;
    std::string target;
    transfer_status status = transfer_status::error;
    uint64_t source_size = 0;
    uint64_t destination_size = 0;
    std::string message;
    std::chrono::milliseconds elapsed{0};
    error_code code = error_code::success;
    std::size_t retries = 0;
    transfer_strategy strategy = transfer_strategy::single_shot;
};

/**
 * @brief User metadata keys attached to stage objects
 */
namespace metadata_keys {
inline constexpr std::string_view wrapped_key = "st_key";
inline constexpr std::string_view key_iv = "st_key_iv";
inline constexpr std::string_view data_iv = "st_iv";
inline constexpr std::string_view material_description = "st_matdesc";
inline constexpr std::string_view digest = "st_digest";
inline constexpr std::string_view ingest_client_name = "st_ingest_client_name";
inline constexpr std::string_view ingest_client_key = "st_ingest_client_key";
}  // namespace metadata_keys

/**
 * @brief Stored object metadata
 */
struct object_metadata {
    uint64_t content_length = 0;
    std::string etag;
    /// User metadata, keys lower-cased without provider prefix
    std::map<std::string, std::string> user_metadata;

    [[nodiscard]] auto get(std::string_view key) const -> std::optional<std::string> {
        auto it = user_metadata.find(detail::to_lower(key));
        if (it == user_metadata.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(std::string_view key, std::string value) {
        user_metadata[detail::to_lower(key)] = std::move(value);
    }
};

/**
 * @brief Entry returned by listing a stage
 */
struct object_summary {
    std::string key;
    uint64_t size = 0;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CORE_TRANSFER_TYPES_H
