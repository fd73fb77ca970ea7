/**
 * @file compression_engine.h
 * @brief LZ4 frame compression for stage payloads
 */

#ifndef KCENON_STAGE_TRANSFER_CORE_COMPRESSION_ENGINE_H
#define KCENON_STAGE_TRANSFER_CORE_COMPRESSION_ENGINE_H

#include <kcenon/stage_transfer/core/transfer_types.h>
#include <kcenon/stage_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace kcenon::stage_transfer {

/**
 * @brief Compression level
 */
enum class compression_level {
    fast,     ///< LZ4 default compression (faster)
    high      ///< LZ4 HC compression (higher ratio)
};

/**
 * @brief Suffix appended to the target name of a compressed payload
 */
inline constexpr std::string_view compressed_suffix = ".lz4";

/**
 * @brief Compression statistics
 */
struct compression_stats {
    uint64_t total_input_bytes = 0;      ///< Total bytes before compression
    uint64_t total_output_bytes = 0;     ///< Total bytes after compression
    uint64_t compression_calls = 0;
    uint64_t decompression_calls = 0;

    /**
     * @brief Calculate compression ratio (output/input)
     * @return Compression ratio (1.0 means no compression benefit)
     */
    [[nodiscard]] auto compression_ratio() const -> double {
        if (total_input_bytes == 0) return 1.0;
        return static_cast<double>(total_output_bytes) /
               static_cast<double>(total_input_bytes);
    }

    [[nodiscard]] auto bytes_saved() const -> uint64_t {
        if (total_output_bytes >= total_input_bytes) return 0;
        return total_input_bytes - total_output_bytes;
    }
};

/**
 * @brief LZ4 compression engine for whole-file payloads
 *
 * Payloads are stored as self-describing LZ4 frames so that any LZ4 tool
 * can read an object downloaded without decompression.
 *
 * @code
 * compression_engine engine;
 * auto packed = engine.compress_frame(data);
 * if (packed.has_value()) {
 *     auto restored = engine.decompress_frame(packed.value());
 * }
 * @endcode
 */
class compression_engine {
public:
    explicit compression_engine(compression_level level = compression_level::fast);

    ~compression_engine();

    compression_engine(const compression_engine&) = delete;
    auto operator=(const compression_engine&) -> compression_engine& = delete;
    compression_engine(compression_engine&&) noexcept;
    auto operator=(compression_engine&&) noexcept -> compression_engine&;

    /**
     * @brief Compress a payload into one LZ4 frame
     * @return Frame bytes, or feature_unavailable when built without LZ4
     */
    [[nodiscard]] auto compress_frame(std::span<const std::byte> input)
        -> result<byte_buffer>;

    /**
     * @brief Decompress one LZ4 frame
     * @return Original payload, or corrupted_payload for malformed input
     */
    [[nodiscard]] auto decompress_frame(std::span<const std::byte> input)
        -> result<byte_buffer>;

    /**
     * @brief Estimate whether compressing the data pays off
     *
     * Pre-compressed formats are rejected by signature. Otherwise a 4 KiB
     * sample is block-compressed and the ratio compared with 1.1.
     */
    [[nodiscard]] auto is_compressible(std::span<const std::byte> data) const -> bool;

    [[nodiscard]] auto stats() const -> compression_stats;

    auto reset_stats() -> void;

    [[nodiscard]] auto level() const -> compression_level;

    auto set_level(compression_level level) -> void;

    /**
     * @brief Check that the library was built with LZ4
     */
    [[nodiscard]] static auto is_available() noexcept -> bool;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Detect a compression format from the file extension
 * @return The format, or compression_format::none when unknown
 */
[[nodiscard]] auto detect_compression_by_extension(std::string_view filename)
    -> compression_format;

/**
 * @brief Detect a compression format from the leading magic bytes
 * @return The format, or compression_format::none when unknown
 */
[[nodiscard]] auto detect_compression_by_magic(std::span<const std::byte> data)
    -> compression_format;

/**
 * @brief Resolve the effective source compression of one file
 *
 * An explicit format is taken as given. auto_detect consults the extension
 * first and the magic bytes second.
 */
[[nodiscard]] auto resolve_source_compression(compression_format requested,
                                              std::string_view filename,
                                              std::span<const std::byte> head)
    -> compression_format;

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CORE_COMPRESSION_ENGINE_H
