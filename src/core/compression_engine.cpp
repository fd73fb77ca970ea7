/**
 * @file compression_engine.cpp
 * @brief LZ4 frame compression implementation
 */

#include <kcenon/stage_transfer/core/compression_engine.h>
#include <kcenon/stage_transfer/core/logging.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#ifdef STAGE_TRANS_ENABLE_LZ4
#include <lz4.h>
#include <lz4frame.h>
#include <lz4hc.h>
#endif

namespace kcenon::stage_transfer {

namespace {

struct magic_signature {
    std::array<uint8_t, 4> bytes;
    std::size_t length;
    compression_format format;
};

constexpr std::array<magic_signature, 7> compression_signatures = {{
    {{0x1F, 0x8B}, 2, compression_format::gzip},
    {{0x42, 0x5A, 0x68}, 3, compression_format::bzip2},
    {{0x28, 0xB5, 0x2F, 0xFD}, 4, compression_format::zstd},
    {{0x04, 0x22, 0x4D, 0x18}, 4, compression_format::lz4},
    // zlib header with the three standard compression levels
    {{0x78, 0x01}, 2, compression_format::deflate},
    {{0x78, 0x9C}, 2, compression_format::deflate},
    {{0x78, 0xDA}, 2, compression_format::deflate},
}};

struct extension_mapping {
    std::string_view extension;
    compression_format format;
};

constexpr std::array<extension_mapping, 8> compression_extensions = {{
    {".gz", compression_format::gzip},
    {".bz2", compression_format::bzip2},
    {".br", compression_format::brotli},
    {".zst", compression_format::zstd},
    {".deflate", compression_format::deflate},
    {".raw_deflate", compression_format::raw_deflate},
    {".lz4", compression_format::lz4},
    {".tgz", compression_format::gzip},
}};

// Other binary formats that do not benefit from a second compression pass
constexpr std::array<std::array<uint8_t, 4>, 5> incompressible_signatures = {{
    {0x50, 0x4B, 0x03, 0x04},  // ZIP
    {0xFF, 0xD8, 0xFF, 0x00},  // JPEG (3 bytes)
    {0x89, 0x50, 0x4E, 0x47},  // PNG
    {0x37, 0x7A, 0xBC, 0xAF},  // 7-Zip
    {0x50, 0x41, 0x52, 0x31},  // Parquet
}};

auto matches(std::span<const std::byte> data, const uint8_t* bytes, std::size_t length) -> bool {
    if (data.size() < length) {
        return false;
    }
    for (std::size_t i = 0; i < length; ++i) {
        if (static_cast<uint8_t>(data[i]) != bytes[i]) {
            return false;
        }
    }
    return true;
}

auto is_precompressed_format(std::span<const std::byte> data) -> bool {
    if (detect_compression_by_magic(data) != compression_format::none) {
        return true;
    }
    for (std::size_t i = 0; i < incompressible_signatures.size(); ++i) {
        const std::size_t length = (i == 1) ? 3 : 4;
        if (matches(data, incompressible_signatures[i].data(), length)) {
            return true;
        }
    }
    return false;
}

// is_compressible() block-compresses this much of the payload head and
// wants at least this input/output ratio
constexpr std::size_t sample_bytes = 4096;
constexpr double worthwhile_ratio = 1.1;

#ifdef STAGE_TRANS_ENABLE_LZ4
// Output block used while draining a decompression context
constexpr std::size_t decompress_block_size = 64 * 1024;

struct lz4f_dctx_wrapper {
    LZ4F_dctx* ctx = nullptr;

    lz4f_dctx_wrapper() {
        if (LZ4F_isError(LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION))) {
            ctx = nullptr;
        }
    }

    ~lz4f_dctx_wrapper() {
        if (ctx) {
            LZ4F_freeDecompressionContext(ctx);
        }
    }

    lz4f_dctx_wrapper(const lz4f_dctx_wrapper&) = delete;
    auto operator=(const lz4f_dctx_wrapper&) -> lz4f_dctx_wrapper& = delete;
};
#endif

}  // namespace

class compression_engine::impl {
public:
    explicit impl(compression_level level) : level_(level) {}

    auto compress_frame(std::span<const std::byte> input) -> result<byte_buffer> {
#ifndef STAGE_TRANS_ENABLE_LZ4
        (void)input;
        ST_LOG_WARN(log_category::compression, "LZ4 compression not enabled");
        return unexpected(error(error_code::feature_unavailable, "LZ4 compression not enabled"));
#else
        LZ4F_preferences_t prefs;
        std::memset(&prefs, 0, sizeof(prefs));
        prefs.frameInfo.contentSize = input.size();
        prefs.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
        prefs.compressionLevel =
            (level_ == compression_level::high) ? LZ4HC_CLEVEL_DEFAULT : 0;

        const std::size_t bound = LZ4F_compressFrameBound(input.size(), &prefs);
        byte_buffer output(bound);

        const std::size_t written = LZ4F_compressFrame(
            output.data(), output.size(), input.data(), input.size(), &prefs);
        if (LZ4F_isError(written)) {
            ST_LOG_ERROR(log_category::compression,
                std::string("LZ4 frame compression failed: ") + LZ4F_getErrorName(written));
            return unexpected(error(error_code::internal_error,
                std::string("LZ4 frame compression failed: ") + LZ4F_getErrorName(written)));
        }
        output.resize(written);

        ST_LOG_TRACE(log_category::compression,
            "Compressed " + std::to_string(input.size()) + " -> " +
            std::to_string(written) + " bytes");

        {
            std::lock_guard lock(stats_mutex_);
            stats_.compression_calls++;
            stats_.total_input_bytes += input.size();
            stats_.total_output_bytes += output.size();
        }

        return output;
#endif
    }

    auto decompress_frame(std::span<const std::byte> input) -> result<byte_buffer> {
#ifndef STAGE_TRANS_ENABLE_LZ4
        (void)input;
        ST_LOG_WARN(log_category::compression, "LZ4 compression not enabled");
        return unexpected(error(error_code::feature_unavailable, "LZ4 compression not enabled"));
#else
        if (input.empty()) {
            return unexpected(error(error_code::corrupted_payload, "empty LZ4 frame"));
        }

        lz4f_dctx_wrapper dctx;
        if (!dctx.ctx) {
            return unexpected(error(error_code::internal_error,
                "failed to create LZ4 decompression context"));
        }

        byte_buffer output;
        std::array<std::byte, decompress_block_size> block{};
        std::size_t consumed = 0;

        while (true) {
            std::size_t dst_size = block.size();
            std::size_t src_size = input.size() - consumed;

            const std::size_t hint = LZ4F_decompress(
                dctx.ctx, block.data(), &dst_size,
                input.data() + consumed, &src_size, nullptr);
            if (LZ4F_isError(hint)) {
                ST_LOG_ERROR(log_category::compression,
                    std::string("LZ4 frame decompression failed: ") + LZ4F_getErrorName(hint));
                return unexpected(error(error_code::corrupted_payload,
                    std::string("LZ4 frame decompression failed: ") + LZ4F_getErrorName(hint)));
            }

            consumed += src_size;
            output.insert(output.end(), block.begin(),
                          block.begin() + static_cast<std::ptrdiff_t>(dst_size));

            if (hint == 0) {
                break;
            }
            if (consumed >= input.size() && dst_size == 0) {
                return unexpected(error(error_code::corrupted_payload,
                    "LZ4 frame is truncated"));
            }
        }

        ST_LOG_TRACE(log_category::compression,
            "Decompressed " + std::to_string(input.size()) + " -> " +
            std::to_string(output.size()) + " bytes");

        {
            std::lock_guard lock(stats_mutex_);
            stats_.decompression_calls++;
        }

        return output;
#endif
    }

    auto is_compressible(std::span<const std::byte> data) const -> bool {
#ifndef STAGE_TRANS_ENABLE_LZ4
        (void)data;
        return false;
#else
        if (data.empty()) {
            return false;
        }

        if (is_precompressed_format(data)) {
            ST_LOG_TRACE(log_category::compression, "Payload already carries a compression signature");
            return false;
        }

        const auto sample = data.first(std::min(data.size(), sample_bytes));
        const auto sample_len = static_cast<int>(sample.size());
        std::vector<char> scratch(static_cast<std::size_t>(LZ4_compressBound(sample_len)));

        const int packed = LZ4_compress_default(reinterpret_cast<const char*>(sample.data()),
                                                scratch.data(), sample_len,
                                                static_cast<int>(scratch.size()));
        return packed > 0 &&
               static_cast<double>(sample_len) / packed >= worthwhile_ratio;
#endif
    }

    auto stats() const -> compression_stats {
        std::lock_guard lock(stats_mutex_);
        return stats_;
    }

    auto reset_stats() -> void {
        std::lock_guard lock(stats_mutex_);
        stats_ = compression_stats{};
    }

    auto level() const -> compression_level { return level_; }

    auto set_level(compression_level level) -> void { level_ = level; }

private:
    compression_level level_;
    compression_stats stats_;
    mutable std::mutex stats_mutex_;
};

compression_engine::compression_engine(compression_level level)
    : impl_(std::make_unique<impl>(level)) {}

compression_engine::~compression_engine() = default;

compression_engine::compression_engine(compression_engine&&) noexcept = default;

auto compression_engine::operator=(compression_engine&&) noexcept
    -> compression_engine& = default;

auto compression_engine::compress_frame(std::span<const std::byte> input)
    -> result<byte_buffer> {
    return impl_->compress_frame(input);
}

auto compression_engine::decompress_frame(std::span<const std::byte> input)
    -> result<byte_buffer> {
    return impl_->decompress_frame(input);
}

auto compression_engine::is_compressible(std::span<const std::byte> data) const -> bool {
    return impl_->is_compressible(data);
}

auto compression_engine::stats() const -> compression_stats {
    return impl_->stats();
}

auto compression_engine::reset_stats() -> void {
    impl_->reset_stats();
}

auto compression_engine::level() const -> compression_level {
    return impl_->level();
}

auto compression_engine::set_level(compression_level level) -> void {
    impl_->set_level(level);
}

auto compression_engine::is_available() noexcept -> bool {
#ifdef STAGE_TRANS_ENABLE_LZ4
    return true;
#else
    return false;
#endif
}

// ============================================================================
// Format detection
// ============================================================================

auto detect_compression_by_extension(std::string_view filename) -> compression_format {
    const auto lowered = detail::to_lower(filename);
    for (const auto& mapping : compression_extensions) {
        if (lowered.size() > mapping.extension.size() &&
            lowered.compare(lowered.size() - mapping.extension.size(),
                            mapping.extension.size(), mapping.extension) == 0) {
            return mapping.format;
        }
    }
    return compression_format::none;
}

auto detect_compression_by_magic(std::span<const std::byte> data) -> compression_format {
    for (const auto& sig : compression_signatures) {
        if (matches(data, sig.bytes.data(), sig.length)) {
            return sig.format;
        }
    }
    return compression_format::none;
}

auto resolve_source_compression(compression_format requested,
                                std::string_view filename,
                                std::span<const std::byte> head)
    -> compression_format {
    if (requested != compression_format::auto_detect) {
        return requested;
    }
    auto by_extension = detect_compression_by_extension(filename);
    if (by_extension != compression_format::none) {
        return by_extension;
    }
    return detect_compression_by_magic(head);
}

}  // namespace kcenon::stage_transfer
