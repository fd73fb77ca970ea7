/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_STAGE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_STAGE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::stage_transfer::benchmark {

/**
 * @brief Payload generators for staged files
 */
class test_data_generator {
public:
    /**
     * @brief Incompressible bytes, like an already compressed or encrypted file
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief CSV rows of the kind usually loaded through a stage
     * @param seed Random seed (0 for random)
     */
    static auto generate_text_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Bytes drawn from an alphabet that shrinks as the ratio grows
     * @param compressibility_ratio 0.0 = random, 1.0 = a single repeated byte
     */
    static auto generate_data_with_compressibility(
        std::size_t size,
        double compressibility_ratio,
        uint32_t seed = 0) -> std::vector<std::byte>;
};

/**
 * @brief Directory of benchmark files, removed with the manager
 */
class temp_file_manager {
public:
    /**
     * @param base_dir Directory to use; a fresh one under the system temp
     *                 directory when empty
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

private:
    std::filesystem::path base_dir_;
};

/**
 * @brief Format bytes as human-readable string (e.g. "1.50 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_file = 64 * KB;
constexpr std::size_t medium_file = 4 * MB;
constexpr std::size_t large_file = 32 * MB;

// Multipart settings used by the transfer benchmarks
constexpr std::size_t part_size = 1 * MB;
constexpr std::size_t multipart_threshold = 8 * MB;
}  // namespace sizes

/**
 * @brief Performance targets
 */
namespace targets {
constexpr double lz4_compress_mbps = 400.0;        // >= 400 MB/s
constexpr double lz4_decompress_mbps = 1500.0;     // >= 1.5 GB/s

// Envelope encryption (AES-GCM data key + digest)
constexpr double envelope_seal_mbps = 300.0;       // >= 300 MB/s
constexpr double envelope_open_mbps = 300.0;       // >= 300 MB/s

// Per-file overhead of a PUT against a local stage
constexpr double per_file_overhead_ms = 5.0;       // < 5ms
}  // namespace targets

}  // namespace kcenon::stage_transfer::benchmark

#endif  // KCENON_STAGE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
