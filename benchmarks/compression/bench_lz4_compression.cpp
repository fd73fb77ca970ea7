/**
 * @file bench_lz4_compression.cpp
 * @brief Benchmarks for LZ4 frame compression of stage payloads
 *
 * Performance Targets:
 * - frame compression, fast level: >= 400 MB/s
 * - frame decompression: >= 1.5 GB/s
 */

#include <benchmark/benchmark.h>

#include <kcenon/stage_transfer/core/compression_engine.h>

#include "utils/benchmark_helpers.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kcenon::stage_transfer::benchmark {

namespace {

constexpr uint32_t csv_seed = 42;

void report_throughput(::benchmark::State& state, std::size_t payload_bytes) {
    state.SetBytesProcessed(static_cast<int64_t>(payload_bytes) * state.iterations());
}

}  // namespace

static void BM_LZ4_Frame_Compression(::benchmark::State& state, compression_level level) {
    const auto payload_bytes = static_cast<std::size_t>(state.range(0));
    const auto rows = test_data_generator::generate_text_data(payload_bytes, csv_seed);
    compression_engine engine(level);

    for (auto _ : state) {
        auto frame = engine.compress_frame(rows);
        if (!frame) {
            state.SkipWithError(frame.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(frame.value().data());
    }

    report_throughput(state, payload_bytes);
}

static void BM_LZ4_Frame_Decompression(::benchmark::State& state) {
    const auto payload_bytes = static_cast<std::size_t>(state.range(0));
    compression_engine engine;
    const auto frame =
        engine.compress_frame(test_data_generator::generate_text_data(payload_bytes, csv_seed));
    if (!frame) {
        state.SkipWithError(frame.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto restored = engine.decompress_frame(frame.value());
        if (!restored) {
            state.SkipWithError(restored.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(restored.value().data());
    }

    report_throughput(state, payload_bytes);
}

/**
 * @brief Frame size relative to the payload, by compressibility percentage
 */
static void BM_LZ4_Frame_Ratio(::benchmark::State& state) {
    const auto payload_bytes = static_cast<std::size_t>(state.range(0));
    const auto payload = test_data_generator::generate_data_with_compressibility(
        payload_bytes, static_cast<double>(state.range(1)) / 100.0, csv_seed);
    compression_engine engine;

    std::size_t frame_bytes = 0;
    for (auto _ : state) {
        auto frame = engine.compress_frame(payload);
        if (!frame) {
            state.SkipWithError(frame.error().message.c_str());
            return;
        }
        frame_bytes = frame.value().size();
        ::benchmark::DoNotOptimize(frame_bytes);
    }

    state.counters["ratio"] =
        static_cast<double>(frame_bytes) / static_cast<double>(payload_bytes);
    report_throughput(state, payload_bytes);
}

// auto_compress check on a payload it should reject
static void BM_Compressibility_Check(::benchmark::State& state) {
    const auto payload = test_data_generator::generate_random_data(sizes::medium_file, csv_seed);
    compression_engine engine;

    for (auto _ : state) {
        bool worthwhile = engine.is_compressible(payload);
        ::benchmark::DoNotOptimize(worthwhile);
    }
}

BENCHMARK_CAPTURE(BM_LZ4_Frame_Compression, fast, compression_level::fast)
    ->RangeMultiplier(8)
    ->Range(sizes::small_file, sizes::large_file)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK_CAPTURE(BM_LZ4_Frame_Compression, high, compression_level::high)
    ->RangeMultiplier(8)
    ->Range(sizes::small_file, sizes::medium_file)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_LZ4_Frame_Decompression)
    ->RangeMultiplier(8)
    ->Range(sizes::small_file, sizes::large_file)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_LZ4_Frame_Ratio)
    ->ArgsProduct({{static_cast<int64_t>(sizes::MB)}, {0, 50, 100}})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Compressibility_Check)->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::stage_transfer::benchmark
