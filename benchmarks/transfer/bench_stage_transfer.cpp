/**
 * @file bench_stage_transfer.cpp
 * @brief End-to-end PUT and GET benchmarks against a local stage
 *
 * Performance Targets:
 * - Per-file overhead of a PUT: < 5ms
 */

#include <benchmark/benchmark.h>

#include <kcenon/stage_transfer/stage_transfer.h>

#include "utils/benchmark_helpers.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::stage_transfer::benchmark {

namespace {

/**
 * @brief stage_session describing a LOCAL_FS stage rooted in a directory
 */
class local_stage_session : public stage_session {
public:
    explicit local_stage_session(std::filesystem::path root) : root_(std::move(root)) {}

    auto describe_stage(const stage_request& /*request*/) -> result<std::string> override {
        return R"({"locationType":"LOCAL_FS","location":")" + root_.string() + R"(/"})";
    }

private:
    std::filesystem::path root_;
};

/**
 * @brief Source files, a stage directory and a download directory
 */
struct transfer_workspace {
    temp_file_manager sources;
    temp_file_manager stage;
    temp_file_manager downloads;

    auto context(std::size_t parallel) const -> transfer_context {
        transfer_context ctx;
        ctx.session_handle = std::make_shared<local_stage_session>(stage.base_dir());
        ctx.session.parallel = parallel;
        ctx.session.big_file_threshold = sizes::multipart_threshold;
        ctx.retry = retry_policy::immediate(0);
        multipart_config multipart;
        multipart.part_size = sizes::part_size;
        multipart.max_concurrent_parts = parallel;
        ctx.multipart = multipart;
        return ctx;
    }

    auto put_command() const -> std::string {
        return "PUT file://" + (sources.base_dir() / "*").string() +
               " @bench/data overwrite=true auto_compress=false";
    }

    auto get_command() const -> std::string {
        return "GET @bench/data file://" + downloads.base_dir().string();
    }
};

}  // namespace

/**
 * @brief PUT throughput by file count and parallelism
 *
 * Args: {file count, parallel}
 */
static void BM_Put_Many_Small_Files(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto parallel = static_cast<std::size_t>(state.range(1));

    transfer_workspace workspace;
    for (std::size_t i = 0; i < file_count; ++i) {
        workspace.sources.create_random_file(
            "part_" + std::to_string(i) + ".bin", sizes::small_file, static_cast<uint32_t>(i + 1));
    }

    for (auto _ : state) {
        auto report = run_transfer_command(workspace.put_command(), workspace.context(parallel));
        if (!report) {
            state.SkipWithError("PUT failed");
            return;
        }
        ::benchmark::DoNotOptimize(report.value());
    }

    state.counters["files"] = static_cast<double>(file_count);
    state.SetBytesProcessed(static_cast<int64_t>(file_count * sizes::small_file) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief PUT of one file, single-shot below the threshold and multipart above
 */
static void BM_Put_Single_File(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    transfer_workspace workspace;
    workspace.sources.create_random_file("single.bin", file_size, 42);

    for (auto _ : state) {
        auto report = run_transfer_command(workspace.put_command(), workspace.context(4));
        if (!report) {
            state.SkipWithError("PUT failed");
            return;
        }
        ::benchmark::DoNotOptimize(report.value());
    }

    state.SetLabel(format_bytes(file_size));
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief GET of previously staged files
 */
static void BM_Get_Staged_Files(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));

    transfer_workspace workspace;
    for (std::size_t i = 0; i < file_count; ++i) {
        workspace.sources.create_random_file(
            "part_" + std::to_string(i) + ".bin", sizes::small_file, static_cast<uint32_t>(i + 1));
    }
    auto staged = run_transfer_command(workspace.put_command(), workspace.context(4));
    if (!staged) {
        state.SkipWithError("Failed to stage files");
        return;
    }

    for (auto _ : state) {
        auto report = run_transfer_command(workspace.get_command(), workspace.context(4));
        if (!report) {
            state.SkipWithError("GET failed");
            return;
        }
        ::benchmark::DoNotOptimize(report.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_count * sizes::small_file) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Put_Many_Small_Files)
    ->Args({16, 1})
    ->Args({16, 4})
    ->Args({64, 4})
    ->Args({64, 16})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Put_Single_File)
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Get_Staged_Files)
    ->Arg(16)
    ->Arg(64)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::stage_transfer::benchmark
