/**
 * @file put_get_local_stage.cpp
 * @brief PUT and GET round trip against a stage on the local filesystem
 *
 * This example demonstrates:
 * - Describing a LOCAL_FS stage through a stage_session
 * - Uploading a set of files with a PUT command
 * - Downloading a subset of them with a GET command and a pattern
 * - Printing the per-file result table
 */

#include <kcenon/stage_transfer/stage_transfer.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace kcenon::stage_transfer;

namespace {

/**
 * @brief Stage session answering every request with one LOCAL_FS stage
 */
class local_stage_session : public stage_session {
public:
    explicit local_stage_session(std::filesystem::path root) : root_(std::move(root)) {}

    auto describe_stage(const stage_request& request) -> result<std::string> override {
        std::cout << "Resolving stage @" << request.stage_name << std::endl;
        return R"({"locationType":"LOCAL_FS","location":")" + root_.string() + R"(/"})";
    }

private:
    std::filesystem::path root_;
};

void create_sample_files(const std::filesystem::path& dir, int count) {
    std::filesystem::create_directories(dir);
    for (int i = 0; i < count; ++i) {
        std::ofstream file(dir / ("orders_" + std::to_string(i) + ".csv"));
        for (int row = 0; row < 1000; ++row) {
            file << row << ",customer_" << (row % 37) << "," << (row * 13 % 1000) << "\n";
        }
    }
}

auto run_and_print(const std::string& command, const transfer_context& context) -> bool {
    std::cout << std::endl << "> " << command << std::endl;

    auto report = run_transfer_command(command, context);
    if (!report) {
        std::cerr << "Command failed: " << describe(report.error()) << std::endl;
        return false;
    }

    std::cout << result_reporter::format_table(result_reporter::to_rows(report.value()));
    return true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [work_dir]" << std::endl;
    std::cout << std::endl;
    std::cout << "Creates sample CSV files under <work_dir>/source, stages them" << std::endl;
    std::cout << "under <work_dir>/stage and downloads some back to <work_dir>/download." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    const std::filesystem::path work_dir =
        argc > 1 ? std::filesystem::path(argv[1])
                 : std::filesystem::temp_directory_path() / "stage_transfer_example";
    const auto source_dir = work_dir / "source";
    const auto stage_dir = work_dir / "stage";
    const auto download_dir = work_dir / "download";

    create_sample_files(source_dir, 5);
    std::filesystem::create_directories(stage_dir);

    transfer_context context;
    context.session_handle = std::make_shared<local_stage_session>(stage_dir);
    context.command_id = "put-get-example";

    if (!run_and_print("PUT file://" + (source_dir / "*.csv").string() +
                           " @example_stage/orders parallel=4 overwrite=true",
                       context)) {
        return 1;
    }

    if (!run_and_print("GET @example_stage/orders file://" + download_dir.string() +
                           " pattern=.*orders_[0-2].*",
                       context)) {
        return 1;
    }

    std::cout << std::endl << "Downloaded files are in " << download_dir << std::endl;
    return 0;
}
