/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::stage_transfer::benchmark {

namespace {

auto make_engine(uint32_t seed) -> std::mt19937 {
    return std::mt19937(seed == 0 ? std::random_device{}() : seed);
}

void append(std::vector<std::byte>& out, const std::string& text, std::size_t limit) {
    for (char c : text) {
        if (out.size() >= limit) {
            return;
        }
        out.push_back(static_cast<std::byte>(c));
    }
}

}  // namespace

// ============================================================================
// test_data_generator
// ============================================================================

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    auto gen = make_engine(seed);
    std::vector<std::byte> data(size);
    std::generate(data.begin(), data.end(),
                  [&gen] { return static_cast<std::byte>(gen() & 0xFF); });
    return data;
}

auto test_data_generator::generate_text_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    static const std::array<const char*, 8> regions = {
        "us-east-1", "us-west-2", "eu-west-1", "eu-central-1",
        "ap-northeast-2", "ap-southeast-1", "sa-east-1", "ca-central-1"};
    static const std::array<const char*, 4> states = {"SHIPPED", "PENDING", "RETURNED",
                                                      "CANCELLED"};

    auto gen = make_engine(seed);
    std::uniform_int_distribution<int> region(0, static_cast<int>(regions.size()) - 1);
    std::uniform_int_distribution<int> state(0, static_cast<int>(states.size()) - 1);
    std::uniform_int_distribution<int> amount(1, 99999);

    std::vector<std::byte> data;
    data.reserve(size);
    append(data, "order_id,region,status,amount\n", size);

    for (uint64_t row = 1; data.size() < size; ++row) {
        std::ostringstream line;
        line << row << ',' << regions[region(gen)] << ',' << states[state(gen)] << ','
             << amount(gen) / 100 << '.' << std::setw(2) << std::setfill('0')
             << amount(gen) % 100 << '\n';
        append(data, line.str(), size);
    }
    return data;
}

auto test_data_generator::generate_data_with_compressibility(
    std::size_t size,
    double compressibility_ratio,
    uint32_t seed) -> std::vector<std::byte> {
    const double clamped = std::clamp(compressibility_ratio, 0.0, 1.0);
    const int alphabet = std::max(1, static_cast<int>(256 * (1.0 - clamped)));

    auto gen = make_engine(seed);
    std::uniform_int_distribution<int> symbol(0, alphabet - 1);

    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(symbol(gen));
    }
    return data;
}

// ============================================================================
// temp_file_manager
// ============================================================================

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir)
    : base_dir_(base_dir.empty()
                    ? std::filesystem::temp_directory_path() /
                          ("stage_transfer_bench_" + std::to_string(std::random_device{}()))
                    : base_dir) {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto temp_file_manager::create_file(const std::string& name,
                                    const std::vector<std::byte>& data)
    -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_file_manager::create_random_file(const std::string& name, std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    return create_file(name, test_data_generator::generate_random_data(size, seed));
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

// ============================================================================
// Formatting
// ============================================================================

auto format_bytes(uint64_t bytes) -> std::string {
    static const std::array<const char*, 4> units = {"B", "KB", "MB", "GB"};

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << ' ' << units[unit];
    } else {
        oss << std::fixed << std::setprecision(2) << value << ' ' << units[unit];
    }
    return oss.str();
}

}  // namespace kcenon::stage_transfer::benchmark
