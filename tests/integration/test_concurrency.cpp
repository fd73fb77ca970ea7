/**
 * @file test_concurrency.cpp
 * @brief Integration tests for parallel transfers and cancellation
 */

#include "test_fixtures.h"

#include <set>

namespace kcenon::stage_transfer::test {

class ConcurrentTransferTest : public StageFixture {
protected:
    void create_files(std::size_t count, std::size_t size) {
        for (std::size_t i = 0; i < count; ++i) {
            create_text_file("part_" + std::to_string(i) + ".csv", size + i);
        }
    }
};

TEST_F(ConcurrentTransferTest, ParallelUploadIsFasterThanSerialSum) {
    latency_ = std::chrono::milliseconds(50);
    create_files(20, 1000);

    auto report = put("*.csv", "parallel=8 auto_compress=false");
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report.value().results.size(), 20u);
    EXPECT_EQ(report.value().count(transfer_status::uploaded), 20u);

    std::chrono::milliseconds serial{0};
    for (const auto& row : report.value().results) {
        serial += row.elapsed;
    }
    EXPECT_GE(serial.count(), 20 * 50);
    EXPECT_LT(report.value().elapsed, serial);
}

TEST_F(ConcurrentTransferTest, EveryFileGetsExactlyOneRow) {
    create_files(30, 500);

    auto report = put("*.csv", "parallel=6 auto_compress=false");
    ASSERT_TRUE(report.has_value());

    std::set<std::string> names;
    for (const auto& row : report.value().results) {
        EXPECT_TRUE(names.insert(row.source).second) << row.source;
    }
    EXPECT_EQ(names.size(), 30u);
}

TEST_F(ConcurrentTransferTest, ParallelDownloadPreservesContent) {
    create_files(12, 2000);
    ASSERT_TRUE(put("*.csv", "parallel=4").has_value());

    auto report = get("parallel=4 decompress=true");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().count(transfer_status::downloaded), 12u);
    for (std::size_t i = 0; i < 12; ++i) {
        const auto name = "part_" + std::to_string(i) + ".csv";
        EXPECT_TRUE(files_equal(upload_dir_ / name, download_dir_ / name)) << name;
    }
}

TEST_F(ConcurrentTransferTest, ConcurrentCommandsOnOneStage) {
    create_files(8, 300);
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            auto report = run("PUT file://" + (upload_dir_ / "*.csv").string() +
                              " @local_stage/run" + std::to_string(i) +
                              " parallel=2 auto_compress=false");
            if (!report || !report.value().succeeded() ||
                report.value().count(transfer_status::uploaded) != 8) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_TRUE(std::filesystem::exists(stage_dir_ / "run3" / "part_7.csv"));
}

// Cancellation
class CancellationTest : public ConcurrentTransferTest {};

TEST_F(CancellationTest, CancelStopsRemainingFiles) {
    latency_ = std::chrono::milliseconds(100);
    create_files(20, 100);

    auto agent = transfer_agent::create(
        "PUT file://" + (upload_dir_ / "*.csv").string() +
        " @local_stage/daily parallel=2 auto_compress=false",
        make_context());
    ASSERT_TRUE(agent.has_value());

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        agent.value()->cancel();
    });
    auto report = agent.value()->execute();
    canceller.join();

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report.value().results.size(), 20u);
    const auto uploaded = report.value().count(transfer_status::uploaded);
    EXPECT_LT(uploaded, 20u);
    EXPECT_GE(report.value().count(transfer_status::error), 1u);
    for (const auto& row : report.value().results) {
        if (row.status == transfer_status::error) {
            EXPECT_EQ(row.code, error_code::cancelled);
        }
    }

    std::size_t staged = 0;
    for (const auto& entry : std::filesystem::directory_iterator(stage_dir_ / "daily")) {
        const auto name = entry.path().filename().string();
        EXPECT_EQ(name.find(".st_tmp."), std::string::npos) << name;
        if (entry.path().extension() == ".csv") {
            ++staged;
        }
    }
    EXPECT_EQ(staged, uploaded);
}

}  // namespace kcenon::stage_transfer::test
