/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the transfer worker pools
 */

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::stage_transfer::adapters::test {

class FixedTransferPoolTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(FixedTransferPoolTest, RunsEveryTask) {
    fixed_transfer_pool pool(4, "unit_pool");
    EXPECT_EQ(pool.worker_count(), 4u);
    EXPECT_TRUE(pool.is_running());

    std::atomic<int> executed{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.submit([&] { ++executed; }));
    }
    for (auto& future : futures) {
        future.get();
    }
    EXPECT_EQ(executed.load(), 32);
}

TEST_F(FixedTransferPoolTest, ConcurrencyIsBoundedByWorkers) {
    fixed_transfer_pool pool(3);

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 12; ++i) {
        futures.push_back(pool.submit([] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }));
    }
    for (auto& future : futures) {
        future.get();
    }
    EXPECT_LE(pool.peak_concurrency(), 3u);
    EXPECT_GE(pool.peak_concurrency(), 2u);
}

TEST_F(FixedTransferPoolTest, ExceptionsReachTheFuture) {
    fixed_transfer_pool pool(1);
    auto future = pool.submit([] { throw std::runtime_error("worker failure"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    auto next = pool.submit([] {});
    EXPECT_NO_THROW(next.get());
}

TEST_F(FixedTransferPoolTest, StageCounters) {
    fixed_transfer_pool pool(1);
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    auto first = pool.submit_to_stage([opened] { opened.wait(); }, "daily");
    auto second = pool.submit_to_stage([] {}, "daily");
    auto other = pool.submit_to_stage([] {}, "weekly");

    EXPECT_EQ(pool.pending_tasks("daily"), 2u);
    EXPECT_EQ(pool.pending_tasks("weekly"), 1u);
    EXPECT_EQ(pool.pending_tasks("missing"), 0u);

    gate.set_value();
    first.get();
    second.get();
    other.get();
    EXPECT_EQ(pool.pending_tasks("daily"), 0u);
}

TEST_F(FixedTransferPoolTest, ShutdownRejectsNewTasks) {
    fixed_transfer_pool pool(2);
    std::atomic<int> executed{0};
    auto queued = pool.submit([&] { ++executed; });

    pool.shutdown();
    EXPECT_FALSE(pool.is_running());
    queued.get();
    EXPECT_EQ(executed.load(), 1);

    auto rejected = pool.submit([] {});
    EXPECT_THROW(rejected.get(), std::runtime_error);
}

TEST(TransferPoolFactoryTest, CreatesRequestedWorkers) {
    auto pool = transfer_pool_factory::create(5, "factory_pool");
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->worker_count(), 5u);
    EXPECT_TRUE(pool->is_running());

    std::atomic<int> executed{0};
    auto future = pool->submit_to_stage([&] { ++executed; }, "stage");
    future.get();
    EXPECT_EQ(executed.load(), 1);
}

}  // namespace kcenon::stage_transfer::adapters::test
