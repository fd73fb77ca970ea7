/**
 * @file test_retry_executor.cpp
 * @brief Unit tests for the retry loop and multipart transfers
 */

#include <gtest/gtest.h>

#include <kcenon/stage_transfer/cloud/cloud_utils.h>
#include <kcenon/stage_transfer/cloud/multipart_transfer.h>
#include <kcenon/stage_transfer/cloud/retry_executor.h>

#include "../mocks/memory_storage_client.h"

#include <numeric>
#include <string>

namespace kcenon::stage_transfer::test {

namespace {

auto sequence_payload(std::size_t size) -> byte_buffer {
    byte_buffer data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>(i % 251);
    }
    return data;
}

}  // namespace

// ============================================================================
// Retry Executor
// ============================================================================

class RetryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RetryExecutorTest, SucceedsAfterRetryableFailures) {
    retry_executor executor(retry_policy::immediate(5));
    int calls = 0;

    auto outcome = executor.execute("upload", [&]() -> result<int> {
        if (++calls < 3) {
            return unexpected{error{error_code::throttled, "SlowDown"}};
        }
        return 7;
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(executor.attempts(), 3u);
    EXPECT_EQ(executor.retries(), 2u);
}

TEST_F(RetryExecutorTest, TerminalErrorIsNotRetried) {
    retry_executor executor(retry_policy::immediate(5));
    int calls = 0;

    auto outcome = executor.execute("download", [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::access_denied, "AccessDenied"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::access_denied);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor.retries(), 0u);
}

TEST_F(RetryExecutorTest, NoSpaceLeftIsNeverRetried) {
    retry_executor executor(retry_policy::immediate(25));
    int calls = 0;

    auto outcome = executor.execute("download", [&]() -> result<void> {
        ++calls;
        return unexpected{error{error_code::no_space_left, "No space left on device"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::no_space_left);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryExecutorTest, BudgetExhaustion) {
    retry_executor executor(retry_policy::immediate(2));
    int calls = 0;

    auto outcome = executor.execute("upload", [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::provider_unavailable, "HTTP 503"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::retries_exhausted);
    EXPECT_NE(outcome.error().message.find("HTTP 503"), std::string::npos);
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryExecutorTest, ZeroRetriesMakesOneAttempt) {
    retry_executor executor(retry_policy::immediate(0));
    int calls = 0;

    auto outcome = executor.execute("upload", [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::transient_network, "reset"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::retries_exhausted);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryExecutorTest, CancelledBeforeAttempt) {
    auto token = cancellation_token::create();
    token->cancel();
    retry_executor executor(retry_policy::immediate(3), token);
    int calls = 0;

    auto outcome = executor.execute("upload", [&]() -> result<int> {
        ++calls;
        return 1;
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::cancelled);
    EXPECT_EQ(calls, 0);
}

TEST_F(RetryExecutorTest, ExpiredTokenRefreshesWithoutConsumingBudget) {
    int refreshes = 0;
    retry_executor executor(retry_policy::immediate(0), nullptr, [&]() -> result<void> {
        ++refreshes;
        return {};
    });
    int calls = 0;

    auto outcome = executor.execute("upload", [&]() -> result<int> {
        if (++calls == 1) {
            return unexpected{error{error_code::token_expired, "ExpiredToken"}};
        }
        return 3;
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(refreshes, 1);
    EXPECT_EQ(executor.refreshes(), 1u);
    EXPECT_EQ(executor.retries(), 0u);
}

TEST_F(RetryExecutorTest, ExpiredTokenWithoutRefreshIsNotRetried) {
    retry_executor executor(retry_policy::immediate(5));
    int calls = 0;

    auto outcome = executor.execute("download", [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::token_expired, "ExpiredToken"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::token_expired);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor.retries(), 0u);
}

TEST_F(RetryExecutorTest, ExpiredTokenRefreshesAreCapped) {
    auto policy = retry_policy::immediate(5);
    policy.max_token_refreshes = 2;
    int refreshes = 0;
    retry_executor executor(policy, nullptr, [&]() -> result<void> {
        ++refreshes;
        return {};
    });
    int calls = 0;

    auto outcome = executor.execute("upload", [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::token_expired, "ExpiredToken"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::token_expired);
    EXPECT_EQ(refreshes, 2);
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryExecutorTest, FailedRefreshIsReturned) {
    retry_executor executor(retry_policy::immediate(5), nullptr, []() -> result<void> {
        return unexpected{error{error_code::session_expired, "session gone"}};
    });
    int calls = 0;

    auto outcome = executor.execute("upload", [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::token_expired, "ExpiredToken"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::session_expired);
    EXPECT_EQ(calls, 1);
}

TEST(RetryDelayTest, ExponentialWithCap) {
    retry_policy policy;
    policy.initial_delay = std::chrono::milliseconds(100);
    policy.max_delay = std::chrono::milliseconds(1000);
    policy.backoff_multiplier = 2.0;
    policy.use_jitter = false;

    EXPECT_EQ(cloud_utils::calculate_retry_delay(policy, 1).count(), 100);
    EXPECT_EQ(cloud_utils::calculate_retry_delay(policy, 2).count(), 200);
    EXPECT_EQ(cloud_utils::calculate_retry_delay(policy, 3).count(), 400);
    EXPECT_EQ(cloud_utils::calculate_retry_delay(policy, 10).count(), 1000);
}

TEST(RetryDelayTest, JitterStaysInRange) {
    retry_policy policy;
    policy.initial_delay = std::chrono::milliseconds(1000);
    policy.max_delay = std::chrono::milliseconds(1000);
    policy.use_jitter = true;

    for (int i = 0; i < 50; ++i) {
        const auto delay = cloud_utils::calculate_retry_delay(policy, 1).count();
        EXPECT_GE(delay, 500);
        EXPECT_LT(delay, 1500);
    }
}

// ============================================================================
// Multipart Transfer
// ============================================================================

class MultipartTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.part_size = 1024;
        config_.max_concurrent_parts = 3;
    }

    memory_storage_client client_;
    multipart_config config_;
};

TEST_F(MultipartTransferTest, PartCount) {
    EXPECT_EQ(multipart_transfer::part_count(0, 1024), 1u);
    EXPECT_EQ(multipart_transfer::part_count(1024, 1024), 1u);
    EXPECT_EQ(multipart_transfer::part_count(1025, 1024), 2u);
    EXPECT_EQ(multipart_transfer::part_count(10 * 1024, 1024), 10u);
}

TEST_F(MultipartTransferTest, UploadAssemblesPartsInOrder) {
    retry_executor executor(retry_policy::immediate(3));
    multipart_transfer transfer(client_, executor, config_);

    const auto payload = sequence_payload(10 * 1024 + 17);
    object_metadata metadata;
    metadata.set("st_digest", "abc");

    auto stored = transfer.upload("big.bin", payload, metadata);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value(), payload.size());
    EXPECT_EQ(client_.calls("upload_part"), 11u);

    auto object = client_.object("big.bin");
    EXPECT_EQ(object.data, payload);
    EXPECT_EQ(object.metadata.get("st_digest"), "abc");
    EXPECT_LE(client_.max_concurrent_uploads(), 3u);
}

TEST_F(MultipartTransferTest, FailedPartIsRetriedAlone) {
    client_.fail_next("upload_part", error_code::throttled, 2);
    retry_executor executor(retry_policy::immediate(5));
    multipart_transfer transfer(client_, executor, config_);

    const auto payload = sequence_payload(4 * 1024);
    auto stored = transfer.upload("retry.bin", payload, {});
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(client_.calls("upload_part"), 6u);
    EXPECT_EQ(executor.retries(), 2u);
    EXPECT_EQ(client_.object("retry.bin").data, payload);
}

TEST_F(MultipartTransferTest, TerminalPartFailureAbortsUpload) {
    client_.fail_next("upload_part", error_code::access_denied);
    retry_executor executor(retry_policy::immediate(5));
    multipart_transfer transfer(client_, executor, config_);

    auto stored = transfer.upload("denied.bin", sequence_payload(8 * 1024), {});
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::access_denied);
    EXPECT_FALSE(client_.has_object("denied.bin"));
    EXPECT_EQ(client_.aborted_uploads(), 1u);
}

TEST_F(MultipartTransferTest, CompleteFailureAbortsUpload) {
    client_.fail_next("complete_multipart", error_code::provider_rejected);
    retry_executor executor(retry_policy::immediate(0));
    multipart_transfer transfer(client_, executor, config_);

    auto stored = transfer.upload("x.bin", sequence_payload(2048), {});
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::provider_rejected);
    EXPECT_FALSE(client_.has_object("x.bin"));
    EXPECT_EQ(client_.aborted_uploads(), 1u);
}

TEST_F(MultipartTransferTest, RangedDownload) {
    const auto payload = sequence_payload(5 * 1024 + 3);
    client_.put_object("big.bin", payload);
    retry_executor executor(retry_policy::immediate(3));
    multipart_transfer transfer(client_, executor, config_);

    auto downloaded = transfer.download("big.bin", payload.size());
    ASSERT_TRUE(downloaded.has_value());
    EXPECT_EQ(downloaded.value(), payload);
    EXPECT_EQ(client_.calls("download_range"), 6u);
}

TEST_F(MultipartTransferTest, ShortRangeIsCorruption) {
    client_.put_object("short.bin", sequence_payload(1000));
    retry_executor executor(retry_policy::immediate(0));
    multipart_transfer transfer(client_, executor, config_);

    auto downloaded = transfer.download("short.bin", 3000);
    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().code, error_code::corrupted_payload);
}

TEST_F(MultipartTransferTest, CancelledTransferStops) {
    auto token = cancellation_token::create();
    token->cancel();
    retry_executor executor(retry_policy::immediate(0), token);
    multipart_transfer transfer(client_, executor, config_, token);

    auto stored = transfer.upload("c.bin", sequence_payload(4096), {});
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::cancelled);
    EXPECT_FALSE(client_.has_object("c.bin"));
}

}  // namespace kcenon::stage_transfer::test
