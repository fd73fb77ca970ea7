/**
 * @file retry_executor.h
 * @brief Retry loop shared by every storage operation
 * @version 0.1.0
 */

#ifndef KCENON_STAGE_TRANSFER_CLOUD_RETRY_EXECUTOR_H
#define KCENON_STAGE_TRANSFER_CLOUD_RETRY_EXECUTOR_H

#include "kcenon/stage_transfer/cloud/cloud_config.h"
#include "kcenon/stage_transfer/cloud/cloud_utils.h"
#include "kcenon/stage_transfer/core/cancellation_token.h"
#include "kcenon/stage_transfer/core/error_codes.h"
#include "kcenon/stage_transfer/core/logging.h"
#include "kcenon/stage_transfer/core/types.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace kcenon::stage_transfer {

/**
 * @brief Re-resolves the stage and installs fresh credentials
 */
using credential_refresh_fn = std::function<result<void>()>;

/**
 * @brief Runs an operation with exponential backoff
 *
 * Only retryable_transport errors are retried. Every other error returns
 * immediately without consuming retry budget. When the budget runs out
 * the last error is reported as retries_exhausted. Counters are atomic so
 * one executor can serve the concurrent parts of a multipart transfer.
 *
 * token_expired is not retried with the same credentials. With a refresh
 * hook the executor renews them and tries again at once, without delay
 * and without consuming retry budget, at most
 * retry_policy::max_token_refreshes times per operation. Without a hook,
 * or once the refreshes are used up, token_expired is returned as is.
 *
 * @code
 * retry_executor executor(policy, token);
 * auto size = executor.execute("upload", [&] { return client.upload(key, data, meta); });
 * @endcode
 */
class retry_executor {
public:
    explicit retry_executor(retry_policy policy,
                            std::shared_ptr<cancellation_token> token = nullptr,
                            credential_refresh_fn refresh = nullptr)
        : policy_(std::move(policy)), token_(std::move(token)), refresh_(std::move(refresh)) {}

    retry_executor(const retry_executor&) = delete;
    auto operator=(const retry_executor&) -> retry_executor& = delete;

    template <typename Operation>
    [[nodiscard]] auto execute(std::string_view operation_name, Operation&& operation)
        -> decltype(operation()) {
        std::size_t retry = 0;
        std::size_t refreshed = 0;

        while (true) {
            if (is_cancelled()) {
                return unexpected{error{error_code::cancelled,
                    std::string(operation_name) + " cancelled"}};
            }

            attempts_.fetch_add(1, std::memory_order_relaxed);
            auto outcome = operation();
            if (outcome.has_value()) {
                return outcome;
            }

            const auto& failure = outcome.error();
            if (!is_retryable(failure.code)) {
                return outcome;
            }

            if (failure.code == error_code::token_expired) {
                if (!refresh_ || refreshed >= policy_.max_token_refreshes) {
                    return outcome;
                }
                ++refreshed;
                refreshes_.fetch_add(1, std::memory_order_relaxed);
                ST_LOG_INFO(log_category::retry,
                    std::string(operation_name) + " refreshing expired credentials (" +
                    std::to_string(refreshed) + "/" +
                    std::to_string(policy_.max_token_refreshes) + ")");
                auto renewed = refresh_();
                if (!renewed) {
                    return unexpected{renewed.error()};
                }
                continue;
            }

            if (retry >= policy_.max_retries) {
                ST_LOG_WARN(log_category::retry,
                    std::string(operation_name) + " exhausted " +
                    std::to_string(policy_.max_retries) + " retries: " + failure.message);
                return unexpected{error{error_code::retries_exhausted,
                    std::string(operation_name) + " failed after " +
                    std::to_string(retry) + " retries: " + failure.message}};
            }

            ++retry;
            retries_.fetch_add(1, std::memory_order_relaxed);

            const auto delay = cloud_utils::calculate_retry_delay(policy_, retry);
            ST_LOG_DEBUG(log_category::retry,
                std::string(operation_name) + " retry " + std::to_string(retry) + "/" +
                std::to_string(policy_.max_retries) + " in " +
                std::to_string(delay.count()) + "ms after " + to_string(failure.code) +
                ": " + failure.message);

            wait(delay);
        }
    }

    /**
     * @brief Total attempts, first attempts included
     */
    [[nodiscard]] auto attempts() const noexcept -> std::size_t {
        return attempts_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Attempts made after a retryable failure
     */
    [[nodiscard]] auto retries() const noexcept -> std::size_t {
        return retries_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Credential refreshes made on token_expired
     */
    [[nodiscard]] auto refreshes() const noexcept -> std::size_t {
        return refreshes_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto policy() const noexcept -> const retry_policy& { return policy_; }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return token_ && token_->is_cancelled();
    }

private:
    void wait(std::chrono::milliseconds delay) const {
        constexpr auto slice = std::chrono::milliseconds(50);
        while (delay.count() > 0 && !is_cancelled()) {
            const auto step = std::min(delay, slice);
            std::this_thread::sleep_for(step);
            delay -= step;
        }
    }

    retry_policy policy_;
    std::shared_ptr<cancellation_token> token_;
    credential_refresh_fn refresh_;
    std::atomic<std::size_t> attempts_{0};
    std::atomic<std::size_t> retries_{0};
    std::atomic<std::size_t> refreshes_{0};
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_CLOUD_RETRY_EXECUTOR_H
