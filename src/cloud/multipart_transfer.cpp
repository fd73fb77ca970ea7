/**
 * @file multipart_transfer.cpp
 * @brief Multipart upload and ranged download implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/multipart_transfer.h"

#include "kcenon/stage_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kcenon::stage_transfer {

namespace {

/**
 * @brief Runs a part function over [0, count) on at most `width` threads
 *
 * Stops handing out parts after the first failure or cancellation and
 * returns that failure.
 */
template <typename PartFunction>
auto run_parts(uint32_t count, std::size_t width,
               const std::shared_ptr<cancellation_token>& token,
               PartFunction&& part_function) -> std::optional<error> {
    std::atomic<uint32_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex failure_mutex;
    std::optional<error> first_failure;

    auto worker = [&]() {
        while (!failed.load()) {
            if (token && token->is_cancelled()) {
                std::lock_guard lock(failure_mutex);
                if (!first_failure) {
                    first_failure = error{error_code::cancelled, "multipart transfer cancelled"};
                }
                failed.store(true);
                return;
            }
            const uint32_t index = next.fetch_add(1);
            if (index >= count) {
                return;
            }
            auto outcome = part_function(index);
            if (!outcome) {
                std::lock_guard lock(failure_mutex);
                if (!first_failure) {
                    first_failure = outcome.error();
                }
                failed.store(true);
                return;
            }
        }
    };

    const auto thread_count = std::max<std::size_t>(
        1, std::min<std::size_t>(width, count));
    std::vector<std::thread> threads;
    threads.reserve(thread_count - 1);
    for (std::size_t i = 1; i < thread_count; ++i) {
        threads.emplace_back(worker);
    }
    worker();
    for (auto& thread : threads) {
        thread.join();
    }

    return first_failure;
}

}  // namespace

multipart_transfer::multipart_transfer(storage_client& client,
                                       retry_executor& executor,
                                       multipart_config config,
                                       std::shared_ptr<cancellation_token> token)
    : client_(client), executor_(executor), config_(config), token_(std::move(token)) {
    if (config_.part_size == 0) {
        config_.part_size = multipart_config{}.part_size;
    }
    if (config_.max_concurrent_parts == 0) {
        config_.max_concurrent_parts = 1;
    }
}

auto multipart_transfer::part_count(uint64_t size, std::size_t part_size) -> uint32_t {
    if (size == 0) {
        return 1;
    }
    return static_cast<uint32_t>((size + part_size - 1) / part_size);
}

auto multipart_transfer::upload(const std::string& key,
                                std::span<const std::byte> data,
                                const object_metadata& metadata) -> result<uint64_t> {
    auto begun = executor_.execute("begin_multipart", [&] {
        return client_.begin_multipart(key, metadata);
    });
    if (!begun) {
        return unexpected{begun.error()};
    }
    const auto handle = std::move(begun.value());

    const uint32_t count = part_count(data.size(), config_.part_size);
    std::vector<completed_part> parts(count);

    ST_LOG_DEBUG(log_category::storage,
        "Multipart upload of " + key + ": " + std::to_string(data.size()) +
        " bytes in " + std::to_string(count) + " parts");

    auto failure = run_parts(count, config_.max_concurrent_parts, token_,
        [&](uint32_t index) -> result<void> {
            const uint64_t offset = static_cast<uint64_t>(index) * config_.part_size;
            const auto length = static_cast<std::size_t>(
                std::min<uint64_t>(config_.part_size, data.size() - offset));
            auto chunk = data.subspan(static_cast<std::size_t>(offset), length);
            const uint32_t part_number = index + 1;

            auto part = executor_.execute("upload_part", [&] {
                return client_.upload_part(handle, part_number, chunk);
            });
            if (!part) {
                return unexpected{part.error()};
            }
            parts[index] = std::move(part.value());
            return {};
        });

    if (!failure) {
        auto completed = executor_.execute("complete_multipart", [&] {
            return client_.complete_multipart(handle, parts);
        });
        if (completed) {
            return static_cast<uint64_t>(data.size());
        }
        failure = completed.error();
    }

    ST_LOG_WARN(log_category::storage,
        "Aborting multipart upload of " + key + ": " + failure->message);
    auto aborted = client_.abort_multipart(handle);
    if (!aborted) {
        ST_LOG_WARN(log_category::storage,
            "Failed to abort multipart upload of " + key + ": " + aborted.error().message);
    }
    return unexpected{*failure};
}

auto multipart_transfer::download(const std::string& key, uint64_t size)
    -> result<byte_buffer> {
    const uint32_t count = part_count(size, config_.part_size);
    byte_buffer output(static_cast<std::size_t>(size));

    ST_LOG_DEBUG(log_category::storage,
        "Ranged download of " + key + ": " + std::to_string(size) +
        " bytes in " + std::to_string(count) + " parts");

    auto failure = run_parts(count, config_.max_concurrent_parts, token_,
        [&](uint32_t index) -> result<void> {
            const uint64_t offset = static_cast<uint64_t>(index) * config_.part_size;
            const uint64_t length = std::min<uint64_t>(config_.part_size, size - offset);
            if (length == 0) {
                return {};
            }

            auto range = executor_.execute("download_range", [&] {
                return client_.download_range(key, offset, length);
            });
            if (!range) {
                return unexpected{range.error()};
            }
            if (range.value().size() != length) {
                return unexpected{error{error_code::corrupted_payload,
                    "ranged download of " + key + " returned " +
                    std::to_string(range.value().size()) + " bytes, expected " +
                    std::to_string(length)}};
            }
            std::memcpy(output.data() + offset, range.value().data(),
                        static_cast<std::size_t>(length));
            return {};
        });

    if (failure) {
        return unexpected{*failure};
    }
    return output;
}

}  // namespace kcenon::stage_transfer
