/**
 * @file memory_storage_client.h
 * @brief In-memory storage_client with scripted failures for unit tests
 */

#ifndef KCENON_STAGE_TRANSFER_TESTS_MOCKS_MEMORY_STORAGE_CLIENT_H
#define KCENON_STAGE_TRANSFER_TESTS_MOCKS_MEMORY_STORAGE_CLIENT_H

#include <kcenon/stage_transfer/cloud/storage_client.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::stage_transfer::test {

/**
 * @brief storage_client keeping objects in a map
 *
 * fail_next() queues errors per operation name ("upload", "download",
 * "download_range", "get_object_metadata", "list", "begin_multipart",
 * "upload_part", "complete_multipart"); each queued error is returned once
 * before the operation succeeds again.
 */
class memory_storage_client : public storage_client {
public:
    struct stored_object {
        byte_buffer data;
        object_metadata metadata;
    };

    explicit memory_storage_client(provider_kind kind = provider_kind::s3) : kind_(kind) {}

    [[nodiscard]] auto provider() const -> provider_kind override { return kind_; }

    void fail_next(const std::string& operation, error_code code, std::size_t times = 1) {
        std::lock_guard lock(mutex_);
        for (std::size_t i = 0; i < times; ++i) {
            failures_[operation].push_back(code);
        }
    }

    void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }

    void set_multipart_support(bool supported) { multipart_supported_ = supported; }

    void put_object(const std::string& key, byte_buffer data, object_metadata metadata = {}) {
        std::lock_guard lock(mutex_);
        metadata.content_length = data.size();
        objects_[key] = stored_object{std::move(data), std::move(metadata)};
    }

    [[nodiscard]] auto has_object(const std::string& key) const -> bool {
        std::lock_guard lock(mutex_);
        return objects_.count(key) > 0;
    }

    [[nodiscard]] auto object(const std::string& key) const -> stored_object {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        return it == objects_.end() ? stored_object{} : it->second;
    }

    [[nodiscard]] auto object_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return objects_.size();
    }

    [[nodiscard]] auto calls(const std::string& operation) const -> std::size_t {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(operation);
        return it == calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] auto aborted_uploads() const -> std::size_t { return aborted_.load(); }

    [[nodiscard]] auto max_concurrent_uploads() const -> std::size_t {
        return max_in_flight_.load();
    }

    auto upload(const std::string& key,
                std::span<const std::byte> data,
                const object_metadata& metadata) -> result<uint64_t> override {
        in_flight_scope scope(*this);
        if (auto failure = take_failure("upload")) {
            return unexpected{*failure};
        }
        put_object(key, byte_buffer(data.begin(), data.end()), metadata);
        return static_cast<uint64_t>(data.size());
    }

    auto download(const std::string& key) -> result<byte_buffer> override {
        in_flight_scope scope(*this);
        if (auto failure = take_failure("download")) {
            return unexpected{*failure};
        }
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return unexpected{error{error_code::object_not_found, key}};
        }
        return it->second.data;
    }

    auto download_range(const std::string& key, uint64_t offset, uint64_t length)
        -> result<byte_buffer> override {
        if (auto failure = take_failure("download_range")) {
            return unexpected{*failure};
        }
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return unexpected{error{error_code::object_not_found, key}};
        }
        const auto& data = it->second.data;
        if (offset >= data.size()) {
            return byte_buffer{};
        }
        const auto end = std::min<uint64_t>(data.size(), offset + length);
        return byte_buffer(data.begin() + static_cast<std::ptrdiff_t>(offset),
                           data.begin() + static_cast<std::ptrdiff_t>(end));
    }

    auto get_object_metadata(const std::string& key) -> result<object_metadata> override {
        if (auto failure = take_failure("get_object_metadata")) {
            return unexpected{*failure};
        }
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return unexpected{error{error_code::object_not_found, key}};
        }
        return it->second.metadata;
    }

    auto list(const std::string& prefix) -> result<std::vector<object_summary>> override {
        if (auto failure = take_failure("list")) {
            return unexpected{*failure};
        }
        std::lock_guard lock(mutex_);
        std::vector<object_summary> listed;
        for (const auto& [key, object] : objects_) {
            if (key.compare(0, prefix.size(), prefix) == 0) {
                listed.push_back({key, object.data.size()});
            }
        }
        return listed;
    }

    auto delete_object(const std::string& key) -> result<void> override {
        std::lock_guard lock(mutex_);
        objects_.erase(key);
        return {};
    }

    auto begin_multipart(const std::string& key, const object_metadata& metadata)
        -> result<multipart_upload> override {
        if (auto failure = take_failure("begin_multipart")) {
            return unexpected{*failure};
        }
        std::lock_guard lock(mutex_);
        multipart_upload upload;
        upload.key = key;
        upload.upload_id = "upload-" + std::to_string(++upload_sequence_);
        upload.metadata = metadata;
        return upload;
    }

    auto upload_part(const multipart_upload& upload,
                     uint32_t part_number,
                     std::span<const std::byte> data) -> result<completed_part> override {
        in_flight_scope scope(*this);
        if (auto failure = take_failure("upload_part")) {
            return unexpected{*failure};
        }
        std::lock_guard lock(mutex_);
        parts_[upload.upload_id][part_number] = byte_buffer(data.begin(), data.end());
        return completed_part{part_number, "etag-" + std::to_string(part_number), data.size()};
    }

    auto complete_multipart(const multipart_upload& upload,
                            const std::vector<completed_part>& parts)
        -> result<void> override {
        if (auto failure = take_failure("complete_multipart")) {
            return unexpected{*failure};
        }
        byte_buffer assembled;
        {
            std::lock_guard lock(mutex_);
            auto& stored = parts_[upload.upload_id];
            for (const auto& part : parts) {
                auto it = stored.find(part.part_number);
                if (it == stored.end()) {
                    return unexpected{error{error_code::provider_rejected,
                        "unknown part " + std::to_string(part.part_number)}};
                }
                assembled.insert(assembled.end(), it->second.begin(), it->second.end());
            }
            parts_.erase(upload.upload_id);
        }
        put_object(upload.key, std::move(assembled), upload.metadata);
        return {};
    }

    auto abort_multipart(const multipart_upload& upload) -> result<void> override {
        std::lock_guard lock(mutex_);
        parts_.erase(upload.upload_id);
        ++aborted_;
        return {};
    }

    [[nodiscard]] auto supports_multipart() const -> bool override {
        return multipart_supported_;
    }

private:
    struct in_flight_scope {
        explicit in_flight_scope(memory_storage_client& owner) : owner_(owner) {
            const auto now = ++owner_.in_flight_;
            auto seen = owner_.max_in_flight_.load();
            while (now > seen && !owner_.max_in_flight_.compare_exchange_weak(seen, now)) {
            }
            if (owner_.latency_.count() > 0) {
                std::this_thread::sleep_for(owner_.latency_);
            }
        }
        ~in_flight_scope() { --owner_.in_flight_; }

        memory_storage_client& owner_;
    };

    auto take_failure(const std::string& operation) -> std::optional<error> {
        std::lock_guard lock(mutex_);
        ++calls_[operation];
        auto it = failures_.find(operation);
        if (it == failures_.end() || it->second.empty()) {
            return std::nullopt;
        }
        const auto code = it->second.front();
        it->second.pop_front();
        return error{code, operation + " failed: " + to_string(code)};
    }

    provider_kind kind_;
    mutable std::mutex mutex_;
    std::map<std::string, stored_object> objects_;
    std::map<std::string, std::map<uint32_t, byte_buffer>> parts_;
    std::map<std::string, std::deque<error_code>> failures_;
    std::map<std::string, std::size_t> calls_;
    std::size_t upload_sequence_ = 0;
    std::chrono::milliseconds latency_{0};
    bool multipart_supported_ = true;
    std::atomic<std::size_t> aborted_{0};
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> max_in_flight_{0};
};

}  // namespace kcenon::stage_transfer::test

#endif  // KCENON_STAGE_TRANSFER_TESTS_MOCKS_MEMORY_STORAGE_CLIENT_H
