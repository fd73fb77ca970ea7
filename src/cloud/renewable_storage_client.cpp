/**
 * @file renewable_storage_client.cpp
 * @brief Storage client whose credentials can be replaced while in use
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/renewable_storage_client.h"

#include <utility>

namespace kcenon::stage_transfer {

renewable_storage_client::renewable_storage_client(std::shared_ptr<storage_client> initial)
    : client_(std::move(initial)) {}

void renewable_storage_client::renew(std::shared_ptr<storage_client> renewed) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_ = std::move(renewed);
    ++generation_;
}

auto renewable_storage_client::generation() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

auto renewable_storage_client::current() const -> std::shared_ptr<storage_client> {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_;
}

auto renewable_storage_client::provider() const -> provider_kind {
    return current()->provider();
}

auto renewable_storage_client::upload(const std::string& key,
                                      std::span<const std::byte> data,
                                      const object_metadata& metadata) -> result<uint64_t> {
    return current()->upload(key, data, metadata);
}

auto renewable_storage_client::download(const std::string& key) -> result<byte_buffer> {
    return current()->download(key);
}

auto renewable_storage_client::download_range(const std::string& key,
                                              uint64_t offset,
                                              uint64_t length) -> result<byte_buffer> {
    return current()->download_range(key, offset, length);
}

auto renewable_storage_client::get_object_metadata(const std::string& key)
    -> result<object_metadata> {
    return current()->get_object_metadata(key);
}

auto renewable_storage_client::list(const std::string& prefix)
    -> result<std::vector<object_summary>> {
    return current()->list(prefix);
}

auto renewable_storage_client::delete_object(const std::string& key) -> result<void> {
    return current()->delete_object(key);
}

auto renewable_storage_client::begin_multipart(const std::string& key,
                                               const object_metadata& metadata)
    -> result<multipart_upload> {
    return current()->begin_multipart(key, metadata);
}

auto renewable_storage_client::upload_part(const multipart_upload& upload,
                                           uint32_t part_number,
                                           std::span<const std::byte> data)
    -> result<completed_part> {
    return current()->upload_part(upload, part_number, data);
}

auto renewable_storage_client::complete_multipart(const multipart_upload& upload,
                                                  const std::vector<completed_part>& parts)
    -> result<void> {
    return current()->complete_multipart(upload, parts);
}

auto renewable_storage_client::abort_multipart(const multipart_upload& upload) -> result<void> {
    return current()->abort_multipart(upload);
}

auto renewable_storage_client::supports_multipart() const -> bool {
    return current()->supports_multipart();
}

}  // namespace kcenon::stage_transfer
