/**
 * @file local_storage.cpp
 * @brief Local directory storage client implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/cloud/local_storage.h"

#include "kcenon/stage_transfer/core/local_file.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <sstream>
#include <system_error>

namespace kcenon::stage_transfer {

namespace {

constexpr const char* temp_marker = ".st_tmp.";

auto ends_with(const std::string& text, std::string_view suffix) -> bool {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto not_found(const std::string& key) -> unexpected {
    return unexpected{error{error_code::object_not_found,
        "LOCAL_FS object not found: " + key}};
}

auto serialize_metadata(const object_metadata& metadata) -> std::string {
    std::ostringstream oss;
    for (const auto& [key, value] : metadata.user_metadata) {
        oss << key << "=" << value << "\n";
    }
    return oss.str();
}

auto parse_metadata(const std::string& text) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> entries;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        entries[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return entries;
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct local_storage_client::impl {
    stage_info stage;
    std::filesystem::path root;

    std::mutex uploads_mutex;
    std::map<std::string, std::map<uint32_t, byte_buffer>> pending_parts;
    std::atomic<uint64_t> next_upload{1};

    auto path_of(const std::string& key) const -> std::filesystem::path {
        return root / stage.object_key(key);
    }

    static auto sidecar_of(const std::filesystem::path& path) -> std::filesystem::path {
        auto sidecar = path;
        sidecar += metadata_suffix;
        return sidecar;
    }

    auto publish(const std::string& key,
                 std::span<const std::byte> data,
                 const object_metadata& metadata) const -> result<uint64_t> {
        const auto path = path_of(key);

        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected{make_local_io_error(ec.value(), "create_directories",
                                                  path.parent_path())};
        }

        // Metadata goes first so a visible object always has its sidecar
        const auto sidecar = sidecar_of(path);
        if (metadata.user_metadata.empty()) {
            std::filesystem::remove(sidecar, ec);
        } else {
            auto written = write_local_file_atomically(sidecar,
                                                       as_bytes(serialize_metadata(metadata)));
            if (!written) {
                return unexpected{written.error()};
            }
        }

        auto written = write_local_file_atomically(path, data);
        if (!written) {
            return unexpected{written.error()};
        }
        return static_cast<uint64_t>(data.size());
    }
};

local_storage_client::local_storage_client(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

local_storage_client::~local_storage_client() = default;

auto local_storage_client::create(const stage_info& stage)
    -> result<std::shared_ptr<local_storage_client>> {
    if (stage.bucket.empty()) {
        return unexpected{error{error_code::invalid_stage_descriptor,
            "local stage has no root directory"}};
    }

    auto state = std::make_unique<impl>();
    state->stage = stage;
    state->root = std::filesystem::path(stage.bucket);

    std::error_code ec;
    std::filesystem::create_directories(state->root, ec);
    if (ec) {
        return unexpected{make_local_io_error(ec.value(), "create_directories", state->root)};
    }

    ST_LOG_DEBUG(log_category::storage, "Created LOCAL_FS client rooted at " +
                                        state->root.string());

    return std::shared_ptr<local_storage_client>(new local_storage_client(std::move(state)));
}

auto local_storage_client::object_path(const std::string& key) const -> std::filesystem::path {
    return impl_->path_of(key);
}

// ============================================================================
// Object Operations
// ============================================================================

auto local_storage_client::upload(const std::string& key,
                                  std::span<const std::byte> data,
                                  const object_metadata& metadata) -> result<uint64_t> {
    return impl_->publish(key, data, metadata);
}

auto local_storage_client::download(const std::string& key) -> result<byte_buffer> {
    const auto path = impl_->path_of(key);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return not_found(key);
    }
    return read_local_file(path);
}

auto local_storage_client::download_range(const std::string& key,
                                          uint64_t offset,
                                          uint64_t length) -> result<byte_buffer> {
    auto whole = download(key);
    if (!whole) {
        return whole;
    }
    const auto& data = whole.value();
    if (offset >= data.size()) {
        return byte_buffer{};
    }
    const auto end = std::min<uint64_t>(data.size(), offset + length);
    return byte_buffer(data.begin() + static_cast<std::ptrdiff_t>(offset),
                       data.begin() + static_cast<std::ptrdiff_t>(end));
}

auto local_storage_client::get_object_metadata(const std::string& key) -> result<object_metadata> {
    const auto path = impl_->path_of(key);
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return not_found(key);
    }

    object_metadata metadata;
    metadata.content_length = static_cast<uint64_t>(size);

    const auto sidecar = impl::sidecar_of(path);
    if (std::filesystem::is_regular_file(sidecar, ec)) {
        auto content = read_local_file(sidecar);
        if (!content) {
            return unexpected{content.error()};
        }
        for (const auto& [name, value] : parse_metadata(to_string(content.value()))) {
            metadata.set(name, value);
        }
    }
    return metadata;
}

auto local_storage_client::list(const std::string& prefix) -> result<std::vector<object_summary>> {
    std::vector<object_summary> objects;
    const auto& root = impl_->root;
    const std::string full_prefix = impl_->stage.prefix + prefix;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return objects;
    }

    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        return unexpected{make_local_io_error(ec.value(), "list", root)};
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return unexpected{make_local_io_error(ec.value(), "list", root)};
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const auto relative = std::filesystem::relative(it->path(), root, ec).generic_string();
        if (ec || ends_with(relative, metadata_suffix) ||
            relative.find(temp_marker) != std::string::npos) {
            continue;
        }
        if (relative.compare(0, full_prefix.size(), full_prefix) != 0 ||
            relative.size() <= impl_->stage.prefix.size()) {
            continue;
        }
        objects.push_back({relative.substr(impl_->stage.prefix.size()),
                           static_cast<uint64_t>(it->file_size(ec))});
    }

    std::sort(objects.begin(), objects.end(),
              [](const object_summary& a, const object_summary& b) { return a.key < b.key; });
    return objects;
}

auto local_storage_client::delete_object(const std::string& key) -> result<void> {
    const auto path = impl_->path_of(key);
    std::error_code ec;
    if (!std::filesystem::remove(path, ec)) {
        if (ec) {
            return unexpected{make_local_io_error(ec.value(), "remove", path)};
        }
        return not_found(key);
    }
    std::filesystem::remove(impl::sidecar_of(path), ec);
    return {};
}

// ============================================================================
// Multipart Operations
// ============================================================================

auto local_storage_client::begin_multipart(const std::string& key,
                                           const object_metadata& metadata)
    -> result<multipart_upload> {
    const auto upload_id = "local-" + std::to_string(impl_->next_upload.fetch_add(1));
    std::lock_guard lock(impl_->uploads_mutex);
    impl_->pending_parts[upload_id];
    return multipart_upload{key, upload_id, metadata};
}

auto local_storage_client::upload_part(const multipart_upload& upload,
                                       uint32_t part_number,
                                       std::span<const std::byte> data) -> result<completed_part> {
    std::lock_guard lock(impl_->uploads_mutex);
    auto it = impl_->pending_parts.find(upload.upload_id);
    if (it == impl_->pending_parts.end()) {
        return unexpected{error{error_code::provider_rejected,
            "unknown multipart upload " + upload.upload_id}};
    }
    it->second[part_number] = byte_buffer(data.begin(), data.end());
    return completed_part{part_number, std::to_string(part_number),
                          static_cast<uint64_t>(data.size())};
}

auto local_storage_client::complete_multipart(const multipart_upload& upload,
                                              const std::vector<completed_part>& parts)
    -> result<void> {
    std::map<uint32_t, byte_buffer> buffered;
    {
        std::lock_guard lock(impl_->uploads_mutex);
        auto it = impl_->pending_parts.find(upload.upload_id);
        if (it == impl_->pending_parts.end()) {
            return unexpected{error{error_code::provider_rejected,
                "unknown multipart upload " + upload.upload_id}};
        }
        buffered = std::move(it->second);
        impl_->pending_parts.erase(it);
    }

    byte_buffer assembled;
    for (const auto& part : parts) {
        auto it = buffered.find(part.part_number);
        if (it == buffered.end()) {
            return unexpected{error{error_code::provider_rejected,
                "multipart upload " + upload.upload_id + " is missing part " +
                std::to_string(part.part_number)}};
        }
        assembled.insert(assembled.end(), it->second.begin(), it->second.end());
    }

    auto published = impl_->publish(upload.key, assembled, upload.metadata);
    if (!published) {
        return unexpected{published.error()};
    }
    return {};
}

auto local_storage_client::abort_multipart(const multipart_upload& upload) -> result<void> {
    std::lock_guard lock(impl_->uploads_mutex);
    impl_->pending_parts.erase(upload.upload_id);
    return {};
}

}  // namespace kcenon::stage_transfer
