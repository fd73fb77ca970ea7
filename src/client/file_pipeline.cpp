/**
 * @file file_pipeline.cpp
 * @brief Per-file upload and download pipeline implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/client/file_pipeline.h"

#include "kcenon/stage_transfer/cloud/multipart_transfer.h"
#include "kcenon/stage_transfer/cloud/retry_executor.h"
#include "kcenon/stage_transfer/core/error_codes.h"
#include "kcenon/stage_transfer/core/local_file.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <chrono>
#include <system_error>

namespace kcenon::stage_transfer {

namespace {

/// Bytes read from the start of a file to recognise its format
constexpr std::size_t magic_sniff_size = 16;

auto ends_with(std::string_view text, std::string_view suffix) -> bool {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto elapsed_since(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

auto default_local_writer(const std::filesystem::path& destination,
                          std::span<const std::byte> data) -> result<void> {
    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            return unexpected{make_local_io_error(ec.value(), "create_directories",
                                                  destination.parent_path())};
        }
    }
    return write_local_file_atomically(destination, data);
}

/**
 * @brief Promote local failures reported only by message to no_space_left
 */
auto normalize_local_failure(error failure) -> error {
    if (failure.code != error_code::no_space_left && mentions_no_space_left(failure.message)) {
        failure.code = error_code::no_space_left;
    }
    return failure;
}

}  // namespace

auto make_client_options(const transfer_options& options) -> storage_client_options {
    storage_client_options client_options;
    client_options.retry.max_retries = options.max_retries;
    client_options.request_timeout = options.network_timeout;
    return client_options;
}

auto make_pipeline_settings(const transfer_options& options, std::string command_id)
    -> pipeline_settings {
    const auto client_options = make_client_options(options);
    pipeline_settings settings;
    settings.threshold = options.threshold;
    settings.retry = client_options.retry;
    settings.multipart = client_options.multipart;
    settings.command_id = std::move(command_id);
    return settings;
}

// ============================================================================
// Implementation
// ============================================================================

struct file_pipeline::impl {
    std::shared_ptr<storage_client> client;
    std::shared_ptr<envelope_codec> codec;
    pipeline_settings settings;
    std::shared_ptr<cancellation_token> token;
    local_writer_fn writer;
    mutable compression_engine compressor;

    auto log_context(const transfer_task& task) const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.command_id = settings.command_id;
        ctx.filename = task.name;
        ctx.provider = to_string(client->provider());
        ctx.file_size = task.size;
        return ctx;
    }

    auto is_cancelled() const -> bool {
        return token && token->is_cancelled();
    }

    auto strategy_for(uint64_t size) const -> transfer_strategy {
        if (!client->supports_multipart()) {
            return transfer_strategy::single_shot;
        }
        return select_strategy(size, settings.threshold);
    }

    auto fail(transfer_result& row,
              const transfer_task& task,
              const error& failure,
              std::chrono::steady_clock::time_point start) const -> transfer_result {
        row.status = transfer_status::error;
        row.code = failure.code;
        row.message = describe(failure);
        row.elapsed = elapsed_since(start);

        auto ctx = log_context(task);
        ctx.duration_ms = static_cast<uint64_t>(row.elapsed.count());
        ctx.error_message = failure.message;
        ST_LOG_WARN_CTX(log_category::agent,
            "Transfer of " + task.name + " failed: " + row.message, ctx);
        return row;
    }

    auto store(const transfer_task& task,
               std::span<const std::byte> raw,
               transfer_result& row,
               std::chrono::steady_clock::time_point start) const -> transfer_result {
        row.source_size = raw.size();
        row.strategy = strategy_for(raw.size());

        if (is_cancelled()) {
            return fail(row, task, error{error_code::cancelled, "transfer cancelled"}, start);
        }

        byte_buffer packed;
        std::span<const std::byte> payload = raw;
        if (task.compress) {
            auto compressed = compressor.compress_frame(raw);
            if (!compressed) {
                return fail(row, task, compressed.error(), start);
            }
            packed = std::move(compressed.value());
            payload = packed;
            ST_LOG_DEBUG(log_category::compression,
                "Compressed " + task.name + " from " + std::to_string(raw.size()) +
                " to " + std::to_string(packed.size()) + " bytes");
        }

        object_metadata metadata;
        if (task.ingest_client_name) {
            metadata.set(metadata_keys::ingest_client_name, *task.ingest_client_name);
        }
        if (task.ingest_client_key) {
            metadata.set(metadata_keys::ingest_client_key, *task.ingest_client_key);
        }

        auto sealed = codec->seal(payload, metadata);
        if (!sealed) {
            return fail(row, task, sealed.error(), start);
        }
        const auto& stored = sealed.value();

        retry_executor executor(settings.retry, token, settings.refresh_credentials);
        result<uint64_t> written = [&]() -> result<uint64_t> {
            if (row.strategy == transfer_strategy::multipart) {
                multipart_transfer multipart(*client, executor, settings.multipart, token);
                return multipart.upload(task.target, stored, metadata);
            }
            return executor.execute("upload", [&] {
                return client->upload(task.target, stored, metadata);
            });
        }();

        row.retries = executor.retries();
        if (!written) {
            return fail(row, task, written.error(), start);
        }

        row.status = transfer_status::uploaded;
        row.destination_size = written.value();
        row.code = error_code::success;
        row.elapsed = elapsed_since(start);

        auto ctx = log_context(task);
        ctx.duration_ms = static_cast<uint64_t>(row.elapsed.count());
        ST_LOG_INFO_CTX(log_category::agent,
            "Uploaded " + task.name + " as " + task.target + " (" + to_string(row.strategy) +
            ", " + std::to_string(row.destination_size) + " bytes)", ctx);
        return row;
    }
};

file_pipeline::file_pipeline(std::shared_ptr<storage_client> client,
                             std::shared_ptr<envelope_codec> codec,
                             pipeline_settings settings,
                             std::shared_ptr<cancellation_token> token,
                             local_writer_fn writer)
    : impl_(std::make_unique<impl>()) {
    impl_->client = std::move(client);
    impl_->codec = std::move(codec);
    impl_->settings = std::move(settings);
    impl_->token = std::move(token);
    impl_->writer = writer ? std::move(writer) : local_writer_fn(default_local_writer);
}

file_pipeline::~file_pipeline() = default;

auto file_pipeline::client() const -> const std::shared_ptr<storage_client>& {
    return impl_->client;
}

auto file_pipeline::settings() const -> const pipeline_settings& {
    return impl_->settings;
}

// ============================================================================
// Upload
// ============================================================================

auto file_pipeline::upload_file(const transfer_task& task) const -> transfer_result {
    const auto start = std::chrono::steady_clock::now();
    transfer_result row;
    row.source = task.name;
    row.target = task.target;
    row.source_size = task.size;

    if (impl_->is_cancelled()) {
        return impl_->fail(row, task, error{error_code::cancelled, "transfer cancelled"}, start);
    }

    auto content = read_local_file(task.source);
    if (!content) {
        return impl_->fail(row, task, content.error(), start);
    }
    return impl_->store(task, content.value(), row, start);
}

auto file_pipeline::upload_buffer(const transfer_task& task,
                                  std::span<const std::byte> raw) const -> transfer_result {
    const auto start = std::chrono::steady_clock::now();
    transfer_result row;
    row.source = task.name;
    row.target = task.target;
    return impl_->store(task, raw, row, start);
}

// ============================================================================
// Download
// ============================================================================

auto file_pipeline::download_object(const transfer_task& task,
                                    const std::filesystem::path& directory) const
    -> transfer_result {
    const auto start = std::chrono::steady_clock::now();
    transfer_result row;
    row.source = task.name;
    row.target = task.target;

    if (impl_->is_cancelled()) {
        return impl_->fail(row, task, error{error_code::cancelled, "transfer cancelled"}, start);
    }

    auto& client = *impl_->client;
    retry_executor executor(impl_->settings.retry, impl_->token,
                            impl_->settings.refresh_credentials);

    auto head = executor.execute("get_object_metadata", [&] {
        return client.get_object_metadata(task.source);
    });
    if (!head) {
        row.retries = executor.retries();
        return impl_->fail(row, task, head.error(), start);
    }
    const auto& metadata = head.value();
    row.source_size = metadata.content_length;
    row.strategy = impl_->strategy_for(metadata.content_length);

    result<byte_buffer> stored = [&]() -> result<byte_buffer> {
        if (row.strategy == transfer_strategy::multipart) {
            multipart_transfer multipart(client, executor, impl_->settings.multipart,
                                         impl_->token);
            return multipart.download(task.source, metadata.content_length);
        }
        return executor.execute("download", [&] {
            return client.download(task.source);
        });
    }();
    row.retries = executor.retries();
    if (!stored) {
        return impl_->fail(row, task, stored.error(), start);
    }

    auto opened = impl_->codec->open(stored.value(), metadata);
    if (!opened) {
        return impl_->fail(row, task, opened.error(), start);
    }

    byte_buffer payload = std::move(opened.value());
    if (task.compress) {
        auto restored = impl_->compressor.decompress_frame(payload);
        if (!restored) {
            return impl_->fail(row, task, restored.error(), start);
        }
        payload = std::move(restored.value());
    }

    // Local write failures are never retried
    const auto destination = directory / task.target;
    auto written = impl_->writer(destination, payload);
    if (!written) {
        return impl_->fail(row, task, normalize_local_failure(written.error()), start);
    }

    row.status = transfer_status::downloaded;
    row.destination_size = payload.size();
    row.code = error_code::success;
    row.elapsed = elapsed_since(start);

    auto ctx = impl_->log_context(task);
    ctx.file_size = row.source_size;
    ctx.duration_ms = static_cast<uint64_t>(row.elapsed.count());
    ST_LOG_INFO_CTX(log_category::agent,
        "Downloaded " + task.name + " to " + destination.string() + " (" +
        to_string(row.strategy) + ", " + std::to_string(row.destination_size) + " bytes)", ctx);
    return row;
}

// ============================================================================
// Planning
// ============================================================================

auto file_pipeline::plan_upload(const std::filesystem::path& path,
                                const transfer_options& options) -> result<transfer_task> {
    auto size = local_file_size(path);
    if (!size) {
        return unexpected{size.error()};
    }

    auto head = read_local_file_head(path, magic_sniff_size);
    if (!head) {
        return unexpected{head.error()};
    }

    transfer_task task;
    task.source = path.string();
    task.name = path.filename().string();
    task.target = task.name;
    task.size = size.value();

    decide_compression(task, options, head.value());
    return task;
}

void file_pipeline::decide_compression(transfer_task& task,
                                       const transfer_options& options,
                                       std::span<const std::byte> head) {
    task.source_compression =
        resolve_source_compression(options.source_compression, task.name, head);
    task.compress = options.auto_compress &&
                    !is_compressed_format(task.source_compression) &&
                    compression_engine::is_available();
    if (task.compress && !ends_with(task.target, compressed_suffix)) {
        task.target += compressed_suffix;
    }
}

}  // namespace kcenon::stage_transfer
