/**
 * @file file_transfer_metadata.cpp
 * @brief Disconnected upload implementation
 * @version 0.1.0
 */

#include "kcenon/stage_transfer/client/file_transfer_metadata.h"

#include "kcenon/stage_transfer/client/file_pipeline.h"
#include "kcenon/stage_transfer/core/logging.h"

#include <atomic>
#include <chrono>
#include <iterator>

namespace kcenon::stage_transfer {

namespace {

auto usage_error(std::string message) -> unexpected {
    return unexpected{error{error_code::invalid_parameter, std::move(message)}};
}

/**
 * @brief Read a whole stream into memory
 */
auto read_stream(std::istream& stream) -> result<byte_buffer> {
    byte_buffer data;
    char block[64 * 1024];
    while (stream) {
        stream.read(block, sizeof(block));
        const auto n = stream.gcount();
        if (n > 0) {
            const auto* begin = reinterpret_cast<const std::byte*>(block);
            data.insert(data.end(), begin, begin + n);
        }
    }
    if (stream.bad()) {
        return unexpected{error{error_code::local_io_error, "failed to read upload stream"}};
    }
    return data;
}

}  // namespace

// ============================================================================
// file_transfer_metadata
// ============================================================================

struct file_transfer_metadata::state {
    stage_info stage;
    transfer_options options;
    std::optional<std::string> destination_filename;
    std::atomic<bool> consumed{false};
};

file_transfer_metadata::file_transfer_metadata(std::shared_ptr<state> state)
    : state_(std::move(state)) {}

auto file_transfer_metadata::single_file(stage_info stage,
                                         transfer_options options,
                                         std::string destination_filename)
    -> file_transfer_metadata {
    auto shared = std::make_shared<state>();
    shared->stage = std::move(stage);
    shared->options = std::move(options);
    shared->destination_filename = std::move(destination_filename);
    return file_transfer_metadata(std::move(shared));
}

auto file_transfer_metadata::multi_file(stage_info stage, transfer_options options)
    -> file_transfer_metadata {
    auto shared = std::make_shared<state>();
    shared->stage = std::move(stage);
    shared->options = std::move(options);
    return file_transfer_metadata(std::move(shared));
}

auto file_transfer_metadata::is_single_file() const -> bool {
    return state_->destination_filename.has_value();
}

auto file_transfer_metadata::stage() const -> const stage_info& {
    return state_->stage;
}

auto file_transfer_metadata::options() const -> const transfer_options& {
    return state_->options;
}

auto file_transfer_metadata::destination_filename() const
    -> const std::optional<std::string>& {
    return state_->destination_filename;
}

auto file_transfer_metadata::is_consumed() const -> bool {
    return state_->consumed.load();
}

auto file_transfer_metadata::try_consume() const -> bool {
    return !state_->consumed.exchange(true);
}

// ============================================================================
// upload_config
// ============================================================================

upload_config::upload_config(file_transfer_metadata metadata)
    : metadata_(std::move(metadata)) {}

upload_config::builder::builder() = default;

auto upload_config::builder::with_metadata(file_transfer_metadata metadata) -> builder& {
    metadata_ = std::move(metadata);
    return *this;
}

auto upload_config::builder::with_input_stream(std::shared_ptr<std::istream> stream)
    -> builder& {
    stream_ = std::move(stream);
    return *this;
}

auto upload_config::builder::with_destination_filename(std::string filename) -> builder& {
    destination_filename_ = std::move(filename);
    return *this;
}

auto upload_config::builder::with_require_compress(bool require) -> builder& {
    require_compress_ = require;
    return *this;
}

auto upload_config::builder::with_network_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    network_timeout_ = timeout;
    return *this;
}

auto upload_config::builder::with_ingest_client_name(std::string name) -> builder& {
    ingest_client_name_ = std::move(name);
    return *this;
}

auto upload_config::builder::with_ingest_client_key(std::string key) -> builder& {
    ingest_client_key_ = std::move(key);
    return *this;
}

auto upload_config::builder::with_use_regional_url(bool use_regional_url) -> builder& {
    use_regional_url_ = use_regional_url;
    return *this;
}

auto upload_config::builder::build() -> result<upload_config> {
    if (!metadata_) {
        return usage_error("upload_config requires file transfer metadata");
    }
    upload_config config(*metadata_);
    config.stream_ = stream_;
    config.destination_filename_ = destination_filename_;
    config.require_compress_ = require_compress_;
    config.network_timeout_ = network_timeout_;
    config.ingest_client_name_ = ingest_client_name_;
    config.ingest_client_key_ = ingest_client_key_;
    config.use_regional_url_ = use_regional_url_;
    return config;
}

// ============================================================================
// upload_without_connection
// ============================================================================

auto upload_without_connection(const upload_config& config,
                               const storage_client_factory_fn& factory)
    -> result<transfer_result> {
    const auto& metadata = config.metadata();

    std::string filename;
    if (metadata.is_single_file()) {
        filename = *metadata.destination_filename();
        if (config.destination_filename() && *config.destination_filename() != filename) {
            return usage_error("destination filename " + *config.destination_filename() +
                               " does not match the metadata for " + filename);
        }
    } else {
        if (!config.destination_filename() || config.destination_filename()->empty()) {
            return usage_error("multi-file metadata requires a destination filename");
        }
        filename = *config.destination_filename();
    }

    if (!config.input_stream()) {
        return usage_error("no input stream for " + filename);
    }

    if (metadata.is_single_file() && !metadata.try_consume()) {
        return unexpected{error{error_code::metadata_already_consumed,
            "file transfer metadata for " + filename + " was already used"}};
    }

    auto payload = read_stream(*config.input_stream());
    if (!payload) {
        return unexpected{payload.error()};
    }

    auto options = metadata.options();
    options.auto_compress = config.require_compress();
    options.source_compression = compression_format::none;
    if (config.network_timeout()) {
        options.network_timeout = *config.network_timeout();
    }

    transfer_task task;
    task.source = filename;
    task.name = filename;
    task.target = filename;
    task.size = payload.value().size();
    task.ingest_client_name = config.ingest_client_name();
    task.ingest_client_key = config.ingest_client_key();
    file_pipeline::decide_compression(task, options, payload.value());

    auto stage = metadata.stage();
    if (config.use_regional_url()) {
        stage.use_regional_url = *config.use_regional_url();
    }
    const auto create_client = factory ? factory : storage_client_factory::default_factory();
    auto client = create_client(stage, make_client_options(options));
    if (!client) {
        return unexpected{client.error()};
    }
    auto codec = envelope_codec::create(stage.encryption);
    if (!codec) {
        return unexpected{codec.error()};
    }

    ST_LOG_DEBUG(log_category::agent,
        "Uploading stream as " + task.target + " without a session (" +
        std::to_string(task.size) + " bytes)");

    file_pipeline pipeline(client.value(), codec.value(), make_pipeline_settings(options, ""));
    auto row = pipeline.upload_buffer(task, payload.value());
    if (row.status == transfer_status::error) {
        return unexpected{error{row.code, row.message}};
    }
    return row;
}

}  // namespace kcenon::stage_transfer
