// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "kcenon/stage_transfer/core/logging.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>

#if STAGE_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::stage_transfer {

namespace {

// Rebuilds input with every match of pattern replaced by replace(match)
template <typename Replace>
auto replace_matches(const std::string& input, const std::regex& pattern, Replace replace)
    -> std::string {
    std::string output;
    output.reserve(input.size());

    auto cursor = input.cbegin();
    for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
        const auto& match = *it;
        output.append(cursor, match[0].first);
        output += replace(match);
        cursor = match[0].second;
    }
    output.append(cursor, input.cend());
    return output;
}

auto utc_timestamp(std::chrono::system_clock::time_point now) -> std::string {
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm parts{};
#if defined(_WIN32)
    gmtime_s(&parts, &seconds);
#else
    gmtime_r(&seconds, &parts);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &parts);
    std::ostringstream oss;
    oss << buffer << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

/**
 * @brief Appends "key":value pairs to a JSON object body
 */
class json_fields {
public:
    void text(std::string_view key, std::string_view value) {
        separator();
        body_ << '"' << key << "\":\"" << detail::escape_json_string(value) << '"';
    }

    void number(std::string_view key, uint64_t value) {
        separator();
        body_ << '"' << key << "\":" << value;
    }

    void raw(std::string_view key, std::string_view json) {
        separator();
        body_ << '"' << key << "\":" << json;
    }

    // Splices the members of another object into this one
    void merge(const std::string& object) {
        if (object.size() > 2) {
            separator();
            body_ << std::string_view(object).substr(1, object.size() - 2);
        }
    }

    [[nodiscard]] auto object() const -> std::string { return "{" + body_.str() + "}"; }

private:
    void separator() {
        if (!empty_) {
            body_ << ',';
        }
        empty_ = false;
    }

    std::ostringstream body_;
    bool empty_ = true;
};

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    static constexpr std::array<std::string_view, 6> names = {
        "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    const auto index = static_cast<std::size_t>(level);
    return index < names.size() ? names[index] : "UNKNOWN";
}

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    // Group 1 is the field or parameter name and stays readable; group 2 is the secret.
    static const std::regex credential_pattern(
        R"(((?:AWS_SECRET_KEY|AWS_TOKEN|AZURE_SAS_TOKEN|GCS_ACCESS_TOKEN|queryStageMasterKey)"
        R"("?\s*[:=]\s*"?)|(?:[?&](?:sig|X-Amz-Signature|X-Amz-Security-Token|X-Goog-Signature)=)|)"
        R"((?:Authorization\s*[:=]\s*(?:Bearer\s+)?)|(?:Bearer\s+)|(?:Signature=)))"
        R"(([^"&,\s]+))",
        std::regex::icase);
    static const std::regex ip_pattern(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)");
    static const std::regex path_pattern(R"((?:/[A-Za-z0-9._-]+)+)");

    std::string output = input;
    if (config_.mask_credentials) {
        output = replace_matches(output, credential_pattern, [this](const std::smatch& m) {
            return m[1].str() + fill(std::min<std::size_t>(m[2].length(), 8));
        });
    }
    if (config_.mask_ips) {
        output = replace_matches(output, ip_pattern,
                                 [this](const std::smatch& m) { return mask_ip(m.str()); });
    }
    if (config_.mask_paths) {
        output = replace_matches(output, path_pattern,
                                 [this](const std::smatch& m) { return mask_path(m.str()); });
    }
    return output;
}

auto sensitive_info_masker::mask_secret(const std::string& secret) const -> std::string {
    const auto visible = secret.size() > config_.visible_chars ? config_.visible_chars : 0;
    return secret.substr(0, visible) + fill(secret.size() - visible);
}

auto sensitive_info_masker::mask_path(const std::string& path) const -> std::string {
    const auto separator = path.find_last_of("/\\");
    if (!config_.mask_paths || separator == std::string::npos) {
        return path;
    }
    return fill(separator) + "/" + path.substr(separator + 1);
}

auto sensitive_info_masker::mask_ip(const std::string& ip) const -> std::string {
    if (!config_.mask_ips) {
        return ip;
    }
    const auto dot = ip.rfind('.');
    if (dot == std::string::npos) {
        return fill(ip.size());
    }
    return fill(dot) + ip.substr(dot);
}

namespace detail {

auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (const char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n"; break;
            case '\r': output += "\\r"; break;
            case '\t': output += "\\t"; break;
            case '\b': output += "\\b"; break;
            case '\f': output += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
                    output += code;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

// ============================================================================
// Structured entries
// ============================================================================

auto transfer_log_context::to_json(const sensitive_info_masker* masker) const -> std::string {
    json_fields fields;
    if (!command_id.empty()) {
        fields.text("command_id", command_id);
    }
    if (!filename.empty()) {
        fields.text("filename", masker ? masker->mask_path(filename) : filename);
    }
    if (provider) {
        fields.text("provider", *provider);
    }
    if (file_size) {
        fields.number("size", *file_size);
    }
    if (part_index) {
        fields.number("part_index", *part_index);
    }
    if (total_parts) {
        fields.number("total_parts", *total_parts);
    }
    if (attempt) {
        fields.number("attempt", *attempt);
    }
    if (duration_ms) {
        fields.number("duration_ms", *duration_ms);
    }
    if (error_message) {
        fields.text("error_message", masker ? masker->mask(*error_message) : *error_message);
    }
    return fields.object();
}

auto structured_log_entry::to_json(const sensitive_info_masker* masker) const -> std::string {
    json_fields fields;
    fields.text("timestamp", timestamp);
    fields.text("level", log_level_to_string(level));
    fields.text("category", category);
    fields.text("message", masker ? masker->mask(message) : message);
    if (context) {
        fields.merge(context->to_json(masker));
    }
    if (source_file) {
        json_fields source;
        source.text("file", *source_file);
        if (source_line) {
            source.number("line", static_cast<uint64_t>(*source_line));
        }
        fields.raw("source", source.object());
    }
    return fields.object();
}

log_entry_builder::log_entry_builder() {
    entry_.timestamp = utc_timestamp(std::chrono::system_clock::now());
}

auto log_entry_builder::context() -> transfer_log_context& {
    if (!entry_.context) {
        entry_.context.emplace();
    }
    return *entry_.context;
}

auto log_entry_builder::with_level(log_level level) -> log_entry_builder& {
    entry_.level = level;
    return *this;
}

auto log_entry_builder::with_category(std::string_view category) -> log_entry_builder& {
    entry_.category = category;
    return *this;
}

auto log_entry_builder::with_message(std::string_view message) -> log_entry_builder& {
    entry_.message = message;
    return *this;
}

auto log_entry_builder::with_command_id(std::string_view id) -> log_entry_builder& {
    context().command_id = id;
    return *this;
}

auto log_entry_builder::with_filename(std::string_view filename) -> log_entry_builder& {
    context().filename = filename;
    return *this;
}

auto log_entry_builder::with_provider(std::string_view provider) -> log_entry_builder& {
    context().provider = std::string(provider);
    return *this;
}

auto log_entry_builder::with_file_size(uint64_t size) -> log_entry_builder& {
    context().file_size = size;
    return *this;
}

auto log_entry_builder::with_part(uint32_t index, uint32_t total) -> log_entry_builder& {
    auto& ctx = context();
    ctx.part_index = index;
    ctx.total_parts = total;
    return *this;
}

auto log_entry_builder::with_attempt(uint32_t attempt) -> log_entry_builder& {
    context().attempt = attempt;
    return *this;
}

auto log_entry_builder::with_duration_ms(uint64_t duration) -> log_entry_builder& {
    context().duration_ms = duration;
    return *this;
}

auto log_entry_builder::with_error_message(std::string_view error) -> log_entry_builder& {
    context().error_message = std::string(error);
    return *this;
}

auto log_entry_builder::with_source_location(const char* file, int line) -> log_entry_builder& {
    if (file != nullptr) {
        entry_.source_file = file;
    }
    if (line > 0) {
        entry_.source_line = line;
    }
    return *this;
}

auto log_entry_builder::with_context(const transfer_log_context& ctx) -> log_entry_builder& {
    entry_.context = ctx;
    return *this;
}

// ============================================================================
// stage_transfer_logger
// ============================================================================

struct stage_transfer_logger::impl {
    std::atomic<log_level> min_level{log_level::info};
    std::atomic<bool> initialized{false};
    std::atomic<bool> console_output{true};

    mutable std::mutex config_mutex;
    log_output_format format{log_output_format::text};
    sensitive_info_masker masker;

    mutable std::mutex callback_mutex;
    log_callback callback;
    json_log_callback json_callback;

    std::mutex stderr_mutex;

#if STAGE_TRANSFER_USE_LOGGER_SYSTEM
    std::mutex backend_mutex;
    std::unique_ptr<kcenon::logger::logger> backend;

    static auto to_backend_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            case log_level::info: break;
        }
        return kcenon::logger::log_level::info;
    }
#endif

    // Returns false when no backend took the line
    auto to_backend([[maybe_unused]] log_level level, [[maybe_unused]] const std::string& line)
        -> bool {
#if STAGE_TRANSFER_USE_LOGGER_SYSTEM
        std::lock_guard lock(backend_mutex);
        if (backend) {
            backend->log(to_backend_level(level), line);
            return true;
        }
#endif
        return false;
    }

    void to_stderr(const std::string& line) {
        if (!console_output.load()) {
            return;
        }
        std::lock_guard lock(stderr_mutex);
        std::cerr << line << '\n';
    }
};

stage_transfer_logger::stage_transfer_logger() : impl_(std::make_unique<impl>()) {}

stage_transfer_logger::~stage_transfer_logger() {
    shutdown();
}

void stage_transfer_logger::initialize() {
    if (impl_->initialized.exchange(true)) {
        return;
    }

#if STAGE_TRANSFER_USE_LOGGER_SYSTEM
    auto built = kcenon::logger::logger_builder()
                     .with_async(true)
                     .with_min_level(impl::to_backend_level(impl_->min_level.load()))
                     .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
                     .build();
    if (built) {
        std::lock_guard lock(impl_->backend_mutex);
        impl_->backend = std::move(built.value());
    } else {
        impl_->to_stderr("stage_transfer: logger_system backend unavailable, using stderr");
    }
#endif
}

void stage_transfer_logger::shutdown() {
#if STAGE_TRANSFER_USE_LOGGER_SYSTEM
    {
        std::lock_guard lock(impl_->backend_mutex);
        if (impl_->backend) {
            impl_->backend->flush();
            impl_->backend->stop();
            impl_->backend.reset();
        }
    }
#endif
    impl_->initialized = false;
}

auto stage_transfer_logger::is_initialized() const -> bool {
    return impl_->initialized.load();
}

void stage_transfer_logger::set_level(log_level level) {
    impl_->min_level.store(level);
#if STAGE_TRANSFER_USE_LOGGER_SYSTEM
    std::lock_guard lock(impl_->backend_mutex);
    if (impl_->backend) {
        impl_->backend->set_min_level(impl::to_backend_level(level));
    }
#endif
}

auto stage_transfer_logger::get_level() const -> log_level {
    return impl_->min_level.load();
}

void stage_transfer_logger::set_output_format(log_output_format format) {
    std::lock_guard lock(impl_->config_mutex);
    impl_->format = format;
}

auto stage_transfer_logger::get_output_format() const -> log_output_format {
    std::lock_guard lock(impl_->config_mutex);
    return impl_->format;
}

void stage_transfer_logger::set_masking_config(masking_config config) {
    std::lock_guard lock(impl_->config_mutex);
    impl_->masker.set_config(std::move(config));
}

auto stage_transfer_logger::get_masking_config() const -> masking_config {
    std::lock_guard lock(impl_->config_mutex);
    return impl_->masker.config();
}

void stage_transfer_logger::set_callback(log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

void stage_transfer_logger::set_json_callback(json_log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->json_callback = std::move(callback);
}

void stage_transfer_logger::set_console_output(bool enable) {
    impl_->console_output.store(enable);
}

auto stage_transfer_logger::is_enabled(log_level level) const -> bool {
    return static_cast<int>(level) >= static_cast<int>(impl_->min_level.load());
}

void stage_transfer_logger::log(log_level level,
                                std::string_view category,
                                std::string_view message,
                                const transfer_log_context* context,
                                const char* file,
                                int line) {
    if (!is_enabled(level)) {
        return;
    }

    log_output_format format;
    sensitive_info_masker masker;
    {
        std::lock_guard lock(impl_->config_mutex);
        format = impl_->format;
        masker = impl_->masker;
    }

    log_callback callback;
    json_log_callback json_callback;
    {
        std::lock_guard lock(impl_->callback_mutex);
        callback = impl_->callback;
        json_callback = impl_->json_callback;
    }

    const auto masked = masker.mask(std::string(message));
    if (callback) {
        callback(level, category, masked, context);
    }

    if (format == log_output_format::json) {
        log_entry_builder builder;
        builder.with_level(level).with_category(category).with_message(masked);
        builder.with_source_location(file, line);
        if (context != nullptr) {
            builder.with_context(*context);
        }
        const auto entry = builder.build();
        const auto json = entry.to_json(&masker);
        if (json_callback) {
            json_callback(entry, json);
        }
        if (!impl_->to_backend(level, json)) {
            impl_->to_stderr(json);
        }
        return;
    }

    std::ostringstream text;
    text << '[' << category << "] " << masked;
    if (context != nullptr) {
        text << ' ' << context->to_json(&masker);
    }
    if (impl_->to_backend(level, text.str())) {
        return;
    }
    impl_->to_stderr(utc_timestamp(std::chrono::system_clock::now()) + " [" +
                     std::string(log_level_to_string(level)) + "] " + text.str());
}

void stage_transfer_logger::flush() {
#if STAGE_TRANSFER_USE_LOGGER_SYSTEM
    std::lock_guard lock(impl_->backend_mutex);
    if (impl_->backend) {
        impl_->backend->flush();
    }
#endif
}

auto get_logger() -> stage_transfer_logger& {
    static stage_transfer_logger instance;
    return instance;
}

}  // namespace kcenon::stage_transfer
