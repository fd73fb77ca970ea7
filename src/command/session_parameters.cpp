/**
 * @file session_parameters.cpp
 * @brief Session parameter handling
 */

#include <kcenon/stage_transfer/command/session_parameters.h>

#include <charconv>
#include <string>

namespace kcenon::stage_transfer {

auto parse_bool_value(std::string_view value) -> std::optional<bool> {
    const auto lowered = detail::to_lower(value);
    if (lowered == "true" || lowered == "on" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "off" || lowered == "no" || lowered == "0") {
        return false;
    }
    return std::nullopt;
}

auto parse_integer_value(std::string_view value) -> std::optional<int64_t> {
    if (value.empty()) {
        return std::nullopt;
    }
    if (value.front() == '+') {
        value.remove_prefix(1);
    }
    int64_t parsed = 0;
    const auto* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

namespace {

auto invalid_value(std::string_view name, std::string_view value) -> unexpected {
    return unexpected{error{error_code::invalid_parameter,
        "invalid value '" + std::string(value) + "' for parameter " + std::string(name)}};
}

}  // namespace

auto session_parameters::apply(std::string_view name, std::string_view value)
    -> result<void> {
    const auto key = detail::to_lower(name);

    if (key == "gcs_use_downscoped_credential" || key == "use_regional_url") {
        auto flag = parse_bool_value(value);
        if (!flag) {
            return invalid_value(name, value);
        }
        (key == "use_regional_url" ? use_regional_url : gcs_use_downscoped_credential) = *flag;
        return {};
    }

    auto number = parse_integer_value(value);
    if (key == "big_file_threshold") {
        if (!number || *number <= 0) {
            return invalid_value(name, value);
        }
        big_file_threshold = static_cast<uint64_t>(*number);
        return {};
    }
    if (key == "parallel") {
        if (!number || *number < 1 || *number > 99) {
            return invalid_value(name, value);
        }
        parallel = static_cast<std::size_t>(*number);
        return {};
    }
    if (key == "max_retries") {
        if (!number || *number < 0) {
            return invalid_value(name, value);
        }
        max_retries = static_cast<std::size_t>(*number);
        return {};
    }
    if (key == "network_timeout_ms") {
        if (!number || *number <= 0) {
            return invalid_value(name, value);
        }
        network_timeout = std::chrono::milliseconds(*number);
        return {};
    }

    return unexpected{error{error_code::invalid_parameter,
        "unknown session parameter: " + std::string(name)}};
}

auto session_parameters::default_options() const -> transfer_options {
    transfer_options options;
    options.parallel = parallel;
    options.threshold = big_file_threshold;
    options.max_retries = max_retries;
    options.use_regional_url = use_regional_url;
    options.gcs_use_downscoped_credential = gcs_use_downscoped_credential;
    options.network_timeout = network_timeout;
    return options;
}

}  // namespace kcenon::stage_transfer
