/**
 * @file command_parser.cpp
 * @brief PUT/GET command interpreter implementation
 */

#include <kcenon/stage_transfer/command/command_parser.h>
#include <kcenon/stage_transfer/core/logging.h>

#include <cctype>
#include <regex>

namespace kcenon::stage_transfer {

namespace {

constexpr std::string_view file_scheme = "file://";
constexpr int64_t max_parallel = 99;

auto invalid_command(std::string message) -> unexpected {
    return unexpected{error{error_code::invalid_command, std::move(message)}};
}

auto invalid_parameter(std::string message) -> unexpected {
    return unexpected{error{error_code::invalid_parameter, std::move(message)}};
}

auto has_file_scheme(std::string_view token) -> bool {
    return token.size() > file_scheme.size() &&
           detail::to_lower(token.substr(0, file_scheme.size())) == file_scheme;
}

auto strip_file_scheme(std::string_view token) -> std::string {
    return std::string(token.substr(file_scheme.size()));
}

auto is_stage_token(std::string_view token) -> bool {
    return !token.empty() && token.front() == '@';
}

}  // namespace

auto command_parser::tokenize(std::string_view command)
    -> result<std::vector<std::string>> {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quote = false;
    bool has_token = false;

    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        if (in_quote) {
            if (c == '\'') {
                if (i + 1 < command.size() && command[i + 1] == '\'') {
                    current += '\'';
                    ++i;
                } else {
                    in_quote = false;
                }
            } else {
                current += c;
            }
            continue;
        }

        if (c == '\'') {
            in_quote = true;
            has_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (has_token) {
                tokens.push_back(std::move(current));
                current.clear();
                has_token = false;
            }
        } else if (c == ';' && i + 1 == command.size()) {
            // trailing statement terminator
        } else {
            current += c;
            has_token = true;
        }
    }

    if (in_quote) {
        return invalid_command("unterminated quote in command");
    }
    if (has_token) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

auto command_parser::split_stage_reference(std::string_view reference,
                                           std::string& stage_name,
                                           std::string& stage_path) -> result<void> {
    if (!is_stage_token(reference)) {
        return invalid_command("stage reference must start with '@': " +
                               std::string(reference));
    }

    std::string_view body = reference.substr(1);
    const auto slash = body.find('/');
    stage_name = std::string(body.substr(0, slash));
    if (stage_name.empty()) {
        return invalid_command("missing stage name in '" + std::string(reference) + "'");
    }

    stage_path.clear();
    if (slash != std::string_view::npos) {
        std::string_view path = body.substr(slash + 1);
        while (!path.empty() && path.front() == '/') {
            path.remove_prefix(1);
        }
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        stage_path = std::string(path);
    }
    return {};
}

auto command_parser::apply_option(transfer_intent& intent, std::string_view token)
    -> result<void> {
    const auto eq = token.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return invalid_command("malformed option '" + std::string(token) +
                               "', expected key=value");
    }

    const auto key = detail::to_lower(token.substr(0, eq));
    const auto value = token.substr(eq + 1);
    auto& options = intent.options;
    const bool upload = intent.is_upload();

    if (key == "parallel") {
        auto number = parse_integer_value(value);
        if (!number || *number < 1 || *number > max_parallel) {
            return invalid_parameter("parallel must be an integer between 1 and 99, got '" +
                                     std::string(value) + "'");
        }
        options.parallel = static_cast<std::size_t>(*number);
        return {};
    }

    if (key == "overwrite") {
        if (!upload) {
            return invalid_parameter("overwrite applies to PUT only");
        }
        auto flag = parse_bool_value(value);
        if (!flag) {
            return invalid_parameter("overwrite must be true or false");
        }
        options.overwrite = *flag;
        return {};
    }

    if (key == "threshold") {
        auto number = parse_integer_value(value);
        if (!number || *number <= 0) {
            return invalid_parameter("threshold must be a positive integer, got '" +
                                     std::string(value) + "'");
        }
        options.threshold = static_cast<uint64_t>(*number);
        return {};
    }

    if (key == "source_compression") {
        if (!upload) {
            return invalid_parameter("source_compression applies to PUT only");
        }
        auto format = parse_compression_format(value);
        if (!format) {
            return invalid_parameter("unsupported source_compression '" +
                                     std::string(value) + "'");
        }
        options.source_compression = *format;
        return {};
    }

    if (key == "auto_compress") {
        if (!upload) {
            return invalid_parameter("auto_compress applies to PUT only");
        }
        auto flag = parse_bool_value(value);
        if (!flag) {
            return invalid_parameter("auto_compress must be true or false");
        }
        options.auto_compress = *flag;
        return {};
    }

    if (key == "pattern") {
        if (upload) {
            return invalid_parameter("pattern applies to GET only");
        }
        try {
            std::regex compiled{std::string(value)};
            (void)compiled;
        } catch (const std::regex_error& e) {
            return invalid_parameter("invalid pattern '" + std::string(value) + "': " + e.what());
        }
        options.pattern = std::string(value);
        return {};
    }

    if (key == "decompress") {
        if (upload) {
            return invalid_parameter("decompress applies to GET only");
        }
        auto flag = parse_bool_value(value);
        if (!flag) {
            return invalid_parameter("decompress must be true or false");
        }
        options.decompress = *flag;
        return {};
    }

    return invalid_parameter("unknown option '" + std::string(token.substr(0, eq)) + "'");
}

auto command_parser::parse(std::string_view command, const session_parameters& session)
    -> result<transfer_intent> {
    auto tokenized = tokenize(command);
    if (!tokenized) {
        return unexpected{tokenized.error()};
    }
    const auto& tokens = tokenized.value();
    if (tokens.empty()) {
        return invalid_command("empty command");
    }

    transfer_intent intent;
    intent.options = session.default_options();

    const auto keyword = detail::to_lower(tokens[0]);
    std::size_t next = 1;

    if (keyword == "put") {
        intent.direction = transfer_direction::upload;
        while (next < tokens.size() && has_file_scheme(tokens[next])) {
            intent.local_paths.push_back(strip_file_scheme(tokens[next]));
            ++next;
        }
        if (intent.local_paths.empty()) {
            return invalid_command("PUT requires at least one file:// source");
        }
        if (next >= tokens.size() || !is_stage_token(tokens[next])) {
            return invalid_command("PUT requires a stage reference after the sources");
        }
        intent.stage_reference = tokens[next++];
    } else if (keyword == "get") {
        intent.direction = transfer_direction::download;
        if (next >= tokens.size() || !is_stage_token(tokens[next])) {
            return invalid_command("GET requires a stage reference");
        }
        intent.stage_reference = tokens[next++];
        if (next >= tokens.size() || !has_file_scheme(tokens[next])) {
            return invalid_command("GET requires a file:// destination directory");
        }
        intent.local_paths.push_back(strip_file_scheme(tokens[next++]));
    } else {
        return invalid_command("unsupported command '" + tokens[0] + "'");
    }

    auto split = split_stage_reference(intent.stage_reference,
                                       intent.stage_name, intent.stage_path);
    if (!split) {
        return unexpected{split.error()};
    }

    for (; next < tokens.size(); ++next) {
        auto applied = apply_option(intent, tokens[next]);
        if (!applied) {
            ST_LOG_DEBUG(log_category::command,
                "Rejected command option: " + applied.error().message);
            return unexpected{applied.error()};
        }
    }

    ST_LOG_DEBUG(log_category::command,
        std::string("Parsed ") + to_string(intent.direction) + " command for stage @" +
        intent.stage_name + " (parallel=" + std::to_string(intent.options.parallel) +
        ", threshold=" + std::to_string(intent.options.threshold) + ")");

    return intent;
}

}  // namespace kcenon::stage_transfer
