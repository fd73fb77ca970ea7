/**
 * @file command_parser.h
 * @brief PUT/GET command interpreter
 *
 * Grammar (keywords and option names are case-insensitive, any token may be
 * single-quoted):
 * @code
 * PUT file://<glob> [file://<glob> ...] @<stage>[/<path>] [<option>=<value> ...]
 * GET @<stage>[/<path>] file://<directory> [<option>=<value> ...]
 * @endcode
 */

#ifndef KCENON_STAGE_TRANSFER_COMMAND_COMMAND_PARSER_H
#define KCENON_STAGE_TRANSFER_COMMAND_COMMAND_PARSER_H

#include <kcenon/stage_transfer/command/session_parameters.h>
#include <kcenon/stage_transfer/core/transfer_types.h>
#include <kcenon/stage_transfer/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace kcenon::stage_transfer {

/**
 * @brief Command interpreter for the PUT and GET data-movement commands
 */
class command_parser {
public:
    /**
     * @brief Parse a command against the session defaults
     * @return The intent, invalid_command for malformed text, or
     *         invalid_parameter for an unknown, misplaced or invalid option
     */
    [[nodiscard]] static auto parse(std::string_view command,
                                    const session_parameters& session)
        -> result<transfer_intent>;

    /**
     * @brief Split command text into tokens, honouring single quotes
     *
     * Quotes may appear inside a token (pattern='a b') and '' inside a
     * quoted section stands for a literal quote.
     */
    [[nodiscard]] static auto tokenize(std::string_view command)
        -> result<std::vector<std::string>>;

    /**
     * @brief Split "@stage/path/" into stage name and path
     */
    [[nodiscard]] static auto split_stage_reference(std::string_view reference,
                                                    std::string& stage_name,
                                                    std::string& stage_path)
        -> result<void>;

private:
    [[nodiscard]] static auto apply_option(transfer_intent& intent,
                                           std::string_view token) -> result<void>;
};

}  // namespace kcenon::stage_transfer

#endif  // KCENON_STAGE_TRANSFER_COMMAND_COMMAND_PARSER_H
