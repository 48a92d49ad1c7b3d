/**
 * @file text_utils.hpp
 * @brief Small string helpers shared by the CLI, the reports and the scheduler parsers.
 */
#pragma once
#include "memescalate/common/common.hpp"

namespace memescalate
{

/**
 * @brief Strip leading and trailing blanks (space, tab, CR, LF).
 */
std::string trim(const std::string& text);

/**
 * @brief Split on a separator, trimming each piece and dropping empty ones.
 */
std::vector<std::string> split_list(const std::string& text, char separator = ',');

/**
 * @brief Join strings with a separator.
 */
std::string join_strings(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Quote a value for a POSIX shell assignment.
 *
 * @details
 * Values made only of characters that need no quoting are returned unchanged. Anything else,
 * including the empty string, is wrapped in single quotes with embedded quotes escaped as
 * `'"'"'`.
 */
std::string shell_quote(const std::string& value);

/**
 * @brief Parse a non-negative decimal integer.
 * @param what Name used in the error message.
 * @throw EscalationError with `InvalidArgument` if `text` is not a plain decimal number.
 */
size_t parse_count(const std::string& text, const char* what);

/**
 * @brief Current local time as `YYYY-MM-DDTHH:MM:SS`.
 */
std::string now_timestamp();

} // namespace memescalate
