/**
 * @file text_utils.cpp
 */
#include "memescalate/common/text_utils.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

#include <charconv>
#include <ctime>

namespace memescalate
{

namespace
{

constexpr const char* kBlanks = " \t\r\n";

bool is_shell_safe(char c)
{
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
    {
        return true;
    }
    switch (c)
    {
        case '@':
        case '%':
        case '+':
        case '=':
        case ':':
        case ',':
        case '.':
        case '/':
        case '-':
        case '_':
            return true;
        default:
            return false;
    }
}

} // namespace

std::string trim(const std::string& text)
{
    auto first = text.find_first_not_of(kBlanks);
    if (first == std::string::npos)
    {
        return {};
    }
    auto last = text.find_last_not_of(kBlanks);
    return text.substr(first, last - first + 1);
}

std::vector<std::string> split_list(const std::string& text, char separator)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t end = text.find(separator, start);
        if (end == std::string::npos)
        {
            end = text.size();
        }
        std::string piece = trim(text.substr(start, end - start));
        if (!piece.empty())
        {
            parts.push_back(std::move(piece));
        }
        start = end + 1;
    }
    return parts;
}

std::string join_strings(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
        {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string shell_quote(const std::string& value)
{
    if (!value.empty() && std::all_of(value.begin(), value.end(), is_shell_safe))
    {
        return value;
    }
    std::string quoted = "'";
    for (char c : value)
    {
        if (c == '\'')
        {
            quoted += "'\"'\"'";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

size_t parse_count(const std::string& text, const char* what)
{
    size_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc{} || ptr != end)
    {
        throw EscalationError(EscalationErrorCode::InvalidArgument,
            std::string(what) + " must be a non-negative integer, got '" + text + "'");
    }
    return value;
}

std::string now_timestamp()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return buffer;
}

} // namespace memescalate
