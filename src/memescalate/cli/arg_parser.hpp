/**
 * @file arg_parser.hpp
 * @brief Command-line splitting into global options, a command and its arguments.
 */
#pragma once
#include "memescalate/common/common.hpp"

namespace memescalate
{

/**
 * @brief Options accepted before the command name.
 */
struct GlobalOptions
{
    std::optional<std::string> config_path;
    std::optional<std::string> checkpoint_dir;
    std::optional<std::string> db_path;
};

/**
 * @brief A command line split at the command name.
 */
struct CommandLine
{
    GlobalOptions globals;

    /**
     * @brief Command name; empty when none was given.
     */
    std::string command;

    std::vector<std::string> args;
};

/**
 * @brief Split `argv` into global options, the command and its raw arguments.
 * @throw EscalationError with `InvalidArgument` for an unknown global option or a missing
 *        option value.
 */
CommandLine parse_command_line(int argc, const char* const* argv);

/**
 * @brief Arguments of one command after option extraction.
 */
struct ParsedArgs
{
    std::vector<std::string> positionals;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    /**
     * @brief Everything after a bare `--`, verbatim.
     */
    std::vector<std::string> passthrough;

    bool has_flag(const std::string& name) const
    {
        return flags.count(name) > 0;
    }

    std::optional<std::string> option(const std::string& name) const
    {
        auto it = options.find(name);
        if (it == options.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Check the positional count.
     * @throw EscalationError with `InvalidArgument` naming `usage` if out of range.
     */
    void expect_positionals(size_t min_count, size_t max_count, const std::string& usage) const;
};

/**
 * @brief Extract the options a command knows about.
 *
 * @param value_options Options that take a value, given as `--name value`.
 * @param flag_options Options without a value.
 * @throw EscalationError with `InvalidArgument` for unknown options or missing values.
 */
ParsedArgs parse_args(
    const std::vector<std::string>& args,
    const std::set<std::string>& value_options = {},
    const std::set<std::string>& flag_options = {});

} // namespace memescalate
