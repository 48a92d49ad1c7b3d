/**
 * @file arg_parser.cpp
 */
#include "memescalate/cli/arg_parser.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

namespace memescalate
{

namespace
{

[[noreturn]] void argument_error(const std::string& message)
{
    throw EscalationError(EscalationErrorCode::InvalidArgument, message);
}

bool looks_like_option(const std::string& arg)
{
    return arg.size() > 2 && arg.compare(0, 2, "--") == 0;
}

} // namespace

CommandLine parse_command_line(int argc, const char* const* argv)
{
    CommandLine line;
    int i = 1;
    for (; i < argc; ++i)
    {
        const std::string arg = argv[i];
        std::optional<std::string>* target = nullptr;
        if (arg == "--config")
        {
            target = &line.globals.config_path;
        }
        else if (arg == "--checkpoint-dir")
        {
            target = &line.globals.checkpoint_dir;
        }
        else if (arg == "--db")
        {
            target = &line.globals.db_path;
        }
        else if (arg == "--help" || arg == "-h")
        {
            line.command = "help";
            return line;
        }
        else if (looks_like_option(arg))
        {
            argument_error("Unknown global option " + arg);
        }
        else
        {
            break;
        }

        if (i + 1 >= argc)
        {
            argument_error("Option " + arg + " needs a value");
        }
        *target = argv[++i];
    }

    if (i < argc)
    {
        line.command = argv[i++];
    }
    for (; i < argc; ++i)
    {
        line.args.emplace_back(argv[i]);
    }
    return line;
}

void ParsedArgs::expect_positionals(
    size_t min_count, size_t max_count, const std::string& usage) const
{
    if (positionals.size() < min_count || positionals.size() > max_count)
    {
        argument_error("Usage: memescalate " + usage);
    }
}

ParsedArgs parse_args(
    const std::vector<std::string>& args,
    const std::set<std::string>& value_options,
    const std::set<std::string>& flag_options)
{
    ParsedArgs parsed;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--")
        {
            parsed.passthrough.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        }
        if (!looks_like_option(arg))
        {
            parsed.positionals.push_back(arg);
            continue;
        }
        if (flag_options.count(arg))
        {
            parsed.flags.insert(arg);
            continue;
        }
        if (!value_options.count(arg))
        {
            argument_error("Unknown option " + arg);
        }
        if (i + 1 >= args.size())
        {
            argument_error("Option " + arg + " needs a value");
        }
        parsed.options[arg] = args[++i];
    }
    return parsed;
}

} // namespace memescalate
