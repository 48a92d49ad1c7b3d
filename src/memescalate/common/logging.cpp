/**
 * @file logging.cpp
 */
#include "memescalate/common/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace memescalate
{

namespace
{

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_stderr_logger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger()
{
    auto logger = spdlog::get(kLoggerName);
    if (!logger)
    {
        logger = make_stderr_logger();
        spdlog::register_logger(logger);
    }
    return logger;
}

void configure_logging(const LogSettings& settings)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    if (!settings.history_log.empty())
    {
        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                settings.history_log, false));
        }
        catch (const spdlog::spdlog_ex& e)
        {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::from_str(settings.level));

    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);

    // SPDLOG_LEVEL=debug (or memescalate=debug) wins over the configured level
    spdlog::cfg::load_env_levels();

    if (!file_error.empty())
    {
        SPDLOG_LOGGER_WARN(logger, "History log {} disabled: {}", settings.history_log, file_error);
    }
}

} // namespace memescalate
