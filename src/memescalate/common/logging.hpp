/**
 * @file logging.hpp
 * @brief Process-wide spdlog logger used by every component.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include <spdlog/spdlog.h>

namespace memescalate
{

/**
 * @brief Name of the shared logger.
 */
inline constexpr const char* kLoggerName = "memescalate";

/**
 * @brief Logging settings taken from configuration.
 */
struct LogSettings
{
    /**
     * @brief spdlog level name (trace, debug, info, warn, error, critical, off).
     */
    std::string level{"info"};

    /**
     * @brief Optional history file; every record is appended to it as well as stderr.
     */
    std::string history_log;
};

/**
 * @brief Get the shared logger, creating a stderr logger on first use.
 *
 * @details
 * Stdout carries machine-parsable `KEY=value` output for the driving shell script, so all
 * diagnostics go to stderr.
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Rebuild the shared logger from settings.
 *
 * @details
 * Call once at process start, before components capture the logger. The `SPDLOG_LEVEL`
 * environment variable overrides the configured level. A history file that cannot be opened
 * is reported and skipped.
 */
void configure_logging(const LogSettings& settings);

} // namespace memescalate
