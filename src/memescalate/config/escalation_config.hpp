/**
 * @file escalation_config.hpp
 * @brief Escalation rule configuration loaded from YAML.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/common/logging.hpp"
#include "memescalate/common/resource_level.hpp"
#include "memescalate/classify/classification_rules.hpp"

namespace memescalate
{

/**
 * @brief Filesystem locations used by the driver and the CLI.
 */
struct TrackerPaths
{
    std::string base_dir{"/data/tracker"};
    std::string checkpoint_dir{"/data/tracker/checkpoints"};
    std::string output_dir{"/data/tracker/outputs"};

    /**
     * @brief Optional history log; empty disables the file sink.
     */
    std::string history_log;
};

/**
 * @brief Settings for the secondary SQLite audit store.
 */
struct AuditSettings
{
    bool enabled{true};
    std::string db_path{"/data/tracker/escalation.db"};
};

/**
 * @brief Informational cluster settings, passed through to the driver.
 */
struct ClusterSettings
{
    std::string name;
    std::string partition;
    std::string nodes;
};

/**
 * @brief Everything the engine and the CLI take from the configuration document.
 */
struct EscalationConfig
{
    /**
     * @brief The resource ladder, lowest tier first. Never empty after loading.
     */
    std::vector<ResourceLevel> levels;

    /**
     * @brief Task classification rules, defaults when `state_handling` is absent.
     */
    ClassificationRules rules{ClassificationRules::defaults()};

    TrackerPaths tracker;
    AuditSettings audit;
    LogSettings logging;
    ClusterSettings cluster;

    /**
     * @brief Seconds the driver waits before querying accounting after a job ends.
     */
    int sacct_delay{2};

    /**
     * @brief Timeout for each scheduler query command, in seconds.
     */
    int query_timeout_seconds{5};

    /**
     * @brief Longest array spec submitted in one job before batching kicks in.
     */
    size_t max_array_spec_len{3000};

    /**
     * @brief Indices per batch when a spec is too long.
     */
    size_t batch_size{500};

    /**
     * @brief The document text as loaded, kept for the audit store's config snapshot.
     */
    std::string source_text;

    /**
     * @brief Highest valid level index.
     * @pre `levels` is not empty.
     */
    size_t max_level() const noexcept
    {
        return levels.size() - 1;
    }
};

/**
 * @brief Parse a configuration document.
 * @param yaml_text The YAML text.
 * @return The parsed configuration.
 * @throw EscalationError with `ConfigError` if the document is not valid YAML, has no
 *        `levels`, a level lacks memory or time, a rule action is unknown, or an exit code
 *        is not an integer.
 */
EscalationConfig parse_config(const std::string& yaml_text);

/**
 * @brief Read and parse a configuration file.
 * @throw EscalationError with `ConfigError` if the file cannot be read or is invalid.
 */
EscalationConfig load_config_file(const std::string& path);

} // namespace memescalate
