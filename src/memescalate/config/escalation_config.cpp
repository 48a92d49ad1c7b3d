/**
 * @file escalation_config.cpp
 */
#include "memescalate/config/escalation_config.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

#include <fstream>
#include <sstream>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

namespace memescalate
{

namespace
{

[[noreturn]] void config_error(const std::string& message)
{
    throw EscalationError(EscalationErrorCode::ConfigError, message);
}

std::string scalar_or(const YAML::Node& node, const char* key, const std::string& fallback)
{
    const YAML::Node value = node[key];
    if (!value || value.IsNull())
    {
        return fallback;
    }
    if (!value.IsScalar())
    {
        config_error(std::string("'") + key + "' must be a scalar");
    }
    return value.Scalar();
}

template <typename T>
T number_or(const YAML::Node& node, const char* key, T fallback)
{
    const YAML::Node value = node[key];
    if (!value || value.IsNull())
    {
        return fallback;
    }
    try
    {
        return value.as<T>();
    }
    catch (const YAML::Exception&)
    {
        config_error(std::string("'") + key + "' must be a number, got '" + value.Scalar() + "'");
    }
}

ResourceLevel parse_level(const YAML::Node& node, size_t index)
{
    const std::string where = "levels[" + std::to_string(index) + "]";
    if (!node.IsMap())
    {
        config_error(where + " must be a mapping with partition, mem and time");
    }

    ResourceLevel level;
    level.partition = scalar_or(node, "partition", "devel");
    level.memory = scalar_or(node, "mem", scalar_or(node, "memory", ""));
    level.time = scalar_or(node, "time", "");

    if (level.memory.empty())
    {
        config_error(where + " has no mem");
    }
    if (level.time.empty())
    {
        config_error(where + " has no time");
    }
    return level;
}

ClassificationRules parse_state_handling(const YAML::Node& node)
{
    if (!node.IsMap())
    {
        config_error("'state_handling' must be a mapping of state to action");
    }

    ClassificationRules rules;
    // Mapping iteration follows document order, which is the rule priority
    for (auto it = node.begin(); it != node.end(); ++it)
    {
        const std::string key = it->first.Scalar();
        if (key == "exit_codes")
        {
            if (!it->second.IsMap())
            {
                config_error("'state_handling.exit_codes' must be a mapping of code to action");
            }
            for (auto code_it = it->second.begin(); code_it != it->second.end(); ++code_it)
            {
                int code = 0;
                try
                {
                    code = code_it->first.as<int>();
                }
                catch (const YAML::Exception&)
                {
                    config_error("Exit code '" + code_it->first.Scalar() + "' is not an integer");
                }
                rules.exit_code_overrides[code] = parse_rule_action(code_it->second.Scalar());
            }
            continue;
        }

        if (key.empty())
        {
            config_error("'state_handling' contains an empty state pattern");
        }
        rules.state_rules.push_back(StateRule{key, parse_rule_action(it->second.Scalar())});
    }

    if (rules.state_rules.empty())
    {
        rules.state_rules = ClassificationRules::default_state_rules();
    }
    return rules;
}

} // namespace

EscalationConfig parse_config(const std::string& yaml_text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        config_error(std::string("Failed to parse config: ") + e.what());
    }

    if (!root.IsMap())
    {
        config_error("Config must be a mapping");
    }

    EscalationConfig config;
    config.source_text = yaml_text;

    const YAML::Node levels = root["levels"];
    if (!levels || !levels.IsSequence() || levels.size() == 0)
    {
        config_error("Config must have a non-empty levels section");
    }
    for (size_t i = 0; i < levels.size(); ++i)
    {
        config.levels.push_back(parse_level(levels[i], i));
    }

    if (const YAML::Node handling = root["state_handling"])
    {
        config.rules = parse_state_handling(handling);
    }

    if (const YAML::Node timeout = root["timeout"])
    {
        config.sacct_delay = number_or<int>(timeout, "sacct_delay", config.sacct_delay);
        config.query_timeout_seconds =
            number_or<int>(timeout, "query_timeout", config.query_timeout_seconds);
        if (config.sacct_delay < 0)
        {
            config_error("'timeout.sacct_delay' must not be negative");
        }
        if (config.query_timeout_seconds <= 0)
        {
            config_error("'timeout.query_timeout' must be positive");
        }
    }

    if (const YAML::Node tracker = root["tracker"])
    {
        config.tracker.base_dir = scalar_or(tracker, "base_dir", config.tracker.base_dir);
        config.tracker.checkpoint_dir =
            scalar_or(tracker, "checkpoint_dir", config.tracker.base_dir + "/checkpoints");
        config.tracker.output_dir =
            scalar_or(tracker, "output_dir", config.tracker.base_dir + "/outputs");
        config.tracker.history_log = scalar_or(tracker, "history_log", "");
    }
    config.logging.history_log = config.tracker.history_log;

    if (const YAML::Node logging = root["logging"])
    {
        if (const YAML::Node enabled = logging["enabled"])
        {
            try
            {
                config.audit.enabled = enabled.as<bool>();
            }
            catch (const YAML::Exception&)
            {
                config_error("'logging.enabled' must be true or false");
            }
        }
        config.audit.db_path = scalar_or(logging, "db_path", config.audit.db_path);
        config.logging.level = scalar_or(logging, "level", config.logging.level);
        // from_str maps unknown names to off
        if (config.logging.level != "off" &&
            spdlog::level::from_str(config.logging.level) == spdlog::level::off)
        {
            config_error("'logging.level' must be one of trace, debug, info, warn, error, "
                "critical or off, got '" + config.logging.level + "'");
        }
    }

    config.max_array_spec_len =
        number_or<size_t>(root, "max_array_spec_len", config.max_array_spec_len);
    config.batch_size = number_or<size_t>(root, "batch_size", config.batch_size);
    if (config.batch_size == 0)
    {
        config_error("'batch_size' must be positive");
    }

    if (const YAML::Node cluster = root["cluster"])
    {
        config.cluster.name = scalar_or(cluster, "name", "");
        config.cluster.partition = scalar_or(cluster, "partition", "");
        config.cluster.nodes = scalar_or(cluster, "nodes", "");
    }

    return config;
}

EscalationConfig load_config_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        config_error("Cannot read config file " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

} // namespace memescalate
