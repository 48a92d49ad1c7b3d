/**
 * @file checkpoint_yaml.cpp
 */
#include "memescalate/chain/checkpoint_yaml.hpp"
#include "memescalate/common/escalation_exceptions.hpp"

#include <yaml-cpp/yaml.h>

namespace memescalate
{

namespace
{

[[noreturn]] void checkpoint_error(const std::string& message)
{
    throw EscalationError(EscalationErrorCode::CheckpointIO, message);
}

// ============================================================================
// Encoding
// ============================================================================

void emit_string_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& items)
{
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& item : items)
    {
        out << item;
    }
    out << YAML::EndSeq;
}

void emit_levels(YAML::Emitter& out, const std::vector<ResourceLevel>& levels)
{
    out << YAML::Key << "levels" << YAML::Value << YAML::BeginSeq;
    for (const auto& level : levels)
    {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "partition" << YAML::Value << level.partition;
        out << YAML::Key << "mem" << YAML::Value << level.memory;
        out << YAML::Key << "time" << YAML::Value << level.time;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emit_state(YAML::Emitter& out, const ChainState& state)
{
    out << YAML::Key << "state" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "current_level" << YAML::Value << state.current_level;
    out << YAML::Key << "current_memory" << YAML::Value << state.current_memory;
    out << YAML::Key << "current_time" << YAML::Value << state.current_time;
    out << YAML::Key << "status" << YAML::Value << to_string(state.status);
    out << YAML::Key << "pending_indices" << YAML::Value << state.pending_indices;
    out << YAML::Key << "failed_indices" << YAML::Value << state.failed_indices;
    out << YAML::Key << "completed_count" << YAML::Value << state.completed_count;
    out << YAML::Key << "failed_count" << YAML::Value << state.failed_count;
    out << YAML::Key << "escalate_count" << YAML::Value << state.escalate_count;
    out << YAML::Key << "last_escalation_reason" << YAML::Value
        << to_string(state.last_escalation_reason);
    out << YAML::EndMap;
}

void emit_round(YAML::Emitter& out, const Round& round)
{
    out << YAML::BeginMap;
    out << YAML::Key << "round" << YAML::Value << round.ordinal;
    out << YAML::Key << "job_id" << YAML::Value << round.primary_job_id();
    emit_string_list(out, "job_ids", round.job_ids);
    out << YAML::Key << "handler_id" << YAML::Value << round.handler_id;
    out << YAML::Key << "array_spec" << YAML::Value << round.array_spec;
    out << YAML::Key << "level" << YAML::Value << round.level;
    out << YAML::Key << "memory" << YAML::Value << round.memory;
    out << YAML::Key << "time" << YAML::Value << round.time;
    out << YAML::Key << "partition" << YAML::Value << round.partition;
    out << YAML::Key << "status" << YAML::Value << to_string(round.status);
    out << YAML::Key << "submitted" << YAML::Value << round.submitted;
    out << YAML::Key << "completed_count" << YAML::Value << round.completed_count;
    out << YAML::Key << "oom_count" << YAML::Value << round.oom_count;
    out << YAML::Key << "timeout_count" << YAML::Value << round.timeout_count;
    out << YAML::Key << "failed_count" << YAML::Value << round.failed_count;
    out << YAML::Key << "escalate_indices" << YAML::Value << round.escalate_indices;
    out << YAML::EndMap;
}

// ============================================================================
// Decoding
// ============================================================================

std::string read_string(const YAML::Node& node, const char* key, const std::string& fallback = "")
{
    const YAML::Node value = node[key];
    if (!value || value.IsNull())
    {
        return fallback;
    }
    if (!value.IsScalar())
    {
        checkpoint_error(std::string("Checkpoint key '") + key + "' must be a scalar");
    }
    return value.Scalar();
}

template <typename T>
T read_number(const YAML::Node& node, const char* key, T fallback = T{})
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
        checkpoint_error(std::string("Checkpoint key '") + key + "' must be a number");
    }
}

std::vector<std::string> read_string_list(const YAML::Node& node, const char* key)
{
    std::vector<std::string> items;
    const YAML::Node value = node[key];
    if (!value || value.IsNull())
    {
        return items;
    }
    if (!value.IsSequence())
    {
        checkpoint_error(std::string("Checkpoint key '") + key + "' must be a list");
    }
    for (const auto& item : value)
    {
        items.push_back(item.Scalar());
    }
    return items;
}

std::vector<ResourceLevel> read_levels(const YAML::Node& node)
{
    const YAML::Node levels = node["levels"];
    if (!levels || !levels.IsSequence() || levels.size() == 0)
    {
        checkpoint_error("Checkpoint has no levels");
    }
    std::vector<ResourceLevel> result;
    for (const auto& entry : levels)
    {
        ResourceLevel level;
        level.partition = read_string(entry, "partition", "devel");
        level.memory = read_string(entry, "mem", read_string(entry, "memory"));
        level.time = read_string(entry, "time");
        result.push_back(std::move(level));
    }
    return result;
}

ChainState read_state(const YAML::Node& node)
{
    ChainState state;
    const YAML::Node s = node["state"];
    if (!s)
    {
        return state;
    }
    state.current_level = read_number<size_t>(s, "current_level");
    state.current_memory = read_string(s, "current_memory");
    state.current_time = read_string(s, "current_time");
    state.status = parse_chain_status(read_string(s, "status", "STARTING"));
    state.pending_indices = read_string(s, "pending_indices");
    state.failed_indices = read_string(s, "failed_indices");
    state.completed_count = read_number<size_t>(s, "completed_count");
    state.failed_count = read_number<size_t>(s, "failed_count");
    state.escalate_count = read_number<size_t>(s, "escalate_count");
    state.last_escalation_reason =
        parse_escalation_reason(read_string(s, "last_escalation_reason"));
    return state;
}

Round read_round(const YAML::Node& node, size_t ordinal)
{
    Round round;
    round.ordinal = ordinal;
    round.job_ids = read_string_list(node, "job_ids");
    if (round.job_ids.empty())
    {
        std::string job_id = read_string(node, "job_id");
        if (!job_id.empty())
        {
            round.job_ids.push_back(job_id);
        }
    }
    round.handler_id = read_string(node, "handler_id");
    round.array_spec = read_string(node, "array_spec");
    round.level = read_number<size_t>(node, "level");
    round.memory = read_string(node, "memory");
    round.time = read_string(node, "time");
    round.partition = read_string(node, "partition");
    round.status = parse_round_status(read_string(node, "status", "RUNNING"));
    round.submitted = read_string(node, "submitted");
    round.completed_count = read_number<size_t>(node, "completed_count");
    round.oom_count = read_number<size_t>(node, "oom_count");
    round.timeout_count = read_number<size_t>(node, "timeout_count");
    round.failed_count = read_number<size_t>(node, "failed_count");
    round.escalate_indices = read_string(node, "escalate_indices");
    return round;
}

} // namespace

std::string encode_checkpoint(const ChainRecord& record)
{
    const EscalationChain& chain = record.chain;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "chain_id" << YAML::Value << chain.chain_id;
    out << YAML::Key << "mode" << YAML::Value << chain.mode();
    out << YAML::Key << "partition" << YAML::Value
        << (chain.levels.empty() ? std::string() : chain.levels.front().partition);
    out << YAML::Key << "original_script" << YAML::Value << chain.script;
    emit_string_list(out, "script_args", chain.script_args);
    out << YAML::Key << "original_array_spec" << YAML::Value << chain.original_array_spec;
    out << YAML::Key << "total_tasks" << YAML::Value << chain.total_tasks;
    out << YAML::Key << "max_level" << YAML::Value
        << (chain.levels.empty() ? size_t{0} : chain.max_level());
    emit_levels(out, chain.levels);
    out << YAML::Key << "created" << YAML::Value << record.created;
    out << YAML::Key << "updated" << YAML::Value << record.updated;
    out << YAML::Key << "revision" << YAML::Value << record.revision;
    emit_state(out, record.state);

    out << YAML::Key << "rounds" << YAML::Value << YAML::BeginSeq;
    for (const auto& round : record.rounds)
    {
        emit_round(out, round);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good())
    {
        checkpoint_error("Failed to encode checkpoint " + chain.chain_id + ": " +
            out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

ChainRecord decode_checkpoint(const std::string& yaml_text)
{
    try
    {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap())
        {
            checkpoint_error("Checkpoint is not a mapping");
        }

        ChainRecord record;
        record.chain.chain_id = read_string(root, "chain_id");
        if (record.chain.chain_id.empty())
        {
            checkpoint_error("Checkpoint has no chain_id");
        }
        record.chain.script = read_string(root, "original_script");
        record.chain.script_args = read_string_list(root, "script_args");
        record.chain.original_array_spec = read_string(root, "original_array_spec");
        record.chain.total_tasks = read_number<size_t>(root, "total_tasks");
        record.chain.levels = read_levels(root);
        record.created = read_string(root, "created");
        record.updated = read_string(root, "updated");
        record.revision = read_number<uint64_t>(root, "revision");
        record.state = read_state(root);
        if (record.state.current_level > record.chain.max_level())
        {
            checkpoint_error("Checkpoint current_level " +
                std::to_string(record.state.current_level) + " is above the ladder's top level " +
                std::to_string(record.chain.max_level()));
        }

        const YAML::Node rounds = root["rounds"];
        if (rounds && rounds.IsSequence())
        {
            for (size_t i = 0; i < rounds.size(); ++i)
            {
                record.rounds.push_back(read_round(rounds[i], i + 1));
            }
        }
        return record;
    }
    catch (const YAML::Exception& e)
    {
        checkpoint_error(std::string("Failed to parse checkpoint: ") + e.what());
    }
}

} // namespace memescalate
