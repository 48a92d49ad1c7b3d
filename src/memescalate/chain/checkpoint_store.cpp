/**
 * @file checkpoint_store.cpp
 */
#include "memescalate/chain/checkpoint_store.hpp"
#include "memescalate/chain/checkpoint_yaml.hpp"
#include "memescalate/common/escalation_exceptions.hpp"
#include "memescalate/common/logging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace memescalate
{

// ============================================================================
// FileCheckpointStore
// ============================================================================

FileCheckpointStore::FileCheckpointStore(std::string directory)
    : m_directory(std::move(directory))
    , m_log(get_logger())
{
}

std::string FileCheckpointStore::path_for(const std::string& chain_id) const
{
    return (fs::path(m_directory) / (chain_id + kSuffix)).string();
}

std::string FileCheckpointStore::location_of(const std::string& chain_id) const
{
    return path_for(chain_id);
}

bool FileCheckpointStore::exists(const std::string& chain_id) const
{
    std::error_code ec;
    return fs::is_regular_file(path_for(chain_id), ec);
}

std::optional<ChainRecord> FileCheckpointStore::load(const std::string& chain_id) const
{
    const std::string path = path_for(chain_id);
    if (!exists(chain_id))
    {
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in)
    {
        throw EscalationError(EscalationErrorCode::CheckpointIO,
            "Cannot open checkpoint " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    ChainRecord record;
    try
    {
        record = decode_checkpoint(buffer.str());
    }
    catch (const EscalationError& e)
    {
        throw EscalationError(EscalationErrorCode::CheckpointIO,
            "Checkpoint " + path + ": " + e.what());
    }
    if (record.chain.chain_id != chain_id)
    {
        throw EscalationError(EscalationErrorCode::CheckpointIO,
            "Checkpoint " + path + " holds chain '" + record.chain.chain_id + "'");
    }
    return record;
}

void FileCheckpointStore::save(const ChainRecord& record)
{
    const std::string text = encode_checkpoint(record);
    const std::string path = path_for(record.chain.chain_id);
    const std::string temp_path = path + ".tmp." + std::to_string(::getpid());

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec)
    {
        throw EscalationError(EscalationErrorCode::CheckpointIO,
            "Cannot create checkpoint directory " + m_directory + ": " + ec.message());
    }

    {
        std::ofstream out(temp_path, std::ios::trunc);
        out << text;
        out.flush();
        if (!out)
        {
            fs::remove(temp_path, ec);
            throw EscalationError(EscalationErrorCode::CheckpointIO,
                "Cannot write checkpoint " + temp_path);
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw EscalationError(EscalationErrorCode::CheckpointIO,
            "Cannot replace checkpoint " + path + ": " + ec.message());
    }
    SPDLOG_LOGGER_DEBUG(m_log, "Saved checkpoint {} (revision {})", path, record.revision);
}

std::vector<std::string> FileCheckpointStore::list() const
{
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(m_directory, ec))
    {
        return ids;
    }

    const std::string suffix = kSuffix;
    for (const auto& entry : fs::directory_iterator(m_directory, ec))
    {
        if (!entry.is_regular_file(ec))
        {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
        {
            ids.push_back(name.substr(0, name.size() - suffix.size()));
        }
    }
    if (ec)
    {
        SPDLOG_LOGGER_WARN(m_log, "Listing {} stopped early: {}", m_directory, ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ============================================================================
// InMemoryCheckpointStore
// ============================================================================

std::optional<ChainRecord> InMemoryCheckpointStore::load(const std::string& chain_id) const
{
    auto it = m_records.find(chain_id);
    if (it == m_records.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryCheckpointStore::save(const ChainRecord& record)
{
    m_records[record.chain.chain_id] = record;
    ++m_save_count;
}

std::vector<std::string> InMemoryCheckpointStore::list() const
{
    std::vector<std::string> ids;
    for (const auto& entry : m_records)
    {
        ids.push_back(entry.first);
    }
    return ids;
}

bool InMemoryCheckpointStore::exists(const std::string& chain_id) const
{
    return m_records.count(chain_id) > 0;
}

std::string InMemoryCheckpointStore::location_of(const std::string& chain_id) const
{
    return "memory:" + chain_id;
}

} // namespace memescalate
