/**
 * @file checkpoint_store.hpp
 * @brief ICheckpointStore interface and its file-backed implementation.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/chain/chain_record.hpp"
#include <spdlog/spdlog.h>

namespace memescalate
{

/**
 * @brief Whole-record persistence for chains.
 *
 * @details
 * There is no partial-update primitive: callers load a record, change it, and save it back.
 * Stores do not lock, so concurrent writers to one chain are last-writer-wins.
 */
class ICheckpointStore
{
public:
    virtual ~ICheckpointStore() = default;

    /**
     * @brief Load a chain's record.
     * @return The record, or `std::nullopt` if the chain has no checkpoint.
     * @throw EscalationError with `CheckpointIO` if the checkpoint exists but cannot be read.
     */
    virtual std::optional<ChainRecord> load(const std::string& chain_id) const = 0;

    /**
     * @brief Replace a chain's record.
     * @throw EscalationError with `CheckpointIO` on write failure.
     */
    virtual void save(const ChainRecord& record) = 0;

    /**
     * @brief Ids of all stored chains, sorted.
     */
    virtual std::vector<std::string> list() const = 0;

    virtual bool exists(const std::string& chain_id) const = 0;

    /**
     * @brief Human-readable location of a chain's checkpoint, for messages.
     */
    virtual std::string location_of(const std::string& chain_id) const = 0;
};

/**
 * @brief Stores each chain as `<dir>/<chain_id>.checkpoint` in YAML.
 *
 * @details
 * Saves write a sibling temporary file and rename it over the checkpoint, so readers see
 * either the old or the new record. The directory is created on first save.
 */
class FileCheckpointStore : public ICheckpointStore
{
public:
    explicit FileCheckpointStore(std::string directory);

    std::optional<ChainRecord> load(const std::string& chain_id) const override;
    void save(const ChainRecord& record) override;
    std::vector<std::string> list() const override;
    bool exists(const std::string& chain_id) const override;
    std::string location_of(const std::string& chain_id) const override;

    const std::string& directory() const noexcept
    {
        return m_directory;
    }

    /**
     * @brief File name suffix of checkpoint files.
     */
    static constexpr const char* kSuffix = ".checkpoint";

private:
    std::string path_for(const std::string& chain_id) const;

    std::string m_directory;
    std::shared_ptr<spdlog::logger> m_log;
};

/**
 * @brief Keeps records in memory. Used where no durable state is wanted.
 */
class InMemoryCheckpointStore : public ICheckpointStore
{
public:
    std::optional<ChainRecord> load(const std::string& chain_id) const override;
    void save(const ChainRecord& record) override;
    std::vector<std::string> list() const override;
    bool exists(const std::string& chain_id) const override;
    std::string location_of(const std::string& chain_id) const override;

    /**
     * @brief Number of successful saves, across all chains.
     */
    size_t save_count() const noexcept
    {
        return m_save_count;
    }

private:
    std::map<std::string, ChainRecord> m_records;
    size_t m_save_count{0};
};

} // namespace memescalate
