/**
 * @file resource_level.hpp
 */
#pragma once
#include "memescalate/common/common.hpp"

namespace memescalate
{

/**
 * @brief One tier of the resource ladder.
 *
 * @details
 * Values are kept in the scheduler's own notation (`16G`, `02:00:00`) and passed through
 * untouched; the engine never does arithmetic on them.
 */
struct ResourceLevel
{
    std::string partition;
    std::string memory;
    std::string time;

    bool operator==(const ResourceLevel& other) const
    {
        return partition == other.partition && memory == other.memory && time == other.time;
    }
};

} // namespace memescalate
