/**
 * @file status_report.hpp
 * @brief Human-readable chain status and checkpoint listing.
 */
#pragma once
#include "memescalate/common/common.hpp"
#include "memescalate/chain/chain_record.hpp"
#include "memescalate/chain/checkpoint_store.hpp"
#include "memescalate/scheduler/scheduler_query.hpp"

namespace memescalate
{

/**
 * @brief Print a chain's state and round history.
 *
 * @param live If given, each round is annotated with the queue state of its handlers and
 *        the live task tallies of its jobs. Query failures just omit the annotation.
 * @param tracker_dir Base directory printed as the location of per-chain index files.
 */
void write_chain_status(
    std::ostream& out,
    const ChainRecord& record,
    const ISchedulerQuery* live,
    const std::string& tracker_dir);

/**
 * @brief Print a summary of every checkpoint in a store.
 *
 * @details
 * Unreadable checkpoints are listed with their error and do not stop the listing.
 */
void write_checkpoint_list(std::ostream& out, const ICheckpointStore& store);

/**
 * @brief Number of indices in a round's spec, or 0 if the spec is malformed.
 */
size_t round_task_count(const Round& round);

} // namespace memescalate
