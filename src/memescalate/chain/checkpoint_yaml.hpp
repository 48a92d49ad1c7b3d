/**
 * @file checkpoint_yaml.hpp
 * @brief YAML encoding of chain records.
 */
#pragma once
#include "memescalate/chain/chain_record.hpp"

namespace memescalate
{

/**
 * @brief Render a record as a YAML document.
 *
 * @details
 * Keys are written in a fixed order: chain identity first, then `state`, then `rounds`.
 * The top-level `partition` and `max_level` keys duplicate the ladder for readers of
 * older checkpoints.
 *
 * @throw EscalationError with `CheckpointIO` if the emitter reports an error.
 */
std::string encode_checkpoint(const ChainRecord& record);

/**
 * @brief Parse a YAML document produced by `encode_checkpoint` or edited by hand.
 *
 * @details
 * Missing optional keys take their defaults. Rounds without a `job_ids` list fall back to
 * the single `job_id` key. Round ordinals are renumbered from position.
 *
 * @throw EscalationError with `CheckpointIO` if the text is not YAML, lacks `chain_id` or
 *        `levels`, holds an unknown status, or has a current level above the ladder.
 */
ChainRecord decode_checkpoint(const std::string& yaml_text);

} // namespace memescalate
