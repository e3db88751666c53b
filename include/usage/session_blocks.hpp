#pragma once

#include "core/timestamp.hpp"
#include "usage/aggregator.hpp"
#include "usage/usage_record.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace tokenmeter {

inline constexpr std::chrono::hours kSessionBlockDuration{5};

/**
 * @brief A 5-hour billing window, starting at the hour of its first record.
 */
struct SessionBlock {
    Timestamp start_time;
    Timestamp end_time;
    bool is_active = false;
    std::vector<UsageRecord> records;
    PeriodStats stats;
};

struct CurrentBlockInfo {
    std::optional<Timestamp> block_start;
    std::optional<Timestamp> reset_time;
    int64_t secs_until_reset = 0;
    double block_cost = 0.0;
    uint64_t block_tokens = 0;
    uint64_t block_calls = 0;
    bool is_active = false;
    double usage_percent = 0.0;
};

/**
 * @brief Group time-sorted records into session blocks.
 *
 * A record opens a new block when it falls at or past the current block's
 * end, or when it follows the previous record by 5 hours or more.
 */
[[nodiscard]] std::vector<SessionBlock> create_blocks(const std::vector<UsageRecord>& records,
                                                      Timestamp now);

// Active block if any, otherwise the most recent; nullptr when there are none
[[nodiscard]] const SessionBlock* find_current_block(const std::vector<SessionBlock>& blocks);

[[nodiscard]] CurrentBlockInfo current_block_info(const std::vector<UsageRecord>& records,
                                                  double plan_cost_limit,
                                                  Timestamp now);

} // namespace tokenmeter
