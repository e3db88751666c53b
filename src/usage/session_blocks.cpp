#include "usage/session_blocks.hpp"
#include "finops/cost_estimator.hpp"

#include <algorithm>

namespace tokenmeter {

std::vector<SessionBlock> create_blocks(const std::vector<UsageRecord>& records,
                                        Timestamp now) {
    std::vector<SessionBlock> blocks;

    for (const auto& record : records) {
        bool need_new_block = blocks.empty();
        if (!need_new_block) {
            const auto& current = blocks.back();
            need_new_block = record.timestamp >= current.end_time ||
                             current.records.empty() ||
                             record.timestamp - current.records.back().timestamp
                                 >= kSessionBlockDuration;
        }

        if (need_new_block) {
            SessionBlock block;
            block.start_time = std::chrono::floor<std::chrono::hours>(record.timestamp);
            block.end_time = block.start_time + kSessionBlockDuration;
            blocks.push_back(std::move(block));
        }

        blocks.back().records.push_back(record);
    }

    for (auto& block : blocks) {
        block.is_active = block.start_time <= now && now < block.end_time;
        block.stats = aggregate_stats(block.records, now);
    }

    return blocks;
}

const SessionBlock* find_current_block(const std::vector<SessionBlock>& blocks) {
    const auto active = std::find_if(blocks.begin(), blocks.end(),
                                     [](const SessionBlock& b) { return b.is_active; });
    if (active != blocks.end()) return &*active;
    return blocks.empty() ? nullptr : &blocks.back();
}

CurrentBlockInfo current_block_info(const std::vector<UsageRecord>& records,
                                    double plan_cost_limit,
                                    Timestamp now) {
    CurrentBlockInfo info;

    const auto blocks = create_blocks(records, now);
    const SessionBlock* block = find_current_block(blocks);
    if (!block) return info;

    info.block_start = block->start_time;
    info.reset_time = block->end_time;
    info.secs_until_reset = std::max<int64_t>(
        0, std::chrono::duration_cast<std::chrono::seconds>(block->end_time - now).count());
    info.is_active = block->is_active;
    info.block_calls = block->records.size();

    for (const auto& r : block->records) {
        info.block_cost += record_cost(r);
        info.block_tokens += r.usage.total_tokens();
    }

    info.usage_percent = plan_cost_limit > 0.0
        ? (info.block_cost / plan_cost_limit) * 100.0
        : 0.0;
    return info;
}

} // namespace tokenmeter
