#include "usage/aggregator.hpp"

namespace tokenmeter {

void ModelStats::add_usage(const TokenUsage& usage) {
    total_input += usage.input_tokens;
    total_output += usage.output_tokens;
    total_cache_create += usage.cache_creation_input_tokens;
    total_cache_read += usage.cache_read_input_tokens;
    ++call_count;
}

uint64_t PeriodStats::total_tokens() const {
    uint64_t total = 0;
    for (const auto& [name, stats] : models) total += stats.total_tokens();
    return total;
}

uint64_t PeriodStats::total_calls() const {
    uint64_t total = 0;
    for (const auto& [name, stats] : models) total += stats.call_count;
    return total;
}

void UsageAggregator::add(const UsageRecord& record) {
    ++records_;
    if (!first_) first_ = record.timestamp;
    last_ = record.timestamp;

    sessions_.insert(record.session_id);

    auto it = models_.find(record.model);
    if (it == models_.end()) {
        it = models_.emplace(record.model, ModelStats(record.model)).first;
    }
    it->second.add_usage(record.usage);
}

PeriodStats UsageAggregator::finish(Timestamp now) const {
    PeriodStats stats;
    stats.start = first_.value_or(now);
    stats.end = last_.value_or(now);
    stats.models = models_;
    stats.session_count = sessions_.size();
    return stats;
}

PeriodStats aggregate_stats(const std::vector<UsageRecord>& records, Timestamp now) {
    UsageAggregator agg;
    for (const auto& r : records) agg.add(r);
    return agg.finish(now);
}

} // namespace tokenmeter
