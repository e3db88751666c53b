#pragma once

#include "core/timestamp.hpp"
#include "usage/usage_record.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tokenmeter {

/**
 * @brief Running totals for one model within a period.
 */
struct ModelStats {
    std::string model;
    uint64_t total_input = 0;
    uint64_t total_output = 0;
    uint64_t total_cache_create = 0;
    uint64_t total_cache_read = 0;
    uint64_t call_count = 0;

    ModelStats() = default;
    explicit ModelStats(std::string name) : model(std::move(name)) {}

    void add_usage(const TokenUsage& usage);

    [[nodiscard]] uint64_t total_tokens() const {
        return total_input + total_output + total_cache_create + total_cache_read;
    }
};

/**
 * @brief Aggregation root for one time window.
 *
 * start/end are the first and last contributing record, not the requested
 * window bounds.
 */
struct PeriodStats {
    Timestamp start;
    Timestamp end;
    std::unordered_map<std::string, ModelStats> models;
    uint64_t session_count = 0;

    [[nodiscard]] uint64_t total_tokens() const;
    [[nodiscard]] uint64_t total_calls() const;
    [[nodiscard]] bool empty() const { return models.empty(); }
};

/**
 * @brief Single-pass fold of time-sorted records into PeriodStats.
 */
class UsageAggregator {
public:
    void add(const UsageRecord& record);

    // Empty input yields start = end = now with everything else zeroed
    [[nodiscard]] PeriodStats finish(Timestamp now) const;

    [[nodiscard]] uint64_t record_count() const { return records_; }

private:
    std::optional<Timestamp> first_;
    std::optional<Timestamp> last_;
    std::unordered_map<std::string, ModelStats> models_;
    std::unordered_set<std::string> sessions_;
    uint64_t records_ = 0;
};

[[nodiscard]] PeriodStats aggregate_stats(const std::vector<UsageRecord>& records,
                                          Timestamp now);

} // namespace tokenmeter
