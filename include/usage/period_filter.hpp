#pragma once

#include "core/timestamp.hpp"
#include "usage/usage_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tokenmeter {

/**
 * @brief Time window for filtering. Both bounds are inclusive; a missing
 *        bound is not checked.
 */
struct Period {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    std::string label;

    [[nodiscard]] bool unbounded() const { return !start && !end; }
    [[nodiscard]] bool contains(Timestamp ts) const;

    // Identity window
    [[nodiscard]] static Period all();

    // [now - days, now]; both bounds derived from the same instant
    [[nodiscard]] static Period last_days(int days, Timestamp now);

    // Calendar windows in the local time zone, ending at the end of today
    [[nodiscard]] static Period today(Timestamp now);
    [[nodiscard]] static Period this_week(Timestamp now);
    [[nodiscard]] static Period this_month(Timestamp now);

    [[nodiscard]] static Period between(std::optional<Timestamp> start,
                                        std::optional<Timestamp> end);
};

/**
 * @brief Order-preserving subsequence of records inside the window.
 */
[[nodiscard]] std::vector<UsageRecord> filter_by_period(const std::vector<UsageRecord>& records,
                                                        const Period& period);

} // namespace tokenmeter
