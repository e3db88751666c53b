#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tokenmeter {

// Absolute instant; time-zone offsets are folded in at parse time
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fffffffff]]" (a space may
 * replace 'T') followed by an optional "Z", "+HH:MM", "+HHMM" or "+HH"
 * offset. Timestamps without an offset are taken as UTC.
 *
 * @return std::nullopt on any syntax or range error
 */
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

/**
 * @brief Parse "YYYY-MM-DD" as local midnight of that day.
 */
[[nodiscard]] std::optional<Timestamp> parse_local_date(std::string_view text);

// Local midnight of the day containing tp
[[nodiscard]] Timestamp start_of_local_day(Timestamp tp);

// Last representable instant of the local day containing tp
[[nodiscard]] Timestamp end_of_local_day(Timestamp tp);

// UTC ISO-8601 with millisecond precision, e.g. "2025-01-15T10:30:00.000Z"
[[nodiscard]] std::string format_iso8601_utc(Timestamp tp);

} // namespace tokenmeter
