#pragma once

#include "core/timestamp.hpp"

#include <cstdint>
#include <string>

namespace tokenmeter {

inline constexpr const char* kUnknownSession = "unknown";
inline constexpr const char* kUnknownModel = "unknown";

// Largest per-call counter accepted from a log line. Keeps totals over any
// realistic number of records far below the uint64_t range.
inline constexpr uint64_t kMaxTokenCount = 1'000'000'000'000;

/**
 * @brief Token counters from a single API call.
 */
struct TokenUsage {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_creation_input_tokens = 0;
    uint64_t cache_read_input_tokens = 0;

    [[nodiscard]] uint64_t total_tokens() const {
        return input_tokens + output_tokens +
               cache_creation_input_tokens + cache_read_input_tokens;
    }

    bool operator==(const TokenUsage&) const = default;
};

/**
 * @brief One parsed log line: a single API call's consumption.
 *
 * Only constructed when the source line carried a non-empty usage block.
 */
struct UsageRecord {
    Timestamp timestamp;
    std::string session_id = kUnknownSession;
    std::string model = kUnknownModel;
    TokenUsage usage;

    bool operator==(const UsageRecord&) const = default;
};

} // namespace tokenmeter
