#pragma once

#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/timestamp.hpp"
#include "usage/period_filter.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tokenmeter {

inline constexpr const char* kVersion = "0.3.0";

enum class PeriodMode { DEFAULT, LAST_DAYS, TODAY, WEEK, MONTH, RANGE, ALL };

/**
 * @brief Command-line flags. Unset optionals fall back to the config file.
 */
struct CliOptions {
    PeriodMode period_mode = PeriodMode::DEFAULT;
    std::optional<int64_t> days;
    std::optional<std::string> since;
    std::optional<std::string> until;
    std::optional<std::string> plan;
    std::optional<std::string> data_dir;
    std::optional<std::string> config_path;
    bool compact = false;
    bool json = false;
    bool blocks = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

struct CliParseResult {
    bool success = false;
    std::string error_message;
    CliOptions options;

    static CliParseResult ok(CliOptions opts) {
        CliParseResult result;
        result.success = true;
        result.options = std::move(opts);
        return result;
    }

    static CliParseResult error(std::string message) {
        CliParseResult result;
        result.success = false;
        result.error_message = std::move(message);
        return result;
    }
};

[[nodiscard]] CliParseResult parse_cli(const std::vector<std::string>& args);

void print_usage(std::ostream& os, const std::string& prog = "tokenmeter");

/**
 * @brief Command-line flags win over config-file values.
 */
void apply_cli_overrides(AppConfig& config, const CliOptions& opts);

/**
 * @brief Build the filtering window requested by flags and config.
 */
[[nodiscard]] Result<Period> resolve_period(const CliOptions& opts,
                                            const AppConfig& config,
                                            Timestamp now);

} // namespace tokenmeter
