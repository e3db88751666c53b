#include "cli/cli_options.hpp"
#include "core/utils.hpp"
#include "finops/cost_estimator.hpp"

#include <format>
#include <ostream>

namespace tokenmeter {

namespace {

// Splits "--flag=value" into flag and inline value
struct Arg {
    std::string name;
    std::optional<std::string> inline_value;
};

Arg split_arg(const std::string& raw) {
    if (raw.starts_with("--")) {
        const auto eq = raw.find('=');
        if (eq != std::string::npos) {
            return {raw.substr(0, eq), raw.substr(eq + 1)};
        }
    }
    return {raw, std::nullopt};
}

bool set_period_mode(CliOptions& opts, PeriodMode mode) {
    if (opts.period_mode != PeriodMode::DEFAULT && opts.period_mode != mode) {
        return false;
    }
    opts.period_mode = mode;
    return true;
}

std::optional<Timestamp> parse_bound(const std::string& text, bool end_of_day) {
    if (text.size() == 10) {
        const auto day = parse_local_date(text);
        if (!day) return std::nullopt;
        return end_of_day ? end_of_local_day(*day) : *day;
    }
    return parse_iso8601(text);
}

} // anonymous namespace

void print_usage(std::ostream& os, const std::string& prog) {
    os << "Usage: " << prog << " [options]\n"
       << "\n"
       << "Reports Claude API token usage and estimated cost from local session logs.\n"
       << "\n"
       << "Period:\n"
       << "  -d, --days N            Analyze the last N days (default 30)\n"
       << "      --today             Today only (local time)\n"
       << "      --week              This week, starting Monday\n"
       << "      --month             This calendar month\n"
       << "      --since DATE        Start date, YYYY-MM-DD or ISO-8601\n"
       << "      --until DATE        End date, inclusive\n"
       << "      --all               No time bounds\n"
       << "\n"
       << "Output:\n"
       << "  -p, --plan NAME         Plan to compare against: pro, max5, max20 (default pro)\n"
       << "  -c, --compact           Single-line summary\n"
       << "      --json              JSON report\n"
       << "      --blocks            Include the current 5-hour session block\n"
       << "\n"
       << "General:\n"
       << "      --data-dir PATH     Log directory (default ~/.claude/projects)\n"
       << "      --config PATH       Config file (default ~/.config/tokenmeter/config.toml)\n"
       << "      --verbose           Debug logging to stderr\n"
       << "  -h, --help              Print this help\n"
       << "  -v, --version           Print version\n"
       << "\n"
       << "Examples:\n"
       << "  " << prog << "                    # last 30 days\n"
       << "  " << prog << " -d 7               # last 7 days\n"
       << "  " << prog << " --plan max5        # compare against Max5 limits\n"
       << "  " << prog << " --compact          # one-line output\n";
}

CliParseResult parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const Arg arg = split_arg(args[i]);
        const std::string& name = arg.name;

        // Fetch the flag's value from "--flag=value" or the next argument
        auto take_value = [&]() -> std::optional<std::string> {
            if (arg.inline_value) return arg.inline_value;
            if (i + 1 < args.size()) return args[++i];
            return std::nullopt;
        };

        if (name == "-h" || name == "--help") {
            opts.help = true;
        } else if (name == "-v" || name == "--version") {
            opts.version = true;
        } else if (name == "-c" || name == "--compact") {
            opts.compact = true;
        } else if (name == "--json") {
            opts.json = true;
        } else if (name == "--blocks") {
            opts.blocks = true;
        } else if (name == "--verbose") {
            opts.verbose = true;
        } else if (name == "-d" || name == "--days") {
            const auto value = take_value();
            if (!value) return CliParseResult::error(std::format("{} requires a value", name));
            const auto days = utils::try_parse_int<int64_t>(*value);
            if (!days || *days <= 0) {
                return CliParseResult::error(
                    std::format("Invalid {} value '{}' (must be a positive integer)", name, *value));
            }
            if (!set_period_mode(opts, PeriodMode::LAST_DAYS)) {
                return CliParseResult::error("Conflicting period options");
            }
            opts.days = *days;
        } else if (name == "--today" || name == "--week" || name == "--month" || name == "--all") {
            const PeriodMode mode = name == "--today" ? PeriodMode::TODAY
                                  : name == "--week"  ? PeriodMode::WEEK
                                  : name == "--month" ? PeriodMode::MONTH
                                                      : PeriodMode::ALL;
            if (!set_period_mode(opts, mode)) {
                return CliParseResult::error("Conflicting period options");
            }
        } else if (name == "--since" || name == "--until") {
            const auto value = take_value();
            if (!value) return CliParseResult::error(std::format("{} requires a value", name));
            if (!set_period_mode(opts, PeriodMode::RANGE)) {
                return CliParseResult::error("Conflicting period options");
            }
            (name == "--since" ? opts.since : opts.until) = *value;
        } else if (name == "-p" || name == "--plan") {
            const auto value = take_value();
            if (!value) return CliParseResult::error(std::format("{} requires a value", name));
            const std::string plan = utils::to_lower(*value);
            if (!find_plan(plan)) {
                return CliParseResult::error(
                    std::format("Invalid {} '{}' (choose pro, max5 or max20)", name, *value));
            }
            opts.plan = plan;
        } else if (name == "--data-dir") {
            const auto value = take_value();
            if (!value || value->empty()) {
                return CliParseResult::error("--data-dir requires a path");
            }
            opts.data_dir = *value;
        } else if (name == "--config") {
            const auto value = take_value();
            if (!value || value->empty()) {
                return CliParseResult::error("--config requires a path");
            }
            opts.config_path = *value;
        } else {
            return CliParseResult::error(std::format("Unknown argument: {}", args[i]));
        }
    }

    if (opts.compact && opts.json) {
        return CliParseResult::error("--compact and --json are mutually exclusive");
    }

    return CliParseResult::ok(std::move(opts));
}

void apply_cli_overrides(AppConfig& config, const CliOptions& opts) {
    if (opts.days) config.report.days = *opts.days;
    if (opts.plan) config.report.plan = *opts.plan;
    if (opts.data_dir) config.data.dir = utils::expand_home(*opts.data_dir).string();
    if (opts.compact) config.report.compact = true;
    if (opts.json) {
        config.report.format = "json";
        config.report.compact = false;
    }
    if (opts.blocks) config.report.show_blocks = true;
    if (opts.verbose) config.logging.level = "debug";
}

Result<Period> resolve_period(const CliOptions& opts, const AppConfig& config, Timestamp now) {
    switch (opts.period_mode) {
        case PeriodMode::DEFAULT:
        case PeriodMode::LAST_DAYS:
            return Result<Period>::ok(
                Period::last_days(static_cast<int>(opts.days.value_or(config.report.days)), now));
        case PeriodMode::TODAY:
            return Result<Period>::ok(Period::today(now));
        case PeriodMode::WEEK:
            return Result<Period>::ok(Period::this_week(now));
        case PeriodMode::MONTH:
            return Result<Period>::ok(Period::this_month(now));
        case PeriodMode::ALL:
            return Result<Period>::ok(Period::all());
        case PeriodMode::RANGE:
            break;
    }

    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    if (opts.since) {
        start = parse_bound(*opts.since, false);
        if (!start) {
            return Result<Period>::error(ErrorCategory::PARSE_ERROR,
                std::format("Invalid --since date '{}'", *opts.since));
        }
    }
    if (opts.until) {
        end = parse_bound(*opts.until, true);
        if (!end) {
            return Result<Period>::error(ErrorCategory::PARSE_ERROR,
                std::format("Invalid --until date '{}'", *opts.until));
        }
    }
    if (start && end && *start > *end) {
        return Result<Period>::error(ErrorCategory::PARSE_ERROR,
            "--since must not be after --until");
    }
    return Result<Period>::ok(Period::between(start, end));
}

} // namespace tokenmeter
