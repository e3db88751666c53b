#include "app/app.hpp"
#include "cli/cli_options.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "finops/cost_estimator.hpp"
#include "report/report_renderer.hpp"
#include "usage/aggregator.hpp"
#include "usage/log_reader.hpp"
#include "usage/period_filter.hpp"
#include "usage/session_blocks.hpp"

#include <filesystem>
#include <format>
#include <ostream>

namespace tokenmeter {

namespace {

// Explicit --config must exist; the default location is optional
ConfigLoader::LoadResult load_config(const CliOptions& opts) {
    if (opts.config_path) {
        return ConfigLoader::load_from_file(*opts.config_path);
    }

    const auto default_path = ConfigLoader::default_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(default_path, ec)) {
        return ConfigLoader::LoadResult::ok(AppConfig{});
    }
    return ConfigLoader::load_from_file(default_path.string());
}

ReportFormat report_format(const ReportConfig& cfg) {
    if (cfg.compact) return ReportFormat::COMPACT;
    if (cfg.format == "json") return ReportFormat::JSON;
    return ReportFormat::TEXT;
}

} // anonymous namespace

int run_app(const std::vector<std::string>& args,
            std::ostream& out,
            std::ostream& err,
            const std::string& prog) {
    const auto cli = parse_cli(args);
    if (!cli.success) {
        err << "Error: " << cli.error_message << "\n\n";
        print_usage(err, prog);
        return kExitUsage;
    }
    const auto& opts = cli.options;

    if (opts.help) {
        print_usage(out, prog);
        return kExitOk;
    }
    if (opts.version) {
        out << prog << " " << kVersion << "\n";
        return kExitOk;
    }

    if (opts.verbose) utils::log::set_level(utils::log::Level::DEBUG);

    auto loaded = load_config(opts);
    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        err << "Error: " << loaded.error_message << "\n";
        return kExitFatal;
    }

    AppConfig config = std::move(loaded.config);
    apply_cli_overrides(config, opts);
    if (const auto errors = ConfigLoader::validate_config(config); !errors.empty()) {
        for (const auto& e : errors) err << "Error: " << e << "\n";
        return kExitUsage;
    }
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    // One instant for every derived bound and for the report header
    const Timestamp now = utils::now();

    const auto period = resolve_period(opts, config, now);
    if (period.is_error()) {
        utils::log::debug(period.describe());
        err << "Error: " << period.error_message() << "\n";
        return kExitUsage;
    }

    LogReader::Config reader_cfg;
    reader_cfg.data_root = config.data.dir;
    reader_cfg.extension = config.data.extension;
    reader_cfg.threads = static_cast<size_t>(config.data.threads);
    const LogReader reader(std::move(reader_cfg));
    const std::string data_dir = reader.config().data_root.string();

    utils::log::info(std::format("Reading usage logs from {}", data_dir));

    auto read = reader.read_all();
    if (read.is_error()) {
        utils::log::error(read.describe());
        err << "Error reading data: " << read.error_message() << "\n";
        return kExitFatal;
    }
    const auto& records = read.value().records;

    if (records.empty()) {
        out << "No usage data found in " << data_dir << "\n";
        return kExitOk;
    }

    const auto filtered = filter_by_period(records, period.value());
    if (filtered.empty()) {
        out << "No data found for " << period.value().label << "\n";
        return kExitOk;
    }
    utils::log::info(std::format("{} of {} records in period '{}'",
        filtered.size(), records.size(), period.value().label));

    const PeriodStats stats = aggregate_stats(filtered, now);

    ReportOptions report_opts;
    report_opts.format = report_format(config.report);
    report_opts.plan = config.report.plan;
    report_opts.period_label = period.value().label;
    report_opts.data_dir = data_dir;

    ReportRenderer renderer(stats, std::move(report_opts), now);
    renderer.set_reader_stats(read.value().stats);
    if (config.report.show_blocks) {
        const auto plan = find_plan(config.report.plan);
        renderer.set_block_info(
            current_block_info(records, plan ? plan->cost_limit : 0.0, now));
    }

    renderer.render(out);
    return kExitOk;
}

} // namespace tokenmeter
