#include "report/report_renderer.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <ostream>

namespace tokenmeter {

using json = nlohmann::json;

namespace {

constexpr std::string_view kRule =
    "==================================================================================";

std::string replace_all(std::string s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// Keep at most max_chars code points; cuts only before a lead byte
std::string truncate_utf8(std::string s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        const auto byte = static_cast<unsigned char>(s[i]);
        if ((byte & 0xC0) == 0x80) continue;
        if (chars == max_chars) {
            s.resize(i);
            break;
        }
        ++chars;
    }
    return s;
}

std::string format_duration(int64_t secs) {
    const int64_t h = secs / 3600;
    const int64_t m = (secs % 3600) / 60;
    if (h > 0) return std::format("{}h {}m", h, m);
    return std::format("{}m", m);
}

} // anonymous namespace

// ============================================================================
// Formatting helpers
// ============================================================================

std::string format_tokens(uint64_t count) {
    if (count >= 1'000'000) {
        return std::format("{:.2f}M", static_cast<double>(count) / 1'000'000.0);
    }
    if (count >= 1'000) {
        return std::format("{:.1f}K", static_cast<double>(count) / 1'000.0);
    }
    return std::to_string(count);
}

std::string format_cost(double cost, int decimals) {
    return std::format("${:.{}f}", cost, decimals);
}

std::string short_model_name(std::string_view model) {
    std::string name = replace_all(std::string(model), "claude-", "");
    name = replace_all(std::move(name), "-20", " ");
    return truncate_utf8(std::move(name), 25);
}

std::string progress_bar(double percent, size_t width) {
    const double clamped = std::clamp(percent, 0.0, 100.0);
    const auto filled = std::min(width, static_cast<size_t>(clamped * static_cast<double>(width) / 100.0));

    std::string bar;
    bar.reserve(width * 3);
    for (size_t i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return bar;
}

// ============================================================================
// ReportRenderer
// ============================================================================

ReportRenderer::ReportRenderer(const PeriodStats& stats, ReportOptions opts, Timestamp generated_at)
    : stats_(stats),
      opts_(std::move(opts)),
      generated_at_(generated_at),
      plan_usage_(estimate_plan_usage(stats, opts_.plan)),
      total_cost_(total_cost(stats)) {}

std::vector<std::pair<const ModelStats*, double>> ReportRenderer::models_by_cost() const {
    std::vector<std::pair<const ModelStats*, double>> rows;
    rows.reserve(stats_.models.size());
    for (const auto& [name, ms] : stats_.models) {
        rows.emplace_back(&ms, model_cost(ms));
    }
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first->model < b.first->model;
    });
    return rows;
}

std::string ReportRenderer::generate() const {
    switch (opts_.format) {
        case ReportFormat::COMPACT: return generate_compact();
        case ReportFormat::JSON:    return generate_json();
        case ReportFormat::TEXT:    break;
    }
    return generate_text();
}

void ReportRenderer::render(std::ostream& os) const {
    os << generate();
    os.flush();
}

std::string ReportRenderer::generate_text() const {
    std::string out;
    out.reserve(4096);
    out += section_header();
    out += section_summary();
    out += section_plan();
    out += section_models();
    if (block_info_) out += section_block();
    out += section_footer();
    return out;
}

std::string ReportRenderer::section_header() const {
    std::string s;
    s += std::format("{}\n", kRule);
    s += "  TOKENMETER :: Claude usage report\n";
    s += std::format("  Generated: {}", utils::format_local(generated_at_, "%Y-%m-%d %H:%M"));
    if (!opts_.period_label.empty()) {
        s += std::format("   Period: {}", opts_.period_label);
    }
    s += std::format("\n{}\n\n", kRule);
    return s;
}

std::string ReportRenderer::section_summary() const {
    std::string s = "Summary\n";
    s += std::format("  {:<15}{}\n", "Total Tokens:", format_tokens(stats_.total_tokens()));
    s += std::format("  {:<15}{}\n", "Total Cost:", format_cost(total_cost_));
    s += std::format("  {:<15}{}\n", "API Calls:", utils::group_thousands(stats_.total_calls()));
    s += std::format("  {:<15}{}\n", "Sessions:", utils::group_thousands(stats_.session_count));
    s += std::format("  {:<15}{} - {}\n\n", "Period:",
                     utils::format_local(stats_.start, "%m/%d"),
                     utils::format_local(stats_.end, "%m/%d"));
    return s;
}

std::string ReportRenderer::section_plan() const {
    if (!plan_usage_) {
        return std::format("Plan Usage\n  Unknown plan '{}'\n\n", opts_.plan);
    }
    const auto& u = *plan_usage_;

    std::string s = std::format("Plan: {}\n", utils::to_upper(u.plan));
    s += std::format("  Cost:  [{}] {:.1f}%\n", progress_bar(u.cost_percent),
                     std::min(u.cost_percent, 100.0));
    s += std::format("         {} / {}\n", format_cost(u.cost_used), format_cost(u.cost_limit));
    s += std::format("  Calls: [{}] {:.1f}%\n", progress_bar(u.calls_percent),
                     std::min(u.calls_percent, 100.0));
    s += std::format("         {} / {}\n",
                     utils::group_thousands(u.calls_used), utils::group_thousands(u.calls_limit));
    for (const auto& warning : check_plan_limits(u)) {
        s += std::format("  ! {}\n", warning);
    }
    s += '\n';
    return s;
}

std::string ReportRenderer::section_models() const {
    std::string s = "Usage by Model\n";
    s += std::format("  {:<25} {:<7} {:>8} {:>9} {:>9} {:>9} {:>11}\n",
                     "Model", "Tier", "Calls", "Input", "Output", "Cache R", "Cost");
    for (const auto& [ms, cost] : models_by_cost()) {
        s += std::format("  {:<25} {:<7} {:>8} {:>9} {:>9} {:>9} {:>11}\n",
                         short_model_name(ms->model),
                         tier_name(ms->model),
                         utils::group_thousands(ms->call_count),
                         format_tokens(ms->total_input),
                         format_tokens(ms->total_output),
                         format_tokens(ms->total_cache_read),
                         format_cost(cost));
    }
    s += '\n';
    return s;
}

std::string ReportRenderer::section_block() const {
    const auto& b = *block_info_;
    if (!b.block_start) {
        return "Session Block\n  No session blocks\n\n";
    }

    std::string s = "Session Block (5h)\n";
    s += std::format("  Started: {}   Resets: {}",
                     utils::format_local(*b.block_start, "%m/%d %H:%M"),
                     utils::format_local(*b.reset_time, "%m/%d %H:%M"));
    if (b.is_active) {
        s += std::format(" (in {})\n", format_duration(b.secs_until_reset));
    } else {
        s += " (expired)\n";
    }
    s += std::format("  Cost: {} ({:.1f}% of plan)   Tokens: {}   Calls: {}\n\n",
                     format_cost(b.block_cost), b.usage_percent,
                     format_tokens(b.block_tokens), utils::group_thousands(b.block_calls));
    return s;
}

std::string ReportRenderer::section_footer() const {
    if (opts_.data_dir.empty()) return std::format("{}\n", kRule);
    return std::format("Data from {}\n{}\n", opts_.data_dir, kRule);
}

std::string ReportRenderer::generate_compact() const {
    if (plan_usage_) {
        return std::format("Claude | ${:.2f} ({:.0f}%) | {} tokens | {} calls\n",
                           total_cost_, plan_usage_->cost_percent,
                           format_tokens(stats_.total_tokens()), stats_.total_calls());
    }
    return std::format("Claude | ${:.2f} | {} tokens\n",
                       total_cost_, format_tokens(stats_.total_tokens()));
}

std::string ReportRenderer::generate_json() const {
    json doc;
    doc["generated_at"] = format_iso8601_utc(generated_at_);
    doc["period"] = {
        {"label", opts_.period_label},
        {"start", format_iso8601_utc(stats_.start)},
        {"end", format_iso8601_utc(stats_.end)},
    };
    doc["totals"] = {
        {"tokens", stats_.total_tokens()},
        {"calls", stats_.total_calls()},
        {"sessions", stats_.session_count},
        {"cost", total_cost_},
    };

    json models = json::array();
    for (const auto& [ms, cost] : models_by_cost()) {
        models.push_back({
            {"model", ms->model},
            {"tier", tier_name(ms->model)},
            {"calls", ms->call_count},
            {"input_tokens", ms->total_input},
            {"output_tokens", ms->total_output},
            {"cache_creation_input_tokens", ms->total_cache_create},
            {"cache_read_input_tokens", ms->total_cache_read},
            {"total_tokens", ms->total_tokens()},
            {"cost", cost},
        });
    }
    doc["models"] = std::move(models);

    if (plan_usage_) {
        const auto& u = *plan_usage_;
        doc["plan"] = {
            {"name", u.plan},
            {"cost_used", u.cost_used},
            {"cost_limit", u.cost_limit},
            {"cost_percent", u.cost_percent},
            {"calls_used", u.calls_used},
            {"calls_limit", u.calls_limit},
            {"calls_percent", u.calls_percent},
            {"warnings", check_plan_limits(u)},
        };
    } else {
        doc["plan"] = nullptr;
        doc["unknown_plan"] = opts_.plan;
    }

    if (block_info_ && block_info_->block_start) {
        const auto& b = *block_info_;
        doc["current_block"] = {
            {"start", format_iso8601_utc(*b.block_start)},
            {"reset", format_iso8601_utc(*b.reset_time)},
            {"secs_until_reset", b.secs_until_reset},
            {"active", b.is_active},
            {"cost", b.block_cost},
            {"tokens", b.block_tokens},
            {"calls", b.block_calls},
            {"usage_percent", b.usage_percent},
        };
    }

    if (reader_stats_) {
        const auto& r = *reader_stats_;
        doc["reader"] = {
            {"files_found", r.files_found},
            {"files_read", r.files_read},
            {"files_skipped", r.files_skipped},
            {"lines_read", r.lines_read},
            {"lines_malformed", r.lines_malformed},
            {"lines_without_usage", r.lines_without_usage},
            {"lines_invalid", r.lines_invalid},
            {"records", r.records},
        };
    }

    return doc.dump(2) + "\n";
}

} // namespace tokenmeter
