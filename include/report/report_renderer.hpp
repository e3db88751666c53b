#pragma once

#include "core/timestamp.hpp"
#include "finops/cost_estimator.hpp"
#include "usage/aggregator.hpp"
#include "usage/log_reader.hpp"
#include "usage/session_blocks.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tokenmeter {

enum class ReportFormat { TEXT, COMPACT, JSON };

struct ReportOptions {
    ReportFormat format = ReportFormat::TEXT;
    std::string plan = "pro";
    std::string period_label;
    std::string data_dir;
};

// ---- Formatting helpers ----------------------------------------------------

// 1234567 -> "1.23M", 1500 -> "1.5K", 999 -> "999"
[[nodiscard]] std::string format_tokens(uint64_t count);

// "$12.3456" with the given number of decimals
[[nodiscard]] std::string format_cost(double cost, int decimals = 4);

// "claude-3-5-sonnet-20241022" -> "3-5-sonnet 241022", at most 25 code points
// (UTF-8 sequences are never split)
[[nodiscard]] std::string short_model_name(std::string_view model);

// Percent is clamped to [0, 100] for display only
[[nodiscard]] std::string progress_bar(double percent, size_t width = 20);

// ---- Renderer --------------------------------------------------------------

class ReportRenderer {
public:
    ReportRenderer(const PeriodStats& stats, ReportOptions opts, Timestamp generated_at);

    // Holds a reference to the stats; a temporary would dangle
    ReportRenderer(PeriodStats&& stats, ReportOptions opts, Timestamp generated_at) = delete;

    void set_block_info(CurrentBlockInfo info) { block_info_ = std::move(info); }
    void set_reader_stats(const ReaderStats& stats) { reader_stats_ = stats; }

    [[nodiscard]] std::string generate() const;

    void render(std::ostream& os) const;

    // Models with their cost, most expensive first
    [[nodiscard]] std::vector<std::pair<const ModelStats*, double>> models_by_cost() const;

private:
    const PeriodStats& stats_;
    ReportOptions opts_;
    Timestamp generated_at_;
    std::optional<PlanUsage> plan_usage_;
    double total_cost_ = 0.0;
    std::optional<CurrentBlockInfo> block_info_;
    std::optional<ReaderStats> reader_stats_;

    [[nodiscard]] std::string section_header() const;
    [[nodiscard]] std::string section_summary() const;
    [[nodiscard]] std::string section_plan() const;
    [[nodiscard]] std::string section_models() const;
    [[nodiscard]] std::string section_block() const;
    [[nodiscard]] std::string section_footer() const;
    [[nodiscard]] std::string generate_text() const;
    [[nodiscard]] std::string generate_compact() const;
    [[nodiscard]] std::string generate_json() const;
};

} // namespace tokenmeter
