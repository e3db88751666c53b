#pragma once

#include "usage/aggregator.hpp"
#include "usage/usage_record.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tokenmeter {

enum class ModelTier { OPUS, SONNET, HAIKU };

/**
 * @brief USD per one million tokens.
 */
struct ModelPricing {
    double input = 0.0;
    double output = 0.0;
    double cache_create = 0.0;
    double cache_read = 0.0;

    bool operator==(const ModelPricing&) const = default;
};

namespace pricing {
inline constexpr ModelPricing kOpus{15.0, 75.0, 18.75, 1.50};
inline constexpr ModelPricing kSonnet{3.0, 15.0, 3.75, 0.30};
inline constexpr ModelPricing kHaiku{0.25, 1.25, 0.30, 0.03};
inline constexpr double kTokensPerUnit = 1'000'000.0;
} // namespace pricing

/**
 * @brief Subscription plan ceilings. token_limit is informational only.
 */
struct PlanLimit {
    std::string_view name;
    uint64_t token_limit = 0;
    double cost_limit = 0.0;
    uint64_t call_limit = 0;
};

struct PlanUsage {
    std::string plan;
    double cost_used = 0.0;
    double cost_limit = 0.0;
    double cost_percent = 0.0;      // not clamped
    uint64_t calls_used = 0;
    uint64_t calls_limit = 0;
    double calls_percent = 0.0;     // not clamped
};

// ---- Tier classification ---------------------------------------------------

/**
 * @brief Exact table lookup, then case-insensitive substring match:
 *        "opus" -> OPUS, "haiku" -> HAIKU, anything else -> SONNET.
 */
[[nodiscard]] ModelTier classify_model(std::string_view model);

[[nodiscard]] const char* tier_label(ModelTier tier);

// "Opus" / "Sonnet" / "Haiku"
[[nodiscard]] std::string tier_name(std::string_view model);

[[nodiscard]] const ModelPricing& tier_pricing(ModelTier tier);

[[nodiscard]] const ModelPricing& get_pricing(std::string_view model);

// True if the model id is in the maintained exact-match table
[[nodiscard]] bool is_known_model(std::string_view model);

// ---- Cost ------------------------------------------------------------------

// Unrounded; rounding belongs to the renderer
[[nodiscard]] double usage_cost(const ModelPricing& rates, uint64_t input, uint64_t output,
                                uint64_t cache_create, uint64_t cache_read);

[[nodiscard]] double model_cost(const ModelStats& stats);

[[nodiscard]] double record_cost(const UsageRecord& record);

[[nodiscard]] std::unordered_map<std::string, double> period_cost(const PeriodStats& stats);

[[nodiscard]] double total_cost(const PeriodStats& stats);

// ---- Plans -----------------------------------------------------------------

[[nodiscard]] std::span<const PlanLimit> plan_limits();

[[nodiscard]] std::optional<PlanLimit> find_plan(std::string_view name);

/**
 * @brief Compare a period against a named plan.
 * @return std::nullopt if the plan name is not one of the enumerated plans
 */
[[nodiscard]] std::optional<PlanUsage> estimate_plan_usage(const PeriodStats& stats,
                                                           std::string_view plan_name);

[[nodiscard]] PlanUsage estimate_plan_usage(const PeriodStats& stats, const PlanLimit& plan);

/**
 * @brief Human-readable warnings for every ceiling that has been reached.
 */
[[nodiscard]] std::vector<std::string> check_plan_limits(const PlanUsage& usage);

} // namespace tokenmeter
