#include "finops/cost_estimator.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace tokenmeter {

namespace {

// Known model identifiers; anything else goes through the substring fallback
const std::unordered_map<std::string_view, ModelTier>& exact_models() {
    static const std::unordered_map<std::string_view, ModelTier> lookup = {
        // Opus
        {"claude-opus-4-5-20251101",   ModelTier::OPUS},
        {"claude-opus-4-1-20250805",   ModelTier::OPUS},
        {"claude-opus-4-20250514",     ModelTier::OPUS},
        {"claude-3-opus-20240229",     ModelTier::OPUS},
        // Sonnet
        {"claude-sonnet-4-5-20250929", ModelTier::SONNET},
        {"claude-sonnet-4-20250514",   ModelTier::SONNET},
        {"claude-3-7-sonnet-20250219", ModelTier::SONNET},
        {"claude-3-5-sonnet-20241022", ModelTier::SONNET},
        {"claude-3-5-sonnet-20240620", ModelTier::SONNET},
        {"claude-3-sonnet-20240229",   ModelTier::SONNET},
        // Haiku
        {"claude-3-5-haiku-20241022",  ModelTier::HAIKU},
        {"claude-3-haiku-20240307",    ModelTier::HAIKU},
    };
    return lookup;
}

constexpr std::array<PlanLimit, 3> kPlans = {{
    {"pro",    19'000,  18.0,  250},
    {"max5",   88'000,  35.0,  1'000},
    {"max20",  220'000, 140.0, 2'000},
}};

double percent_of(double used, double limit) {
    return limit > 0.0 ? (used / limit) * 100.0 : 0.0;
}

} // anonymous namespace

// ============================================================================
// Tier classification
// ============================================================================

ModelTier classify_model(std::string_view model) {
    const auto& exact = exact_models();
    if (const auto it = exact.find(model); it != exact.end()) {
        return it->second;
    }

    const std::string lower = utils::to_lower(model);
    if (lower.find("opus") != std::string::npos) return ModelTier::OPUS;
    if (lower.find("haiku") != std::string::npos) return ModelTier::HAIKU;
    return ModelTier::SONNET;
}

const char* tier_label(ModelTier tier) {
    switch (tier) {
        case ModelTier::OPUS:   return "Opus";
        case ModelTier::SONNET: return "Sonnet";
        case ModelTier::HAIKU:  return "Haiku";
    }
    return "Sonnet";
}

std::string tier_name(std::string_view model) {
    return tier_label(classify_model(model));
}

const ModelPricing& tier_pricing(ModelTier tier) {
    switch (tier) {
        case ModelTier::OPUS:   return pricing::kOpus;
        case ModelTier::SONNET: return pricing::kSonnet;
        case ModelTier::HAIKU:  return pricing::kHaiku;
    }
    return pricing::kSonnet;
}

const ModelPricing& get_pricing(std::string_view model) {
    return tier_pricing(classify_model(model));
}

bool is_known_model(std::string_view model) {
    return exact_models().contains(model);
}

// ============================================================================
// Cost
// ============================================================================

double usage_cost(const ModelPricing& rates, uint64_t input, uint64_t output,
                  uint64_t cache_create, uint64_t cache_read) {
    double cost = 0.0;
    cost += (static_cast<double>(input) / pricing::kTokensPerUnit) * rates.input;
    cost += (static_cast<double>(output) / pricing::kTokensPerUnit) * rates.output;
    cost += (static_cast<double>(cache_create) / pricing::kTokensPerUnit) * rates.cache_create;
    cost += (static_cast<double>(cache_read) / pricing::kTokensPerUnit) * rates.cache_read;
    return cost;
}

double model_cost(const ModelStats& stats) {
    return usage_cost(get_pricing(stats.model), stats.total_input, stats.total_output,
                      stats.total_cache_create, stats.total_cache_read);
}

double record_cost(const UsageRecord& record) {
    const auto& u = record.usage;
    return usage_cost(get_pricing(record.model), u.input_tokens, u.output_tokens,
                      u.cache_creation_input_tokens, u.cache_read_input_tokens);
}

std::unordered_map<std::string, double> period_cost(const PeriodStats& stats) {
    std::unordered_map<std::string, double> costs;
    costs.reserve(stats.models.size());
    for (const auto& [model, model_stats] : stats.models) {
        costs.emplace(model, model_cost(model_stats));
    }
    return costs;
}

double total_cost(const PeriodStats& stats) {
    double total = 0.0;
    for (const auto& [model, cost] : period_cost(stats)) {
        total += cost;
    }
    return total;
}

// ============================================================================
// Plans
// ============================================================================

std::span<const PlanLimit> plan_limits() {
    return kPlans;
}

std::optional<PlanLimit> find_plan(std::string_view name) {
    for (const auto& plan : kPlans) {
        if (plan.name == name) return plan;
    }
    return std::nullopt;
}

std::optional<PlanUsage> estimate_plan_usage(const PeriodStats& stats,
                                             std::string_view plan_name) {
    const auto plan = find_plan(plan_name);
    if (!plan) return std::nullopt;
    return estimate_plan_usage(stats, *plan);
}

PlanUsage estimate_plan_usage(const PeriodStats& stats, const PlanLimit& plan) {
    PlanUsage usage;
    usage.plan = std::string(plan.name);
    usage.cost_used = total_cost(stats);
    usage.cost_limit = plan.cost_limit;
    usage.cost_percent = percent_of(usage.cost_used, plan.cost_limit);
    usage.calls_used = stats.total_calls();
    usage.calls_limit = plan.call_limit;
    usage.calls_percent = percent_of(static_cast<double>(usage.calls_used),
                                     static_cast<double>(plan.call_limit));
    return usage;
}

std::vector<std::string> check_plan_limits(const PlanUsage& usage) {
    std::vector<std::string> warnings;
    if (usage.cost_limit > 0 && usage.cost_used >= usage.cost_limit) {
        warnings.push_back(std::format("Cost limit reached (used: ${:.2f}, limit: ${:.2f})",
                                       usage.cost_used, usage.cost_limit));
    }
    if (usage.calls_limit > 0 && usage.calls_used >= usage.calls_limit) {
        warnings.push_back(std::format("Call limit reached (used: {}, limit: {})",
                                       usage.calls_used, usage.calls_limit));
    }
    return warnings;
}

} // namespace tokenmeter
