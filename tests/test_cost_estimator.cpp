#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "finops/cost_estimator.hpp"

#include <vector>

using namespace tokenmeter;
using Catch::Approx;
using namespace std::chrono;

namespace {

UsageRecord make_record(std::string model, uint64_t in, uint64_t out,
                        uint64_t cc = 0, uint64_t cr = 0, std::string session = "s") {
    UsageRecord r;
    r.timestamp = sys_days{year{2025} / 1 / 1};
    r.session_id = std::move(session);
    r.model = std::move(model);
    r.usage = TokenUsage{in, out, cc, cr};
    return r;
}

PeriodStats stats_of(const std::vector<UsageRecord>& records) {
    return aggregate_stats(records, sys_days{year{2025} / 1 / 2});
}

} // namespace

TEST_CASE("CostEstimator: exact table lookup", "[cost][tier]") {
    CHECK(classify_model("claude-opus-4-5-20251101") == ModelTier::OPUS);
    CHECK(classify_model("claude-sonnet-4-5-20250929") == ModelTier::SONNET);
    CHECK(classify_model("claude-3-5-haiku-20241022") == ModelTier::HAIKU);
    CHECK(is_known_model("claude-3-opus-20240229"));
    CHECK_FALSE(is_known_model("claude-opus-9"));
}

TEST_CASE("CostEstimator: substring fallback for unlisted models", "[cost][tier]") {
    CHECK(classify_model("claude-opus-9-20300101") == ModelTier::OPUS);
    CHECK(classify_model("Claude-OPUS-Next") == ModelTier::OPUS);
    CHECK(classify_model("claude-haiku-5") == ModelTier::HAIKU);
    CHECK(classify_model("HAIKU") == ModelTier::HAIKU);
    CHECK(classify_model("gpt-4") == ModelTier::SONNET);
    CHECK(classify_model("unknown") == ModelTier::SONNET);
    CHECK(classify_model("") == ModelTier::SONNET);
}

TEST_CASE("CostEstimator: tier names and pricing", "[cost][tier]") {
    CHECK(tier_name("claude-opus-4-5-20251101") == "Opus");
    CHECK(tier_name("claude-sonnet-4-20250514") == "Sonnet");
    CHECK(tier_name("claude-3-haiku-20240307") == "Haiku");
    CHECK(tier_name("mystery") == "Sonnet");

    CHECK(get_pricing("claude-opus-4-5-20251101") == pricing::kOpus);
    CHECK(get_pricing("mystery") == pricing::kSonnet);
    CHECK(tier_pricing(ModelTier::HAIKU).output == Approx(1.25));
}

TEST_CASE("CostEstimator: haiku records cost", "[cost]") {
    const std::vector<UsageRecord> records = {
        make_record("claude-3-5-haiku-20241022", 1'000'000, 1'000'000),
        make_record("claude-3-5-haiku-20241022", 1'000'000, 1'000'000),
        make_record("claude-3-5-haiku-20241022", 1'000'000, 1'000'000),
    };
    const auto stats = stats_of(records);
    CHECK(total_cost(stats) == Approx(4.50));
    CHECK(record_cost(records[0]) == Approx(1.50));
}

TEST_CASE("CostEstimator: cache tokens are priced separately", "[cost]") {
    const auto r = make_record("claude-opus-4-5-20251101", 0, 0, 1'000'000, 2'000'000);
    CHECK(record_cost(r) == Approx(18.75 + 3.00));

    const auto s = make_record("claude-sonnet-4-5-20250929", 500'000, 100'000, 0, 0);
    CHECK(record_cost(s) == Approx(1.50 + 1.50));
}

TEST_CASE("CostEstimator: total is the sum of per-model costs", "[cost]") {
    const std::vector<UsageRecord> records = {
        make_record("claude-opus-4-5-20251101", 1234, 5678, 91, 2345),
        make_record("claude-sonnet-4-5-20250929", 99'999, 12'345, 0, 777'777),
        make_record("claude-3-haiku-20240307", 42, 4242, 424, 0),
        make_record("some-new-model", 1'000, 1'000),
    };
    const auto stats = stats_of(records);
    const auto per_model = period_cost(stats);
    REQUIRE(per_model.size() == 4);

    double sum = 0.0;
    for (const auto& [model, cost] : per_model) {
        CHECK(cost >= 0.0);
        sum += cost;
    }
    CHECK(total_cost(stats) == Approx(sum));

    double by_record = 0.0;
    for (const auto& r : records) by_record += record_cost(r);
    CHECK(total_cost(stats) == Approx(by_record));
}

TEST_CASE("CostEstimator: empty period costs nothing", "[cost]") {
    const auto stats = stats_of({});
    CHECK(period_cost(stats).empty());
    CHECK(total_cost(stats) == 0.0);
}

TEST_CASE("CostEstimator: plan table", "[cost][plan]") {
    REQUIRE(plan_limits().size() == 3);

    const auto pro = find_plan("pro");
    REQUIRE(pro.has_value());
    CHECK(pro->token_limit == 19'000);
    CHECK(pro->cost_limit == Approx(18.0));
    CHECK(pro->call_limit == 250);

    const auto max20 = find_plan("max20");
    REQUIRE(max20.has_value());
    CHECK(max20->cost_limit == Approx(140.0));
    CHECK(max20->call_limit == 2'000);

    CHECK_FALSE(find_plan("enterprise").has_value());
    CHECK_FALSE(find_plan("PRO").has_value());
}

TEST_CASE("CostEstimator: unknown plan yields no usage", "[cost][plan]") {
    const auto stats = stats_of({make_record("claude-3-haiku-20240307", 1, 1)});
    CHECK_FALSE(estimate_plan_usage(stats, "platinum").has_value());
}

TEST_CASE("CostEstimator: plan percentages are not clamped", "[cost][plan]") {
    // 2 opus calls at 1M output each = $150
    const std::vector<UsageRecord> records = {
        make_record("claude-opus-4-5-20251101", 0, 1'000'000),
        make_record("claude-opus-4-5-20251101", 0, 1'000'000),
    };
    const auto usage = estimate_plan_usage(stats_of(records), "pro");
    REQUIRE(usage.has_value());
    CHECK(usage->plan == "pro");
    CHECK(usage->cost_used == Approx(150.0));
    CHECK(usage->cost_limit == Approx(18.0));
    CHECK(usage->cost_percent == Approx(150.0 / 18.0 * 100.0));
    CHECK(usage->calls_used == 2);
    CHECK(usage->calls_limit == 250);
    CHECK(usage->calls_percent == Approx(0.8));
}

TEST_CASE("CostEstimator: zero limit yields zero percent", "[cost][plan]") {
    const PlanLimit unlimited{"custom", 0, 0.0, 0};
    const auto usage = estimate_plan_usage(
        stats_of({make_record("claude-3-opus-20240229", 1'000, 1'000)}), unlimited);
    CHECK(usage.cost_used > 0.0);
    CHECK(usage.cost_percent == 0.0);
    CHECK(usage.calls_percent == 0.0);
    CHECK(check_plan_limits(usage).empty());
}

TEST_CASE("CostEstimator: limit warnings", "[cost][plan]") {
    PlanUsage usage;
    usage.plan = "pro";
    usage.cost_used = 12.0;
    usage.cost_limit = 18.0;
    usage.calls_used = 100;
    usage.calls_limit = 250;
    CHECK(check_plan_limits(usage).empty());

    usage.cost_used = 18.0;
    auto warnings = check_plan_limits(usage);
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0] == "Cost limit reached (used: $18.00, limit: $18.00)");

    usage.calls_used = 300;
    warnings = check_plan_limits(usage);
    REQUIRE(warnings.size() == 2);
    CHECK(warnings[1] == "Call limit reached (used: 300, limit: 250)");
}
