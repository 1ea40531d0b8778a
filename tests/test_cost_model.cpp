#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "finops/cost_model.hpp"

using namespace ccdash;

namespace {

TokenCounts tokens(int64_t in, int64_t out, int64_t read = 0, int64_t create = 0) {
    TokenCounts t;
    t.input = in;
    t.output = out;
    t.cache_read = read;
    t.cache_creation = create;
    return t;
}

} // anonymous namespace

TEST_CASE("CostModel: dated model id prices at its family rate", "[cost]") {
    CostModel model;
    const auto& rate = model.rate_for("claude-opus-4-5-20251101");
    CHECK(rate.prefix == "claude-opus-4-5");
    CHECK(rate.input_per_million == Catch::Approx(5.0));
    CHECK(rate.output_per_million == Catch::Approx(25.0));
}

TEST_CASE("CostModel: longest prefix wins over a shorter family", "[cost]") {
    CostModel model;
    CHECK(model.rate_for("claude-opus-4-5-20251101").prefix == "claude-opus-4-5");
    CHECK(model.rate_for("claude-opus-4-1-20250805").prefix == "claude-opus-4-1");
    CHECK(model.rate_for("claude-opus-4-20250514").prefix == "claude-opus-4");
    CHECK(model.rate_for("claude-3-5-haiku-20241022").prefix == "claude-3-5-haiku");
    CHECK(model.rate_for("claude-3-haiku-20240307").prefix == "claude-3-haiku");
}

TEST_CASE("CostModel: dotted and upper-case names are normalised", "[cost]") {
    CostModel model;
    CHECK(model.rate_for("claude-opus-4.5").prefix == "claude-opus-4-5");
    CHECK(model.rate_for("  Claude-Sonnet-4.5-20250929 ").prefix == "claude-sonnet-4-5");
}

TEST_CASE("CostModel: unknown model falls back to the default rate", "[cost]") {
    CostModel model;
    const auto& rate = model.rate_for("gpt-something");
    CHECK(rate == CostModel::builtin_default());
    CHECK(model.estimate("unknown", tokens(1'000'000, 0)) == Catch::Approx(3.0));

    const auto stats = model.get_stats();
    CHECK(stats.default_hits == 2);
}

TEST_CASE("CostModel: estimate applies every category", "[cost]") {
    CostModel model;
    // opus-4-5: 5 / 25 / 0.50 / 6.25 per million
    const double expected = (1000 * 5.0 + 2000 * 25.0 + 4000 * 0.5 + 800 * 6.25) / 1e6;
    CHECK(model.estimate("claude-opus-4-5-20251101", tokens(1000, 2000, 4000, 800))
          == Catch::Approx(expected));
    CHECK(model.estimate("claude-opus-4-5", TokenCounts{}) == 0.0);
}

TEST_CASE("CostModel: configured rates override and extend the table", "[cost]") {
    CostModel::Config cfg;
    ModelRate cheap_opus;
    cheap_opus.prefix = "claude-opus-4-5";
    cheap_opus.input_per_million = 1.0;
    cheap_opus.output_per_million = 2.0;
    cfg.models.push_back(cheap_opus);

    ModelRate custom;
    custom.prefix = "my-local-model";
    custom.input_per_million = 0.5;
    cfg.models.push_back(custom);

    ModelRate fallback;
    fallback.prefix = "default";
    fallback.input_per_million = 10.0;
    cfg.default_rate = fallback;

    CostModel model(cfg);
    CHECK(model.rate_for("claude-opus-4-5-20251101").input_per_million == Catch::Approx(1.0));
    CHECK(model.rate_for("my-local-model-v2").prefix == "my-local-model");
    CHECK(model.rate_for("mystery").input_per_million == Catch::Approx(10.0));
    CHECK(model.rate_for("claude-haiku-4-5").input_per_million == Catch::Approx(1.0));

    CHECK(model.get_stats().table_size == CostModel::builtin_rates().size() + 1);
}

TEST_CASE("CostModel: reported cost takes precedence over the estimate", "[cost]") {
    CostModel model;
    UsageRecord record;
    record.model = "claude-opus-4-5";
    record.tokens = tokens(1'000'000, 1'000'000);

    CHECK(model.cost(record) == Catch::Approx(30.0));

    record.reported_cost_usd = 0.42;
    CHECK(model.cost(record) == Catch::Approx(0.42));

    record.reported_cost_usd = 0.0;
    CHECK(model.cost(record) == 0.0);
}

TEST_CASE("CostModel: lookup statistics", "[cost]") {
    CostModel model;
    (void)model.rate_for("claude-sonnet-4-5");
    (void)model.rate_for("claude-sonnet-4-5-20250929");
    (void)model.rate_for("nope");

    const auto stats = model.get_stats();
    CHECK(stats.exact_hits == 1);
    CHECK(stats.prefix_hits == 1);
    CHECK(stats.default_hits == 1);
}
