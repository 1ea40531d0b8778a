#include "finops/cost_model.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace ccdash {

namespace {

ModelRate make_rate(std::string prefix, double in, double out, double read, double create) {
    ModelRate r;
    r.prefix = std::move(prefix);
    r.input_per_million = in;
    r.output_per_million = out;
    r.cache_read_per_million = read;
    r.cache_creation_per_million = create;
    return r;
}

} // anonymous namespace

std::vector<ModelRate> CostModel::builtin_rates() {
    return {
        // 4.5 generation
        make_rate("claude-opus-4-5",   5.00, 25.00, 0.50,  6.25),
        make_rate("claude-sonnet-4-5", 3.00, 15.00, 0.30,  3.75),
        make_rate("claude-haiku-4-5",  1.00,  5.00, 0.10,  1.25),
        // 4 / 4.1
        make_rate("claude-opus-4-1",  15.00, 75.00, 1.50, 18.75),
        make_rate("claude-opus-4",    15.00, 75.00, 1.50, 18.75),
        make_rate("claude-sonnet-4",   3.00, 15.00, 0.30,  3.75),
        // 3.x
        make_rate("claude-3-opus",     15.00, 75.00, 1.50, 18.75),
        make_rate("claude-3-7-sonnet",  3.00, 15.00, 0.30,  3.75),
        make_rate("claude-3-5-sonnet",  3.00, 15.00, 0.30,  3.75),
        make_rate("claude-3-5-haiku",   0.80,  4.00, 0.08,  1.00),
        make_rate("claude-3-haiku",     0.25,  1.25, 0.03,  0.30),
    };
}

ModelRate CostModel::builtin_default() {
    return make_rate("default", 3.00, 15.00, 0.30, 3.75);
}

CostModel::CostModel() : CostModel(Config{}) {}

CostModel::CostModel(Config config)
    : default_(config.default_rate.value_or(builtin_default())) {
    for (auto& rate : builtin_rates()) {
        auto key = normalize(rate.prefix);
        rates_[key] = std::move(rate);
    }
    for (auto& rate : config.models) {
        auto key = normalize(rate.prefix);
        if (key.empty()) continue;
        rates_[key] = std::move(rate);
    }
    for (const auto& [key, rate] : rates_) {
        longest_prefix_ = std::max(longest_prefix_, key.size());
    }
}

std::string CostModel::normalize(std::string_view model) {
    auto s = utils::to_lower(utils::trim(std::string(model)));
    std::replace(s.begin(), s.end(), '.', '-');
    return s;
}

const ModelRate& CostModel::rate_for(std::string_view model) const {
    const auto key = normalize(model);

    if (const auto it = rates_.find(key); it != rates_.end()) {
        exact_hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second;
    }

    // Longest prefix first: "claude-opus-4-5-..." must not price as opus-4
    for (size_t len = std::min(key.size(), longest_prefix_); len > 0; --len) {
        if (const auto it = rates_.find(key.substr(0, len)); it != rates_.end()) {
            prefix_hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    default_hits_.fetch_add(1, std::memory_order_relaxed);
    return default_;
}

double CostModel::estimate(std::string_view model, const TokenCounts& tokens) const {
    return rate_for(model).cost(tokens);
}

double CostModel::cost(const UsageRecord& record) const {
    if (record.reported_cost_usd) {
        return *record.reported_cost_usd;
    }
    return estimate(record.model, record.tokens);
}

CostModel::Stats CostModel::get_stats() const {
    return {
        exact_hits_.load(std::memory_order_relaxed),
        prefix_hits_.load(std::memory_order_relaxed),
        default_hits_.load(std::memory_order_relaxed),
        rates_.size()
    };
}

} // namespace ccdash
