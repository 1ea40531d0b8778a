#pragma once

#include "core/types.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ccdash {

/**
 * @brief Maps (model, token counts) to USD
 *
 * Lookup order: exact id, longest matching prefix, default rate. Model ids
 * are normalised first ('.' becomes '-', lower case) so "claude-opus-4.5"
 * prices the same as "claude-opus-4-5-20251101". Unknown models are priced
 * at the default (Sonnet) rate, never at zero.
 */
class CostModel {
public:
    struct Config {
        std::vector<ModelRate> models;       // Added to / replacing built-ins
        std::optional<ModelRate> default_rate;
    };

    CostModel();
    explicit CostModel(Config config);

    [[nodiscard]] static std::vector<ModelRate> builtin_rates();
    [[nodiscard]] static ModelRate builtin_default();

    [[nodiscard]] const ModelRate& rate_for(std::string_view model) const;

    /// Estimate from the price table only.
    [[nodiscard]] double estimate(std::string_view model, const TokenCounts& tokens) const;

    /// Reported cost when the record carries one, estimate otherwise.
    [[nodiscard]] double cost(const UsageRecord& record) const;

    struct Stats {
        uint64_t exact_hits = 0;
        uint64_t prefix_hits = 0;
        uint64_t default_hits = 0;
        size_t table_size = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    static std::string normalize(std::string_view model);

    std::unordered_map<std::string, ModelRate> rates_;   // Keyed by normalised prefix
    size_t longest_prefix_ = 0;
    ModelRate default_;

    mutable std::atomic<uint64_t> exact_hits_{0};
    mutable std::atomic<uint64_t> prefix_hits_{0};
    mutable std::atomic<uint64_t> default_hits_{0};
};

} // namespace ccdash
