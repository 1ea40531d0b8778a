#pragma once

#include "core/utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ccdash {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Token Accounting
// ============================================================================

struct TokenCounts {
    int64_t input = 0;
    int64_t output = 0;
    int64_t cache_read = 0;
    int64_t cache_creation = 0;

    // Sums saturate at INT64_MAX
    [[nodiscard]] int64_t total() const {
        return utils::saturating_add(utils::saturating_add(input, output),
                                     utils::saturating_add(cache_read, cache_creation));
    }

    TokenCounts& operator+=(const TokenCounts& o) {
        input = utils::saturating_add(input, o.input);
        output = utils::saturating_add(output, o.output);
        cache_read = utils::saturating_add(cache_read, o.cache_read);
        cache_creation = utils::saturating_add(cache_creation, o.cache_creation);
        return *this;
    }

    bool operator==(const TokenCounts&) const = default;
};

/// Model id used when a usage line carries none.
inline constexpr const char* kUnknownModel = "unknown";

/**
 * @brief One accounting event read from a transcript line
 *
 * Created by RecordParser, owned by UsageAggregator. Shared as
 * UsageRecordPtr and never modified after construction.
 */
struct UsageRecord {
    std::string identity;
    TimePoint timestamp{};
    std::string project_id;
    std::string session_id;
    std::string model = kUnknownModel;
    TokenCounts tokens;
    std::optional<double> reported_cost_usd;

    [[nodiscard]] int64_t total_tokens() const { return tokens.total(); }

    bool operator==(const UsageRecord&) const = default;
};

using UsageRecordPtr = std::shared_ptr<const UsageRecord>;

// ============================================================================
// Pricing
// ============================================================================

/// USD per million tokens for one model family, matched by id prefix.
struct ModelRate {
    std::string prefix;
    double input_per_million = 0.0;
    double output_per_million = 0.0;
    double cache_read_per_million = 0.0;
    double cache_creation_per_million = 0.0;

    [[nodiscard]] double cost(const TokenCounts& t) const {
        return (static_cast<double>(t.input) * input_per_million
              + static_cast<double>(t.output) * output_per_million
              + static_cast<double>(t.cache_read) * cache_read_per_million
              + static_cast<double>(t.cache_creation) * cache_creation_per_million) / 1'000'000.0;
    }

    bool operator==(const ModelRate&) const = default;
};

// ============================================================================
// Snapshot
// ============================================================================

struct ModelUsage {
    std::string model;
    TokenCounts tokens;
    int64_t total_tokens = 0;
    double total_cost_usd = 0.0;
    uint64_t record_count = 0;

    bool operator==(const ModelUsage&) const = default;
};

/**
 * @brief Aggregated, immutable result for one window at one point in time
 *
 * per_model is sorted by total_cost_usd descending, ties by model ascending.
 * Rates are tokens per second and never negative.
 */
struct Snapshot {
    std::string window_key;
    std::string window_label;
    TimePoint window_start{};
    TimePoint window_end{};
    bool open_ended = false;

    TokenCounts tokens;
    int64_t total_tokens = 0;
    double total_cost_usd = 0.0;
    uint64_t record_count = 0;
    std::vector<ModelUsage> per_model;

    double rate_60s = 0.0;
    double rate_session_avg = 0.0;

    std::optional<TimePoint> earliest_timestamp;
    std::optional<TimePoint> latest_timestamp;

    bool source_available = true;
    std::string status_message;
    uint64_t skipped_lines = 0;
    uint64_t unreadable_files = 0;

    TimePoint built_at{};

    bool operator==(const Snapshot&) const = default;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

} // namespace ccdash
