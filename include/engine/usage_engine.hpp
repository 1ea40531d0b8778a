#pragma once

#include "cache/cache_persistence.hpp"
#include "cache/snapshot_cache.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "finops/cost_model.hpp"
#include "snapshot/snapshot_builder.hpp"
#include "usage/log_locator.hpp"
#include "usage/record_parser.hpp"
#include "usage/usage_aggregator.hpp"
#include "window/window_spec.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace ccdash {

/**
 * @brief The one entry point per refresh tick
 *
 * query() rescans the log tree (metadata, then only new bytes), checks the
 * snapshot cache against the current source fingerprint and rebuilds on a
 * miss. Invalid windows are rejected before any I/O.
 *
 * Owns the aggregator and cache; both are touched only from query(),
 * which is serialised by an internal mutex.
 */
class UsageEngine {
public:
    using ClockFn = std::function<TimePoint()>;

    struct Config {
        LogLocator::Config locator;
        RecordParser::Config parser;
        UsageAggregator::Config aggregator;
        CostModel::Config pricing;
        SnapshotCache::Config cache;
        bool persist = false;
        std::string persist_path;
    };

    /// Engine config from the loaded dashboard config (resolves current_project_only).
    [[nodiscard]] static Config config_from(const DashboardConfig& config);

    explicit UsageEngine(Config config, ClockFn clock = {});

    UsageEngine(const UsageEngine&) = delete;
    UsageEngine& operator=(const UsageEngine&) = delete;

    [[nodiscard]] Result<SnapshotPtr> query(const WindowSpec& spec);

    [[nodiscard]] TimePoint now() const { return clock_(); }
    [[nodiscard]] const CostModel& cost_model() const { return cost_model_; }

    struct Stats {
        uint64_t queries = 0;
        uint64_t cache_hits = 0;
        uint64_t rebuilds = 0;
        uint64_t invalid_windows = 0;
        uint64_t persist_failures = 0;
        uint64_t persist_writes = 0;
        uint64_t records_invalidations = 0;   // Cache cleared after a scan added or rewrote records
        uint64_t last_rebuild_us = 0;      // Scan through build, cache miss path only
        UsageAggregator::Stats aggregator;
        SnapshotCache::Stats cache;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    void restore_persisted(const std::string& fingerprint, TimePoint now);
    // Writes the cache file; called only when the fingerprint or key set changed
    void persist_cache(const std::string& fingerprint, const std::string& key);
    void log_locate_problems(const LocateResult& located);

    Config config_;
    ClockFn clock_;

    LogLocator locator_;
    CostModel cost_model_;
    UsageAggregator aggregator_;
    SnapshotBuilder builder_;
    SnapshotCache cache_;
    std::optional<CachePersistence> persistence_;

    std::mutex query_mutex_;
    bool persisted_loaded_ = false;
    bool scanned_ = false;
    std::string persisted_fingerprint_;
    std::unordered_set<std::string> persisted_keys_;
    std::string last_locate_warning_;
    size_t last_locate_error_count_ = 0;

    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> rebuilds_{0};
    std::atomic<uint64_t> invalid_windows_{0};
    std::atomic<uint64_t> persist_failures_{0};
    std::atomic<uint64_t> persist_writes_{0};
    std::atomic<uint64_t> records_invalidations_{0};
    std::atomic<uint64_t> last_rebuild_us_{0};
};

} // namespace ccdash
