#include "engine/usage_engine.hpp"
#include "cache/source_fingerprint.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace ccdash {

UsageEngine::Config UsageEngine::config_from(const DashboardConfig& config) {
    Config cfg;
    cfg.locator.root_dir = config.usage.root_dir;
    cfg.locator.project_filter = config.usage.project_filter;
    cfg.locator.exclude_agent_logs = config.usage.exclude_agent_logs;

    if (config.usage.current_project_only && cfg.locator.project_filter.empty()) {
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            utils::log::warn(std::format("Cannot resolve working directory: {}", ec.message()));
        } else {
            cfg.locator.project_filter = LogLocator::encode_project_dir(cwd.string());
        }
    }

    cfg.parser.max_line_bytes = config.usage.max_line_bytes;
    cfg.pricing.models = config.pricing.models;
    cfg.pricing.default_rate = config.pricing.default_rate;
    cfg.cache.max_entries = config.cache.max_entries;
    cfg.cache.ttl = config.cache.snapshot_ttl;
    cfg.persist = config.cache.persist;
    cfg.persist_path = config.cache.persist_path;
    return cfg;
}

UsageEngine::UsageEngine(Config config, ClockFn clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : ClockFn(&utils::now)),
      locator_(config_.locator),
      cost_model_(config_.pricing),
      aggregator_(RecordParser(config_.parser), config_.aggregator),
      builder_(cost_model_),
      cache_(config_.cache) {
    if (config_.persist) {
        persistence_.emplace(config_.persist_path.empty() ? CachePersistence::default_path()
                                                          : config_.persist_path);
    }
}

Result<SnapshotPtr> UsageEngine::query(const WindowSpec& spec) {
    queries_.fetch_add(1, std::memory_order_relaxed);

    if (auto problem = validate_window(spec); !problem.empty()) {
        invalid_windows_.fetch_add(1, std::memory_order_relaxed);
        return Result<SnapshotPtr>::error(ErrorCategory::INVALID_WINDOW, std::move(problem));
    }

    std::lock_guard lock(query_mutex_);
    utils::Timer timer;
    const auto now = clock_();

    const auto located = locator_.locate();
    log_locate_problems(located);

    const auto report = aggregator_.scan(located.files);
    const auto fingerprint = compute_source_fingerprint(located);

    // Records can change under an unchanged fingerprint, e.g. a file that was
    // unreadable last scan. Entries built before such a scan are dropped.
    if (scanned_ && (report.records_added > 0 || report.files_rewritten > 0)) {
        cache_.clear();
        persisted_keys_.clear();
        records_invalidations_.fetch_add(1, std::memory_order_relaxed);
    }
    scanned_ = true;

    if (persistence_ && !persisted_loaded_) {
        restore_persisted(fingerprint, now);
    }

    const auto key = spec.key();
    if (!fingerprint.empty()) {
        if (auto cached = cache_.get(key, fingerprint, now)) {
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
            return Result<SnapshotPtr>::ok(std::move(cached));
        }
    }

    const auto records = aggregator_.records();
    std::optional<TimePoint> earliest;
    if (!records.empty()) earliest = records.front()->timestamp;

    auto window = resolve_window(spec, now, earliest);
    if (window.is_error()) {
        invalid_windows_.fetch_add(1, std::memory_order_relaxed);
        return Result<SnapshotPtr>::error_from(window);
    }

    auto snap = builder_.build(spec, window.value(), filter_records(records, window.value()), now);
    snap.source_available = located.root_exists;
    if (!located.root_exists) {
        snap.status_message = located.warning.empty() ? "projects directory not found"
                                                      : located.warning;
    }
    snap.skipped_lines = aggregator_.skipped_lines();
    snap.unreadable_files = report.files_unreadable + located.errors.size();

    auto ptr = std::make_shared<const Snapshot>(std::move(snap));
    rebuilds_.fetch_add(1, std::memory_order_relaxed);
    last_rebuild_us_.store(static_cast<uint64_t>(timer.elapsed().count()),
                           std::memory_order_relaxed);

    if (!fingerprint.empty()) {
        cache_.put(key, fingerprint, ptr, now);
        if (persistence_ && (fingerprint != persisted_fingerprint_ || !persisted_keys_.contains(key))) {
            persist_cache(fingerprint, key);
        }
    }
    return Result<SnapshotPtr>::ok(std::move(ptr));
}

void UsageEngine::restore_persisted(const std::string& fingerprint, TimePoint now) {
    persisted_loaded_ = true;

    auto loaded = persistence_->load(fingerprint);
    if (loaded.is_error()) {
        // Corrupt cache is only a cold start
        utils::log::warn(std::format("Ignoring snapshot cache: {}", loaded.error_message()));
        return;
    }

    auto& outcome = loaded.value();
    if (outcome.discarded > 0) {
        utils::log::info(std::format("Discarded {} persisted snapshots built from older logs",
                                     outcome.discarded));
    }
    // A matching fingerprint means the logs are unchanged since the save,
    // so restored entries get a fresh TTL from load time.
    for (auto& e : outcome.entries) {
        e.created_at = now;
    }
    if (!outcome.entries.empty()) {
        utils::log::info(std::format("Restored {} snapshots from {}",
                                     outcome.entries.size(), persistence_->path()));
        persisted_fingerprint_ = fingerprint;
        for (const auto& e : outcome.entries) persisted_keys_.insert(e.window_key);
    }
    cache_.restore(std::move(outcome.entries));
}

void UsageEngine::persist_cache(const std::string& fingerprint, const std::string& key) {
    const auto saved = persistence_->save(cache_.entries());
    if (saved.is_error()) {
        // Log the first failure only; the next rebuild retries anyway
        if (persist_failures_.fetch_add(1, std::memory_order_relaxed) == 0) {
            utils::log::warn(std::format("Cannot persist snapshot cache: {}",
                                         saved.error_message()));
        }
        return;
    }
    persist_writes_.fetch_add(1, std::memory_order_relaxed);
    if (fingerprint != persisted_fingerprint_) {
        persisted_fingerprint_ = fingerprint;
        persisted_keys_.clear();
    }
    persisted_keys_.insert(key);
}

void UsageEngine::log_locate_problems(const LocateResult& located) {
    if (located.warning != last_locate_warning_) {
        if (!located.warning.empty()) utils::log::warn(located.warning);
        last_locate_warning_ = located.warning;
    }
    if (located.errors.size() != last_locate_error_count_) {
        for (const auto& err : located.errors) {
            utils::log::warn(std::format("Skipping unreadable path {}", err));
        }
        last_locate_error_count_ = located.errors.size();
    }
}

UsageEngine::Stats UsageEngine::get_stats() const {
    Stats s;
    s.queries = queries_.load(std::memory_order_relaxed);
    s.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    s.rebuilds = rebuilds_.load(std::memory_order_relaxed);
    s.invalid_windows = invalid_windows_.load(std::memory_order_relaxed);
    s.persist_failures = persist_failures_.load(std::memory_order_relaxed);
    s.persist_writes = persist_writes_.load(std::memory_order_relaxed);
    s.records_invalidations = records_invalidations_.load(std::memory_order_relaxed);
    s.last_rebuild_us = last_rebuild_us_.load(std::memory_order_relaxed);
    s.aggregator = aggregator_.get_stats();
    s.cache = cache_.get_stats();
    return s;
}

} // namespace ccdash
