#include "cache/cache_persistence.hpp"
#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace ccdash {

namespace fs = std::filesystem;

// ============================================================================
// On-disk schema
// ============================================================================

namespace {

struct PersistedModel {
    std::string model;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t cache_read_tokens = 0;
    int64_t cache_creation_tokens = 0;
    double total_cost_usd = 0.0;
    uint64_t record_count = 0;
};

struct PersistedSnapshot {
    std::string window_key;
    std::string window_label;
    int64_t window_start_ms = 0;
    int64_t window_end_ms = 0;
    bool open_ended = false;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t cache_read_tokens = 0;
    int64_t cache_creation_tokens = 0;
    double total_cost_usd = 0.0;
    uint64_t record_count = 0;
    std::vector<PersistedModel> per_model;
    double rate_60s = 0.0;
    double rate_session_avg = 0.0;
    std::optional<int64_t> earliest_ms;
    std::optional<int64_t> latest_ms;
    bool source_available = true;
    std::string status_message;
    uint64_t skipped_lines = 0;
    uint64_t unreadable_files = 0;
    int64_t built_at_ms = 0;
};

struct PersistedEntry {
    std::string window_key;
    std::string source_fingerprint;
    int64_t created_at_ms = 0;
    PersistedSnapshot snapshot;
};

struct PersistedFile {
    int version = 0;
    std::vector<PersistedEntry> entries;
};

constexpr glz::opts kReadOpts{.error_on_unknown_keys = false};

TokenCounts to_counts(int64_t in, int64_t out, int64_t read, int64_t create) {
    TokenCounts t;
    t.input = in;
    t.output = out;
    t.cache_read = read;
    t.cache_creation = create;
    return t;
}

std::optional<int64_t> to_ms(const std::optional<TimePoint>& tp) {
    if (!tp) return std::nullopt;
    return utils::to_epoch_ms(*tp);
}

std::optional<TimePoint> from_ms(const std::optional<int64_t>& ms) {
    if (!ms) return std::nullopt;
    return utils::from_epoch_ms(*ms);
}

PersistedSnapshot to_persisted(const Snapshot& s) {
    PersistedSnapshot p;
    p.window_key = s.window_key;
    p.window_label = s.window_label;
    p.window_start_ms = utils::to_epoch_ms(s.window_start);
    p.window_end_ms = utils::to_epoch_ms(s.window_end);
    p.open_ended = s.open_ended;
    p.input_tokens = s.tokens.input;
    p.output_tokens = s.tokens.output;
    p.cache_read_tokens = s.tokens.cache_read;
    p.cache_creation_tokens = s.tokens.cache_creation;
    p.total_cost_usd = s.total_cost_usd;
    p.record_count = s.record_count;
    p.per_model.reserve(s.per_model.size());
    for (const auto& m : s.per_model) {
        p.per_model.push_back({m.model, m.tokens.input, m.tokens.output, m.tokens.cache_read,
                               m.tokens.cache_creation, m.total_cost_usd, m.record_count});
    }
    p.rate_60s = s.rate_60s;
    p.rate_session_avg = s.rate_session_avg;
    p.earliest_ms = to_ms(s.earliest_timestamp);
    p.latest_ms = to_ms(s.latest_timestamp);
    p.source_available = s.source_available;
    p.status_message = s.status_message;
    p.skipped_lines = s.skipped_lines;
    p.unreadable_files = s.unreadable_files;
    p.built_at_ms = utils::to_epoch_ms(s.built_at);
    return p;
}

Snapshot from_persisted(const PersistedSnapshot& p) {
    Snapshot s;
    s.window_key = p.window_key;
    s.window_label = p.window_label;
    s.window_start = utils::from_epoch_ms(p.window_start_ms);
    s.window_end = utils::from_epoch_ms(p.window_end_ms);
    s.open_ended = p.open_ended;
    s.tokens = to_counts(p.input_tokens, p.output_tokens, p.cache_read_tokens,
                         p.cache_creation_tokens);
    s.total_tokens = s.tokens.total();
    s.total_cost_usd = p.total_cost_usd;
    s.record_count = p.record_count;
    s.per_model.reserve(p.per_model.size());
    for (const auto& pm : p.per_model) {
        ModelUsage m;
        m.model = pm.model;
        m.tokens = to_counts(pm.input_tokens, pm.output_tokens, pm.cache_read_tokens,
                             pm.cache_creation_tokens);
        m.total_tokens = m.tokens.total();
        m.total_cost_usd = pm.total_cost_usd;
        m.record_count = pm.record_count;
        s.per_model.push_back(std::move(m));
    }
    s.rate_60s = p.rate_60s;
    s.rate_session_avg = p.rate_session_avg;
    s.earliest_timestamp = from_ms(p.earliest_ms);
    s.latest_timestamp = from_ms(p.latest_ms);
    s.source_available = p.source_available;
    s.status_message = p.status_message;
    s.skipped_lines = p.skipped_lines;
    s.unreadable_files = p.unreadable_files;
    s.built_at = utils::from_epoch_ms(p.built_at_ms);
    return s;
}

} // anonymous namespace

// ============================================================================
// CachePersistence
// ============================================================================

CachePersistence::CachePersistence(std::string path)
    : path_(std::move(path)) {}

std::string CachePersistence::default_path() {
    const char* home = std::getenv("HOME");
    const fs::path base = (home && *home) ? fs::path(home) : fs::path(".");
    return (base / ".ccdash" / "snapshot_cache.json").string();
}

Result<std::string> CachePersistence::serialize(const std::vector<SnapshotCache::Entry>& entries) {
    PersistedFile file;
    file.version = kFormatVersion;
    file.entries.reserve(entries.size());
    for (const auto& e : entries) {
        if (!e.snapshot) continue;
        file.entries.push_back({e.window_key, e.source_fingerprint,
                                utils::to_epoch_ms(e.created_at), to_persisted(*e.snapshot)});
    }

    std::string buffer;
    if (auto ec = glz::write_json(file, buffer); ec) {
        return Result<std::string>::error(ErrorCategory::CACHE_ERROR,
                                          "Failed to serialize snapshot cache");
    }
    return Result<std::string>::ok(std::move(buffer));
}

Result<std::vector<SnapshotCache::Entry>> CachePersistence::deserialize(const std::string& json) {
    using R = Result<std::vector<SnapshotCache::Entry>>;

    PersistedFile file;
    if (auto ec = glz::read<kReadOpts>(file, json); ec) {
        return R::error(ErrorCategory::CACHE_ERROR,
                        std::format("Malformed snapshot cache: {}", glz::format_error(ec, json)));
    }
    if (file.version != kFormatVersion) {
        return R::error(ErrorCategory::CACHE_ERROR,
                        std::format("Unsupported snapshot cache version {} (expected {})",
                                    file.version, kFormatVersion));
    }

    std::vector<SnapshotCache::Entry> entries;
    entries.reserve(file.entries.size());
    for (const auto& pe : file.entries) {
        SnapshotCache::Entry e;
        e.window_key = pe.window_key;
        e.source_fingerprint = pe.source_fingerprint;
        e.created_at = utils::from_epoch_ms(pe.created_at_ms);
        e.snapshot = std::make_shared<const Snapshot>(from_persisted(pe.snapshot));
        entries.push_back(std::move(e));
    }
    return R::ok(std::move(entries));
}

Result<CachePersistence::LoadOutcome> CachePersistence::load(
    const std::string& current_fingerprint) const {
    using R = Result<LoadOutcome>;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return R::ok(LoadOutcome{});
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return R::error(ErrorCategory::CACHE_ERROR,
                        std::format("Cannot open snapshot cache {}", path_));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = deserialize(buffer.str());
    if (parsed.is_error()) {
        return R::error(parsed.error_category(),
                        std::format("{}: {}", path_, parsed.error_message()));
    }

    LoadOutcome outcome;
    for (auto& e : parsed.value()) {
        if (e.source_fingerprint != current_fingerprint) {
            ++outcome.discarded;
            continue;
        }
        outcome.entries.push_back(std::move(e));
    }
    return R::ok(std::move(outcome));
}

Result<size_t> CachePersistence::save(const std::vector<SnapshotCache::Entry>& entries) const {
    // File keeps oldest first so restore() rebuilds the same recency order
    std::vector<SnapshotCache::Entry> ordered(entries.rbegin(), entries.rend());
    auto json = serialize(ordered);
    if (json.is_error()) {
        return Result<size_t>::error_from(json);
    }

    const fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result<size_t>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot create {}: {}", target.parent_path().string(), ec.message()));
        }
    }

    const auto tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<size_t>::error(ErrorCategory::IO_ERROR,
                                         std::format("Cannot write {}", tmp));
        }
        out << json.value();
        out.flush();
        if (!out) {
            return Result<size_t>::error(ErrorCategory::IO_ERROR,
                                         std::format("Short write to {}", tmp));
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(tmp, ec);
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
                                     std::format("Cannot replace {}: {}", path_, reason));
    }
    return Result<size_t>::ok(ordered.size());
}

} // namespace ccdash
