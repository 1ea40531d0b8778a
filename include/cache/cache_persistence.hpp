#pragma once

#include "cache/snapshot_cache.hpp"
#include "core/error.hpp"

#include <string>
#include <vector>

namespace ccdash {

/**
 * @brief Saves and restores SnapshotCache entries as a JSON file
 *
 * File format (glaze):
 *   {"version":1,"entries":[{"window_key":..., "source_fingerprint":...,
 *                            "created_at_ms":..., "snapshot":{...}}]}
 *
 * Entries are stored oldest first.
 *
 * Writes go to "<path>.tmp" and are renamed over the target, so a reader
 * never sees a half-written file. A missing file loads as empty; an
 * unreadable, malformed or wrong-version file is reported as CACHE_ERROR
 * and the caller treats it as a cold cache.
 */
class CachePersistence {
public:
    static constexpr int kFormatVersion = 1;

    explicit CachePersistence(std::string path);

    struct LoadOutcome {
        std::vector<SnapshotCache::Entry> entries;   // Oldest first
        size_t discarded = 0;                        // Fingerprint did not match
    };

    /// Entries whose source fingerprint equals current_fingerprint.
    [[nodiscard]] Result<LoadOutcome> load(const std::string& current_fingerprint) const;

    /// @param entries Most recently used first, as SnapshotCache::entries() returns them
    [[nodiscard]] Result<size_t> save(const std::vector<SnapshotCache::Entry>& entries) const;

    [[nodiscard]] const std::string& path() const { return path_; }

    /// $HOME/.ccdash/snapshot_cache.json (relative to the working directory without HOME)
    [[nodiscard]] static std::string default_path();

    [[nodiscard]] static Result<std::string> serialize(const std::vector<SnapshotCache::Entry>& entries);
    [[nodiscard]] static Result<std::vector<SnapshotCache::Entry>> deserialize(const std::string& json);

private:
    std::string path_;
};

} // namespace ccdash
