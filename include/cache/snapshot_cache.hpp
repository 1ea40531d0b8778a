#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ccdash {

/**
 * @brief Bounded LRU of built snapshots, one slot per window key
 *
 * An entry is served only while its source fingerprint equals the caller's
 * current one and it is younger than the TTL. A fingerprint mismatch drops
 * the entry on lookup. On overflow, entries built from a different source
 * fingerprint than the one just inserted go first (oldest first), then
 * plain LRU.
 *
 * All times are supplied by the caller so the engine's clock is the only
 * clock involved.
 */
class SnapshotCache {
public:
    struct Config {
        size_t max_entries = 8;
        std::chrono::milliseconds ttl{5000};
    };

    struct Entry {
        std::string window_key;
        std::string source_fingerprint;
        TimePoint created_at{};
        SnapshotPtr snapshot;
    };

    explicit SnapshotCache(const Config& config);

    /// Cached snapshot for (window_key, fingerprint), or nullptr on miss.
    [[nodiscard]] SnapshotPtr get(const std::string& window_key,
                                  const std::string& source_fingerprint,
                                  TimePoint now);

    void put(const std::string& window_key, const std::string& source_fingerprint,
             SnapshotPtr snapshot, TimePoint now);

    /// Entries from most to least recently used (for persistence).
    [[nodiscard]] std::vector<Entry> entries() const;

    /// Re-insert persisted entries; the last one becomes most recent.
    void restore(std::vector<Entry> entries);

    void clear();

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t expirations;
        uint64_t invalidations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    void evict_locked(const std::string& keep_fingerprint);

    Config config_;

    mutable std::mutex mutex_;
    std::list<Entry> lru_list_;          // Front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> map_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;
    uint64_t invalidations_ = 0;
};

} // namespace ccdash
