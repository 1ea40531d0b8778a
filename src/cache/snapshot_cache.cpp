#include "cache/snapshot_cache.hpp"

#include <algorithm>

namespace ccdash {

SnapshotCache::SnapshotCache(const Config& config)
    : config_(config) {
    config_.max_entries = std::max(config_.max_entries, size_t{1});
}

SnapshotPtr SnapshotCache::get(const std::string& window_key,
                               const std::string& source_fingerprint,
                               TimePoint now) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(window_key);
    if (it == map_.end()) {
        ++misses_;
        return nullptr;
    }

    auto& entry = *it->second;

    // Source changed since this entry was built
    if (entry.source_fingerprint != source_fingerprint) {
        lru_list_.erase(it->second);
        map_.erase(it);
        ++invalidations_;
        ++misses_;
        return nullptr;
    }

    // TTL check
    if (now - entry.created_at >= config_.ttl) {
        lru_list_.erase(it->second);
        map_.erase(it);
        ++expirations_;
        ++misses_;
        return nullptr;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    ++hits_;
    return entry.snapshot;
}

void SnapshotCache::put(const std::string& window_key, const std::string& source_fingerprint,
                        SnapshotPtr snapshot, TimePoint now) {
    if (!snapshot) return;
    std::lock_guard lock(mutex_);

    auto it = map_.find(window_key);
    if (it != map_.end()) {
        it->second->source_fingerprint = source_fingerprint;
        it->second->snapshot = std::move(snapshot);
        it->second->created_at = now;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    lru_list_.emplace_front(Entry{window_key, source_fingerprint, now, std::move(snapshot)});
    map_[window_key] = lru_list_.begin();
    evict_locked(source_fingerprint);
}

void SnapshotCache::evict_locked(const std::string& keep_fingerprint) {
    // Stale-source entries first, walking from the least recently used end
    for (auto it = lru_list_.end(); map_.size() > config_.max_entries && it != lru_list_.begin(); ) {
        --it;
        if (it->source_fingerprint != keep_fingerprint) {
            map_.erase(it->window_key);
            it = lru_list_.erase(it);
            ++evictions_;
        }
    }

    while (map_.size() > config_.max_entries && !lru_list_.empty()) {
        auto& back = lru_list_.back();
        map_.erase(back.window_key);
        lru_list_.pop_back();
        ++evictions_;
    }
}

std::vector<SnapshotCache::Entry> SnapshotCache::entries() const {
    std::lock_guard lock(mutex_);
    return {lru_list_.begin(), lru_list_.end()};
}

void SnapshotCache::restore(std::vector<Entry> entries) {
    std::lock_guard lock(mutex_);
    for (auto& e : entries) {
        if (!e.snapshot) continue;
        auto it = map_.find(e.window_key);
        if (it != map_.end()) {
            lru_list_.erase(it->second);
            map_.erase(it);
        }
        const auto fingerprint = e.source_fingerprint;
        lru_list_.push_front(std::move(e));
        map_[lru_list_.front().window_key] = lru_list_.begin();
        evict_locked(fingerprint);
    }
}

void SnapshotCache::clear() {
    std::lock_guard lock(mutex_);
    lru_list_.clear();
    map_.clear();
}

SnapshotCache::Stats SnapshotCache::get_stats() const {
    std::lock_guard lock(mutex_);
    return {
        .hits = hits_,
        .misses = misses_,
        .evictions = evictions_,
        .expirations = expirations_,
        .invalidations = invalidations_,
        .current_entries = map_.size(),
    };
}

} // namespace ccdash
