#pragma once

#include "core/types.hpp"
#include "usage/log_locator.hpp"
#include "usage/record_parser.hpp"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ccdash {

/// What one scan() call did.
struct ScanReport {
    size_t files_seen = 0;
    size_t files_read = 0;               // Opened because size/mtime changed
    size_t files_rewritten = 0;          // Shrunk or prefix changed: re-read from 0
    size_t files_unreadable = 0;
    uint64_t lines_parsed = 0;
    uint64_t records_added = 0;
    uint64_t duplicates_discarded = 0;
    uint64_t lines_skipped = 0;
    std::vector<std::string> unreadable_paths;
};

/**
 * @brief Incremental, deduplicating store of usage records
 *
 * Each file is read only past the byte offset consumed by the previous scan,
 * and only up to the last complete line. A file that shrank, or whose first
 * bytes no longer match what was read before, is treated as rewritten: every
 * identity it contributed is released and the file is re-read from byte 0.
 *
 * Records are keyed by identity. An identity seen again (same file re-read,
 * or the same API response copied into another transcript) is discarded.
 * Identities are reference counted by the files that contain them, so
 * rewriting one file never drops a record another file still carries.
 *
 * Thread-safety: all public methods lock an internal mutex. The engine only
 * calls scan() from its build task.
 */
class UsageAggregator {
public:
    struct Config {
        size_t read_chunk_bytes = 1024 * 1024;
        size_t signature_bytes = 256;
    };

    explicit UsageAggregator(RecordParser parser = RecordParser{});
    UsageAggregator(RecordParser parser, Config config);

    UsageAggregator(const UsageAggregator&) = delete;
    UsageAggregator& operator=(const UsageAggregator&) = delete;

    /// Incorporate whatever is new in the given files.
    ScanReport scan(const std::vector<LogFileInfo>& files);

    /// All records, ordered by timestamp then identity.
    [[nodiscard]] std::vector<UsageRecordPtr> records() const;

    [[nodiscard]] size_t record_count() const;
    [[nodiscard]] std::optional<TimePoint> earliest_timestamp() const;

    /// Malformed lines currently present across all tracked files.
    [[nodiscard]] uint64_t skipped_lines() const;

    struct Stats {
        uint64_t scans = 0;
        uint64_t lines_parsed = 0;
        uint64_t records_added = 0;
        uint64_t duplicates_discarded = 0;
        uint64_t files_rewritten = 0;
        uint64_t unreadable_events = 0;
        size_t record_count = 0;
        size_t tracked_files = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct Entry {
        UsageRecordPtr record;
        uint32_t owners = 0;
    };

    struct FileState {
        uint64_t offset = 0;             // Always just past a '\n'
        uint64_t size = 0;
        int64_t mtime_ns = 0;
        bool seen = false;
        std::string signature;           // First bytes already consumed
        std::unordered_set<std::string> identities;
        uint64_t skipped = 0;
        std::string session_fallback;
    };

    bool is_rewritten(std::ifstream& in, const LogFileInfo& file, const FileState& state) const;
    void release(FileState& state);
    void read_new_lines(std::ifstream& in, const LogFileInfo& file, FileState& state,
                        ScanReport& report);
    void handle_line(std::string_view line, uint64_t offset, const LogFileInfo& file,
                     FileState& state, ScanReport& report);
    void refresh_signature(std::ifstream& in, FileState& state) const;

    RecordParser parser_;
    Config config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> records_;
    std::unordered_map<std::string, FileState> files_;

    mutable std::vector<UsageRecordPtr> sorted_;
    mutable bool sorted_dirty_ = true;

    Stats stats_;
};

} // namespace ccdash
