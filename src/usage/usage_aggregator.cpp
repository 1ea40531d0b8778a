#include "usage/usage_aggregator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>

namespace ccdash {

UsageAggregator::UsageAggregator(RecordParser parser)
    : UsageAggregator(std::move(parser), Config{}) {}

UsageAggregator::UsageAggregator(RecordParser parser, Config config)
    : parser_(std::move(parser)), config_(config) {
    config_.read_chunk_bytes = std::max(config_.read_chunk_bytes, size_t{4096});
}

ScanReport UsageAggregator::scan(const std::vector<LogFileInfo>& files) {
    std::lock_guard lock(mutex_);
    ScanReport report;
    ++stats_.scans;

    for (const auto& file : files) {
        ++report.files_seen;
        auto& state = files_[file.path];

        if (state.seen && file.size == state.size && file.mtime_ns == state.mtime_ns) {
            continue;  // Unchanged since last scan
        }

        std::ifstream in(file.path, std::ios::binary);
        if (!in) {
            // Keep the previous contribution; try again next scan
            ++report.files_unreadable;
            ++stats_.unreadable_events;
            report.unreadable_paths.push_back(file.path);
            utils::log::warn(std::format("Cannot open usage log {}", file.path));
            continue;
        }

        if (state.seen && is_rewritten(in, file, state)) {
            utils::log::info(std::format("Usage log rewritten, re-reading: {}", file.path));
            release(state);
            ++report.files_rewritten;
            ++stats_.files_rewritten;
        }

        if (!state.seen) {
            state.session_fallback = std::filesystem::path(file.path).stem().string();
            state.seen = true;
        }

        ++report.files_read;
        read_new_lines(in, file, state, report);
        refresh_signature(in, state);

        state.size = file.size;
        state.mtime_ns = file.mtime_ns;
    }

    stats_.lines_parsed += report.lines_parsed;
    stats_.records_added += report.records_added;
    stats_.duplicates_discarded += report.duplicates_discarded;
    if (report.records_added > 0 || report.files_rewritten > 0) {
        sorted_dirty_ = true;
    }
    return report;
}

bool UsageAggregator::is_rewritten(std::ifstream& in, const LogFileInfo& file,
                                   const FileState& state) const {
    if (file.size < state.offset) return true;
    if (state.signature.empty()) return false;

    std::string prefix(state.signature.size(), '\0');
    in.clear();
    in.seekg(0);
    in.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
    prefix.resize(static_cast<size_t>(in.gcount()));
    return prefix != state.signature;
}

void UsageAggregator::release(FileState& state) {
    for (const auto& identity : state.identities) {
        auto it = records_.find(identity);
        if (it == records_.end()) continue;
        if (--it->second.owners == 0) {
            records_.erase(it);
        }
    }
    state.identities.clear();
    state.offset = 0;
    state.skipped = 0;
    state.signature.clear();
}

void UsageAggregator::read_new_lines(std::ifstream& in, const LogFileInfo& file,
                                     FileState& state, ScanReport& report) {
    if (file.size <= state.offset) return;

    in.clear();
    in.seekg(static_cast<std::streamoff>(state.offset));
    if (!in) return;

    const size_t max_line = parser_.config().max_line_bytes;
    std::vector<char> chunk(config_.read_chunk_bytes);
    std::string pending;                 // Bytes after the last '\n' seen so far
    uint64_t pending_offset = state.offset;
    uint64_t remaining = file.size - state.offset;
    bool discarding = false;             // Inside a line longer than max_line
    uint64_t discard_start = 0;

    while (remaining > 0) {
        const auto want = static_cast<std::streamsize>(
            std::min<uint64_t>(remaining, chunk.size()));
        in.read(chunk.data(), want);
        const auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        remaining -= got;
        pending.append(chunk.data(), got);

        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            if (discarding) {
                ++state.skipped;
                ++report.lines_skipped;
                discarding = false;
            } else {
                handle_line(std::string_view(pending).substr(start, nl - start),
                            pending_offset + start, file, state, report);
            }
            start = nl + 1;
        }
        pending_offset += start;
        pending.erase(0, start);

        if (!discarding && pending.size() > max_line) {
            discarding = true;
            discard_start = pending_offset;
        }
        if (discarding) {
            pending_offset += pending.size();
            pending.clear();
        }
    }

    // An unterminated tail is left for a later scan
    state.offset = discarding ? discard_start : pending_offset;
}

void UsageAggregator::handle_line(std::string_view line, uint64_t offset, const LogFileInfo& file,
                                  FileState& state, ScanReport& report) {
    LineContext ctx;
    ctx.path = file.path;
    ctx.project_id = file.project_id;
    ctx.session_fallback = state.session_fallback;
    ctx.offset = offset;

    ++report.lines_parsed;
    auto outcome = parser_.parse(line, ctx);

    switch (outcome.status) {
        case ParseStatus::IGNORED:
            return;
        case ParseStatus::SKIPPED:
            ++state.skipped;
            ++report.lines_skipped;
            return;
        case ParseStatus::RECORD:
            break;
    }

    auto& record = *outcome.record;
    if (!state.identities.insert(record.identity).second) {
        // Repeated within this file (streamed responses repeat their usage)
        ++report.duplicates_discarded;
        return;
    }

    auto [it, inserted] = records_.try_emplace(record.identity);
    ++it->second.owners;
    if (inserted) {
        it->second.record = std::make_shared<const UsageRecord>(std::move(record));
        ++report.records_added;
    } else {
        ++report.duplicates_discarded;
    }
}

void UsageAggregator::refresh_signature(std::ifstream& in, FileState& state) const {
    const auto wanted = std::min<uint64_t>(config_.signature_bytes, state.offset);
    if (state.signature.size() >= wanted) return;

    std::string prefix(static_cast<size_t>(wanted), '\0');
    in.clear();
    in.seekg(0);
    in.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
    prefix.resize(static_cast<size_t>(in.gcount()));
    state.signature = std::move(prefix);
}

std::vector<UsageRecordPtr> UsageAggregator::records() const {
    std::lock_guard lock(mutex_);
    if (sorted_dirty_) {
        sorted_.clear();
        sorted_.reserve(records_.size());
        for (const auto& [identity, entry] : records_) {
            sorted_.push_back(entry.record);
        }
        std::sort(sorted_.begin(), sorted_.end(),
                  [](const UsageRecordPtr& a, const UsageRecordPtr& b) {
                      if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
                      return a->identity < b->identity;
                  });
        sorted_dirty_ = false;
    }
    return sorted_;
}

size_t UsageAggregator::record_count() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

std::optional<TimePoint> UsageAggregator::earliest_timestamp() const {
    std::lock_guard lock(mutex_);
    std::optional<TimePoint> earliest;
    for (const auto& [identity, entry] : records_) {
        if (!earliest || entry.record->timestamp < *earliest) {
            earliest = entry.record->timestamp;
        }
    }
    return earliest;
}

uint64_t UsageAggregator::skipped_lines() const {
    std::lock_guard lock(mutex_);
    uint64_t total = 0;
    for (const auto& [path, state] : files_) {
        total += state.skipped;
    }
    return total;
}

UsageAggregator::Stats UsageAggregator::get_stats() const {
    std::lock_guard lock(mutex_);
    Stats s = stats_;
    s.record_count = records_.size();
    s.tracked_files = files_.size();
    return s;
}

} // namespace ccdash
