#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ccdash {

/// Where a line came from; used for project/session attribution and as the
/// identity of last resort.
struct LineContext {
    std::string_view path;
    std::string_view project_id;
    std::string_view session_fallback;   // File stem, used when sessionId is absent
    uint64_t offset = 0;                 // Byte offset of the line start
};

enum class ParseStatus {
    RECORD,    // Usage line decoded into a record
    IGNORED,   // Valid line without usage (prompt, summary, blank)
    SKIPPED    // Malformed: counted, then processing continues
};

struct ParseOutcome {
    ParseStatus status = ParseStatus::IGNORED;
    std::optional<UsageRecord> record;
    std::string reason;                  // Why a line was skipped

    static ParseOutcome ignored() { return {}; }

    static ParseOutcome skipped(std::string why) {
        ParseOutcome o;
        o.status = ParseStatus::SKIPPED;
        o.reason = std::move(why);
        return o;
    }

    static ParseOutcome parsed(UsageRecord r) {
        ParseOutcome o;
        o.status = ParseStatus::RECORD;
        o.record = std::move(r);
        return o;
    }
};

/**
 * @brief Decodes one transcript line into a UsageRecord
 *
 * Recognised fields:
 *   timestamp                                   RFC 3339, required for usage lines
 *   sessionId, uuid, requestId, costUSD
 *   message.id, message.model
 *   message.usage.{input_tokens, output_tokens,
 *                  cache_read_input_tokens, cache_creation_input_tokens}
 *   message.usage.cache_creation.{ephemeral_5m_input_tokens,
 *                                 ephemeral_1h_input_tokens}
 *
 * Everything else is ignored. Missing token counts default to zero and a
 * missing model to "unknown". Pure function of (line, context).
 */
class RecordParser {
public:
    struct Config {
        size_t max_line_bytes = 10 * 1024 * 1024;
    };

    RecordParser() = default;
    explicit RecordParser(Config config) : config_(config) {}

    [[nodiscard]] ParseOutcome parse(std::string_view line, const LineContext& ctx) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace ccdash
