#include "usage/record_parser.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace ccdash {

namespace {

std::string_view strip(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

/**
 * @brief Stable identity for a usage line
 *
 * The same API response is copied into every transcript that resumes a
 * session, so the message id (+ request id) deduplicates across files.
 * Lines without one fall back to the uuid, then to path@offset.
 */
std::string make_identity(const JsonValue& line, const JsonValue& message, const LineContext& ctx) {
    const auto message_id = message.string_or("id", "");
    if (!message_id.empty()) {
        return std::format("{}:{}", message_id, line.string_or("requestId", ""));
    }
    const auto uuid = line.string_or("uuid", "");
    if (!uuid.empty()) {
        return std::format("uuid:{}", uuid);
    }
    return std::format("{}@{}", ctx.path, ctx.offset);
}

constexpr double kMaxTokenCount = 1e15;

bool count_out_of_range(const JsonValue& obj, std::string_view key) {
    const auto v = obj.number(key);
    return v && *v > kMaxTokenCount;
}

bool counts_in_range(const JsonValue& usage) {
    const auto detail = usage["cache_creation"];
    return !count_out_of_range(usage, "input_tokens")
        && !count_out_of_range(usage, "output_tokens")
        && !count_out_of_range(usage, "cache_read_input_tokens")
        && !count_out_of_range(usage, "cache_creation_input_tokens")
        && !count_out_of_range(detail, "ephemeral_5m_input_tokens")
        && !count_out_of_range(detail, "ephemeral_1h_input_tokens");
}

TokenCounts extract_tokens(const JsonValue& usage) {
    TokenCounts t;
    t.input = usage.count_or("input_tokens", 0);
    t.output = usage.count_or("output_tokens", 0);
    t.cache_read = usage.count_or("cache_read_input_tokens", 0);
    t.cache_creation = usage.count_or("cache_creation_input_tokens", 0);

    // Newer transcripts may only carry the per-TTL breakdown
    if (t.cache_creation == 0) {
        const auto detail = usage["cache_creation"];
        t.cache_creation = detail.count_or("ephemeral_5m_input_tokens", 0)
                         + detail.count_or("ephemeral_1h_input_tokens", 0);
    }
    return t;
}

} // anonymous namespace

ParseOutcome RecordParser::parse(std::string_view raw_line, const LineContext& ctx) const {
    const auto line = strip(raw_line);
    if (line.empty()) return ParseOutcome::ignored();

    if (line.size() > config_.max_line_bytes) {
        return ParseOutcome::skipped(std::format("line exceeds {} bytes", config_.max_line_bytes));
    }

    const auto parsed = JsonValue::try_parse(std::string(line));
    if (!parsed) return ParseOutcome::skipped("invalid JSON");

    const auto& doc = *parsed;
    if (!doc.is_object()) return ParseOutcome::skipped("line is not a JSON object");

    const auto message = doc["message"];
    const auto usage = message["usage"];
    if (!usage.is_object()) return ParseOutcome::ignored();

    const auto ts_field = doc["timestamp"];
    if (!ts_field.is_string()) return ParseOutcome::skipped("usage line without timestamp");
    const auto timestamp = utils::parse_rfc3339(ts_field.get<std::string>());
    if (!timestamp) return ParseOutcome::skipped("unparsable timestamp");
    if (!counts_in_range(usage)) return ParseOutcome::skipped("token count out of range");

    UsageRecord record;
    record.identity = make_identity(doc, message, ctx);
    record.timestamp = *timestamp;
    record.project_id = std::string(ctx.project_id);
    record.session_id = doc.string_or("sessionId", std::string(ctx.session_fallback));

    record.model = message.string_or("model", kUnknownModel);
    if (record.model.empty()) record.model = kUnknownModel;

    record.tokens = extract_tokens(usage);

    if (const auto cost = doc.number("costUSD"); cost && *cost >= 0.0) {
        record.reported_cost_usd = *cost;
    }

    return ParseOutcome::parsed(std::move(record));
}

} // namespace ccdash
