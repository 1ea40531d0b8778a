#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "usage/record_parser.hpp"
#include "mocks/usage_log_fixture.hpp"

#include <string>

using namespace ccdash;
using ccdash::testing::UsageLine;

namespace {

const TimePoint kT0 = utils::from_epoch_ms(1762161330250);   // 2025-11-03T09:15:30.250Z

LineContext ctx(uint64_t offset = 0) {
    LineContext c;
    c.path = "/logs/-home-me-app/abc.jsonl";
    c.project_id = "-home-me-app";
    c.session_fallback = "abc";
    c.offset = offset;
    return c;
}

} // anonymous namespace

TEST_CASE("RecordParser: maps usage fields onto the record", "[parser]") {
    UsageLine line;
    line.timestamp = kT0;
    line.input = 100;
    line.output = 50;
    line.cache_read = 7;
    line.cache_creation = 3;
    line.message_id = "msg_01";
    line.request_id = "req_01";
    line.session_id = "sess-9";

    const auto out = RecordParser().parse(line.json(), ctx());
    REQUIRE(out.status == ParseStatus::RECORD);
    REQUIRE(out.record.has_value());

    const auto& r = *out.record;
    CHECK(r.timestamp == kT0);
    CHECK(r.model == "claude-opus-4-5-20251101");
    CHECK(r.tokens.input == 100);
    CHECK(r.tokens.output == 50);
    CHECK(r.tokens.cache_read == 7);
    CHECK(r.tokens.cache_creation == 3);
    CHECK(r.total_tokens() == 160);
    CHECK(r.project_id == "-home-me-app");
    CHECK(r.session_id == "sess-9");
    CHECK(r.identity == "msg_01:req_01");
    CHECK_FALSE(r.reported_cost_usd.has_value());
}

TEST_CASE("RecordParser: missing counts and model take defaults", "[parser]") {
    const std::string json =
        R"({"type":"assistant","timestamp":"2025-11-03T09:15:30.250Z","message":{"usage":{"output_tokens":12}}})";

    const auto out = RecordParser().parse(json, ctx());
    REQUIRE(out.status == ParseStatus::RECORD);
    CHECK(out.record->model == kUnknownModel);
    CHECK(out.record->tokens.input == 0);
    CHECK(out.record->tokens.output == 12);
    CHECK(out.record->tokens.cache_read == 0);
    CHECK(out.record->tokens.cache_creation == 0);
    CHECK(out.record->session_id == "abc");
}

TEST_CASE("RecordParser: negative counts are treated as absent", "[parser]") {
    const std::string json =
        R"({"timestamp":"2025-11-03T09:15:30Z","message":{"usage":{"input_tokens":-5,"output_tokens":4}}})";

    const auto out = RecordParser().parse(json, ctx());
    REQUIRE(out.status == ParseStatus::RECORD);
    CHECK(out.record->tokens.input == 0);
    CHECK(out.record->tokens.output == 4);
}

TEST_CASE("RecordParser: counts too large for int64 skip the line", "[parser]") {
    const RecordParser parser;

    auto out = parser.parse(
        R"({"timestamp":"2025-11-03T09:15:30Z","message":{"usage":{"input_tokens":1e19,"output_tokens":4}}})",
        ctx());
    CHECK(out.status == ParseStatus::SKIPPED);
    CHECK(out.reason == "token count out of range");
    CHECK_FALSE(out.record.has_value());

    out = parser.parse(
        R"({"timestamp":"2025-11-03T09:15:30Z","message":{"usage":{"input_tokens":1,)"
        R"("cache_creation":{"ephemeral_1h_input_tokens":5e18}}}})",
        ctx());
    CHECK(out.status == ParseStatus::SKIPPED);

    out = parser.parse(
        R"({"timestamp":"2025-11-03T09:15:30Z","message":{"usage":{"input_tokens":1e12}}})", ctx());
    REQUIRE(out.status == ParseStatus::RECORD);
    CHECK(out.record->tokens.input == 1000000000000);
}

TEST_CASE("RecordParser: ephemeral cache creation breakdown is summed", "[parser]") {
    const std::string json =
        R"({"timestamp":"2025-11-03T09:15:30Z","message":{"model":"claude-sonnet-4-5","usage":{"input_tokens":1,)"
        R"("cache_creation":{"ephemeral_5m_input_tokens":200,"ephemeral_1h_input_tokens":30}}}})";

    const auto out = RecordParser().parse(json, ctx());
    REQUIRE(out.status == ParseStatus::RECORD);
    CHECK(out.record->tokens.cache_creation == 230);
}

TEST_CASE("RecordParser: aggregate cache creation wins over the breakdown", "[parser]") {
    const std::string json =
        R"({"timestamp":"2025-11-03T09:15:30Z","message":{"usage":{"cache_creation_input_tokens":40,)"
        R"("cache_creation":{"ephemeral_5m_input_tokens":200}}}})";

    const auto out = RecordParser().parse(json, ctx());
    REQUIRE(out.status == ParseStatus::RECORD);
    CHECK(out.record->tokens.cache_creation == 40);
}

TEST_CASE("RecordParser: identity falls back to uuid, then path and offset", "[parser]") {
    UsageLine line;
    line.timestamp = kT0;
    line.output = 1;

    SECTION("uuid") {
        line.uuid = "u-123";
        const auto out = RecordParser().parse(line.json(), ctx(42));
        REQUIRE(out.status == ParseStatus::RECORD);
        CHECK(out.record->identity == "uuid:u-123");
    }

    SECTION("position") {
        const auto out = RecordParser().parse(line.json(), ctx(42));
        REQUIRE(out.status == ParseStatus::RECORD);
        CHECK(out.record->identity == "/logs/-home-me-app/abc.jsonl@42");
    }
}

TEST_CASE("RecordParser: the same response in two files shares one identity", "[parser]") {
    UsageLine line;
    line.timestamp = kT0;
    line.output = 9;
    line.message_id = "msg_shared";
    line.request_id = "req_shared";

    auto other = ctx(999);
    other.path = "/logs/-home-me-app/resumed.jsonl";

    const RecordParser parser;
    const auto a = parser.parse(line.json(), ctx(0));
    const auto b = parser.parse(line.json(), other);
    REQUIRE(a.record.has_value());
    REQUIRE(b.record.has_value());
    CHECK(a.record->identity == b.record->identity);
}

TEST_CASE("RecordParser: reported cost is carried when non-negative", "[parser]") {
    UsageLine line;
    line.timestamp = kT0;
    line.output = 1;

    line.cost_usd = 0.125;
    auto out = RecordParser().parse(line.json(), ctx());
    REQUIRE(out.record.has_value());
    REQUIRE(out.record->reported_cost_usd.has_value());
    CHECK(*out.record->reported_cost_usd == Catch::Approx(0.125));

    line.cost_usd = -1.0;
    out = RecordParser().parse(line.json(), ctx());
    REQUIRE(out.record.has_value());
    CHECK_FALSE(out.record->reported_cost_usd.has_value());
}

TEST_CASE("RecordParser: lines without usage are ignored, not skipped", "[parser]") {
    const RecordParser parser;
    CHECK(parser.parse("", ctx()).status == ParseStatus::IGNORED);
    CHECK(parser.parse("   \r", ctx()).status == ParseStatus::IGNORED);
    CHECK(parser.parse(R"({"type":"user","message":{"role":"user","content":"hi"}})", ctx()).status
          == ParseStatus::IGNORED);
    CHECK(parser.parse(R"({"type":"summary","summary":"x"})", ctx()).status == ParseStatus::IGNORED);
}

TEST_CASE("RecordParser: malformed lines are skipped with a reason", "[parser]") {
    const RecordParser parser;

    auto out = parser.parse("{not json", ctx());
    CHECK(out.status == ParseStatus::SKIPPED);
    CHECK_FALSE(out.reason.empty());

    out = parser.parse("[1,2,3]", ctx());
    CHECK(out.status == ParseStatus::SKIPPED);

    out = parser.parse(R"({"message":{"usage":{"input_tokens":1}}})", ctx());
    CHECK(out.status == ParseStatus::SKIPPED);

    out = parser.parse(R"({"timestamp":"yesterday","message":{"usage":{"input_tokens":1}}})", ctx());
    CHECK(out.status == ParseStatus::SKIPPED);
}

TEST_CASE("RecordParser: lines over the size limit are skipped", "[parser]") {
    RecordParser::Config cfg;
    cfg.max_line_bytes = 64;
    const RecordParser parser(cfg);

    UsageLine line;
    line.timestamp = kT0;
    line.output = 1;
    REQUIRE(line.json().size() > 64);

    const auto out = parser.parse(line.json(), ctx());
    CHECK(out.status == ParseStatus::SKIPPED);
}
