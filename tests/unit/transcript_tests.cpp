/**
 * Unit tests for transcript aggregation
 */

#include <doctest/doctest.h>
#include <worthit/transcript.hpp>

#include "test_helpers.hpp"

#include <sstream>

using namespace worthit;

namespace {

std::string assistant_line(const std::string& model, int in, int out, int cache_read, int cache_write) {
    return R"({"type":"assistant","message":{"role":"assistant","model":")" + model +
           R"(","usage":{"input_tokens":)" + std::to_string(in) +
           R"(,"output_tokens":)" + std::to_string(out) +
           R"(,"cache_read_input_tokens":)" + std::to_string(cache_read) +
           R"(,"cache_creation_input_tokens":)" + std::to_string(cache_write) + "}}}\n";
}

const char* kUserLine = R"({"type":"user","message":{"role":"user","content":"hi"}})" "\n";

TranscriptSummary summarize(const std::string& text) {
    std::istringstream in(text);
    return summarize_transcript(in);
}

} // namespace

TEST_CASE("sums usage of the current turn") {
    std::string text = std::string(kUserLine) +
                       assistant_line("claude-sonnet-4-5", 100, 50, 10, 5) +
                       assistant_line("claude-sonnet-4-5", 200, 25, 20, 0);
    auto s = summarize(text);
    CHECK(s.assistant_messages == 2);
    CHECK(s.totals.input == 300);
    CHECK(s.totals.output == 75);
    CHECK(s.totals.cache_read == 30);
    CHECK(s.totals.cache_write == 5);
    CHECK(s.model == "claude-sonnet-4-5");
}

TEST_CASE("stops at the most recent user entry") {
    std::string text = assistant_line("claude-opus-4-5", 1000, 1000, 0, 0) +
                       kUserLine +
                       assistant_line("claude-haiku-4-5", 7, 3, 0, 0);
    auto s = summarize(text);
    CHECK(s.assistant_messages == 1);
    CHECK(s.totals.input == 7);
    CHECK(s.totals.output == 3);
    CHECK(s.model == "claude-haiku-4-5");
}

TEST_CASE("model comes from the latest assistant entry") {
    std::string text = std::string(kUserLine) +
                       assistant_line("claude-sonnet-4-5", 1, 1, 0, 0) +
                       assistant_line("claude-opus-4-5", 1, 1, 0, 0);
    CHECK(summarize(text).model == "claude-opus-4-5");
}

TEST_CASE("turn ending in a user entry has no assistant messages") {
    std::string text = assistant_line("claude-opus-4-5", 10, 10, 0, 0) + kUserLine;
    auto s = summarize(text);
    CHECK(s.assistant_messages == 0);
    CHECK(total_tokens(s.totals) == 0);
    CHECK(s.model == "unknown");
}

TEST_CASE("other entry types do not end the turn") {
    std::string text = std::string(kUserLine) +
                       assistant_line("claude-sonnet-4-5", 5, 5, 0, 0) +
                       R"({"type":"system","content":"compacted"})" "\n" +
                       assistant_line("claude-sonnet-4-5", 5, 5, 0, 0);
    auto s = summarize(text);
    CHECK(s.assistant_messages == 2);
    CHECK(s.totals.input == 10);
}

TEST_CASE("malformed and blank lines are skipped") {
    std::string text = std::string(kUserLine) +
                       "not json at all\n" +
                       "\n   \n" +
                       "[1,2,3]\n" +
                       assistant_line("claude-sonnet-4-5", 4, 2, 0, 0) +
                       "{\"truncated\": \n";
    auto s = summarize(text);
    CHECK(s.skipped_lines == 3);
    CHECK(s.assistant_messages == 1);
    CHECK(s.totals.input == 4);
}

TEST_CASE("assistant entries without an assistant role are ignored") {
    std::string text = std::string(kUserLine) +
                       R"({"type":"assistant","message":{"role":"tool","usage":{"input_tokens":99}}})" "\n" +
                       R"({"type":"assistant"})" "\n";
    auto s = summarize(text);
    CHECK(s.assistant_messages == 0);
    CHECK(s.totals.input == 0);
}

TEST_CASE("missing usage and model fields") {
    std::string text = std::string(kUserLine) +
                       R"({"type":"assistant","message":{"role":"assistant"}})" "\n";
    auto s = summarize(text);
    CHECK(s.assistant_messages == 1);
    CHECK(total_tokens(s.totals) == 0);
    CHECK(s.model == "unknown");
}

TEST_CASE("non-numeric and negative counters count as zero") {
    std::string text = std::string(kUserLine) +
        R"({"type":"assistant","message":{"role":"assistant","model":"m","usage":)"
        R"({"input_tokens":"100","output_tokens":-5,"cache_read_input_tokens":1.5,)"
        R"("cache_creation_input_tokens":7}}})" "\n";
    auto s = summarize(text);
    CHECK(s.totals.input == 0);
    CHECK(s.totals.output == 0);
    CHECK(s.totals.cache_read == 0);
    CHECK(s.totals.cache_write == 7);
}

TEST_CASE("empty transcript") {
    auto s = summarize("");
    CHECK(s.assistant_messages == 0);
    CHECK(s.skipped_lines == 0);
    CHECK(s.model == "unknown");
}

TEST_CASE("read_transcript from disk") {
    TempTestDir dir;
    std::string path = dir.file("t.jsonl", std::string(kUserLine) +
                                           assistant_line("claude-haiku-4-5", 10, 20, 0, 0));
    auto r = read_transcript(path);
    REQUIRE(r.ok);
    CHECK(r.summary.totals.input == 10);
    CHECK(r.summary.totals.output == 20);
}

TEST_CASE("read_transcript fails for a missing file") {
    TempTestDir dir;
    auto r = read_transcript(dir.path + "/missing.jsonl");
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}
