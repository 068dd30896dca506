#include "worthit/transcript.hpp"

#include <cstdint>
#include <fstream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace worthit {

namespace {

using json = nlohmann::json;

std::string get_string(const json& j, const std::string& key, const std::string& default_val = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return default_val;
}

// Token counters are trusted upstream, but a transcript is still a file on
// disk: anything that is not a non-negative integer counts as zero.
std::uint64_t get_count(const json& usage, const char* key) {
    auto it = usage.find(key);
    if (it == usage.end()) return 0;
    if (it->is_number_unsigned()) return it->get<std::uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<std::int64_t>();
        return v > 0 ? static_cast<std::uint64_t>(v) : 0;
    }
    return 0;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

TranscriptSummary summarize_transcript(std::istream& in) {
    TranscriptSummary summary;
    std::vector<json> entries;

    std::string line;
    while (std::getline(in, line)) {
        if (is_blank(line)) continue;
        auto entry = json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.is_object()) {
            ++summary.skipped_lines;
            continue;
        }
        entries.push_back(std::move(entry));
    }

    // Walk back from the end until the turn's opening user entry
    bool have_model = false;
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::string type = get_string(*it, "type");
        if (type == "user") break;
        if (type != "assistant") continue;

        auto msg_it = it->find("message");
        if (msg_it == it->end() || !msg_it->is_object()) continue;
        const auto& message = *msg_it;
        if (get_string(message, "role") != "assistant") continue;

        if (!have_model) {
            summary.model = get_string(message, "model", "unknown");
            have_model = true;
        }

        auto usage_it = message.find("usage");
        if (usage_it != message.end() && usage_it->is_object()) {
            const auto& usage = *usage_it;
            summary.totals.input += get_count(usage, "input_tokens");
            summary.totals.output += get_count(usage, "output_tokens");
            summary.totals.cache_read += get_count(usage, "cache_read_input_tokens");
            summary.totals.cache_write += get_count(usage, "cache_creation_input_tokens");
        }
        ++summary.assistant_messages;
    }

    if (!have_model) {
        summary.model = "unknown";
    }

    if (summary.skipped_lines > 0) {
        spdlog::debug("skipped {} malformed transcript line(s)", summary.skipped_lines);
    }
    return summary;
}

TranscriptResult read_transcript(const std::string& path) {
    TranscriptResult result;

    std::ifstream file(path);
    if (!file) {
        result.error = "cannot open transcript";
        return result;
    }

    result.summary = summarize_transcript(file);
    if (file.bad()) {
        result.error = "I/O error while reading transcript";
        return result;
    }

    spdlog::debug("transcript turn: {} assistant message(s), model {}",
                  result.summary.assistant_messages, result.summary.model);
    result.ok = true;
    return result;
}

} // namespace worthit
