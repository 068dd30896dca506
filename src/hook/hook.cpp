#include "worthit/hook.hpp"
#include "worthit/hook_input.hpp"
#include "worthit/path_utils.hpp"
#include "worthit/transcript.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace worthit {

namespace {

HookOutcome failed(const std::string& category, const std::string& message) {
    HookOutcome outcome;
    outcome.status = HookStatus::Failed;
    outcome.error_category = category;
    outcome.message = message;
    return outcome;
}

HookOutcome nothing_to_report(const char* reason) {
    spdlog::debug("nothing to report: {}", reason);
    HookOutcome outcome;
    outcome.status = HookStatus::NothingToReport;
    return outcome;
}

HookOutcome process_transcript_path(const std::string& raw_path, const HookOptions& options) {
    auto path = sanitize_transcript_path(raw_path, options.transcript_root);
    if (!path.ok) {
        return failed(path_error_category(path.error), path.message);
    }

    std::error_code ec;
    bool exists = std::filesystem::exists(path.path, ec);
    if (ec) {
        return failed("path_resolve", "cannot stat transcript path: " + ec.message());
    }
    if (!exists) {
        return nothing_to_report("transcript does not exist");
    }

    auto transcript = read_transcript(path.path);
    if (!transcript.ok) {
        return failed("transcript_read", transcript.error);
    }

    const auto& summary = transcript.summary;
    if (summary.assistant_messages == 0) {
        return nothing_to_report("no assistant messages in current turn");
    }
    if (total_tokens(summary.totals) == 0) {
        return nothing_to_report("no tokens used");
    }

    HookOutcome outcome;
    outcome.status = HookStatus::Reported;
    outcome.report = build_report(summary);
    spdlog::info("turn cost {} ({} in / {} out)", outcome.report.cost_display,
                 outcome.report.input_tokens, outcome.report.output_tokens);
    return outcome;
}

} // namespace

HookOutcome process_hook(const nlohmann::json& payload, const HookOptions& options) {
    auto input = validate_hook_input(payload);
    if (!input.ok) {
        return failed(input_error_to_string(input.error), input.message);
    }
    return process_transcript_path(input.transcript_path, options);
}

HookOutcome process_hook_text(const std::string& payload_text, const HookOptions& options) {
    auto input = parse_hook_input(payload_text);
    if (!input.ok) {
        return failed(input_error_to_string(input.error), input.message);
    }
    return process_transcript_path(input.transcript_path, options);
}

} // namespace worthit
