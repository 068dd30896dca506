#pragma once

/**
 * @file hook.hpp
 * @brief One hook invocation, end to end
 *
 * payload -> validate_hook_input -> sanitize_transcript_path
 *         -> read_transcript -> build_report
 *
 * The host gets either a report, nothing (no usage to show), or a failure
 * with a category and a message that never repeats the raw path.
 */

#include "worthit/report.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace worthit {

enum class HookStatus {
    Reported,
    NothingToReport,  // transcript missing, empty turn or zero tokens
    Failed,
};

struct HookOptions {
    std::string transcript_root;  // empty: no root containment
};

struct HookOutcome {
    HookStatus status = HookStatus::Failed;
    std::string error_category;  // set when Failed
    std::string message;         // set when Failed
    UsageReport report;          // set when Reported
};

HookOutcome process_hook(const nlohmann::json& payload, const HookOptions& options);

// Same as above, starting from serialized payload text.
HookOutcome process_hook_text(const std::string& payload_text, const HookOptions& options);

} // namespace worthit
