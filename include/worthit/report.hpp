#pragma once

#include "worthit/transcript.hpp"
#include "worthit/types.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace worthit {

// ============================================================================
// Usage Report
// ============================================================================

struct UsageReport {
    std::uint64_t input_tokens = 0;   // input + cache read + cache write
    std::uint64_t output_tokens = 0;
    double cost = 0.0;
    std::string cost_display;         // format_cost(cost)
    std::string model_display;        // sanitized display name
};

// Price a turn summary with the rates of its model.
UsageReport build_report(const TranscriptSummary& summary);

// ASCII unit separator between record fields.
inline constexpr char kFieldSeparator = '\x1F';

// "<in>\x1F<out>\x1F<cost>\x1F<model>"
std::string render_fields(const UsageReport& report);

// "<model>: In: <in> / Out: <out> / Cost: <cost>"
std::string render_status_line(const UsageReport& report);

std::string render_report(const UsageReport& report, OutputFormat format);

nlohmann::json report_to_json(const UsageReport& report);

} // namespace worthit
