#include "worthit/report.hpp"
#include "worthit/pricing.hpp"
#include "worthit/sanitize.hpp"

namespace worthit {

UsageReport build_report(const TranscriptSummary& summary) {
    const auto& totals = summary.totals;

    UsageReport report;
    report.input_tokens = totals.input + totals.cache_read + totals.cache_write;
    report.output_tokens = totals.output;
    report.cost = calculate_cost(totals, get_pricing(summary.model));
    report.cost_display = format_cost(report.cost);
    report.model_display = sanitize_output(model_display_name(summary.model));
    return report;
}

// The cost display comes from format_cost and is the only field allowed to
// carry a '$'. Everything else goes through sanitize_output.
std::string render_fields(const UsageReport& report) {
    std::string out;
    out += sanitize_output(format_token_count(report.input_tokens));
    out += kFieldSeparator;
    out += sanitize_output(format_token_count(report.output_tokens));
    out += kFieldSeparator;
    out += report.cost_display;
    out += kFieldSeparator;
    out += sanitize_output(report.model_display);
    return out;
}

std::string render_status_line(const UsageReport& report) {
    return sanitize_output(report.model_display) +
           ": In: " + sanitize_output(format_token_count(report.input_tokens)) +
           " / Out: " + sanitize_output(format_token_count(report.output_tokens)) +
           " / Cost: " + report.cost_display;
}

std::string render_report(const UsageReport& report, OutputFormat format) {
    switch (format) {
        case OutputFormat::Status: return render_status_line(report);
        case OutputFormat::Fields: return render_fields(report);
    }
    return render_fields(report);
}

nlohmann::json report_to_json(const UsageReport& report) {
    nlohmann::json j;
    j["ok"] = true;
    j["input_tokens"] = report.input_tokens;
    j["output_tokens"] = report.output_tokens;
    j["cost"] = report.cost;
    j["cost_display"] = report.cost_display;
    j["model"] = sanitize_output(report.model_display);
    return j;
}

} // namespace worthit
