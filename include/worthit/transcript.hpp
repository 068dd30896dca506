#pragma once

#include "worthit/types.hpp"

#include <cstddef>
#include <istream>
#include <string>

namespace worthit {

// ============================================================================
// Transcript Summary
// ============================================================================

// Usage of the current turn: every assistant entry after the most recent
// user entry.
struct TranscriptSummary {
    UsageTotals totals;
    std::string model;                   // latest assistant model, "unknown" if unset
    std::size_t assistant_messages = 0;  // entries that contributed usage
    std::size_t skipped_lines = 0;       // lines that were not valid JSON objects
};

struct TranscriptResult {
    bool ok = false;
    std::string error;
    TranscriptSummary summary;
};

// Aggregate a JSONL transcript read from a stream. Never fails; malformed
// lines are skipped and counted.
TranscriptSummary summarize_transcript(std::istream& in);

// Open and aggregate a transcript file. The path is expected to be sanitized
// already. Fails only if the file cannot be opened or read.
TranscriptResult read_transcript(const std::string& path);

} // namespace worthit
