#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace worthit {

// ============================================================================
// Pricing and Usage
// ============================================================================

// Per-token USD rates for one model family.
struct PricingEntry {
    double input = 0.0;
    double output = 0.0;
    double cache_write = 0.0;
    double cache_read = 0.0;
};

inline bool operator==(const PricingEntry& a, const PricingEntry& b) {
    return a.input == b.input && a.output == b.output &&
           a.cache_write == b.cache_write && a.cache_read == b.cache_read;
}

inline bool operator!=(const PricingEntry& a, const PricingEntry& b) {
    return !(a == b);
}

// Token counts for one turn, as summed by the transcript reader.
struct UsageTotals {
    std::uint64_t input = 0;
    std::uint64_t output = 0;
    std::uint64_t cache_write = 0;
    std::uint64_t cache_read = 0;
};

inline std::uint64_t total_tokens(const UsageTotals& t) {
    return t.input + t.output + t.cache_write + t.cache_read;
}

enum class ModelFamily {
    Opus,
    Sonnet,
    Haiku,
};

// ============================================================================
// Hook Payload Errors
// ============================================================================

enum class InputError {
    None,
    MalformedJson,   // payload text is not JSON at all
    NotAnObject,     // structural: top level is not a key-value mapping
    MissingField,    // transcript_path absent or falsy
    WrongType,       // transcript_path present but not a string
};

inline const char* input_error_to_string(InputError e) {
    switch (e) {
        case InputError::None: return "none";
        case InputError::MalformedJson: return "malformed_payload";
        case InputError::NotAnObject: return "structural_error";
        case InputError::MissingField: return "missing_field";
        case InputError::WrongType: return "type_error";
        default: return "unknown";
    }
}

// ============================================================================
// Path Errors
// ============================================================================

enum class PathError {
    None,
    ContainsNul,
    ForbiddenPattern,  // "..", "~", "$" or "`" found in the raw string
    EscapesRoot,       // canonical path lies outside the allowed root
    NotRegularFile,    // something exists there but it is not a regular file
    ResolveFailed,     // filesystem error while canonicalizing or stat'ing
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "contains_nul";
        case PathError::ForbiddenPattern: return "forbidden_pattern";
        case PathError::EscapesRoot: return "escapes_root";
        case PathError::NotRegularFile: return "not_regular_file";
        case PathError::ResolveFailed: return "resolve_failed";
        default: return "unknown";
    }
}

// Coarse category reported to the host for a path failure.
inline const char* path_error_category(PathError e) {
    switch (e) {
        case PathError::ContainsNul:
        case PathError::ForbiddenPattern:
        case PathError::EscapesRoot:
            return "path_security";
        case PathError::NotRegularFile:
            return "path_kind";
        case PathError::ResolveFailed:
            return "path_resolve";
        default:
            return "none";
    }
}

// ============================================================================
// Output Format
// ============================================================================

enum class OutputFormat {
    Fields,  // unit-separated record for shell wrappers
    Status,  // single human-readable status line
};

inline const char* output_format_to_string(OutputFormat f) {
    switch (f) {
        case OutputFormat::Fields: return "fields";
        case OutputFormat::Status: return "status";
        default: return "fields";
    }
}

std::optional<OutputFormat> parse_output_format(const std::string& s);

} // namespace worthit
