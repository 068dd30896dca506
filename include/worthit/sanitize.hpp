#pragma once

#include <optional>
#include <string>

namespace worthit {

// Make a string safe to interpolate into a shell-facing status line.
// - "\n" and "\r" become a single space
// - "`" and "$" are removed
// - "|" becomes "/"
// Everything else is left untouched. Applying it twice is a no-op.
std::string sanitize_output(const std::string& text);

// Absent input (nullopt or a null pointer) sanitizes to the empty string.
std::string sanitize_output(const std::optional<std::string>& text);
std::string sanitize_output(const char* text);

// True if text contains none of the characters sanitize_output rewrites.
bool is_output_safe(const std::string& text);

} // namespace worthit
