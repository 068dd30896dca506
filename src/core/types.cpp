#include "worthit/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace worthit {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<OutputFormat> parse_output_format(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "fields") return OutputFormat::Fields;
    if (lower == "status") return OutputFormat::Status;
    return std::nullopt;
}

} // namespace worthit
