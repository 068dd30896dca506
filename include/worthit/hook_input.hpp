#pragma once

#include "worthit/types.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace worthit {

// Key under which the host passes the transcript location.
inline constexpr const char* kTranscriptPathKey = "transcript_path";

struct HookInputResult {
    bool ok = false;
    InputError error = InputError::None;
    std::string message;
    std::string transcript_path;  // raw, unmodified, when ok
};

// Validate an already-decoded hook payload.
// - NotAnObject if the payload is not a JSON object
// - MissingField if transcript_path is absent or falsy (null, false, 0, "", [], {})
// - WrongType if transcript_path is truthy but not a string
// No filesystem access and no normalization happens here.
HookInputResult validate_hook_input(const nlohmann::json& payload);

// Decode serialized payload text, then validate it.
// MalformedJson if the text does not parse.
HookInputResult parse_hook_input(const std::string& text);

} // namespace worthit
