#include "worthit/hook_input.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace worthit {

namespace {

// Mirrors the host's notion of an "empty" value: null, false, zero and empty
// containers all count as not provided.
bool is_truthy(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return v.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return v.get<std::int64_t>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return v.get<std::uint64_t>() != 0;
        case nlohmann::json::value_t::number_float:
            return v.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !v.get_ref<const std::string&>().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
        case nlohmann::json::value_t::binary:
            return !v.empty();
    }
    return false;
}

HookInputResult fail(InputError error, std::string message) {
    HookInputResult result;
    result.error = error;
    result.message = std::move(message);
    spdlog::debug("hook payload rejected: {}", input_error_to_string(error));
    return result;
}

} // namespace

HookInputResult validate_hook_input(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return fail(InputError::NotAnObject, "Hook input must be a dict (JSON object)");
    }

    auto it = payload.find(kTranscriptPathKey);
    if (it == payload.end() || !is_truthy(*it)) {
        return fail(InputError::MissingField, "Missing transcript_path in hook input");
    }

    if (!it->is_string()) {
        return fail(InputError::WrongType, "transcript_path must be string");
    }

    HookInputResult result;
    result.ok = true;
    result.transcript_path = it->get<std::string>();
    return result;
}

HookInputResult parse_hook_input(const std::string& text) {
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return fail(InputError::MalformedJson,
                    std::string("Hook input is not valid JSON (byte ") +
                        std::to_string(e.byte) + ")");
    }
    return validate_hook_input(payload);
}

} // namespace worthit
