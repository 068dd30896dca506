#include "worthit/sanitize.hpp"

namespace worthit {

std::string sanitize_output(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\n':
            case '\r':
                out.push_back(' ');
                break;
            case '`':
            case '$':
                break;
            case '|':
                out.push_back('/');
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

std::string sanitize_output(const std::optional<std::string>& text) {
    if (!text) {
        return {};
    }
    return sanitize_output(*text);
}

std::string sanitize_output(const char* text) {
    if (text == nullptr) {
        return {};
    }
    return sanitize_output(std::string(text));
}

bool is_output_safe(const std::string& text) {
    return text.find_first_of("\n\r`$|") == std::string::npos;
}

} // namespace worthit
