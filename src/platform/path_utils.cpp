#include "worthit/path_utils.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace worthit {

namespace fs = std::filesystem;

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

PathResult fail(PathError error, std::string message) {
    spdlog::warn("transcript path rejected: {}", path_error_to_string(error));
    PathResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

// Expand a leading "~" or "~/" using HOME. Other forms are left alone.
std::string expand_home(const std::string& p) {
    if (p.empty() || p[0] != '~') {
        return p;
    }
    if (p.size() > 1 && p[1] != '/') {
        return p;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return p;
    }
    return std::string(home) + p.substr(1);
}

// Absolute, symlink-resolved, dot-segment-collapsed form of p.
// Trailing components that do not exist are appended lexically.
fs::path resolve(const fs::path& p, std::error_code& ec) {
    fs::path abs = fs::absolute(p, ec);
    if (ec) return {};
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) return {};
    return canon.lexically_normal();
}

} // namespace

bool contains_forbidden_pattern(const std::string& raw) {
    static const std::array<const char*, 4> patterns = {"..", "~", "$", "`"};
    for (const char* pattern : patterns) {
        if (raw.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool is_within_root(const fs::path& root, const fs::path& candidate) {
    auto lex_root = root.lexically_normal();
    auto lex_cand = candidate.lexically_normal();
    auto root_it = lex_root.begin();
    auto cand_it = lex_cand.begin();
    for (; root_it != lex_root.end(); ++root_it) {
        // A trailing separator shows up as an empty final element
        if (root_it->empty()) continue;
        if (cand_it == lex_cand.end() || *root_it != *cand_it) {
            return false;
        }
        ++cand_it;
    }
    return true;
}

PathResult sanitize_transcript_path(const std::string& raw, const std::string& allowed_root) {
    if (raw.empty()) {
        return fail(PathError::ResolveFailed, "transcript path is empty");
    }
    if (contains_nul(raw)) {
        return fail(PathError::ContainsNul, "transcript path contains a NUL byte");
    }
    if (contains_forbidden_pattern(raw)) {
        return fail(PathError::ForbiddenPattern,
                    "transcript path contains a forbidden pattern (.., ~, $ or `)");
    }

    std::error_code ec;
    fs::path resolved = resolve(fs::path(expand_home(raw)), ec);
    if (ec) {
        return fail(PathError::ResolveFailed,
                    "cannot resolve transcript path: " + ec.message());
    }

    if (!allowed_root.empty()) {
        fs::path root = resolve(fs::path(expand_home(allowed_root)), ec);
        if (ec) {
            return fail(PathError::ResolveFailed,
                        "cannot resolve transcript root: " + ec.message());
        }
        if (!is_within_root(root, resolved)) {
            return fail(PathError::EscapesRoot,
                        "transcript path is outside the allowed root");
        }
    }

    auto st = fs::status(resolved, ec);
    if (st.type() != fs::file_type::not_found) {
        if (ec) {
            return fail(PathError::ResolveFailed,
                        "cannot stat transcript path: " + ec.message());
        }
        if (!fs::is_regular_file(st)) {
            return fail(PathError::NotRegularFile, "transcript path is not a regular file");
        }
    }

    PathResult result;
    result.ok = true;
    result.path = resolved.string();
    return result;
}

} // namespace worthit
