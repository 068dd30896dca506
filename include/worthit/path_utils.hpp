#pragma once

#include "worthit/types.hpp"

#include <filesystem>
#include <string>

namespace worthit {

struct PathResult {
    bool ok = false;
    std::string path;  // canonical absolute path when ok
    PathError error = PathError::None;
    std::string message;
};

// True if the raw string contains "..", "~", "$" or "`" anywhere.
// Substring match, not segment match.
bool contains_forbidden_pattern(const std::string& raw);

// Component-wise containment check on lexically normalized paths.
// Does not touch the filesystem.
bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Sanitize an attacker-influenced transcript path.
// - Rejects NUL bytes and the deny-listed patterns (ForbiddenPattern)
// - Resolves to a canonical absolute path (symlinks followed)
// - When allowed_root is non-empty, rejects results outside it (EscapesRoot)
// - If something exists at the result it must be a regular file (NotRegularFile)
// - Filesystem errors are reported as ResolveFailed
// A path that does not exist yet is accepted.
PathResult sanitize_transcript_path(const std::string& raw,
                                    const std::string& allowed_root = "");

} // namespace worthit
