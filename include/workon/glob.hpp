#pragma once

#include <workon/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace workon {

// Match a glob pattern against a relative path (both normalized to '/').
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// Expand a pattern against the files under root_dir, returning sorted paths
// relative to root_dir. Directories named in `prune_dirs` (e.g. ".git") are
// not descended into, and a `.git` file at any level is never returned.
Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const std::filesystem::path& root_dir,
    const std::vector<std::string>& prune_dirs = {".git"});

} // namespace workon
