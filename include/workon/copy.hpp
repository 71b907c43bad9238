#pragma once

#include <workon/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace workon {

// Copies files between sibling worktrees. Returned paths are relative to
// the source directory, in copy order.
class CopyEngine {
public:
    virtual ~CopyEngine() = default;
    virtual Result<std::vector<std::string>> copy_matching(
        const std::filesystem::path& source_dir,
        const std::filesystem::path& dest_dir,
        const std::vector<std::string>& include_patterns,
        const std::vector<std::string>& exclude_patterns,
        bool overwrite) = 0;
};

// Glob-driven copy using copy-on-write clones where the filesystem supports
// them (`cp --reflink=auto`), plain copies otherwise. `.git` is never copied.
// A pattern ending in '/' selects everything below that directory.
class FileCopyEngine : public CopyEngine {
public:
    Result<std::vector<std::string>> copy_matching(
        const std::filesystem::path& source_dir,
        const std::filesystem::path& dest_dir,
        const std::vector<std::string>& include_patterns,
        const std::vector<std::string>& exclude_patterns,
        bool overwrite) override;
};

} // namespace workon
