#pragma once

#include <workon/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace workon {

// A syntactically valid local branch name (git check-ref-format --branch rules).
// '/' separates namespace levels, which become nested directories on disk.
struct BranchName {
    static Result<BranchName> parse(const std::string& raw);

    const std::string& str() const;
    const std::vector<std::string>& segments() const;

    // Directory path relative to the worktree root, one level per namespace segment.
    std::filesystem::path relative_path() const;

    bool operator==(const BranchName& o) const;
    bool operator!=(const BranchName& o) const;

private:
    std::string raw_;
    std::vector<std::string> segments_;
};

} // namespace workon
