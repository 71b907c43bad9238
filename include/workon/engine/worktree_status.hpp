#pragma once

#include <workon/git.hpp>
#include <workon/result.hpp>
#include <optional>
#include <string>

namespace workon {

// Point-in-time status of one worktree. Recomputed on every read.
struct WorktreeStatus {
    bool is_detached = false;
    bool is_dirty = false;              // tracked changes, staged or unstaged
    bool has_unpushed_commits = false;  // also true when nothing tracks the branch
    bool is_merged = false;             // branch tip reachable from the base branch
    bool is_behind = false;             // upstream has commits the branch lacks
    bool upstream_gone = false;         // upstream configured, tracking ref deleted
    bool branch_missing = false;        // HEAD names a branch whose ref is gone
};

class WorktreeDescriptor {
public:
    WorktreeDescriptor(GitBackend& git, WorktreeEntry entry);

    const WorktreeEntry& entry() const { return entry_; }
    const std::optional<std::string>& branch() const { return entry_.branch; }

    // Pure read. `base_branch` is the branch merges are measured against;
    // without one, nothing counts as merged.
    Result<WorktreeStatus> describe(const std::optional<std::string>& base_branch) const;

private:
    GitBackend& git_;
    WorktreeEntry entry_;

    Status describe_branch(const std::string& branch,
                           const std::optional<std::string>& base_branch,
                           WorktreeStatus& st) const;
};

} // namespace workon
