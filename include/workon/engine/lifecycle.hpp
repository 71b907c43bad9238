#pragma once

#include <workon/copy.hpp>
#include <workon/engine/config_resolver.hpp>
#include <workon/engine/name_resolver.hpp>
#include <workon/engine/prune.hpp>
#include <workon/engine/worktree_status.hpp>
#include <workon/git.hpp>
#include <workon/hooks.hpp>
#include <workon/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace workon {

struct CreateOptions {
    std::optional<std::string> base;   // --base
    bool orphan = false;
    bool detach = false;
    bool run_hooks = true;
};

struct CreateResult {
    NameResolution resolution;
    std::optional<std::string> base_branch;
    std::vector<std::string> copied_files;
    std::vector<HookOutcome> hooks;
    std::vector<std::string> warnings;  // copy and hook failures
};

struct PruneOptions {
    PruneSelector selector;
    bool allow_dirty = false;
    bool allow_unpushed = false;
    bool force = false;
    bool dry_run = false;
};

struct PruneReport {
    PrunePlan plan;
    std::vector<RemovalResult> results;

    size_t failures() const;
};

// Filters combine with AND. `dirty` and `clean` exclude each other.
struct ListFilter {
    bool dirty = false;
    bool clean = false;
    bool ahead = false;
    bool behind = false;
    bool gone = false;
};

struct WorktreeSummary {
    std::string name;   // path relative to the worktree root
    WorktreeEntry entry;
    WorktreeStatus status;
};

struct MoveOptions {
    bool force = false;     // skip the protection and safety checks
    bool dry_run = false;
};

struct MoveResult {
    std::string from_branch;
    std::string to_branch;
    std::filesystem::path from_path;
    std::filesystem::path to_path;
    bool dry_run = false;
};

// Sequences name resolution, status, planning and the side-effecting
// collaborators for one command invocation.
class Lifecycle {
public:
    Lifecycle(GitBackend& git, const ConfigResolver& config,
              HookRunner& hooks, CopyEngine& copier);

    // Parent directory of the shared git directory.
    Result<std::filesystem::path> worktrees_root();

    // workon.defaultBranch, else init.defaultBranch when that branch exists,
    // else main, else master.
    Result<std::optional<std::string>> default_base_branch();

    // Fatal errors leave the repository untouched. Once the worktree exists,
    // copy and hook failures only add warnings.
    Result<CreateResult> create_worktree(const std::string& token,
                                         const CreateOptions& opts);

    // A dry run returns the plan without removing anything.
    Result<PruneReport> prune_worktrees(const PruneOptions& opts);

    Result<std::vector<WorktreeSummary>> list_worktrees(const ListFilter& filter);

    // Rename a worktree together with its branch. `from` names the worktree
    // by directory, branch or absolute path; `to` becomes both the new branch
    // and the new directory under the root. A refused or failed move leaves
    // branch and directory as they were.
    Result<MoveResult> move_worktree(const std::string& from, const std::string& to,
                                     const MoveOptions& opts);

    // Registered worktree whose directory contains `dir`.
    Result<WorktreeEntry> worktree_containing(const std::filesystem::path& dir);

private:
    GitBackend& git_;
    const ConfigResolver& config_;
    HookRunner& hooks_;
    CopyEngine& copier_;

    Result<std::vector<WorktreeSummary>> describe_all(
        const std::filesystem::path& root,
        const std::optional<std::string>& base_branch);

    Result<WorktreeSpec> creation_spec(const NameResolution& res,
                                       const std::optional<std::string>& base);
    Result<WorktreeSpec> pr_spec(const std::string& branch, unsigned number,
                                 std::string& remote_out);
    Result<std::optional<std::filesystem::path>> copy_source(
        const std::filesystem::path& root,
        const std::optional<std::string>& base);
};

// Worktree name for display: the path relative to `root`, or the absolute
// path when the worktree lives elsewhere.
std::string worktree_display_name(const std::filesystem::path& root,
                                  const std::filesystem::path& path);

} // namespace workon
