#pragma once

#include <workon/process.hpp>
#include <workon/result.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace workon {

// One entry of git's worktree registry (`git worktree list --porcelain`).
struct WorktreeEntry {
    std::filesystem::path path;
    std::string head;                   // commit id, empty when unborn or bare
    std::optional<std::string> branch;  // short branch name, nullopt when detached
    bool bare = false;
    bool locked = false;
    bool prunable = false;              // admin entry whose directory is gone

    bool is_detached() const { return !bare && !branch; }
};

struct AheadBehind {
    size_t ahead = 0;
    size_t behind = 0;
};

// Configured upstream of a local branch (branch.<name>.remote / .merge).
struct Upstream {
    std::string remote;        // remote name, "." for a local upstream
    std::string merge_ref;     // e.g. refs/heads/feature or refs/pull/7/head
    std::string tracking_ref;  // e.g. refs/remotes/origin/feature
};

// How the backend should populate a new worktree.
struct WorktreeSpec {
    enum class Kind {
        CheckoutBranch,  // existing local branch
        TrackRemote,     // new local branch tracking start_point
        NewBranch,       // new local branch from start_point (HEAD when empty)
        Orphan,          // new branch without history, seeded with one empty commit
        Detached         // no branch, HEAD at start_point (HEAD when empty)
    };

    Kind kind = Kind::NewBranch;
    std::string branch;
    std::string start_point;
};

// Everything the engine needs from git. The engine never touches repository
// state except through this interface.
class GitBackend {
public:
    virtual ~GitBackend() = default;

    virtual Result<std::vector<WorktreeEntry>> list_worktrees() = 0;
    virtual Status create_worktree(const std::filesystem::path& path,
                                   const WorktreeSpec& spec) = 0;
    virtual Status remove_worktree(const std::filesystem::path& path, bool force) = 0;
    // Relocate a registered worktree; missing parent directories are created.
    virtual Status move_worktree(const std::filesystem::path& from,
                                 const std::filesystem::path& to) = 0;
    // Rename a local branch along with its config section and any HEAD
    // pointing at it.
    virtual Status rename_branch(const std::string& from, const std::string& to) = 0;

    virtual Result<std::optional<std::string>> current_branch_of(
        const std::filesystem::path& worktree) = 0;
    // Commit checked out in `worktree`, empty when the branch is unborn.
    virtual Result<std::string> head_commit_of(const std::filesystem::path& worktree) = 0;
    // Tracked changes only, staged or unstaged.
    virtual Result<bool> is_dirty(const std::filesystem::path& worktree) = 0;
    virtual Result<AheadBehind> ahead_behind(const std::string& local_ref,
                                             const std::string& remote_ref) = 0;
    // True when every commit reachable from `ancestor` is reachable from `descendant`.
    virtual Result<bool> is_ancestor(const std::string& ancestor,
                                     const std::string& descendant) = 0;
    virtual Status fetch_ref(const std::string& remote, const std::string& refspec) = 0;

    virtual Result<bool> ref_exists(const std::string& full_ref) = 0;
    virtual Result<std::optional<Upstream>> upstream_of(const std::string& branch) = 0;
    virtual Status set_branch_upstream(const std::string& branch,
                                       const std::string& remote,
                                       const std::string& merge_ref) = 0;
    virtual Result<std::vector<std::string>> remotes() = 0;
    // True when `commit` is contained in some local branch or remote-tracking ref.
    virtual Result<bool> reachable_from_any_ref(const std::string& commit) = 0;

    // Shared git directory (the bare repository).
    virtual Result<std::filesystem::path> common_dir() = 0;
    // Branch HEAD of the shared repository points at, nullopt when detached.
    virtual Result<std::optional<std::string>> head_branch() = 0;
};

// Parse `git worktree list --porcelain` output.
Result<std::vector<WorktreeEntry>> parse_worktree_list(const std::string& porcelain);

// Remote-tracking ref that mirrors `merge_ref` of `remote` under the default
// fetch refspec (refs/heads/x -> refs/remotes/<remote>/x).
std::string tracking_ref_for(const std::string& remote, const std::string& merge_ref);

// GitBackend over the git executable.
class GitCli : public GitBackend {
public:
    explicit GitCli(std::filesystem::path repo_dir);

    Result<std::string> check_version();

    Result<std::vector<WorktreeEntry>> list_worktrees() override;
    Status create_worktree(const std::filesystem::path& path,
                           const WorktreeSpec& spec) override;
    Status remove_worktree(const std::filesystem::path& path, bool force) override;
    Status move_worktree(const std::filesystem::path& from,
                         const std::filesystem::path& to) override;
    Status rename_branch(const std::string& from, const std::string& to) override;

    Result<std::optional<std::string>> current_branch_of(
        const std::filesystem::path& worktree) override;
    Result<std::string> head_commit_of(const std::filesystem::path& worktree) override;
    Result<bool> is_dirty(const std::filesystem::path& worktree) override;
    Result<AheadBehind> ahead_behind(const std::string& local_ref,
                                     const std::string& remote_ref) override;
    Result<bool> is_ancestor(const std::string& ancestor,
                             const std::string& descendant) override;
    Status fetch_ref(const std::string& remote, const std::string& refspec) override;

    Result<bool> ref_exists(const std::string& full_ref) override;
    Result<std::optional<Upstream>> upstream_of(const std::string& branch) override;
    Status set_branch_upstream(const std::string& branch,
                               const std::string& remote,
                               const std::string& merge_ref) override;
    Result<std::vector<std::string>> remotes() override;
    Result<bool> reachable_from_any_ref(const std::string& commit) override;

    Result<std::filesystem::path> common_dir() override;
    Result<std::optional<std::string>> head_branch() override;

    const std::filesystem::path& repo_dir() const { return repo_dir_; }
    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
    std::filesystem::path repo_dir_;
    int timeout_seconds_ = 120;

    Result<CommandResult> git(const std::filesystem::path& dir,
                       const std::vector<std::string>& args);
    Status orphan_seed(const std::filesystem::path& path, const std::string& branch);
};

} // namespace workon
