#pragma once

#include <workon/engine/worktree_status.hpp>
#include <workon/git.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace workon {

struct PruneSelector {
    enum class Kind {
        Names,   // explicit worktree or branch names
        All,     // every worktree
        Stale,   // local branch deleted
        Gone,    // remote-tracking branch deleted
        Merged   // branch merged into the base (or merged_target)
    };

    Kind kind = Kind::Stale;
    std::vector<std::string> names;
    std::optional<std::string> merged_target;
};

const char* selector_name(PruneSelector::Kind kind);

// A worktree with its status, in registry enumeration order.
struct PruneCandidate {
    std::string name;   // path relative to the worktree root
    WorktreeEntry entry;
    WorktreeStatus status;
};

struct PruneItem {
    std::string name;
    std::filesystem::path path;
    std::optional<std::string> branch;
    bool dirty = false;
};

enum class UnsafeReason { Dirty, Unpushed, DirtyAndUnpushed };

const char* unsafe_reason_text(UnsafeReason reason);

struct SkippedProtected {
    PruneItem item;
    std::string rule;   // matching pattern, or the default branch note
};

struct SkippedUnsafe {
    PruneItem item;
    UnsafeReason reason;
};

struct PrunePolicy {
    std::vector<std::string> protected_patterns;
    std::optional<std::string> default_branch;  // implicitly protected
    bool allow_dirty = false;
    bool allow_unpushed = false;
    bool force = false;   // skip the protection and safety gates
    bool dry_run = false;
};

// Disjoint partitions of the selected worktrees.
struct PrunePlan {
    std::vector<PruneItem> to_remove;
    std::vector<SkippedProtected> skipped_protected;
    std::vector<SkippedUnsafe> skipped_unsafe;
    std::vector<std::string> unmatched_names;
    bool dry_run = false;
};

struct RemovalResult {
    PruneItem item;
    bool removed = false;
    std::string error;
};

bool selector_matches(const PruneSelector& selector, const PruneCandidate& c);

// Selection, protection and safety gates, evaluated per candidate in that
// order; the first failing gate decides. Output order follows input order.
PrunePlan plan_prune(const std::vector<PruneCandidate>& candidates,
                     const PruneSelector& selector,
                     const PrunePolicy& policy);

// Remove every to_remove item in order. A failure is recorded on its item
// and the batch continues. A dry-run plan removes nothing.
std::vector<RemovalResult> execute_plan(const PrunePlan& plan, GitBackend& git);

} // namespace workon
