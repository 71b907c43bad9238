#include <workon/engine/worktree_status.hpp>
#include <workon/log.hpp>

namespace workon {

WorktreeDescriptor::WorktreeDescriptor(GitBackend& git, WorktreeEntry entry)
    : git_(git), entry_(std::move(entry)) {}

Result<WorktreeStatus> WorktreeDescriptor::describe(
    const std::optional<std::string>& base_branch) const {
    WorktreeStatus st;
    st.is_detached = entry_.is_detached();

    // A prunable entry has lost its directory: nothing on disk can be dirty.
    if (!entry_.prunable) {
        auto dirty = git_.is_dirty(entry_.path);
        if (dirty.is_err()) return std::move(dirty).error();
        st.is_dirty = dirty.value();
    }

    if (st.is_detached) {
        // No branch to push; the work is safe only if some ref still holds HEAD.
        if (!entry_.head.empty()) {
            auto held = git_.reachable_from_any_ref(entry_.head);
            if (held.is_err()) return std::move(held).error();
            st.has_unpushed_commits = !held.value();
        }
        return Result<WorktreeStatus>::ok(st);
    }

    if (entry_.branch) {
        WORKON_TRY(describe_branch(*entry_.branch, base_branch, st));
    }
    return Result<WorktreeStatus>::ok(st);
}

Status WorktreeDescriptor::describe_branch(const std::string& branch,
                                           const std::optional<std::string>& base_branch,
                                           WorktreeStatus& st) const {
    const std::string local_ref = "refs/heads/" + branch;

    auto exists = git_.ref_exists(local_ref);
    if (exists.is_err()) return std::move(exists).error();
    if (!exists.value()) {
        st.branch_missing = true;
        return ok_status();
    }

    auto upstream = git_.upstream_of(branch);
    if (upstream.is_err()) return std::move(upstream).error();

    if (!upstream.value()) {
        // Nothing confirms the work is backed up anywhere.
        st.has_unpushed_commits = true;
    } else {
        const auto& up = *upstream.value();
        auto tracked = git_.ref_exists(up.tracking_ref);
        if (tracked.is_err()) return std::move(tracked).error();

        if (!tracked.value()) {
            st.upstream_gone = true;
            st.has_unpushed_commits = true;
        } else {
            auto ab = git_.ahead_behind(local_ref, up.tracking_ref);
            if (ab.is_err()) return std::move(ab).error();
            st.has_unpushed_commits = ab.value().ahead > 0;
            st.is_behind = ab.value().behind > 0;
        }
    }

    if (base_branch && *base_branch != branch) {
        const std::string base_ref = "refs/heads/" + *base_branch;
        auto base_exists = git_.ref_exists(base_ref);
        if (base_exists.is_err()) return std::move(base_exists).error();
        if (base_exists.value()) {
            auto merged = git_.is_ancestor(local_ref, base_ref);
            if (merged.is_err()) return std::move(merged).error();
            st.is_merged = merged.value();
        } else {
            log::debug("base branch '%s' does not exist; '%s' not treated as merged",
                       base_branch->c_str(), branch.c_str());
        }
    }

    return ok_status();
}

} // namespace workon
