#include <workon/engine/prune.hpp>
#include <workon/engine/protected.hpp>
#include <workon/log.hpp>

#include <algorithm>

namespace workon {

const char* selector_name(PruneSelector::Kind kind) {
    switch (kind) {
        case PruneSelector::Kind::Names:  return "names";
        case PruneSelector::Kind::All:    return "all";
        case PruneSelector::Kind::Stale:  return "stale";
        case PruneSelector::Kind::Gone:   return "gone";
        case PruneSelector::Kind::Merged: return "merged";
    }
    return "unknown";
}

const char* unsafe_reason_text(UnsafeReason reason) {
    switch (reason) {
        case UnsafeReason::Dirty:            return "dirty";
        case UnsafeReason::Unpushed:         return "unpushed";
        case UnsafeReason::DirtyAndUnpushed: return "dirty+unpushed";
    }
    return "unknown";
}

static bool name_matches(const std::string& wanted, const PruneCandidate& c) {
    if (wanted == c.name) return true;
    if (c.entry.branch && wanted == *c.entry.branch) return true;
    return wanted == c.entry.path.string();
}

bool selector_matches(const PruneSelector& selector, const PruneCandidate& c) {
    if (c.entry.bare) return false;

    switch (selector.kind) {
        case PruneSelector::Kind::Names:
            return std::any_of(selector.names.begin(), selector.names.end(),
                               [&](const std::string& n) { return name_matches(n, c); });
        case PruneSelector::Kind::All:
            return true;
        case PruneSelector::Kind::Stale:
            return c.status.branch_missing;
        case PruneSelector::Kind::Gone:
            return c.status.upstream_gone;
        case PruneSelector::Kind::Merged:
            return !c.status.is_detached && c.status.is_merged;
    }
    return false;
}

static PruneItem item_of(const PruneCandidate& c) {
    PruneItem item;
    item.name = c.name;
    item.path = c.entry.path;
    item.branch = c.entry.branch;
    item.dirty = c.status.is_dirty;
    return item;
}

PrunePlan plan_prune(const std::vector<PruneCandidate>& candidates,
                     const PruneSelector& selector,
                     const PrunePolicy& policy) {
    PrunePlan plan;
    plan.dry_run = policy.dry_run;
    ProtectedBranchMatcher matcher(policy.protected_patterns);

    for (const auto& c : candidates) {
        if (!selector_matches(selector, c)) continue;

        PruneItem item = item_of(c);

        if (policy.force) {
            plan.to_remove.push_back(std::move(item));
            continue;
        }

        if (c.entry.branch) {
            const std::string& branch = *c.entry.branch;
            if (const std::string* pattern = matcher.matching_pattern(branch)) {
                log::debug("'%s': protected by pattern '%s'", branch.c_str(), pattern->c_str());
                plan.skipped_protected.push_back({std::move(item), *pattern});
                continue;
            }
            if (policy.default_branch && branch == *policy.default_branch) {
                log::debug("'%s': default branch", branch.c_str());
                plan.skipped_protected.push_back({std::move(item), "default branch"});
                continue;
            }
        }

        const bool dirty = c.status.is_dirty && !policy.allow_dirty;
        const bool unpushed = c.status.has_unpushed_commits && !policy.allow_unpushed;
        if (dirty || unpushed) {
            UnsafeReason reason = dirty && unpushed ? UnsafeReason::DirtyAndUnpushed
                                : dirty             ? UnsafeReason::Dirty
                                                    : UnsafeReason::Unpushed;
            log::debug("'%s': unsafe (%s)", c.name.c_str(), unsafe_reason_text(reason));
            plan.skipped_unsafe.push_back({std::move(item), reason});
            continue;
        }

        plan.to_remove.push_back(std::move(item));
    }

    if (selector.kind == PruneSelector::Kind::Names) {
        for (const auto& n : selector.names) {
            bool found = std::any_of(candidates.begin(), candidates.end(),
                                     [&](const PruneCandidate& c) {
                                         return !c.entry.bare && name_matches(n, c);
                                     });
            if (!found) plan.unmatched_names.push_back(n);
        }
    }

    return plan;
}

std::vector<RemovalResult> execute_plan(const PrunePlan& plan, GitBackend& git) {
    std::vector<RemovalResult> results;
    if (plan.dry_run) return results;

    results.reserve(plan.to_remove.size());
    for (const auto& item : plan.to_remove) {
        RemovalResult r;
        r.item = item;

        // Only items that passed the safety gate while dirty need --force.
        auto st = git.remove_worktree(item.path, item.dirty);
        if (st.is_ok()) {
            r.removed = true;
            log::info("pruned %s", item.path.c_str());
        } else {
            r.error = st.error().message;
            log::error("could not prune %s: %s", item.path.c_str(), r.error.c_str());
        }
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace workon
