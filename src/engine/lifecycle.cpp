#include <workon/engine/lifecycle.hpp>
#include <workon/engine/protected.hpp>
#include <workon/log.hpp>

#include <algorithm>
#include <iterator>

namespace workon {

namespace fs = std::filesystem;

size_t PruneReport::failures() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [](const RemovalResult& r) { return !r.removed; }));
}

std::string worktree_display_name(const fs::path& root, const fs::path& path) {
    fs::path rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || rel == "." || *rel.begin() == "..") return path.string();
    return rel.generic_string();
}

Lifecycle::Lifecycle(GitBackend& git, const ConfigResolver& config,
                     HookRunner& hooks, CopyEngine& copier)
    : git_(git), config_(config), hooks_(hooks), copier_(copier) {}

Result<fs::path> Lifecycle::worktrees_root() {
    auto common = git_.common_dir();
    if (common.is_err()) return std::move(common).error();
    return Result<fs::path>::ok(common.value().parent_path());
}

Result<std::optional<std::string>> Lifecycle::default_base_branch() {
    using Opt = std::optional<std::string>;

    auto configured = config_.default_branch();
    if (configured.is_err()) return std::move(configured).error();
    if (configured.value()) return Result<Opt>::ok(configured.value());

    std::vector<std::string> candidates;
    auto init = config_.git_setting("init.defaultBranch");
    if (init.is_err()) return std::move(init).error();
    if (init.value() && !init.value()->empty()) candidates.push_back(*init.value());
    candidates.push_back("main");
    candidates.push_back("master");

    for (const auto& name : candidates) {
        auto exists = git_.ref_exists("refs/heads/" + name);
        if (exists.is_err()) return std::move(exists).error();
        if (exists.value()) return Result<Opt>::ok(name);
    }
    return Result<Opt>::ok(std::nullopt);
}

// ---------------------------------------------------------------------------
// create
// ---------------------------------------------------------------------------

namespace {

// Every setting creation reads, resolved up front so a bad value fails
// before anything is written.
struct CreateSettings {
    std::optional<std::string> base;
    std::string pr_format;
    bool auto_copy = false;
    std::vector<std::string> copy_patterns;
    std::vector<std::string> copy_excludes;
    std::vector<std::string> hooks;
    int hook_timeout = 300;
};

Result<CreateSettings> load_create_settings(const ConfigResolver& config,
                                            const CreateOptions& opts) {
    CreateSettings s;

    if (opts.base) {
        s.base = opts.base;
    } else {
        auto def = config.default_branch();
        if (def.is_err()) return std::move(def).error();
        s.base = def.value();
    }

    auto fmt = config.pr_format();
    if (fmt.is_err()) return std::move(fmt).error();
    s.pr_format = fmt.value();

    auto copy = config.auto_copy_untracked();
    if (copy.is_err()) return std::move(copy).error();
    s.auto_copy = copy.value();

    auto patterns = config.copy_patterns();
    if (patterns.is_err()) return std::move(patterns).error();
    s.copy_patterns = std::move(patterns).value();

    auto excludes = config.copy_excludes();
    if (excludes.is_err()) return std::move(excludes).error();
    s.copy_excludes = std::move(excludes).value();

    auto hooks = config.post_create_hooks();
    if (hooks.is_err()) return std::move(hooks).error();
    s.hooks = std::move(hooks).value();

    auto timeout = config.hook_timeout();
    if (timeout.is_err()) return std::move(timeout).error();
    s.hook_timeout = timeout.value();

    return Result<CreateSettings>::ok(std::move(s));
}

} // namespace

Result<WorktreeSpec> Lifecycle::pr_spec(const std::string& branch, unsigned number,
                                        std::string& remote_out) {
    auto remotes = git_.remotes();
    if (remotes.is_err()) return std::move(remotes).error();
    const auto& names = remotes.value();
    if (names.empty()) {
        return WorkonError{WorkonError::NotFound,
            "no remote to fetch pull request #" + std::to_string(number) + " from",
            "add one with `git remote add origin <url>`"};
    }

    std::string remote = names.front();
    for (const char* preferred : {"upstream", "origin"}) {
        if (std::find(names.begin(), names.end(), preferred) != names.end()) {
            remote = preferred;
            break;
        }
    }

    const std::string pull_ref = "refs/pull/" + std::to_string(number) + "/head";
    const std::string tracking = "refs/remotes/" + remote + "/pull/" +
                                 std::to_string(number) + "/head";

    auto fetched = git_.ref_exists(tracking);
    if (fetched.is_err()) return std::move(fetched).error();
    if (!fetched.value()) {
        log::info("fetching pull request #%u from %s", number, remote.c_str());
        WORKON_TRY(git_.fetch_ref(remote, "+" + pull_ref + ":" + tracking));
    }

    remote_out = remote;

    WorktreeSpec spec;
    spec.branch = branch;
    auto local = git_.ref_exists("refs/heads/" + branch);
    if (local.is_err()) return std::move(local).error();
    if (local.value()) {
        spec.kind = WorktreeSpec::Kind::CheckoutBranch;
    } else {
        spec.kind = WorktreeSpec::Kind::NewBranch;
        spec.start_point = tracking;
    }
    return Result<WorktreeSpec>::ok(std::move(spec));
}

Result<WorktreeSpec> Lifecycle::creation_spec(const NameResolution& res,
                                              const std::optional<std::string>& base) {
    WorktreeSpec spec;
    spec.branch = res.branch_name;

    if (std::holds_alternative<OrphanMode>(res.mode)) {
        auto taken = git_.ref_exists("refs/heads/" + res.branch_name);
        if (taken.is_err()) return std::move(taken).error();
        if (taken.value()) {
            return WorkonError{WorkonError::Resolution,
                "branch '" + res.branch_name + "' already exists; an orphan needs a new branch",
                "drop --orphan to check out the existing branch"};
        }
        spec.kind = WorktreeSpec::Kind::Orphan;
        return Result<WorktreeSpec>::ok(std::move(spec));
    }
    if (std::holds_alternative<DetachedMode>(res.mode)) {
        spec.kind = WorktreeSpec::Kind::Detached;
        spec.branch.clear();
        spec.start_point = base.value_or("");
        return Result<WorktreeSpec>::ok(std::move(spec));
    }

    auto local = git_.ref_exists("refs/heads/" + res.branch_name);
    if (local.is_err()) return std::move(local).error();
    if (local.value()) {
        spec.kind = WorktreeSpec::Kind::CheckoutBranch;
        return Result<WorktreeSpec>::ok(std::move(spec));
    }

    auto remotes = git_.remotes();
    if (remotes.is_err()) return std::move(remotes).error();
    std::vector<std::string> order = remotes.value();
    auto origin = std::find(order.begin(), order.end(), "origin");
    if (origin != order.end()) std::rotate(order.begin(), origin, origin + 1);

    for (const auto& remote : order) {
        const std::string ref = "refs/remotes/" + remote + "/" + res.branch_name;
        auto exists = git_.ref_exists(ref);
        if (exists.is_err()) return std::move(exists).error();
        if (exists.value()) {
            spec.kind = WorktreeSpec::Kind::TrackRemote;
            spec.start_point = remote + "/" + res.branch_name;
            return Result<WorktreeSpec>::ok(std::move(spec));
        }
    }

    spec.kind = WorktreeSpec::Kind::NewBranch;
    spec.start_point = base.value_or("");
    return Result<WorktreeSpec>::ok(std::move(spec));
}

Result<std::optional<fs::path>> Lifecycle::copy_source(const fs::path& root,
                                                       const std::optional<std::string>& base) {
    using Opt = std::optional<fs::path>;
    std::error_code ec;

    if (base) {
        fs::path dir = root / *base;
        if (fs::is_directory(dir, ec)) return Result<Opt>::ok(dir);
    }

    auto head = git_.head_branch();
    if (head.is_err()) return std::move(head).error();
    if (head.value()) {
        fs::path dir = root / *head.value();
        if (fs::is_directory(dir, ec)) return Result<Opt>::ok(dir);
    }
    return Result<Opt>::ok(std::nullopt);
}

Result<CreateResult> Lifecycle::create_worktree(const std::string& token,
                                                const CreateOptions& opts) {
    auto settings = load_create_settings(config_, opts);
    if (settings.is_err()) return std::move(settings).error();
    const CreateSettings& cfg = settings.value();

    auto root = worktrees_root();
    if (root.is_err()) return std::move(root).error();

    auto existing = git_.list_worktrees();
    if (existing.is_err()) return std::move(existing).error();

    ResolveOptions ropts;
    ropts.orphan = opts.orphan;
    ropts.detach = opts.detach;
    ropts.explicit_base = opts.base.has_value();
    ropts.pr_format = cfg.pr_format;

    NameResolver resolver(root.value());
    auto resolved = resolver.resolve(token, ropts, existing.value());
    if (resolved.is_err()) return std::move(resolved).error();

    CreateResult result;
    result.resolution = std::move(resolved).value();
    result.base_branch = cfg.base;
    const NameResolution& res = result.resolution;

    std::string pr_remote;
    const auto* pr = std::get_if<PrTrackingMode>(&res.mode);
    auto spec = pr ? pr_spec(res.branch_name, pr->number, pr_remote)
                   : creation_spec(res, cfg.base);
    if (spec.is_err()) return std::move(spec).error();

    log::debug("creating %s worktree '%s' at %s", mode_name(res.mode),
               res.branch_name.c_str(), res.worktree_path.c_str());
    WORKON_TRY(git_.create_worktree(res.worktree_path, spec.value()));

    auto head = git_.head_commit_of(res.worktree_path);
    if (head.is_err()) {
        log::debug("cannot read HEAD of new worktree: %s", head.error().message.c_str());
        log::info("created %s", res.worktree_path.c_str());
    } else if (head.value().empty()) {
        log::info("created %s", res.worktree_path.c_str());
    } else {
        log::info("created %s (HEAD at %.7s)", res.worktree_path.c_str(), head.value().c_str());
    }

    if (pr) {
        const std::string merge_ref = "refs/pull/" + std::to_string(pr->number) + "/head";
        auto up = git_.set_branch_upstream(res.branch_name, pr_remote, merge_ref);
        if (up.is_err()) {
            std::string w = "could not set upstream of '" + res.branch_name + "': " +
                            up.error().message;
            log::warn("%s", w.c_str());
            result.warnings.push_back(std::move(w));
        }
    }

    if (cfg.auto_copy) {
        auto source = copy_source(root.value(), cfg.base);
        if (source.is_err()) {
            std::string w = "skipped copying files: " + source.error().message;
            log::warn("%s", w.c_str());
            result.warnings.push_back(std::move(w));
        } else if (!source.value()) {
            log::debug("no source worktree to copy files from");
        } else {
            std::vector<std::string> includes = cfg.copy_patterns;
            if (includes.empty()) includes.push_back("**/*");
            auto copied = copier_.copy_matching(*source.value(), res.worktree_path,
                                                includes, cfg.copy_excludes, false);
            if (copied.is_err()) {
                std::string w = "copying files from " + source.value()->string() +
                                " failed: " + copied.error().message;
                log::warn("%s", w.c_str());
                result.warnings.push_back(std::move(w));
            } else {
                result.copied_files = std::move(copied).value();
                log::info("copied %zu file(s) from %s", result.copied_files.size(),
                          source.value()->c_str());
            }
        }
    }

    if (opts.run_hooks && !cfg.hooks.empty()) {
        HookContext ctx;
        ctx.cwd = res.worktree_path;
        if (!std::holds_alternative<DetachedMode>(res.mode)) ctx.branch_name = res.branch_name;
        ctx.base_branch = cfg.base;
        ctx.timeout_seconds = cfg.hook_timeout;

        result.hooks = hooks_.run(cfg.hooks, ctx);
        for (const auto& h : result.hooks) {
            if (h.success) continue;
            result.warnings.push_back("hook '" + h.command + "' failed: " + h.message);
        }
    }

    return Result<CreateResult>::ok(std::move(result));
}

// ---------------------------------------------------------------------------
// prune / list
// ---------------------------------------------------------------------------

Result<std::vector<WorktreeSummary>> Lifecycle::describe_all(
    const fs::path& root, const std::optional<std::string>& base_branch) {
    auto entries = git_.list_worktrees();
    if (entries.is_err()) return std::move(entries).error();

    std::vector<WorktreeSummary> out;
    for (auto& e : entries.value()) {
        if (e.bare) continue;

        WorktreeDescriptor desc(git_, e);
        auto st = desc.describe(base_branch);
        if (st.is_err()) {
            WorkonError err = std::move(st).error();
            err.message = "cannot determine status of " + e.path.string() + ": " + err.message;
            return err;
        }

        WorktreeSummary s;
        s.name = worktree_display_name(root, e.path);
        s.entry = std::move(e);
        s.status = st.value();
        out.push_back(std::move(s));
    }
    return Result<std::vector<WorktreeSummary>>::ok(std::move(out));
}

Result<PruneReport> Lifecycle::prune_worktrees(const PruneOptions& opts) {
    auto protected_patterns = config_.protected_branches();
    if (protected_patterns.is_err()) return std::move(protected_patterns).error();

    auto default_base = default_base_branch();
    if (default_base.is_err()) return std::move(default_base).error();

    std::optional<std::string> merge_base = default_base.value();
    if (opts.selector.merged_target) {
        merge_base = opts.selector.merged_target;
        auto exists = git_.ref_exists("refs/heads/" + *merge_base);
        if (exists.is_err()) return std::move(exists).error();
        if (!exists.value()) {
            return WorkonError{WorkonError::NotFound,
                "merge target '" + *merge_base + "' is not a local branch"};
        }
    }
    if (opts.selector.kind == PruneSelector::Kind::Merged && !merge_base) {
        return WorkonError{WorkonError::NotFound,
            "no base branch to measure merged worktrees against",
            "pass --merged=<branch> or set workon.defaultBranch"};
    }

    auto root = worktrees_root();
    if (root.is_err()) return std::move(root).error();

    auto summaries = describe_all(root.value(), merge_base);
    if (summaries.is_err()) return std::move(summaries).error();

    std::vector<PruneCandidate> candidates;
    candidates.reserve(summaries.value().size());
    for (auto& s : summaries.value()) {
        candidates.push_back({std::move(s.name), std::move(s.entry), s.status});
    }

    PrunePolicy policy;
    policy.protected_patterns = std::move(protected_patterns).value();
    policy.default_branch = default_base.value();
    policy.allow_dirty = opts.allow_dirty;
    policy.allow_unpushed = opts.allow_unpushed;
    policy.force = opts.force;
    policy.dry_run = opts.dry_run;

    PruneReport report;
    report.plan = plan_prune(candidates, opts.selector, policy);
    for (const auto& n : report.plan.unmatched_names) {
        log::warn("no worktree named '%s'", n.c_str());
    }
    log::debug("prune (%s): %zu to remove, %zu protected, %zu unsafe",
               selector_name(opts.selector.kind), report.plan.to_remove.size(),
               report.plan.skipped_protected.size(), report.plan.skipped_unsafe.size());

    report.results = execute_plan(report.plan, git_);
    return Result<PruneReport>::ok(std::move(report));
}

Result<std::vector<WorktreeSummary>> Lifecycle::list_worktrees(const ListFilter& filter) {
    if (filter.dirty && filter.clean) {
        return WorkonError{WorkonError::InvalidArg,
            "--dirty and --clean cannot be combined"};
    }

    auto base = default_base_branch();
    if (base.is_err()) return std::move(base).error();

    auto root = worktrees_root();
    if (root.is_err()) return std::move(root).error();

    auto all = describe_all(root.value(), base.value());
    if (all.is_err()) return std::move(all).error();

    std::vector<WorktreeSummary> out;
    for (auto& s : all.value()) {
        const WorktreeStatus& st = s.status;
        if (filter.dirty && !st.is_dirty) continue;
        if (filter.clean && st.is_dirty) continue;
        if (filter.ahead && !st.has_unpushed_commits) continue;
        if (filter.behind && !st.is_behind) continue;
        if (filter.gone && !st.upstream_gone) continue;
        out.push_back(std::move(s));
    }
    return Result<std::vector<WorktreeSummary>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// move
// ---------------------------------------------------------------------------

static bool names_worktree(const std::string& wanted, const fs::path& root,
                           const WorktreeEntry& e) {
    if (e.bare) return false;
    if (wanted == worktree_display_name(root, e.path)) return true;
    if (e.branch && wanted == *e.branch) return true;
    return wanted == e.path.string();
}

// Namespace directories emptied by a move are removed up to `root`.
static void remove_empty_parents(fs::path dir, const fs::path& root) {
    std::error_code ec;
    for (;;) {
        fs::path rel = dir.lexically_relative(root);
        if (rel.empty() || rel == "." || *rel.begin() == "..") return;
        if (!fs::is_empty(dir, ec) || ec) return;
        if (!fs::remove(dir, ec) || ec) return;
        log::debug("removed empty directory %s", dir.c_str());
        dir = dir.parent_path();
    }
}

Result<MoveResult> Lifecycle::move_worktree(const std::string& from, const std::string& to,
                                            const MoveOptions& opts) {
    if (from == to) {
        return WorkonError{WorkonError::InvalidArg,
            "source and target names are identical: '" + from + "'"};
    }

    auto protected_patterns = config_.protected_branches();
    if (protected_patterns.is_err()) return std::move(protected_patterns).error();

    auto default_base = default_base_branch();
    if (default_base.is_err()) return std::move(default_base).error();

    auto root = worktrees_root();
    if (root.is_err()) return std::move(root).error();

    auto existing = git_.list_worktrees();
    if (existing.is_err()) return std::move(existing).error();

    auto found = std::find_if(existing.value().begin(), existing.value().end(),
                              [&](const WorktreeEntry& e) {
                                  return names_worktree(from, root.value(), e);
                              });
    if (found == existing.value().end()) {
        return WorkonError{WorkonError::NotFound,
            "no worktree named '" + from + "'", "see `git workon list`"};
    }
    const WorktreeEntry source = *found;
    if (!source.branch) {
        return WorkonError{WorkonError::Resolution,
            "cannot move the detached worktree at " + source.path.string(),
            "check out a branch in it first"};
    }
    const std::string branch = *source.branch;

    ResolveOptions ropts;
    ropts.literal = true;
    NameResolver resolver(root.value());
    auto target = resolver.resolve(to, ropts, existing.value());
    if (target.is_err()) return std::move(target).error();

    auto taken = git_.ref_exists("refs/heads/" + to);
    if (taken.is_err()) return std::move(taken).error();
    if (taken.value()) {
        return WorkonError{WorkonError::Resolution,
            "name already in use: branch '" + to + "' already exists"};
    }

    if (!opts.force) {
        const std::string hint = "pass --force to move it anyway";
        ProtectedBranchMatcher matcher(std::move(protected_patterns).value());
        if (const std::string* pattern = matcher.matching_pattern(branch)) {
            return WorkonError{WorkonError::Unsafe,
                "branch '" + branch + "' is protected by pattern '" + *pattern + "'", hint};
        }
        if (default_base.value() && branch == *default_base.value()) {
            return WorkonError{WorkonError::Unsafe,
                "branch '" + branch + "' is the default branch", hint};
        }

        auto st = WorktreeDescriptor(git_, source).describe(std::nullopt);
        if (st.is_err()) {
            WorkonError err = std::move(st).error();
            err.message = "cannot determine status of " + source.path.string() + ": " +
                          err.message;
            return err;
        }
        if (st.value().is_dirty) {
            return WorkonError{WorkonError::Unsafe,
                "worktree '" + from + "' has uncommitted changes", hint};
        }
        if (st.value().has_unpushed_commits) {
            return WorkonError{WorkonError::Unsafe,
                "branch '" + branch + "' has commits that are not pushed", hint};
        }
    }

    MoveResult result;
    result.from_branch = branch;
    result.to_branch = to;
    result.from_path = source.path;
    result.to_path = target.value().worktree_path;
    result.dry_run = opts.dry_run;
    if (opts.dry_run) return Result<MoveResult>::ok(std::move(result));

    WORKON_TRY(git_.rename_branch(branch, to));

    auto moved = git_.move_worktree(result.from_path, result.to_path);
    if (moved.is_err()) {
        WorkonError err = std::move(moved).error();
        auto back = git_.rename_branch(to, branch);
        if (back.is_err()) {
            err.message += "; renaming the branch back also failed: " + back.error().message;
            err.hint = "run `git branch -m " + to + " " + branch + "` to restore it";
        }
        return err;
    }

    remove_empty_parents(result.from_path.parent_path(), root.value());
    log::info("moved %s to %s", result.from_path.c_str(), result.to_path.c_str());
    return Result<MoveResult>::ok(std::move(result));
}

Result<WorktreeEntry> Lifecycle::worktree_containing(const fs::path& dir) {
    auto entries = git_.list_worktrees();
    if (entries.is_err()) return std::move(entries).error();

    std::error_code ec;
    fs::path here = fs::weakly_canonical(dir, ec);
    if (ec) here = dir.lexically_normal();

    const WorktreeEntry* best = nullptr;
    size_t best_depth = 0;
    for (const auto& e : entries.value()) {
        if (e.bare) continue;
        fs::path rel = here.lexically_relative(e.path);
        if (rel.empty() || *rel.begin() == "..") continue;
        size_t depth = static_cast<size_t>(std::distance(e.path.begin(), e.path.end()));
        if (!best || depth > best_depth) {
            best = &e;
            best_depth = depth;
        }
    }
    if (!best) {
        return WorkonError{WorkonError::NotFound,
            "not inside a worktree: " + here.string(),
            "name the worktree explicitly: git workon move <from> <to>"};
    }
    return Result<WorktreeEntry>::ok(*best);
}

} // namespace workon
