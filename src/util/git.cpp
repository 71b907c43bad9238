#include <workon/git.hpp>
#include <workon/log.hpp>

#include <cstdio>
#include <sstream>

namespace workon {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Porcelain parsing (pure functions)
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

Result<std::vector<WorktreeEntry>> parse_worktree_list(const std::string& porcelain) {
    std::vector<WorktreeEntry> entries;
    std::istringstream stream(porcelain);
    std::string line;
    bool open = false;

    // Records are separated by blank lines; each starts with "worktree <path>".
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            open = false;
            continue;
        }

        if (starts_with(line, "worktree ")) {
            entries.push_back(WorktreeEntry{});
            entries.back().path = line.substr(9);
            open = true;
            continue;
        }
        if (!open) {
            return WorkonError{WorkonError::Parse,
                "unexpected line in worktree list: '" + line + "'"};
        }

        auto& e = entries.back();
        if (starts_with(line, "HEAD ")) {
            e.head = line.substr(5);
        } else if (starts_with(line, "branch ")) {
            std::string ref = line.substr(7);
            const std::string heads = "refs/heads/";
            e.branch = starts_with(ref, heads) ? ref.substr(heads.size()) : ref;
        } else if (line == "bare") {
            e.bare = true;
        } else if (line == "detached") {
            e.branch.reset();
        } else if (line == "locked" || starts_with(line, "locked ")) {
            e.locked = true;
        } else if (line == "prunable" || starts_with(line, "prunable ")) {
            e.prunable = true;
        }
    }

    return Result<std::vector<WorktreeEntry>>::ok(std::move(entries));
}

std::string tracking_ref_for(const std::string& remote, const std::string& merge_ref) {
    if (remote == ".") return merge_ref;
    const std::string heads = "refs/heads/";
    if (starts_with(merge_ref, heads)) {
        return "refs/remotes/" + remote + "/" + merge_ref.substr(heads.size());
    }
    if (starts_with(merge_ref, "refs/")) {
        return "refs/remotes/" + remote + "/" + merge_ref.substr(5);
    }
    return "refs/remotes/" + remote + "/" + merge_ref;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

GitCli::GitCli(fs::path repo_dir) : repo_dir_(std::move(repo_dir)) {}

Result<CommandResult> GitCli::git(const fs::path& dir,
                                  const std::vector<std::string>& args) {
    std::vector<std::string> argv{"git", "-C", dir.string()};
    argv.insert(argv.end(), args.begin(), args.end());

    std::string joined;
    for (const auto& a : args) {
        joined += ' ';
        joined += a;
    }
    log::debug("git -C %s%s", dir.c_str(), joined.c_str());

    return run_command(argv, "", timeout_seconds_);
}

static WorkonError git_failure(const std::string& what, const CommandResult& cmd) {
    std::string detail = trim_output(cmd.stderr_str);
    if (detail.empty()) detail = "exit code " + std::to_string(cmd.exit_code);
    return WorkonError{WorkonError::GitBackend, what + " failed: " + detail};
}

Result<std::string> GitCli::check_version() {
    auto r = git(repo_dir_, {"--version"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return WorkonError{WorkonError::NotFound,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_output(r.value().stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return WorkonError{WorkonError::Parse, "unexpected git --version output: " + out};
    }
    std::string ver = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver.c_str(), "%d.%d", &major, &minor) < 2) {
        return WorkonError{WorkonError::Parse, "cannot parse git version: " + ver};
    }
    if (major < 2 || (major == 2 && minor < 20)) {
        return WorkonError{WorkonError::GitBackend,
            "git version " + ver + " too old", "upgrade to git >= 2.20"};
    }
    return Result<std::string>::ok(std::move(ver));
}

Result<std::vector<WorktreeEntry>> GitCli::list_worktrees() {
    auto r = git(repo_dir_, {"worktree", "list", "--porcelain"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git worktree list", r.value());
    }
    return parse_worktree_list(r.value().stdout_str);
}

Status GitCli::create_worktree(const fs::path& path, const WorktreeSpec& spec) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return WorkonError{WorkonError::IO,
            "cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    std::vector<std::string> args{"worktree", "add"};
    switch (spec.kind) {
        case WorktreeSpec::Kind::CheckoutBranch:
            args.insert(args.end(), {path.string(), spec.branch});
            break;
        case WorktreeSpec::Kind::TrackRemote:
            args.insert(args.end(), {"--track", "-b", spec.branch, path.string(), spec.start_point});
            break;
        case WorktreeSpec::Kind::NewBranch:
            args.insert(args.end(), {"--no-track", "-b", spec.branch, path.string()});
            if (!spec.start_point.empty()) args.push_back(spec.start_point);
            break;
        case WorktreeSpec::Kind::Orphan:
        case WorktreeSpec::Kind::Detached:
            args.insert(args.end(), {"--detach", path.string()});
            if (!spec.start_point.empty()) args.push_back(spec.start_point);
            break;
    }

    auto r = git(repo_dir_, args);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git worktree add " + path.string(), r.value());
    }

    if (spec.kind == WorktreeSpec::Kind::Orphan) {
        auto seeded = orphan_seed(path, spec.branch);
        if (seeded.is_err()) {
            // Drop the half-made worktree so a retry sees the old state.
            auto undo = remove_worktree(path, true);
            if (undo.is_err()) {
                log::warn("could not remove %s after failed orphan setup: %s",
                          path.c_str(), undo.error().message.c_str());
            }
            return seeded;
        }
    }
    return ok_status();
}

// Turn a freshly added detached worktree into an orphan branch whose only
// commit is empty.
Status GitCli::orphan_seed(const fs::path& path, const std::string& branch) {
    auto co = git(path, {"checkout", "--orphan", branch});
    if (co.is_err()) return std::move(co).error();
    if (co.value().exit_code != 0) {
        return git_failure("git checkout --orphan " + branch, co.value());
    }

    auto rm = git(path, {"rm", "-r", "-f", "-q", "--ignore-unmatch", "."});
    if (rm.is_err()) return std::move(rm).error();
    if (rm.value().exit_code != 0) {
        return git_failure("git rm (orphan cleanup)", rm.value());
    }

    std::vector<std::string> commit;
    auto name = git(path, {"config", "--get", "user.name"});
    auto email = git(path, {"config", "--get", "user.email"});
    if (name.is_err() || name.value().exit_code != 0) {
        commit.insert(commit.end(), {"-c", "user.name=git-workon"});
    }
    if (email.is_err() || email.value().exit_code != 0) {
        commit.insert(commit.end(), {"-c", "user.email=git-workon@localhost"});
    }
    commit.insert(commit.end(), {"commit", "--allow-empty", "-q", "-m", "Initial commit"});

    auto c = git(path, commit);
    if (c.is_err()) return std::move(c).error();
    if (c.value().exit_code != 0) {
        return git_failure("git commit (orphan seed)", c.value());
    }
    return ok_status();
}

Status GitCli::remove_worktree(const fs::path& path, bool force) {
    std::vector<std::string> args{"worktree", "remove"};
    if (force) args.push_back("--force");
    args.push_back(path.string());

    auto r = git(repo_dir_, args);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git worktree remove " + path.string(), r.value());
    }
    return ok_status();
}

Status GitCli::move_worktree(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (ec) {
        return WorkonError{WorkonError::IO,
            "cannot create " + to.parent_path().string() + ": " + ec.message()};
    }

    auto r = git(repo_dir_, {"worktree", "move", from.string(), to.string()});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git worktree move " + from.string() + " " + to.string(), r.value());
    }
    return ok_status();
}

Status GitCli::rename_branch(const std::string& from, const std::string& to) {
    auto r = git(repo_dir_, {"branch", "-m", from, to});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git branch -m " + from + " " + to, r.value());
    }
    return ok_status();
}

Result<std::optional<std::string>> GitCli::current_branch_of(const fs::path& worktree) {
    auto r = git(worktree, {"symbolic-ref", "--quiet", "--short", "HEAD"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code == 0) {
        return Result<std::optional<std::string>>::ok(trim_output(cmd.stdout_str));
    }
    if (cmd.exit_code == 1) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return git_failure("git symbolic-ref HEAD in " + worktree.string(), cmd);
}

Result<std::string> GitCli::head_commit_of(const fs::path& worktree) {
    auto r = git(worktree, {"rev-parse", "--verify", "--quiet", "HEAD"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code == 0) return Result<std::string>::ok(trim_output(cmd.stdout_str));
    // --quiet reports an unborn HEAD as a bare exit 1
    if (cmd.exit_code == 1 && trim_output(cmd.stderr_str).empty()) {
        return Result<std::string>::ok(std::string());
    }
    return git_failure("git rev-parse HEAD in " + worktree.string(), cmd);
}

Result<bool> GitCli::is_dirty(const fs::path& worktree) {
    auto r = git(worktree, {"status", "--porcelain", "--untracked-files=no"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git status in " + worktree.string(), r.value());
    }
    return Result<bool>::ok(!trim_output(r.value().stdout_str).empty());
}

Result<AheadBehind> GitCli::ahead_behind(const std::string& local_ref,
                                         const std::string& remote_ref) {
    auto r = git(repo_dir_, {"rev-list", "--left-right", "--count",
                             local_ref + "..." + remote_ref});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git rev-list " + local_ref + "..." + remote_ref, r.value());
    }

    AheadBehind ab;
    std::istringstream in(r.value().stdout_str);
    if (!(in >> ab.ahead >> ab.behind)) {
        return WorkonError{WorkonError::Parse,
            "unexpected rev-list output: '" + trim_output(r.value().stdout_str) + "'"};
    }
    return Result<AheadBehind>::ok(ab);
}

Result<bool> GitCli::is_ancestor(const std::string& ancestor,
                                 const std::string& descendant) {
    auto r = git(repo_dir_, {"merge-base", "--is-ancestor", ancestor, descendant});
    if (r.is_err()) return std::move(r).error();
    switch (r.value().exit_code) {
        case 0: return Result<bool>::ok(true);
        case 1: return Result<bool>::ok(false);
        default:
            return git_failure("git merge-base --is-ancestor " + ancestor + " " + descendant,
                               r.value());
    }
}

Status GitCli::fetch_ref(const std::string& remote, const std::string& refspec) {
    auto r = git(repo_dir_, {"fetch", "--quiet", remote, refspec});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git fetch " + remote + " " + refspec, r.value());
    }
    return ok_status();
}

Result<bool> GitCli::ref_exists(const std::string& full_ref) {
    auto r = git(repo_dir_, {"show-ref", "--verify", "--quiet", full_ref});
    if (r.is_err()) return std::move(r).error();
    switch (r.value().exit_code) {
        case 0: return Result<bool>::ok(true);
        case 1: return Result<bool>::ok(false);
        default: return git_failure("git show-ref " + full_ref, r.value());
    }
}

Result<std::optional<Upstream>> GitCli::upstream_of(const std::string& branch) {
    auto get = [&](const std::string& key) -> Result<std::optional<std::string>> {
        auto r = git(repo_dir_, {"config", "--get", key});
        if (r.is_err()) return std::move(r).error();
        if (r.value().exit_code == 1) {
            return Result<std::optional<std::string>>::ok(std::nullopt);
        }
        if (r.value().exit_code != 0) return git_failure("git config " + key, r.value());
        return Result<std::optional<std::string>>::ok(trim_output(r.value().stdout_str));
    };

    auto remote = get("branch." + branch + ".remote");
    if (remote.is_err()) return std::move(remote).error();
    auto merge = get("branch." + branch + ".merge");
    if (merge.is_err()) return std::move(merge).error();

    if (!remote.value() || !merge.value()) {
        return Result<std::optional<Upstream>>::ok(std::nullopt);
    }

    Upstream up;
    up.remote = *remote.value();
    up.merge_ref = *merge.value();
    up.tracking_ref = tracking_ref_for(up.remote, up.merge_ref);
    return Result<std::optional<Upstream>>::ok(std::move(up));
}

Status GitCli::set_branch_upstream(const std::string& branch,
                                   const std::string& remote,
                                   const std::string& merge_ref) {
    const std::vector<std::pair<std::string, std::string>> kv{
        {"branch." + branch + ".remote", remote},
        {"branch." + branch + ".merge", merge_ref},
    };
    for (const auto& [key, value] : kv) {
        auto r = git(repo_dir_, {"config", key, value});
        if (r.is_err()) return std::move(r).error();
        if (r.value().exit_code != 0) return git_failure("git config " + key, r.value());
    }
    return ok_status();
}

Result<std::vector<std::string>> GitCli::remotes() {
    auto r = git(repo_dir_, {"remote"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) return git_failure("git remote", r.value());

    std::vector<std::string> names;
    std::istringstream in(r.value().stdout_str);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) names.push_back(line);
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Result<bool> GitCli::reachable_from_any_ref(const std::string& commit) {
    auto r = git(repo_dir_, {"for-each-ref", "--count=1", "--format=%(refname)",
                             "--contains", commit, "refs/heads", "refs/remotes"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return git_failure("git for-each-ref --contains " + commit, r.value());
    }
    return Result<bool>::ok(!trim_output(r.value().stdout_str).empty());
}

Result<fs::path> GitCli::common_dir() {
    auto r = git(repo_dir_, {"rev-parse", "--git-common-dir"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return WorkonError{WorkonError::NotFound,
            "not a git repository: " + repo_dir_.string(),
            "run git-workon inside a repository or pass -C <dir>"};
    }

    fs::path dir = trim_output(r.value().stdout_str);
    if (dir.is_relative()) dir = repo_dir_ / dir;

    std::error_code ec;
    auto canon = fs::weakly_canonical(dir, ec);
    if (ec) {
        return WorkonError{WorkonError::IO,
            "cannot resolve " + dir.string() + ": " + ec.message()};
    }
    return Result<fs::path>::ok(std::move(canon));
}

Result<std::optional<std::string>> GitCli::head_branch() {
    auto common = common_dir();
    if (common.is_err()) return std::move(common).error();
    return current_branch_of(common.value());
}

} // namespace workon
