#pragma once

#include <workon/config_store.hpp>
#include <workon/copy.hpp>
#include <workon/git.hpp>
#include <workon/hooks.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace workon::testing {

namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& tag = "workon_test_") {
        const char* src = std::getenv("WORKON_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / (tag + std::to_string(
            std::hash<std::string>{}(std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()))));
        fs::create_directories(path);
        path = fs::canonical(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }

    std::string read_file(const std::string& rel) const {
        std::ifstream f(path / rel);
        return std::string((std::istreambuf_iterator<char>(f)),
                           std::istreambuf_iterator<char>());
    }
};

// In-memory repository. Mutating calls are appended to `calls`.
class FakeGitBackend : public GitBackend {
public:
    fs::path common;
    std::optional<std::string> head;
    std::vector<WorktreeEntry> worktrees;
    std::set<std::string> refs;
    std::map<std::string, Upstream> upstreams;
    std::map<std::string, AheadBehind> counts;          // key: local + "..." + remote
    std::set<std::pair<std::string, std::string>> ancestry;  // (ancestor, descendant)
    std::set<fs::path> dirty;
    std::vector<std::string> remote_names;
    std::set<std::string> held_commits;

    std::set<fs::path> fail_remove;
    bool fail_create = false;
    bool fail_status = false;
    bool fail_set_upstream = false;
    bool fail_move = false;
    bool fail_rename = false;

    std::vector<std::string> calls;
    std::vector<WorktreeSpec> created_specs;
    size_t reads = 0;

    // Registry helpers
    WorktreeEntry& add_branch_worktree(const fs::path& path, const std::string& branch,
                                       const std::string& head_id = "c0ffee") {
        WorktreeEntry e;
        e.path = path;
        e.head = head_id;
        e.branch = branch;
        worktrees.push_back(e);
        refs.insert("refs/heads/" + branch);
        return worktrees.back();
    }

    WorktreeEntry& add_detached_worktree(const fs::path& path, const std::string& head_id) {
        WorktreeEntry e;
        e.path = path;
        e.head = head_id;
        worktrees.push_back(e);
        return worktrees.back();
    }

    void add_bare(const fs::path& path) {
        WorktreeEntry e;
        e.path = path;
        e.bare = true;
        worktrees.push_back(e);
    }

    // Branch tracking origin/<branch>, level with it.
    void push_branch(const std::string& branch, size_t ahead = 0, size_t behind = 0) {
        Upstream up{"origin", "refs/heads/" + branch, "refs/remotes/origin/" + branch};
        upstreams[branch] = up;
        refs.insert(up.tracking_ref);
        counts["refs/heads/" + branch + "..." + up.tracking_ref] = {ahead, behind};
    }

    void merge_into(const std::string& branch, const std::string& base) {
        ancestry.insert({"refs/heads/" + branch, "refs/heads/" + base});
    }

    Result<std::vector<WorktreeEntry>> list_worktrees() override {
        ++reads;
        return Result<std::vector<WorktreeEntry>>::ok(worktrees);
    }

    Status create_worktree(const fs::path& path, const WorktreeSpec& spec) override {
        calls.push_back("create " + path.string());
        if (fail_create) return WorkonError{WorkonError::GitBackend, "worktree add failed"};
        created_specs.push_back(spec);

        WorktreeEntry e;
        e.path = path;
        e.head = "n3wc0mm1t";
        if (spec.kind != WorktreeSpec::Kind::Detached) {
            e.branch = spec.branch;
            refs.insert("refs/heads/" + spec.branch);
        }
        worktrees.push_back(e);
        return ok_status();
    }

    Status remove_worktree(const fs::path& path, bool force) override {
        calls.push_back(std::string("remove ") + path.string() + (force ? " --force" : ""));
        if (fail_remove.count(path)) {
            return WorkonError{WorkonError::GitBackend, "cannot remove " + path.string()};
        }
        for (auto it = worktrees.begin(); it != worktrees.end(); ++it) {
            if (it->path == path) {
                worktrees.erase(it);
                break;
            }
        }
        return ok_status();
    }

    Status move_worktree(const fs::path& from, const fs::path& to) override {
        calls.push_back("move " + from.string() + " " + to.string());
        if (fail_move) return WorkonError{WorkonError::GitBackend, "worktree move failed"};
        for (auto& e : worktrees) {
            if (e.path == from) {
                e.path = to;
                return ok_status();
            }
        }
        return WorkonError{WorkonError::GitBackend, from.string() + " is not a worktree"};
    }

    Status rename_branch(const std::string& from, const std::string& to) override {
        calls.push_back("rename " + from + " " + to);
        if (fail_rename) return WorkonError{WorkonError::GitBackend, "branch -m failed"};
        if (!refs.erase("refs/heads/" + from)) {
            return WorkonError{WorkonError::GitBackend, "no branch named " + from};
        }
        refs.insert("refs/heads/" + to);
        for (auto& e : worktrees) {
            if (e.branch && *e.branch == from) e.branch = to;
        }
        auto up = upstreams.find(from);
        if (up != upstreams.end()) {
            upstreams[to] = up->second;
            upstreams.erase(from);
        }
        return ok_status();
    }

    Result<std::optional<std::string>> current_branch_of(const fs::path& worktree) override {
        ++reads;
        for (const auto& e : worktrees) {
            if (e.path == worktree) return Result<std::optional<std::string>>::ok(e.branch);
        }
        return WorkonError{WorkonError::NotFound, "no worktree at " + worktree.string()};
    }

    Result<std::string> head_commit_of(const fs::path& worktree) override {
        ++reads;
        for (const auto& e : worktrees) {
            if (e.path == worktree) return Result<std::string>::ok(e.head);
        }
        return WorkonError{WorkonError::NotFound, "no worktree at " + worktree.string()};
    }

    Result<bool> is_dirty(const fs::path& worktree) override {
        ++reads;
        if (fail_status) return WorkonError{WorkonError::GitBackend, "status failed"};
        return Result<bool>::ok(dirty.count(worktree) > 0);
    }

    Result<AheadBehind> ahead_behind(const std::string& local_ref,
                                     const std::string& remote_ref) override {
        ++reads;
        auto it = counts.find(local_ref + "..." + remote_ref);
        return Result<AheadBehind>::ok(it == counts.end() ? AheadBehind{} : it->second);
    }

    Result<bool> is_ancestor(const std::string& ancestor,
                             const std::string& descendant) override {
        ++reads;
        return Result<bool>::ok(ancestry.count({ancestor, descendant}) > 0);
    }

    Status fetch_ref(const std::string& remote, const std::string& refspec) override {
        calls.push_back("fetch " + remote + " " + refspec);
        auto colon = refspec.find(':');
        if (colon != std::string::npos) refs.insert(refspec.substr(colon + 1));
        return ok_status();
    }

    Result<bool> ref_exists(const std::string& full_ref) override {
        ++reads;
        return Result<bool>::ok(refs.count(full_ref) > 0);
    }

    Result<std::optional<Upstream>> upstream_of(const std::string& branch) override {
        ++reads;
        auto it = upstreams.find(branch);
        if (it == upstreams.end()) return Result<std::optional<Upstream>>::ok(std::nullopt);
        return Result<std::optional<Upstream>>::ok(it->second);
    }

    Status set_branch_upstream(const std::string& branch, const std::string& remote,
                               const std::string& merge_ref) override {
        calls.push_back("set-upstream " + branch + " " + remote + " " + merge_ref);
        if (fail_set_upstream) return WorkonError{WorkonError::GitBackend, "config failed"};
        upstreams[branch] = Upstream{remote, merge_ref, tracking_ref_for(remote, merge_ref)};
        return ok_status();
    }

    Result<std::vector<std::string>> remotes() override {
        ++reads;
        return Result<std::vector<std::string>>::ok(remote_names);
    }

    Result<bool> reachable_from_any_ref(const std::string& commit) override {
        ++reads;
        return Result<bool>::ok(held_commits.count(commit) > 0);
    }

    Result<fs::path> common_dir() override {
        ++reads;
        return Result<fs::path>::ok(common);
    }

    Result<std::optional<std::string>> head_branch() override {
        ++reads;
        return Result<std::optional<std::string>>::ok(head);
    }

    bool mutated() const { return !calls.empty(); }
};

class FakeConfigStore : public ConfigStore {
public:
    std::map<std::pair<std::string, ConfigScope>, std::vector<std::string>> values;
    std::set<std::string> broken_keys;

    void set(const std::string& key, ConfigScope scope, std::vector<std::string> v) {
        values[{key, scope}] = std::move(v);
    }

    Result<std::optional<std::string>> get_scoped(const std::string& key,
                                                  ConfigScope scope) override {
        auto all = get_all_scoped(key, scope);
        if (all.is_err()) return std::move(all).error();
        if (all.value().empty()) return Result<std::optional<std::string>>::ok(std::nullopt);
        return Result<std::optional<std::string>>::ok(all.value().back());
    }

    Result<std::vector<std::string>> get_all_scoped(const std::string& key,
                                                    ConfigScope scope) override {
        if (broken_keys.count(key)) {
            return WorkonError{WorkonError::Config, "cannot read " + key};
        }
        auto it = values.find({key, scope});
        if (it == values.end()) return Result<std::vector<std::string>>::ok({});
        return Result<std::vector<std::string>>::ok(it->second);
    }
};

class RecordingHookRunner : public HookRunner {
public:
    explicit RecordingHookRunner(std::vector<std::string>* events = nullptr)
        : events_(events) {}

    std::set<std::string> failing;
    std::vector<std::string> commands;
    std::vector<HookContext> contexts;

    std::vector<HookOutcome> run(const std::vector<std::string>& cmds,
                                 const HookContext& ctx) override {
        if (events_) events_->push_back("hooks");
        contexts.push_back(ctx);
        std::vector<HookOutcome> out;
        for (const auto& c : cmds) {
            commands.push_back(c);
            HookOutcome o;
            o.command = c;
            o.success = failing.count(c) == 0;
            o.exit_code = o.success ? 0 : 1;
            if (!o.success) o.message = "exited with code 1";
            out.push_back(o);
        }
        return out;
    }

private:
    std::vector<std::string>* events_;
};

struct CopyCall {
    fs::path source;
    fs::path dest;
    std::vector<std::string> includes;
    std::vector<std::string> excludes;
    bool overwrite;
};

class RecordingCopyEngine : public CopyEngine {
public:
    explicit RecordingCopyEngine(std::vector<std::string>* events = nullptr)
        : events_(events) {}

    std::vector<CopyCall> calls;
    std::vector<std::string> result{".env"};
    bool fail = false;

    Result<std::vector<std::string>> copy_matching(const fs::path& source_dir,
                                                   const fs::path& dest_dir,
                                                   const std::vector<std::string>& includes,
                                                   const std::vector<std::string>& excludes,
                                                   bool overwrite) override {
        if (events_) events_->push_back("copy");
        calls.push_back({source_dir, dest_dir, includes, excludes, overwrite});
        if (fail) return WorkonError{WorkonError::IO, "disk full"};
        return Result<std::vector<std::string>>::ok(result);
    }

private:
    std::vector<std::string>* events_;
};

} // namespace workon::testing
