#include <workon/cli.hpp>
#include <workon/config_store.hpp>
#include <workon/copy.hpp>
#include <workon/engine/config_resolver.hpp>
#include <workon/engine/lifecycle.hpp>
#include <workon/engine/report.hpp>
#include <workon/git.hpp>
#include <workon/hooks.hpp>
#include <workon/log.hpp>

#include <CLI/CLI.hpp>

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace workon;

namespace {

int fail(const WorkonError& err) {
    std::cerr << err.format() << "\n";
    return 1;
}

std::string describe_item(const PruneItem& item) {
    std::string out = item.path.string();
    out += item.branch ? " (branch " + *item.branch + ")" : " (detached)";
    return out;
}

void print_plan(const PrunePlan& plan) {
    if (!plan.skipped_protected.empty()) {
        std::cout << "Skipped (protected):\n";
        for (const auto& s : plan.skipped_protected) {
            std::cout << "  " << describe_item(s.item) << ": " << s.rule << "\n";
        }
    }
    if (!plan.skipped_unsafe.empty()) {
        std::cout << "Skipped (unsafe to prune):\n";
        for (const auto& s : plan.skipped_unsafe) {
            std::cout << "  " << describe_item(s.item) << ": "
                      << unsafe_reason_text(s.reason) << "\n";
        }
    }
    if (plan.to_remove.empty()) {
        std::cout << "No worktrees to prune\n";
        return;
    }
    std::cout << "Worktrees to prune:\n";
    for (const auto& item : plan.to_remove) {
        std::cout << "  " << describe_item(item) << "\n";
    }
}

bool confirm(size_t count) {
    std::cerr << "Prune " << count << " worktree(s)? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

std::string status_flags(const WorktreeStatus& st) {
    std::string out;
    auto add = [&](bool on, const char* word) {
        if (!on) return;
        if (!out.empty()) out += ',';
        out += word;
    };
    add(st.is_detached, "detached");
    add(st.is_dirty, "dirty");
    add(st.has_unpushed_commits, "unpushed");
    add(st.is_behind, "behind");
    add(st.is_merged, "merged");
    add(st.upstream_gone, "gone");
    add(st.branch_missing, "branch-deleted");
    return out;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int run_new(Lifecycle& lifecycle, const NewArgs& args) {
    CreateOptions opts;
    if (!args.base.empty()) opts.base = args.base;
    opts.orphan = args.orphan;
    opts.detach = args.detach;
    opts.run_hooks = !args.no_hooks;

    auto created = lifecycle.create_worktree(args.name, opts);
    if (created.is_err()) return fail(created.error());

    const CreateResult& result = created.value();

    if (args.json) {
        std::cout << create_result_to_json(result) << "\n";
    } else {
        std::cout << result.resolution.worktree_path.string() << "\n";
    }
    return 0;
}

int run_prune(Lifecycle& lifecycle, GitBackend& git, const PruneArgs& args) {
    PruneOptions opts;
    opts.allow_dirty = args.allow_dirty;
    opts.allow_unpushed = args.allow_unpushed;
    opts.force = args.force;
    opts.selector = prune_selector_of(args);

    // Plan first; removal only follows an explicit go-ahead.
    const bool ask = !args.dry_run && !args.yes && !args.json;
    opts.dry_run = args.dry_run || ask;

    auto planned = lifecycle.prune_worktrees(opts);
    if (planned.is_err()) return fail(planned.error());
    PruneReport report = std::move(planned).value();

    if (ask) {
        print_plan(report.plan);
        if (report.plan.to_remove.empty()) return 0;
        if (!isatty(STDIN_FILENO)) {
            log::error("refusing to prune without confirmation; pass --yes");
            return 1;
        }
        if (!confirm(report.plan.to_remove.size())) {
            std::cout << "Cancelled\n";
            return 0;
        }
        report.plan.dry_run = false;
        report.results = execute_plan(report.plan, git);
    }

    if (args.json) {
        std::cout << prune_report_to_json(report) << "\n";
    } else if (!ask) {
        print_plan(report.plan);
        if (report.plan.dry_run && !report.plan.to_remove.empty()) {
            std::cout << "Dry run - no changes made\n";
        }
    }

    size_t failed = report.failures();
    if (failed > 0) {
        log::error("%zu of %zu worktree(s) could not be pruned", failed, report.results.size());
        return 1;
    }
    if (!report.plan.dry_run && !report.results.empty()) {
        std::cout << "Pruned " << report.results.size() << " worktree(s)\n";
    }
    return 0;
}

int run_list(Lifecycle& lifecycle, const ListArgs& args) {
    auto listed = lifecycle.list_worktrees(args.filter);
    if (listed.is_err()) return fail(listed.error());

    if (args.json) {
        std::cout << worktrees_to_json(listed.value()) << "\n";
        return 0;
    }
    for (const auto& w : listed.value()) {
        std::cout << w.name;
        std::string flags = status_flags(w.status);
        if (!flags.empty()) std::cout << "  [" << flags << "]";
        std::cout << "\n";
    }
    return 0;
}

int run_move(Lifecycle& lifecycle, const fs::path& repo_dir, const MoveArgs& args) {
    std::string from;
    std::string to = args.names.back();
    if (args.names.size() == 2) {
        from = args.names.front();
    } else {
        auto here = lifecycle.worktree_containing(repo_dir);
        if (here.is_err()) return fail(here.error());
        from = here.value().branch ? *here.value().branch : here.value().path.string();
    }

    MoveOptions opts;
    opts.force = args.force;
    opts.dry_run = args.dry_run;
    auto moved = lifecycle.move_worktree(from, to, opts);
    if (moved.is_err()) return fail(moved.error());

    const MoveResult& result = moved.value();
    if (args.json) {
        std::cout << move_result_to_json(result) << "\n";
    } else if (result.dry_run) {
        std::cout << "Would move " << result.from_path.string() << " -> "
                  << result.to_path.string() << " (branch " << result.from_branch
                  << " -> " << result.to_branch << ")\n";
        std::cout << "Dry run - no changes made\n";
    } else {
        std::cout << result.to_path.string() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Manage a bare repository with one worktree per branch", "git-workon"};
    CliArgs args;
    CliCommands cmds = build_cli(app, args);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }
    finish_cli(cmds, args);
    const GlobalArgs& global = args.global;
    const NewArgs& new_args = args.new_args;

    log::apply_verbosity(global.verbose, global.quiet);
    log::set_color_enabled(!global.no_color && isatty(STDERR_FILENO));

    fs::path repo_dir = global.dir.empty() ? fs::current_path() : fs::path(global.dir);
    GitCli git(repo_dir);
    auto version = git.check_version();
    if (version.is_err()) return fail(version.error());
    log::debug("using %s", version.value().c_str());

    GitConfigStore store(repo_dir);
    ConfigResolver config(store);
    for (const auto& kv : global.overrides) {
        auto st = config.set_override(kv);
        if (st.is_err()) return fail(st.error());
    }
    if (new_args.copy_untracked || new_args.no_copy_untracked) {
        auto st = config.set_override(keys::AutoCopyUntracked,
                                      new_args.copy_untracked ? "true" : "false");
        if (st.is_err()) return fail(st.error());
    }

    ShellHookRunner hooks;
    FileCopyEngine copier;
    Lifecycle lifecycle(git, config, hooks, copier);

    if (*cmds.new_cmd) return run_new(lifecycle, new_args);
    if (*cmds.prune) return run_prune(lifecycle, git, args.prune);
    if (*cmds.list) return run_list(lifecycle, args.list);
    if (*cmds.move) return run_move(lifecycle, repo_dir, args.move);
    return 0;
}
