#include <workon/cli.hpp>

#include <CLI/CLI.hpp>

namespace workon {

CliCommands build_cli(CLI::App& app, CliArgs& args) {
    CliCommands cmds;
    app.require_subcommand(1);

    GlobalArgs& global = args.global;
    app.add_option("-C", global.dir, "Run as if started in <dir>")->type_name("DIR");
    app.add_flag("-v,--verbose", global.verbose, "More output (repeatable)");
    app.add_flag("-q,--quiet", global.quiet, "Less output (repeatable)");
    app.add_flag("--no-color", global.no_color, "Disable colored diagnostics");
    app.add_option("-c", global.overrides, "Override a workon.* setting (key=value)")
        ->type_name("KEY=VALUE")
        ->allow_extra_args(false);

    NewArgs& n = args.new_args;
    cmds.new_cmd = app.add_subcommand("new", "Create a worktree for a branch or pull request");
    cmds.new_cmd->add_option("name", n.name, "Branch name, #<n>, pr-<n> or pull request URL")
        ->required();
    cmds.new_cmd->add_option("-b,--base", n.base, "Start the new branch from this ref");
    auto* orphan = cmds.new_cmd->add_flag("--orphan", n.orphan, "Create a branch without history");
    auto* detach = cmds.new_cmd->add_flag("-d,--detach", n.detach, "Check out without a branch");
    orphan->excludes(detach);
    auto* copy_on = cmds.new_cmd->add_flag("--copy-untracked", n.copy_untracked,
                                           "Copy files from the base worktree");
    auto* copy_off = cmds.new_cmd->add_flag("--no-copy-untracked", n.no_copy_untracked,
                                            "Do not copy files from the base worktree");
    copy_on->excludes(copy_off);
    cmds.new_cmd->add_flag("--no-hooks", n.no_hooks, "Skip workon.postCreateHook commands");
    cmds.new_cmd->add_flag("--json", n.json, "Print the result as JSON");

    PruneArgs& p = args.prune;
    cmds.prune = app.add_subcommand("prune", "Remove worktrees that are no longer needed");
    auto* names = cmds.prune->add_option("names", p.names, "Worktree or branch names to prune");
    auto* all = cmds.prune->add_flag("--all", p.all, "Consider every worktree");
    auto* gone = cmds.prune->add_flag("--gone", p.gone,
                                      "Worktrees whose upstream branch was deleted");
    cmds.merged = cmds.prune->add_option("--merged", p.merged_target,
                                         "Worktrees merged into BRANCH (default branch if omitted)")
        ->type_name("BRANCH")
        ->expected(0, 1);
    // One selector per run; exclusion is symmetric in CLI11.
    names->excludes(all)->excludes(gone)->excludes(cmds.merged);
    all->excludes(gone)->excludes(cmds.merged);
    gone->excludes(cmds.merged);
    cmds.prune->add_flag("--allow-dirty", p.allow_dirty, "Prune worktrees with local changes");
    cmds.prune->add_flag("--allow-unpushed", p.allow_unpushed,
                         "Prune worktrees with commits not on any remote");
    cmds.prune->add_flag("-f,--force", p.force,
                         "Remove selected worktrees even if protected, dirty or unpushed");
    cmds.prune->add_flag("-n,--dry-run", p.dry_run, "Show the plan without removing anything");
    cmds.prune->add_flag("-y,--yes", p.yes, "Do not ask for confirmation");
    cmds.prune->add_flag("--json", p.json, "Print the plan and results as JSON");

    ListArgs& l = args.list;
    cmds.list = app.add_subcommand("list", "List worktrees with their status");
    auto* dirty = cmds.list->add_flag("--dirty", l.filter.dirty, "Only worktrees with local changes");
    auto* clean = cmds.list->add_flag("--clean", l.filter.clean,
                                      "Only worktrees without local changes");
    dirty->excludes(clean);
    cmds.list->add_flag("--ahead", l.filter.ahead, "Only worktrees with unpushed commits");
    cmds.list->add_flag("--behind", l.filter.behind, "Only worktrees behind their upstream");
    cmds.list->add_flag("--gone", l.filter.gone, "Only worktrees whose upstream was deleted");
    cmds.list->add_flag("--json", l.json, "Print as JSON");

    MoveArgs& m = args.move;
    cmds.move = app.add_subcommand("move", "Rename a worktree together with its branch");
    cmds.move->alias("mv");
    cmds.move->add_option("names", m.names,
                          "[FROM] TO; FROM defaults to the worktree containing the current directory")
        ->required()
        ->expected(1, 2);
    cmds.move->add_flag("-f,--force", m.force,
                        "Move even if protected, dirty or holding unpushed commits");
    cmds.move->add_flag("-n,--dry-run", m.dry_run, "Check the move without performing it");
    cmds.move->add_flag("--json", m.json, "Print the result as JSON");

    return cmds;
}

void finish_cli(const CliCommands& commands, CliArgs& args) {
    args.prune.merged = commands.merged && commands.merged->count() > 0;
}

PruneSelector prune_selector_of(const PruneArgs& args) {
    PruneSelector sel;
    if (!args.names.empty()) {
        sel.kind = PruneSelector::Kind::Names;
        sel.names = args.names;
    } else if (args.all) {
        sel.kind = PruneSelector::Kind::All;
    } else if (args.gone) {
        sel.kind = PruneSelector::Kind::Gone;
    } else if (args.merged) {
        sel.kind = PruneSelector::Kind::Merged;
        if (!args.merged_target.empty()) sel.merged_target = args.merged_target;
    } else {
        sel.kind = PruneSelector::Kind::Stale;
    }
    return sel;
}

} // namespace workon
