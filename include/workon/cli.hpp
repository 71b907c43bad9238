#pragma once

#include <workon/engine/lifecycle.hpp>

#include <string>
#include <vector>

namespace CLI {
class App;
class Option;
} // namespace CLI

namespace workon {

struct GlobalArgs {
    std::string dir;
    int verbose = 0;
    int quiet = 0;
    bool no_color = false;
    std::vector<std::string> overrides;
};

struct NewArgs {
    std::string name;
    std::string base;
    bool orphan = false;
    bool detach = false;
    bool copy_untracked = false;
    bool no_copy_untracked = false;
    bool no_hooks = false;
    bool json = false;
};

struct PruneArgs {
    std::vector<std::string> names;
    bool all = false;
    bool gone = false;
    bool merged = false;
    std::string merged_target;
    bool allow_dirty = false;
    bool allow_unpushed = false;
    bool force = false;
    bool dry_run = false;
    bool yes = false;
    bool json = false;
};

struct ListArgs {
    ListFilter filter;
    bool json = false;
};

struct MoveArgs {
    std::vector<std::string> names;  // [from] to
    bool force = false;
    bool dry_run = false;
    bool json = false;
};

struct CliArgs {
    GlobalArgs global;
    NewArgs new_args;
    PruneArgs prune;
    ListArgs list;
    MoveArgs move;
};

// Subcommand handles, valid for the lifetime of the App they were added to.
struct CliCommands {
    CLI::App* new_cmd = nullptr;
    CLI::App* prune = nullptr;
    CLI::App* list = nullptr;
    CLI::App* move = nullptr;
    CLI::Option* merged = nullptr;
};

// Register every option of git-workon on `app`, binding them into `args`.
CliCommands build_cli(CLI::App& app, CliArgs& args);

// Fill the fields CLI11 cannot bind directly. Call after a successful parse.
void finish_cli(const CliCommands& commands, CliArgs& args);

// Map the parsed prune selector flags onto a selector.
PruneSelector prune_selector_of(const PruneArgs& args);

} // namespace workon
