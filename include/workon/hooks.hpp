#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace workon {

struct HookContext {
    std::filesystem::path cwd;                // the new worktree
    std::string branch_name;                  // WORKON_BRANCH_NAME, omitted when empty
    std::optional<std::string> base_branch;   // WORKON_BASE_BRANCH
    int timeout_seconds = 300;                // 0 = no timeout
};

struct HookOutcome {
    std::string command;
    bool success = false;
    int exit_code = -1;    // -1 when the command never produced an exit status
    std::string message;   // failure detail
};

// Runs post-create commands. Command failures are reported per outcome,
// never as an error of the runner itself.
class HookRunner {
public:
    virtual ~HookRunner() = default;
    virtual std::vector<HookOutcome> run(const std::vector<std::string>& commands,
                                         const HookContext& ctx) = 0;
};

// Runs each command through `sh -c` with WORKON_* variables exported.
class ShellHookRunner : public HookRunner {
public:
    std::vector<HookOutcome> run(const std::vector<std::string>& commands,
                                 const HookContext& ctx) override;
};

} // namespace workon
