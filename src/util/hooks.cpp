#include <workon/hooks.hpp>
#include <workon/log.hpp>
#include <workon/process.hpp>

#include <cstdio>

namespace workon {

std::vector<HookOutcome> ShellHookRunner::run(const std::vector<std::string>& commands,
                                              const HookContext& ctx) {
    EnvVars env{{"WORKON_WORKTREE_PATH", ctx.cwd.string()}};
    if (!ctx.branch_name.empty()) {
        env.emplace_back("WORKON_BRANCH_NAME", ctx.branch_name);
    }
    if (ctx.base_branch) {
        env.emplace_back("WORKON_BASE_BRANCH", *ctx.base_branch);
    }

    std::vector<HookOutcome> outcomes;
    outcomes.reserve(commands.size());

    for (size_t i = 0; i < commands.size(); ++i) {
        const auto& command = commands[i];
        log::info("running hook %zu/%zu: %s", i + 1, commands.size(), command.c_str());

        HookOutcome outcome;
        outcome.command = command;

        auto r = run_command({"sh", "-c", command}, ctx.cwd.string(),
                             ctx.timeout_seconds, env);
        if (r.is_err()) {
            outcome.message = r.error().message;
        } else {
            const auto& cmd = r.value();
            if (!cmd.stdout_str.empty()) std::fputs(cmd.stdout_str.c_str(), stdout);
            if (!cmd.stderr_str.empty()) std::fputs(cmd.stderr_str.c_str(), stderr);

            outcome.exit_code = cmd.exit_code;
            outcome.success = cmd.exit_code == 0;
            if (!outcome.success) {
                outcome.message = "exited with code " + std::to_string(cmd.exit_code);
            }
        }

        if (outcome.success) {
            log::debug("hook succeeded: %s", command.c_str());
        } else {
            log::warn("hook '%s' failed: %s", command.c_str(), outcome.message.c_str());
        }
        outcomes.push_back(std::move(outcome));
    }

    return outcomes;
}

} // namespace workon
