#include <workon/config_store.hpp>
#include <workon/log.hpp>
#include <workon/process.hpp>

namespace workon {

const char* scope_name(ConfigScope scope) {
    switch (scope) {
        case ConfigScope::Local:  return "local";
        case ConfigScope::Global: return "global";
    }
    return "unknown";
}

static const char* scope_flag(ConfigScope scope) {
    return scope == ConfigScope::Local ? "--local" : "--global";
}

GitConfigStore::GitConfigStore(std::filesystem::path repo_dir)
    : repo_dir_(std::move(repo_dir)) {}

// `git config --get-all` exits 1 when the key is absent; -z keeps values
// containing newlines intact.
static Result<std::vector<std::string>> read_values(const std::filesystem::path& repo,
                                                    const std::string& key,
                                                    ConfigScope scope) {
    log::trace("git config %s --get-all %s", scope_flag(scope), key.c_str());
    auto r = run_command({"git", "-C", repo.string(), "config", scope_flag(scope),
                          "-z", "--get-all", key});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    std::vector<std::string> values;
    if (cmd.exit_code == 1) {
        return Result<std::vector<std::string>>::ok(std::move(values));
    }
    if (cmd.exit_code != 0) {
        return WorkonError{WorkonError::Config,
            "cannot read " + key + " from " + scope_name(scope) + " config: " +
            trim_output(cmd.stderr_str)};
    }

    size_t start = 0;
    const std::string& out = cmd.stdout_str;
    while (start < out.size()) {
        size_t nul = out.find('\0', start);
        if (nul == std::string::npos) nul = out.size();
        values.push_back(out.substr(start, nul - start));
        start = nul + 1;
    }
    return Result<std::vector<std::string>>::ok(std::move(values));
}

Result<std::optional<std::string>> GitConfigStore::get_scoped(const std::string& key,
                                                              ConfigScope scope) {
    auto r = read_values(repo_dir_, key, scope);
    if (r.is_err()) return std::move(r).error();
    if (r.value().empty()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    // Last one wins for single-valued keys, as in git.
    return Result<std::optional<std::string>>::ok(r.value().back());
}

Result<std::vector<std::string>> GitConfigStore::get_all_scoped(const std::string& key,
                                                                ConfigScope scope) {
    return read_values(repo_dir_, key, scope);
}

} // namespace workon
