#pragma once

#include <workon/git.hpp>
#include <workon/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace workon {

struct NormalMode {};
struct OrphanMode {};
struct DetachedMode {};
struct PrTrackingMode {
    unsigned number = 0;
};

using CreationMode = std::variant<NormalMode, OrphanMode, DetachedMode, PrTrackingMode>;

const char* mode_name(const CreationMode& mode);

// Recognize a pull request token: "#12", "pr#12", "pr-12", a hosted URL
// ".../pull/12[/...]" or a remote ref "<remote>/pull/12/head".
// nullopt when the token is not PR-shaped; an error when it is PR-shaped
// but carries no usable number (e.g. "#abc").
Result<std::optional<unsigned>> parse_pr_reference(const std::string& token);

// Substitute every {number} in a validated template.
std::string format_pr_name(const std::string& format, unsigned number);

struct ResolveOptions {
    bool orphan = false;
    bool detach = false;
    bool explicit_base = false;   // PR shorthand is only recognized without --base
    bool literal = false;         // never read the token as a pull request
    std::string pr_format = "pr-{number}";
};

struct NameResolution {
    std::string branch_name;               // worktree name for detached mode
    std::filesystem::path worktree_path;
    CreationMode mode;
};

class NameResolver {
public:
    explicit NameResolver(std::filesystem::path worktrees_root);

    Result<NameResolution> resolve(const std::string& token,
                                   const ResolveOptions& opts,
                                   const std::vector<WorktreeEntry>& existing) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    Status check_collision(const NameResolution& res,
                           const std::vector<WorktreeEntry>& existing) const;
};

} // namespace workon
