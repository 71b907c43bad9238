#include <workon/engine/name_resolver.hpp>
#include <workon/branch_name.hpp>
#include <workon/log.hpp>

#include <algorithm>
#include <cctype>

namespace workon {

namespace fs = std::filesystem;

namespace {

struct ModeName {
    const char* operator()(const NormalMode&) const { return "normal"; }
    const char* operator()(const OrphanMode&) const { return "orphan"; }
    const char* operator()(const DetachedMode&) const { return "detached"; }
    const char* operator()(const PrTrackingMode&) const { return "pr"; }
};

} // namespace

const char* mode_name(const CreationMode& mode) {
    return std::visit(ModeName{}, mode);
}

// ---------------------------------------------------------------------------
// Pull request tokens
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

static Result<std::optional<unsigned>> pr_number(const std::string& digits,
                                                 const std::string& token) {
    // Nine digits keeps the value inside `unsigned` without overflow checks.
    if (!all_digits(digits) || digits.size() > 9 || std::stoul(digits) == 0) {
        return WorkonError{WorkonError::Resolution,
            "invalid pull request reference '" + token + "'",
            "use #<number>, pr#<number>, pr-<number> or a .../pull/<number> URL"};
    }
    return Result<std::optional<unsigned>>::ok(
        static_cast<unsigned>(std::stoul(digits)));
}

static std::vector<std::string> split_slash(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t slash = s.find('/', start);
        parts.push_back(s.substr(start, slash == std::string::npos ? std::string::npos
                                                                    : slash - start));
        if (slash == std::string::npos) return parts;
        start = slash + 1;
    }
}

Result<std::optional<unsigned>> parse_pr_reference(const std::string& token) {
    if (starts_with(token, "#")) return pr_number(token.substr(1), token);
    if (starts_with(token, "pr#")) return pr_number(token.substr(3), token);
    // "pr-cleanup" is an ordinary branch name; only digits make it a PR.
    if (starts_with(token, "pr-") && all_digits(token.substr(3))) {
        return pr_number(token.substr(3), token);
    }

    if (token.find("/pull/") == std::string::npos) {
        return Result<std::optional<unsigned>>::ok(std::nullopt);
    }

    auto parts = split_slash(token);
    if (token.find("://") != std::string::npos) {
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            if (parts[i] != "pull") continue;
            std::string seg = parts[i + 1];
            seg = seg.substr(0, seg.find_first_of("?#"));
            return pr_number(seg, token);
        }
        return pr_number("", token);
    }

    if (parts.size() >= 4 && parts[parts.size() - 3] == "pull" && parts.back() == "head") {
        return pr_number(parts[parts.size() - 2], token);
    }

    // Something like "fix/pull/thing" is a namespaced branch name.
    return Result<std::optional<unsigned>>::ok(std::nullopt);
}

std::string format_pr_name(const std::string& format, unsigned number) {
    const std::string placeholder = "{number}";
    const std::string digits = std::to_string(number);
    std::string out = format;
    size_t pos = 0;
    while ((pos = out.find(placeholder, pos)) != std::string::npos) {
        out.replace(pos, placeholder.size(), digits);
        pos += digits.size();
    }
    return out;
}

// ---------------------------------------------------------------------------
// NameResolver
// ---------------------------------------------------------------------------

static fs::path normalized(const fs::path& p) {
    std::error_code ec;
    auto canon = fs::weakly_canonical(p, ec);
    if (ec) return p.lexically_normal();
    return canon;
}

// True when `inner` lies strictly below `outer`.
static bool is_below(const fs::path& outer, const fs::path& inner) {
    auto o = outer.begin();
    auto i = inner.begin();
    for (; o != outer.end(); ++o, ++i) {
        if (i == inner.end() || *o != *i) return false;
    }
    return i != inner.end();
}

NameResolver::NameResolver(fs::path worktrees_root)
    : root_(normalized(worktrees_root)) {}

Result<NameResolution> NameResolver::resolve(const std::string& token,
                                             const ResolveOptions& opts,
                                             const std::vector<WorktreeEntry>& existing) const {
    if (opts.orphan && opts.detach) {
        return WorkonError{WorkonError::Resolution,
            "cannot create '" + token + "' as both orphan and detached",
            "pass at most one of --orphan and --detach"};
    }
    if (token.empty()) {
        return WorkonError{WorkonError::Resolution, "empty worktree name"};
    }

    NameResolution res;
    res.mode = NormalMode{};
    res.branch_name = token;

    if (opts.orphan) {
        res.mode = OrphanMode{};
    } else if (opts.detach) {
        res.mode = DetachedMode{};
    } else if (!opts.explicit_base && !opts.literal) {
        auto pr = parse_pr_reference(token);
        if (pr.is_err()) return std::move(pr).error();
        if (pr.value()) {
            res.mode = PrTrackingMode{*pr.value()};
            res.branch_name = format_pr_name(opts.pr_format, *pr.value());
            log::debug("'%s' is pull request #%u -> branch '%s'",
                       token.c_str(), *pr.value(), res.branch_name.c_str());
        }
    }

    auto name = BranchName::parse(res.branch_name);
    if (name.is_err()) {
        return WorkonError{WorkonError::Resolution,
            name.error().message, "choose a name git accepts as a branch"};
    }

    res.worktree_path = root_ / name.value().relative_path();
    WORKON_TRY(check_collision(res, existing));
    return Result<NameResolution>::ok(std::move(res));
}

Status NameResolver::check_collision(const NameResolution& res,
                                     const std::vector<WorktreeEntry>& existing) const {
    const fs::path target = normalized(res.worktree_path);
    const bool wants_branch = !std::holds_alternative<DetachedMode>(res.mode);

    for (const auto& e : existing) {
        const fs::path p = normalized(e.path);
        if (p == target) {
            return WorkonError{WorkonError::Resolution,
                "name already in use: a worktree is already registered at " + target.string(),
                "pick another name or prune the existing worktree"};
        }
        if (wants_branch && e.branch && *e.branch == res.branch_name) {
            return WorkonError{WorkonError::Resolution,
                "name already in use: branch '" + res.branch_name +
                "' is already checked out at " + p.string()};
        }
        if (!e.bare && p != root_ && is_below(p, target)) {
            return WorkonError{WorkonError::Resolution,
                "name already in use: " + target.string() +
                " would be nested inside the worktree at " + p.string()};
        }
    }

    std::error_code ec;
    if (fs::exists(target, ec)) {
        return WorkonError{WorkonError::Resolution,
            "name already in use: " + target.string() + " already exists",
            "remove the directory or pick another name"};
    }
    return ok_status();
}

} // namespace workon
