#include <workon/glob.hpp>
#include <algorithm>

namespace workon {

namespace fs = std::filesystem;

static std::string normalize(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    if (out.size() > 2 && out.compare(0, 2, "./") == 0) out.erase(0, 2);
    return out;
}

static std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> segs;
    size_t start = 0;
    for (;;) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            segs.push_back(s.substr(start));
            return segs;
        }
        segs.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
}

// Parse a [...] class starting just after '['. Advances `pi` past ']'.
static bool match_class(const std::string& pat, size_t& pi, char c) {
    bool negate = false;
    if (pi < pat.size() && (pat[pi] == '!' || pat[pi] == '^')) {
        negate = true;
        pi++;
    }
    bool matched = false;
    while (pi < pat.size() && pat[pi] != ']') {
        char lo = pat[pi];
        if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
            if (c >= lo && c <= pat[pi + 2]) matched = true;
            pi += 3;
        } else {
            if (c == lo) matched = true;
            pi++;
        }
    }
    if (pi < pat.size()) pi++;
    return matched != negate;
}

// Single path segment; neither side contains '/'.
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];
        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }
        if (si >= str.size()) return false;
        if (pc == '?') {
            pi++;
            si++;
        } else if (pc == '[') {
            pi++;
            if (!match_class(pat, pi, str[si])) return false;
            si++;
        } else {
            if (pc != str[si]) return false;
            pi++;
            si++;
        }
    }
    return si == str.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k < path.size(); k++) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size()) return false;
        if (!match_segment(pat[pi], 0, path[si], 0)) return false;
        pi++;
        si++;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split(normalize(pattern)), 0, split(normalize(path)), 0);
}

Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const fs::path& root_dir,
    const std::vector<std::string>& prune_dirs)
{
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return WorkonError(WorkonError::IO,
            "glob_expand: not a directory: " + root_dir.string());
    }

    std::vector<std::string> results;
    auto norm_pattern = normalize(pattern);

    fs::recursive_directory_iterator it(root_dir, ec);
    if (ec) {
        return WorkonError(WorkonError::IO,
            "cannot read directory " + root_dir.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return WorkonError(WorkonError::IO,
                "error iterating " + root_dir.string() + ": " + ec.message());
        }
        const auto name = it->path().filename().string();
        if (it->is_directory(ec)) {
            if (std::find(prune_dirs.begin(), prune_dirs.end(), name) != prune_dirs.end()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec) || name == ".git") continue;

        auto rel = fs::relative(it->path(), root_dir, ec);
        if (ec) continue;

        auto rel_str = normalize(rel.generic_string());
        if (glob_match(norm_pattern, rel_str)) {
            results.push_back(rel_str);
        }
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace workon
