#include <workon/copy.hpp>
#include <workon/glob.hpp>
#include <workon/log.hpp>
#include <workon/process.hpp>

#include <unordered_set>

namespace workon {

namespace fs = std::filesystem;

static std::string expand_dir_pattern(const std::string& pattern) {
    if (!pattern.empty() && pattern.back() == '/') return pattern + "**";
    return pattern;
}

static bool excluded(const std::string& rel, const std::vector<std::string>& excludes) {
    for (const auto& ex : excludes) {
        if (glob_match(expand_dir_pattern(ex), rel)) return true;
    }
    return false;
}

static Status copy_one(const fs::path& src, const fs::path& dest) {
    auto r = run_command({"cp", "--reflink=auto", src.string(), dest.string()});
    if (r.is_ok() && r.value().exit_code == 0) return ok_status();

    std::error_code ec;
    fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return WorkonError{WorkonError::IO,
            "cannot copy " + src.string() + " to " + dest.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<std::vector<std::string>> FileCopyEngine::copy_matching(
    const fs::path& source_dir,
    const fs::path& dest_dir,
    const std::vector<std::string>& include_patterns,
    const std::vector<std::string>& exclude_patterns,
    bool overwrite)
{
    std::vector<std::string> copied;
    std::unordered_set<std::string> seen;

    for (const auto& pattern : include_patterns) {
        auto matches = glob_expand(expand_dir_pattern(pattern), source_dir);
        if (matches.is_err()) return std::move(matches).error();

        for (const auto& rel : matches.value()) {
            if (!seen.insert(rel).second) continue;
            if (excluded(rel, exclude_patterns)) {
                log::trace("copy: excluded %s", rel.c_str());
                continue;
            }

            fs::path dest = dest_dir / rel;
            std::error_code ec;
            if (fs::exists(dest, ec) && !overwrite) {
                log::debug("copy: skipping %s (already exists)", rel.c_str());
                continue;
            }
            fs::create_directories(dest.parent_path(), ec);
            if (ec) {
                return WorkonError{WorkonError::IO,
                    "cannot create " + dest.parent_path().string() + ": " + ec.message()};
            }

            WORKON_TRY(copy_one(source_dir / rel, dest));
            copied.push_back(rel);
        }
    }

    return Result<std::vector<std::string>>::ok(std::move(copied));
}

} // namespace workon
