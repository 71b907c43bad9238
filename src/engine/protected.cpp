#include <workon/engine/protected.hpp>

namespace workon {

bool protected_pattern_matches(const std::string& pattern, const std::string& branch) {
    if (pattern == "*") return true;

    const std::string wildcard = "/*";
    if (pattern.size() > wildcard.size() &&
        pattern.compare(pattern.size() - wildcard.size(), wildcard.size(), wildcard) == 0) {
        // prefix + '/' followed by a single non-empty segment
        const size_t ns_len = pattern.size() - 1;
        if (branch.size() <= ns_len) return false;
        if (branch.compare(0, ns_len, pattern, 0, ns_len) != 0) return false;
        return branch.find('/', ns_len) == std::string::npos;
    }

    return pattern == branch;
}

bool is_protected(const std::string& branch, const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (protected_pattern_matches(p, branch)) return true;
    }
    return false;
}

ProtectedBranchMatcher::ProtectedBranchMatcher(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {}

bool ProtectedBranchMatcher::is_protected(const std::string& branch) const {
    return matching_pattern(branch) != nullptr;
}

const std::string* ProtectedBranchMatcher::matching_pattern(const std::string& branch) const {
    for (const auto& p : patterns_) {
        if (protected_pattern_matches(p, branch)) return &p;
    }
    return nullptr;
}

} // namespace workon
