#pragma once

#include <string>
#include <vector>

namespace workon {

// One protected-branch pattern: an exact name, "*" (everything) or
// "<ns>/*" (direct children of namespace <ns>, one level only).
bool protected_pattern_matches(const std::string& pattern, const std::string& branch);

bool is_protected(const std::string& branch, const std::vector<std::string>& patterns);

// Exempts branches from destructive operations. Patterns are evaluated in
// configured order and the first match wins.
class ProtectedBranchMatcher {
public:
    explicit ProtectedBranchMatcher(std::vector<std::string> patterns);

    bool is_protected(const std::string& branch) const;

    // The first pattern matching `branch`, or nullptr.
    const std::string* matching_pattern(const std::string& branch) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
};

} // namespace workon
