#pragma once

#include <workon/config_store.hpp>
#include <workon/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace workon {

namespace keys {
inline constexpr const char* DefaultBranch     = "workon.defaultBranch";
inline constexpr const char* PostCreateHook    = "workon.postCreateHook";
inline constexpr const char* CopyPattern       = "workon.copyPattern";
inline constexpr const char* CopyExclude       = "workon.copyExclude";
inline constexpr const char* AutoCopyUntracked = "workon.autoCopyUntracked";
inline constexpr const char* ProtectedBranches = "workon.pruneProtectedBranches";
inline constexpr const char* PrFormat          = "workon.prFormat";
inline constexpr const char* HookTimeout       = "workon.hookTimeout";
} // namespace keys

enum class ValueSource { Cli, Local, Global, Default };

const char* source_name(ValueSource src);

struct KeySpec {
    const char* name;
    bool multi;
    std::optional<std::string> default_value;
};

// Recognized keys, or nullptr. Lookup is case-insensitive like git's.
const KeySpec* find_key_spec(const std::string& key);
const std::vector<KeySpec>& known_keys();

struct ResolvedValue {
    std::string key;
    std::vector<std::string> values;  // single-valued keys hold at most one
    ValueSource source = ValueSource::Default;

    bool is_set() const { return !values.empty(); }
    const std::string& single() const { return values.back(); }
};

// git's boolean spellings; an empty value means true.
Result<bool> parse_git_bool(const std::string& raw);

// Layered settings for one invocation:
// CLI override > local scope > global scope > built-in default.
// Multi-valued keys are never merged: the first layer defining the key wins whole.
class ConfigResolver {
public:
    explicit ConfigResolver(ConfigStore& store);

    // Single-valued keys replace the override; multi-valued keys append to it.
    Status set_override(const std::string& key, const std::string& value);
    // Parse "key=value" as given to -c.
    Status set_override(const std::string& assignment);

    Result<ResolvedValue> resolve(const std::string& key) const;

    Result<std::optional<std::string>> default_branch() const;
    Result<std::vector<std::string>> post_create_hooks() const;
    Result<std::vector<std::string>> copy_patterns() const;
    Result<std::vector<std::string>> copy_excludes() const;
    Result<bool> auto_copy_untracked() const;
    Result<std::vector<std::string>> protected_branches() const;
    Result<std::string> pr_format() const;
    Result<int> hook_timeout() const;

    // Raw, unvalidated value of an arbitrary git setting (local, then global).
    Result<std::optional<std::string>> git_setting(const std::string& key) const;

private:
    ConfigStore& store_;
    std::map<std::string, std::vector<std::string>> overrides_;

    Status validate(const KeySpec& spec, const ResolvedValue& value) const;
};

} // namespace workon
