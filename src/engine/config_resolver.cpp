#include <workon/engine/config_resolver.hpp>
#include <workon/branch_name.hpp>

#include <algorithm>
#include <cctype>

namespace workon {

const char* source_name(ValueSource src) {
    switch (src) {
        case ValueSource::Cli:     return "command line";
        case ValueSource::Local:   return "local config";
        case ValueSource::Global:  return "global config";
        case ValueSource::Default: return "built-in default";
    }
    return "unknown";
}

const std::vector<KeySpec>& known_keys() {
    static const std::vector<KeySpec> specs = {
        {keys::DefaultBranch,     false, std::nullopt},
        {keys::PostCreateHook,    true,  std::nullopt},
        {keys::CopyPattern,       true,  std::nullopt},
        {keys::CopyExclude,       true,  std::nullopt},
        {keys::AutoCopyUntracked, false, std::string("false")},
        {keys::ProtectedBranches, true,  std::nullopt},
        {keys::PrFormat,          false, std::string("pr-{number}")},
        {keys::HookTimeout,       false, std::string("300")},
    };
    return specs;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return s;
}

const KeySpec* find_key_spec(const std::string& key) {
    const std::string wanted = lower(key);
    for (const auto& spec : known_keys()) {
        if (lower(spec.name) == wanted) return &spec;
    }
    return nullptr;
}

Result<bool> parse_git_bool(const std::string& raw) {
    const std::string v = lower(raw);
    if (v.empty() || v == "true" || v == "yes" || v == "on" || v == "1") {
        return Result<bool>::ok(true);
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return Result<bool>::ok(false);
    }
    return WorkonError{WorkonError::InvalidArg, "'" + raw + "' is not a boolean"};
}

ConfigResolver::ConfigResolver(ConfigStore& store) : store_(store) {}

Status ConfigResolver::set_override(const std::string& key, const std::string& value) {
    const KeySpec* spec = find_key_spec(key);
    if (!spec) {
        return WorkonError{WorkonError::Config,
            "unknown configuration key '" + key + "' on the command line",
            "recognized keys start with 'workon.', e.g. workon.prFormat"};
    }
    auto& slot = overrides_[spec->name];
    if (!spec->multi) slot.clear();
    slot.push_back(value);
    return ok_status();
}

Status ConfigResolver::set_override(const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        return WorkonError{WorkonError::Config,
            "malformed override '" + assignment + "'", "expected key=value"};
    }
    return set_override(assignment.substr(0, eq), assignment.substr(eq + 1));
}

static WorkonError invalid_value(const ResolvedValue& v, const std::string& value,
                                 const std::string& rule) {
    std::string hint;
    switch (v.source) {
        case ValueSource::Local:
            hint = "fix it with: git config --local --replace-all " + v.key + " <value>";
            break;
        case ValueSource::Global:
            hint = "fix it with: git config --global --replace-all " + v.key + " <value>";
            break;
        default:
            break;
    }
    return WorkonError{WorkonError::Config,
        "invalid value '" + value + "' for " + v.key + " (from " +
        source_name(v.source) + "): " + rule,
        hint};
}

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

Status ConfigResolver::validate(const KeySpec& spec, const ResolvedValue& v) const {
    const std::string name = spec.name;

    if (name == keys::PostCreateHook || name == keys::ProtectedBranches) {
        for (const auto& entry : v.values) {
            if (is_blank(entry)) return invalid_value(v, entry, "entries must not be empty");
        }
        return ok_status();
    }
    if (!v.is_set()) return ok_status();

    const std::string& value = v.single();

    if (name == keys::DefaultBranch) {
        auto b = BranchName::parse(value);
        if (b.is_err()) return invalid_value(v, value, b.error().message);
    } else if (name == keys::AutoCopyUntracked) {
        if (parse_git_bool(value).is_err()) {
            return invalid_value(v, value, "expected true/false/yes/no/on/off/1/0");
        }
    } else if (name == keys::PrFormat) {
        const std::string placeholder = "{number}";
        if (value.find(placeholder) == std::string::npos) {
            return invalid_value(v, value, "must contain the {number} placeholder");
        }
        std::string rest = value;
        for (size_t pos; (pos = rest.find(placeholder)) != std::string::npos;) {
            rest.replace(pos, placeholder.size(), "1");
        }
        if (rest.find('{') != std::string::npos || rest.find('}') != std::string::npos) {
            return invalid_value(v, value, "{number} is the only supported placeholder");
        }
        auto b = BranchName::parse(rest);
        if (b.is_err()) {
            return invalid_value(v, value, "does not produce a valid branch name (" +
                                           b.error().message + ")");
        }
    } else if (name == keys::HookTimeout) {
        if (value.empty() || value.size() > 9 ||
            !std::all_of(value.begin(), value.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            })) {
            return invalid_value(v, value, "expected a non-negative number of seconds");
        }
    }
    return ok_status();
}

Result<ResolvedValue> ConfigResolver::resolve(const std::string& key) const {
    const KeySpec* spec = find_key_spec(key);
    if (!spec) {
        return WorkonError{WorkonError::Config, "unknown configuration key '" + key + "'"};
    }

    ResolvedValue v;
    v.key = spec->name;

    auto ov = overrides_.find(spec->name);
    if (ov != overrides_.end() && !ov->second.empty()) {
        v.values = ov->second;
        v.source = ValueSource::Cli;
    } else {
        for (auto scope : {ConfigScope::Local, ConfigScope::Global}) {
            if (spec->multi) {
                auto r = store_.get_all_scoped(spec->name, scope);
                if (r.is_err()) return std::move(r).error();
                v.values = std::move(r).value();
            } else {
                auto r = store_.get_scoped(spec->name, scope);
                if (r.is_err()) return std::move(r).error();
                if (r.value()) v.values = {*r.value()};
            }
            if (!v.values.empty()) {
                v.source = scope == ConfigScope::Local ? ValueSource::Local
                                                       : ValueSource::Global;
                break;
            }
        }
        if (v.values.empty() && spec->default_value) {
            v.values = {*spec->default_value};
            v.source = ValueSource::Default;
        }
    }

    WORKON_TRY(validate(*spec, v));
    return Result<ResolvedValue>::ok(std::move(v));
}

Result<std::optional<std::string>> ConfigResolver::default_branch() const {
    auto r = resolve(keys::DefaultBranch);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().is_set()) return Result<std::optional<std::string>>::ok(std::nullopt);
    return Result<std::optional<std::string>>::ok(r.value().single());
}

static Result<std::vector<std::string>> list_of(const ConfigResolver& cfg, const char* key) {
    auto r = cfg.resolve(key);
    if (r.is_err()) return std::move(r).error();
    return Result<std::vector<std::string>>::ok(std::move(r.value().values));
}

Result<std::vector<std::string>> ConfigResolver::post_create_hooks() const {
    return list_of(*this, keys::PostCreateHook);
}

Result<std::vector<std::string>> ConfigResolver::copy_patterns() const {
    return list_of(*this, keys::CopyPattern);
}

Result<std::vector<std::string>> ConfigResolver::copy_excludes() const {
    return list_of(*this, keys::CopyExclude);
}

Result<std::vector<std::string>> ConfigResolver::protected_branches() const {
    return list_of(*this, keys::ProtectedBranches);
}

Result<bool> ConfigResolver::auto_copy_untracked() const {
    auto r = resolve(keys::AutoCopyUntracked);
    if (r.is_err()) return std::move(r).error();
    return parse_git_bool(r.value().single());
}

Result<std::string> ConfigResolver::pr_format() const {
    auto r = resolve(keys::PrFormat);
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(r.value().single());
}

Result<int> ConfigResolver::hook_timeout() const {
    auto r = resolve(keys::HookTimeout);
    if (r.is_err()) return std::move(r).error();
    return Result<int>::ok(std::stoi(r.value().single()));
}

Result<std::optional<std::string>> ConfigResolver::git_setting(const std::string& key) const {
    for (auto scope : {ConfigScope::Local, ConfigScope::Global}) {
        auto r = store_.get_scoped(key, scope);
        if (r.is_err()) return std::move(r).error();
        if (r.value()) return Result<std::optional<std::string>>::ok(*r.value());
    }
    return Result<std::optional<std::string>>::ok(std::nullopt);
}

} // namespace workon
