#pragma once

#include <workon/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace workon {

enum class ConfigScope { Local, Global };

const char* scope_name(ConfigScope scope);

// Scoped key/value source. Multi-valued keys keep insertion order and duplicates.
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual Result<std::optional<std::string>> get_scoped(const std::string& key,
                                                          ConfigScope scope) = 0;
    virtual Result<std::vector<std::string>> get_all_scoped(const std::string& key,
                                                            ConfigScope scope) = 0;
};

// ConfigStore over `git config --local` / `git config --global`.
class GitConfigStore : public ConfigStore {
public:
    explicit GitConfigStore(std::filesystem::path repo_dir);

    Result<std::optional<std::string>> get_scoped(const std::string& key,
                                                  ConfigScope scope) override;
    Result<std::vector<std::string>> get_all_scoped(const std::string& key,
                                                    ConfigScope scope) override;

private:
    std::filesystem::path repo_dir_;
};

} // namespace workon
