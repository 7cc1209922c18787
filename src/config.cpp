// ============================================================================
// Strongbox - Configuration Implementation
// ============================================================================

#include "strongbox/config.hpp"
#include "strongbox/types.hpp"

#include <cstdlib>

namespace strongbox {

Config Config::defaults() {
    Config config;
    config.data_path = constants::DEFAULT_DATA_FILE;
    config.key_path = constants::DEFAULT_KEY_FILE;
    return config;
}

std::filesystem::path Config::lock_path() const {
    std::filesystem::path lock = data_path;
    lock += ".lock";
    return lock;
}

std::optional<std::string> process_env(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Config resolve_config(const ConfigOverrides& overrides, const EnvLookup& env) {
    Config config = Config::defaults();
    config.verbose = overrides.verbose;

    // Empty values count as unset so `STRONGBOX_KEY_FILE=` falls back cleanly
    auto pick = [&](const std::optional<std::string>& option, const char* variable)
        -> std::optional<std::string> {
        if (option && !option->empty()) {
            return option;
        }
        if (env) {
            if (auto value = env(variable); value && !value->empty()) {
                return value;
            }
        }
        return std::nullopt;
    };

    if (auto path = pick(overrides.data_file, constants::ENV_DATA_FILE)) {
        config.data_path = *path;
    }
    if (auto path = pick(overrides.key_file, constants::ENV_KEY_FILE)) {
        config.key_path = *path;
    }

    return config;
}

} // namespace strongbox
