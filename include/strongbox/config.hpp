// ============================================================================
// Strongbox - Configuration
// ============================================================================
// Locations of the two persistent files. Each comes from, in order:
//   1. a command-line override (--data-file / --key-file)
//   2. an environment variable (STRONGBOX_DATA_FILE / STRONGBOX_KEY_FILE)
//   3. the default name in the working directory
// ============================================================================

#ifndef STRONGBOX_CONFIG_HPP
#define STRONGBOX_CONFIG_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace strongbox {

struct Config {
    std::filesystem::path data_path;
    std::filesystem::path key_path;
    bool verbose = false;

    /// Default file names in the working directory
    [[nodiscard]] static Config defaults();

    /// Lock file guarding the data file and key file against concurrent runs
    [[nodiscard]] std::filesystem::path lock_path() const;
};

/// Explicit overrides, typically from the command line
struct ConfigOverrides {
    std::optional<std::string> data_file;
    std::optional<std::string> key_file;
    bool verbose = false;
};

/// Looks up an environment variable; empty optional if unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Reads the process environment
[[nodiscard]] std::optional<std::string> process_env(std::string_view name);

/// Resolve the effective configuration
[[nodiscard]] Config resolve_config(
    const ConfigOverrides& overrides,
    const EnvLookup& env = process_env
);

} // namespace strongbox

#endif // STRONGBOX_CONFIG_HPP
