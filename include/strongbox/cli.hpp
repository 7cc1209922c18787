// ============================================================================
// Strongbox - Command Line Interface
// ============================================================================
// A command-line secret store backed by a local master key.
//
// Usage:
//   strongbox <command> [options] [arguments]
//
// Commands:
//   add       Encrypt and store a password for a service
//   get       Decrypt and print the password for a service
//   delete    Remove the password for a service
//   list      List stored service names
//   help      Show help information
//   version   Show version information
// ============================================================================

#ifndef STRONGBOX_CLI_HPP
#define STRONGBOX_CLI_HPP

#include "strongbox/config.hpp"
#include "strongbox/types.hpp"

#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strongbox::cli {

/// Exit codes for the CLI. Each error class has its own status so scripts can
/// tell "not found" apart from "wrong key" apart from "corrupt file".
enum class ExitCode : int {
    Success = 0,
    InvalidArguments = 1,
    FileError = 2,
    CryptoError = 3,
    KeyError = 4,
    InternalError = 5,
    NotFound = 6,
    AuthenticationError = 7,
    FormatError = 8
};

/// Map a library error to the process exit status
[[nodiscard]] ExitCode exit_code_for(ErrorCode code) noexcept;

/// CLI argument parser result
struct ParsedArgs {
    std::string command;
    std::vector<std::string> positional;

    // Flags
    bool help = false;
    bool verbose = false;
    bool version = false;

    // Options with values
    std::optional<std::string> data_file;
    std::optional<std::string> key_file;

    // Unrecognised option, reported by run()
    std::optional<std::string> unknown_option;
};

/// Diagnostic output. Errors and warnings go to the error stream, results
/// and confirmations to the output stream. Info lines only appear in
/// verbose mode.
class Console {
public:
    Console(std::ostream& out, std::ostream& err, bool verbose = false)
        : out_(out), err_(err), verbose_(verbose) {}

    void print_error(std::string_view message);
    void print_warning(std::string_view message);
    void print_success(std::string_view message);
    void print_info(std::string_view message);

    /// Bare line on the output stream (command results)
    void print_line(std::string_view text);

    [[nodiscard]] std::ostream& out() noexcept { return out_; }
    [[nodiscard]] bool verbose() const noexcept { return verbose_; }
    void set_verbose(bool verbose) noexcept { verbose_ = verbose; }

private:
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
};

/// Parse command line arguments
[[nodiscard]] ParsedArgs parse_args(std::span<char*> args);

/// Main CLI entry point (standard streams)
[[nodiscard]] ExitCode run(std::span<char*> args);

/// Main CLI entry point with explicit streams
[[nodiscard]] ExitCode run(std::span<char*> args, std::ostream& out, std::ostream& err);

// Command handlers
[[nodiscard]] ExitCode cmd_help(const ParsedArgs& args, Console& console);
[[nodiscard]] ExitCode cmd_version(Console& console);
[[nodiscard]] ExitCode cmd_add(const ParsedArgs& args, const Config& config, Console& console);
[[nodiscard]] ExitCode cmd_get(const ParsedArgs& args, const Config& config, Console& console);
[[nodiscard]] ExitCode cmd_delete(const ParsedArgs& args, const Config& config, Console& console);
[[nodiscard]] ExitCode cmd_list(const ParsedArgs& args, const Config& config, Console& console);

/// Securely read a password from the terminal (hides input)
[[nodiscard]] std::string read_password(std::string_view prompt);

} // namespace strongbox::cli

#endif // STRONGBOX_CLI_HPP
