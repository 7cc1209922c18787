// ============================================================================
// Strongbox - Command Line Interface Implementation
// ============================================================================

#include "strongbox/cli.hpp"
#include "strongbox/strongbox.hpp"

#include <expected>
#include <iostream>
#include <string>

#include <termios.h>
#include <unistd.h>

namespace strongbox::cli {

namespace {

std::string quoted(std::string_view text) {
    return "'" + std::string(text) + "'";
}

std::string describe(std::string_view what, ErrorCode code) {
    return std::string(what) + ": " + std::string(error_to_string(code));
}

/// Everything a command needs once the files are locked
struct Session {
    FileLock lock;
    RecordStore records;
};

/// Take the lock and load the data file
std::expected<Session, ExitCode> open_session(const Config& config, Console& console) {
    console.print_info("Data file: " + config.data_path.string());

    auto lock = FileLock::acquire(config.lock_path());
    if (!lock) {
        console.print_error(describe("Cannot lock " + config.lock_path().string(), lock.error()));
        return std::unexpected(exit_code_for(lock.error()));
    }

    RecordStore records(config.data_path);
    if (auto loaded = records.load(); !loaded) {
        console.print_error(describe("Cannot load " + config.data_path.string(), loaded.error()));
        if (classify(loaded.error()) == ErrorClass::Format) {
            console.print_info("The data file was left untouched; repair or move it before retrying.");
        }
        return std::unexpected(exit_code_for(loaded.error()));
    }

    console.print_info("Loaded " + std::to_string(records.size()) + " record(s)");
    return Session{std::move(*lock), std::move(records)};
}

/// Load or create the master key, warning when a new key can't open the
/// records already on disk
std::expected<MasterKey, ExitCode> open_master_key(
    const Config& config,
    const RecordStore& records,
    Console& console
) {
    console.print_info("Key file: " + config.key_path.string());

    KeyStore key_store(config.key_path);
    auto key = key_store.load_or_generate();
    if (!key) {
        console.print_error(describe("Cannot obtain master key " + config.key_path.string(),
                                     key.error()));
        return std::unexpected(exit_code_for(key.error()));
    }

    switch (key->origin) {
        case KeyOrigin::Loaded:
            break;
        case KeyOrigin::Generated:
            console.print_info("Generated new master key: " + config.key_path.string());
            break;
        case KeyOrigin::Replaced:
            console.print_warning("Master key file " + config.key_path.string() +
                                  " was unreadable or malformed and has been replaced");
            break;
    }

    if (key->origin != KeyOrigin::Loaded && !records.empty()) {
        console.print_warning("The " + std::to_string(records.size()) +
                              " existing record(s) were sealed under a different key"
                              " and cannot be opened with the new one");
    }

    return std::move(*key);
}

} // namespace

// ============================================================================
// Terminal Utilities
// ============================================================================

void Console::print_error(std::string_view message) {
    err_ << "[ERROR] " << message << "\n";
}

void Console::print_warning(std::string_view message) {
    err_ << "[WARN] " << message << "\n";
}

void Console::print_success(std::string_view message) {
    out_ << "[OK] " << message << "\n";
}

void Console::print_info(std::string_view message) {
    if (verbose_) {
        err_ << "[INFO] " << message << "\n";
    }
}

void Console::print_line(std::string_view text) {
    out_ << text << "\n";
}

std::string read_password(std::string_view prompt) {
    std::string password;

    // Piped input: no prompt, no terminal tricks
    if (!::isatty(STDIN_FILENO)) {
        std::getline(std::cin, password);
        return password;
    }

    std::cerr << prompt << std::flush;

    // Disable terminal echo while the password is typed
    struct termios old_term, new_term;
    bool restore = ::tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (restore) {
        new_term = old_term;
        new_term.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::getline(std::cin, password);

    if (restore) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    }
    std::cerr << "\n";

    return password;
}

ExitCode exit_code_for(ErrorCode code) noexcept {
    switch (classify(code)) {
        case ErrorClass::None:
            return ExitCode::Success;
        case ErrorClass::KeyIO:
            return ExitCode::KeyError;
        case ErrorClass::Format:
            return ExitCode::FormatError;
        case ErrorClass::Authentication:
            return ExitCode::AuthenticationError;
        case ErrorClass::NotFound:
            return ExitCode::NotFound;
        case ErrorClass::IO:
            return ExitCode::FileError;
        case ErrorClass::Internal:
            break;
    }

    switch (code) {
        case ErrorCode::EncryptionFailed:
        case ErrorCode::CipherInitFailed:
        case ErrorCode::CipherUpdateFailed:
        case ErrorCode::CipherFinalizeFailed:
        case ErrorCode::DecryptionFailed:
            return ExitCode::CryptoError;
        case ErrorCode::InvalidServiceName:
        case ErrorCode::InvalidArgument:
            return ExitCode::InvalidArguments;
        default:
            return ExitCode::InternalError;
    }
}

// ============================================================================
// Argument Parsing
// ============================================================================

ParsedArgs parse_args(std::span<char*> args) {
    ParsedArgs result;
    bool options_done = false;

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (!options_done && arg == "--") {
            // Everything after "--" is positional (passwords starting with '-')
            options_done = true;
        } else if (!options_done && arg.starts_with("--")) {
            std::string_view option = arg.substr(2);

            if (option == "help") {
                result.help = true;
            } else if (option == "verbose") {
                result.verbose = true;
            } else if (option == "version") {
                result.version = true;
            } else if (option.starts_with("data-file=")) {
                result.data_file = std::string(option.substr(10));
            } else if (option.starts_with("key-file=")) {
                result.key_file = std::string(option.substr(9));
            } else if (!result.unknown_option) {
                result.unknown_option = std::string(arg);
            }
        } else if (!options_done && arg.size() > 1 && arg.starts_with("-")) {
            // Short options
            for (std::size_t j = 1; j < arg.size(); ++j) {
                switch (arg[j]) {
                    case 'h': result.help = true; break;
                    case 'v': result.verbose = true; break;
                    case 'V': result.version = true; break;
                    case 'd':
                        if (i + 1 < args.size()) {
                            result.data_file = args[++i];
                        } else if (!result.unknown_option) {
                            result.unknown_option = "-d (missing path)";
                        }
                        break;
                    case 'k':
                        if (i + 1 < args.size()) {
                            result.key_file = args[++i];
                        } else if (!result.unknown_option) {
                            result.unknown_option = "-k (missing path)";
                        }
                        break;
                    default:
                        if (!result.unknown_option) {
                            result.unknown_option = "-" + std::string(1, arg[j]);
                        }
                        break;
                }
            }
        } else {
            // Positional argument
            if (result.command.empty()) {
                result.command = std::string(arg);
            } else {
                result.positional.push_back(std::string(arg));
            }
        }
    }

    return result;
}

// ============================================================================
// Help Command
// ============================================================================

ExitCode cmd_help(const ParsedArgs& args, Console& console) {
    std::ostream& out = console.out();

    if (args.positional.empty() || args.command != "help") {
        out << R"(
Strongbox - A local secret store sealed with AES-256-GCM

USAGE:
    strongbox <command> [options] [arguments]

COMMANDS:
    add <service> [password]   Encrypt and store a password
    get <service>              Decrypt and print a password
    delete <service>           Remove a stored password
    list                       List stored service names
    version                    Show version information
    help [command]             Show this help message

OPTIONS:
    --data-file=<file>, -d     Data file (default: secrets.json)
    --key-file=<file>, -k      Master key file (default: master.key)
    --verbose, -v              Print diagnostics to stderr
    --                         Treat the remaining arguments as positional

ENVIRONMENT:
    STRONGBOX_DATA_FILE        Data file, if --data-file is not given
    STRONGBOX_KEY_FILE         Master key file, if --key-file is not given

EXAMPLES:
    strongbox add github 'p@ss1'
    strongbox get github
    strongbox delete github
    strongbox list --data-file=~/vault.json --key-file=~/vault.key

Use 'strongbox help <command>' for more information about a command.
)";
    } else if (args.positional[0] == "add") {
        out << R"(
strongbox add - Encrypt and store a password

USAGE:
    strongbox add <service> [password]

If the password is omitted it is read from the terminal without echo (or
from stdin when piped). Adding an existing service replaces its password.
Use '--' before a password that starts with '-'.

A master key is generated on first use. Keep the key file safe: without it
no stored password can be recovered.
)";
    } else if (args.positional[0] == "get") {
        out << R"(
strongbox get - Decrypt and print a password

USAGE:
    strongbox get <service>

EXIT STATUS:
    0   Password printed
    6   No password stored for the service
    7   Authentication failed (wrong master key or tampered record)
    8   Record or data file is malformed
)";
    } else if (args.positional[0] == "delete") {
        out << R"(
strongbox delete - Remove a stored password

USAGE:
    strongbox delete <service>

Exits with status 6 if no password is stored for the service.
)";
    } else if (args.positional[0] == "list") {
        out << R"(
strongbox list - List stored service names

USAGE:
    strongbox list

Prints one service name per line, sorted. Prints nothing for an empty store.
)";
    } else {
        console.print_error("No help for unknown command " + cli::quoted(args.positional[0]));
        return ExitCode::InvalidArguments;
    }

    return ExitCode::Success;
}

// ============================================================================
// Version Command
// ============================================================================

ExitCode cmd_version(Console& console) {
    std::ostream& out = console.out();
    out << "Strongbox v" << VERSION_STRING << "\n";
    out << "A local secret store built with modern C++23\n";
    out << "\nEncryption: AES-256-GCM (96-bit random nonce per record)\n";
    out << "Master key: 256-bit random, stored in a local key file\n";
    return ExitCode::Success;
}

// ============================================================================
// Add Command
// ============================================================================

ExitCode cmd_add(const ParsedArgs& args, const Config& config, Console& console) {
    if (args.positional.empty()) {
        console.print_error("Missing service name. Use: strongbox add <service> [password]");
        return ExitCode::InvalidArguments;
    }
    if (args.positional.size() > 2) {
        console.print_error("Too many arguments. Quote passwords that contain spaces.");
        return ExitCode::InvalidArguments;
    }

    const std::string& service = args.positional[0];
    if (service.empty()) {
        console.print_error(std::string(error_to_string(ErrorCode::InvalidServiceName)));
        return ExitCode::InvalidArguments;
    }

    std::string password = args.positional.size() == 2
        ? args.positional[1]
        : read_password("Password for " + cli::quoted(service) + ": ");
    if (password.empty()) {
        console.print_error("Password must not be empty");
        return ExitCode::InvalidArguments;
    }

    auto session = open_session(config, console);
    if (!session) {
        secure_zero(password);
        return session.error();
    }

    auto key = open_master_key(config, session->records, console);
    if (!key) {
        secure_zero(password);
        return key.error();
    }

    auto record = EnvelopeCodec::seal_text(password, key->span());
    secure_zero(password);
    if (!record) {
        console.print_error(describe("Encryption failed", record.error()));
        return exit_code_for(record.error());
    }

    bool replaced = session->records.contains(service);
    if (auto added = session->records.add(service, std::move(*record)); !added) {
        console.print_error(describe("Cannot store " + cli::quoted(service), added.error()));
        return exit_code_for(added.error());
    }

    if (auto saved = session->records.save(); !saved) {
        console.print_error(describe("Cannot save " + config.data_path.string(), saved.error()));
        return exit_code_for(saved.error());
    }

    console.print_success((replaced ? "Updated password for " : "Stored password for ") +
                          cli::quoted(service));
    return ExitCode::Success;
}

// ============================================================================
// Get Command
// ============================================================================

ExitCode cmd_get(const ParsedArgs& args, const Config& config, Console& console) {
    if (args.positional.size() != 1) {
        console.print_error("Use: strongbox get <service>");
        return ExitCode::InvalidArguments;
    }

    const std::string& service = args.positional[0];

    auto session = open_session(config, console);
    if (!session) {
        return session.error();
    }

    auto record = session->records.get(service);
    if (!record) {
        console.print_warning("No password stored for " + cli::quoted(service));
        return exit_code_for(record.error());
    }

    auto key = open_master_key(config, session->records, console);
    if (!key) {
        return key.error();
    }

    auto plaintext = EnvelopeCodec::open_text(*record, key->span());
    if (!plaintext) {
        if (plaintext.error() == ErrorCode::AuthenticationFailed) {
            console.print_error("Cannot decrypt " + cli::quoted(service) +
                                ": wrong master key or tampered record");
        } else {
            console.print_error(describe("Cannot decrypt " + cli::quoted(service), plaintext.error()));
        }
        return exit_code_for(plaintext.error());
    }

    console.print_line(*plaintext);
    secure_zero(*plaintext);
    return ExitCode::Success;
}

// ============================================================================
// Delete Command
// ============================================================================

ExitCode cmd_delete(const ParsedArgs& args, const Config& config, Console& console) {
    if (args.positional.size() != 1) {
        console.print_error("Use: strongbox delete <service>");
        return ExitCode::InvalidArguments;
    }

    const std::string& service = args.positional[0];

    auto session = open_session(config, console);
    if (!session) {
        return session.error();
    }

    // Nothing changed, so nothing is written
    if (!session->records.remove(service)) {
        console.print_warning("No password stored for " + cli::quoted(service));
        return ExitCode::NotFound;
    }

    if (auto saved = session->records.save(); !saved) {
        console.print_error(describe("Cannot save " + config.data_path.string(), saved.error()));
        return exit_code_for(saved.error());
    }

    console.print_success("Deleted " + cli::quoted(service));
    return ExitCode::Success;
}

// ============================================================================
// List Command
// ============================================================================

ExitCode cmd_list(const ParsedArgs& args, const Config& config, Console& console) {
    if (!args.positional.empty()) {
        console.print_error("Use: strongbox list");
        return ExitCode::InvalidArguments;
    }

    auto session = open_session(config, console);
    if (!session) {
        return session.error();
    }

    for (const auto& service : session->records.list()) {
        console.print_line(service);
    }
    return ExitCode::Success;
}

// ============================================================================
// Main Entry Point
// ============================================================================

ExitCode run(std::span<char*> args) {
    return run(args, std::cout, std::cerr);
}

ExitCode run(std::span<char*> args, std::ostream& out, std::ostream& err) {
    Console console(out, err);

    if (args.size() < 2) {
        static_cast<void>(cmd_help(ParsedArgs{}, console));
        return ExitCode::InvalidArguments;
    }

    ParsedArgs parsed = parse_args(args);
    console.set_verbose(parsed.verbose);

    if (parsed.unknown_option) {
        console.print_error("Unknown option: " + *parsed.unknown_option +
                            ". Use 'strongbox help' for usage.");
        return ExitCode::InvalidArguments;
    }

    // Handle help flag on any command
    if (parsed.help) {
        ParsedArgs help_args;
        help_args.command = "help";
        if (!parsed.command.empty() && parsed.command != "help") {
            help_args.positional.push_back(parsed.command);
        }
        return cmd_help(help_args, console);
    }

    if (parsed.version || parsed.command == "version") {
        return cmd_version(console);
    }

    if (parsed.command.empty()) {
        static_cast<void>(cmd_help(ParsedArgs{}, console));
        return ExitCode::InvalidArguments;
    }

    if (parsed.command == "help") {
        return cmd_help(parsed, console);
    }

    Config config = resolve_config(ConfigOverrides{parsed.data_file, parsed.key_file, parsed.verbose});

    // Dispatch to command handlers
    if (parsed.command == "add") {
        return cmd_add(parsed, config, console);
    } else if (parsed.command == "get") {
        return cmd_get(parsed, config, console);
    } else if (parsed.command == "delete") {
        return cmd_delete(parsed, config, console);
    } else if (parsed.command == "list") {
        return cmd_list(parsed, config, console);
    } else {
        console.print_error("Unknown command: " + cli::quoted(parsed.command) +
                            ". Use 'strongbox help' for usage.");
        return ExitCode::InvalidArguments;
    }
}

} // namespace strongbox::cli
