#pragma once

#include <string>
#include <vector>
#include <optional>
#include <iosfwd>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <session/session_error.hpp>

// Command-line flags. Every override is optional so the config file value
// survives unless a flag names it.
struct CliOptions {
    bool help = false;
    bool version = false;
    bool no_lock = false;

    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> transport;
    std::optional<std::string> command;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> mailbox;
    std::vector<std::string> fetch;          // replaces the configured list when non-empty
    std::optional<std::string> lock_file;
    std::optional<std::string> banner;
    std::optional<int> timeout;
    std::optional<int> settle_ms;
    std::optional<std::string> log_file;
};

// Exit codes
enum ExitCode {
    EXIT_OK         = 0,
    EXIT_USAGE      = 1,
    EXIT_CONNECT    = 2,
    EXIT_TIMEOUT    = 3,
    EXIT_EOF        = 4,
    EXIT_REJECTED   = 5,
    EXIT_IO         = 6,
};

// Parse argv (argv[0] skipped).
Result<CliOptions> parse_args(const std::vector<std::string>& args);

// Apply flag overrides on top of a loaded config.
Result<void> apply_overrides(Config& config, const CliOptions& options);

int exit_code_for(SessionError::Kind kind);

class ProbeCLI {
public:
    // transcript: where the session is mirrored; status: themed progress lines
    ProbeCLI(std::ostream& transcript, std::ostream& status);

    // Parse, load config, run the session. Returns the process exit code.
    int run(const std::vector<std::string>& args);

    void print_usage() const;
    void print_version() const;

private:
    std::ostream& transcript_;
    std::ostream& status_;
};
