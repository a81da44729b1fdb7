#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    Config() = default;

    // Built-in defaults: local test server, test account, INBOX, one fetch.
    static Config defaults();

    // Parse YAML text on top of the defaults
    static Result<Config> parse(const std::string& yaml_text);

    // Load a YAML file on top of the defaults
    static Result<Config> load_file(const fs::path& path);

    // Load the explicit path if given, else ./mailprobe.yaml, else
    // ~/.mailprobe/config.yaml, else the defaults. Only an explicit path
    // that does not exist is an error.
    static Result<Config> load(const std::optional<fs::path>& explicit_path = std::nullopt,
                               const fs::path& dir = fs::current_path());

    // Range and presence checks, run after CLI overrides are applied
    Result<void> validate() const;

    // Accessors
    const ServerConfig& server() const { return server_; }
    const CredentialsConfig& credentials() const { return credentials_; }
    const SessionConfig& session() const { return session_; }
    const std::string& log_file() const { return log_file_; }
    const fs::path& source() const { return source_; }

    ServerConfig& server() { return server_; }
    CredentialsConfig& credentials() { return credentials_; }
    SessionConfig& session() { return session_; }
    void set_log_file(const std::string& path) { log_file_ = path; }

private:
    ServerConfig server_;
    CredentialsConfig credentials_;
    SessionConfig session_;
    std::string log_file_;
    fs::path source_;           // empty when running on defaults
};

// "spawn" / "tcp"
Result<Transport> parse_transport(const std::string& name);
const char* to_string(Transport transport);

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
