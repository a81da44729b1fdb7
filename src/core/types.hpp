#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// How the session channel is opened
enum class Transport {
    SPAWN,   // child process (telnet) on a pseudo-terminal
    TCP,     // direct socket
};

// Configuration structures
struct ServerConfig {
    std::string host;
    int port = 0;
    Transport transport = Transport::SPAWN;
    std::string command;                 // spawn template, {host} and {port} substituted
    int connect_timeout = 10;            // seconds (tcp only)
};

struct CredentialsConfig {
    std::string user;
    std::string password;
};

struct SessionConfig {
    std::string mailbox;
    std::vector<std::string> fetch;      // one tagged FETCH per entry
    std::string lock_file;               // empty = skip lock removal
    std::string banner;                  // regex the greeting must match
    int timeout = 30;                    // seconds per expect
    int settle_ms = 0;                   // pause after the banner
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
