#pragma once

#include <string>
#include <chrono>
#include <memory>
#include <core/types.hpp>

// A bidirectional byte stream owned by one session.
class Channel {
public:
    virtual ~Channel() = default;

    // Wait up to `timeout` for data. Returns what was read; empty means
    // either the wait timed out or the stream ended (check eof()).
    // Throws SessionError(IO) on a hard read failure.
    virtual std::string read_some(std::chrono::milliseconds timeout) = 0;

    // Write every byte of `data`. Throws SessionError(IO) on failure.
    virtual void write_all(const std::string& data) = 0;

    virtual void close() = 0;
    virtual bool eof() const = 0;

    // Line terminator the peer expects for a sent command
    virtual const char* line_ending() const = 0;

    // For logs and error messages, e.g. "telnet 127.0.0.1 10000"
    virtual std::string describe() const = 0;
};

// Open a channel for the configured transport.
// Throws SessionError(CONNECT) when the spawn or connect fails.
std::unique_ptr<Channel> open_channel(const ServerConfig& server);
