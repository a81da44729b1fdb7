#pragma once

#include <string>
#include <vector>
#include <platform/process.hpp>
#include "channel.hpp"

// Channel over a child process running on a pseudo-terminal, the way an
// expect tool drives an interactive program such as telnet.
class SpawnChannel : public Channel {
public:
    // Throws SessionError(CONNECT) if the program cannot be started.
    SpawnChannel(const std::string& program, const std::vector<std::string>& args);
    ~SpawnChannel() override;

    SpawnChannel(const SpawnChannel&) = delete;
    SpawnChannel& operator=(const SpawnChannel&) = delete;

    // Build from a command template ("telnet {host} {port}").
    static std::unique_ptr<SpawnChannel> from_template(const std::string& command,
                                                       const std::string& host, int port);

    std::string read_some(std::chrono::milliseconds timeout) override;
    void write_all(const std::string& data) override;
    void close() override;
    bool eof() const override { return eof_; }
    const char* line_ending() const override { return "\n"; }
    std::string describe() const override { return description_; }

    // Exit code of the child once it has exited, -1 otherwise.
    int exit_code();

private:
    platform::PtyProcess pty_;
    std::string description_;
    bool eof_ = false;
};
