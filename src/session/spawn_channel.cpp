#include "spawn_channel.hpp"
#include "session_error.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

SpawnChannel::SpawnChannel(const std::string& program, const std::vector<std::string>& args) {
    description_ = program;
    for (const auto& a : args) description_ += " " + a;

    int err = 0;
    pty_ = platform::spawn_pty(program, args, false, &err);
    if (!pty_.valid()) {
        std::string reason = err ? std::string(strerror(err)) : "unknown error";
        probe_log(fmt::format("SPAWN failed: {} ({})", description_, reason));
        throw SessionError(SessionError::Kind::CONNECT,
                           fmt::format("Failed to spawn '{}': {}", description_, reason));
    }
    probe_log(fmt::format("SPAWN {} pid={}", description_, pty_.process().native_handle()));
}

SpawnChannel::~SpawnChannel() {
    close();
}

std::unique_ptr<SpawnChannel> SpawnChannel::from_template(const std::string& command,
                                                          const std::string& host, int port) {
    std::string expanded = replace_all(command, "{host}", host);
    expanded = replace_all(expanded, "{port}", std::to_string(port));

    auto argv = split_args(expanded);
    if (argv.empty()) {
        throw SessionError(SessionError::Kind::CONNECT, "Spawn command is empty");
    }
    std::string program = argv.front();
    argv.erase(argv.begin());
    return std::make_unique<SpawnChannel>(program, argv);
}

std::string SpawnChannel::read_some(std::chrono::milliseconds timeout) {
    if (eof_ || pty_.master_fd() < 0) {
        eof_ = true;
        return "";
    }

    int revents = platform::poll_socket(pty_.master_fd(), POLLIN,
                                        static_cast<int>(timeout.count()));
    if (revents == 0) return "";

    char buf[CHANNEL_READ_BUF_SIZE];
    ssize_t n;
    do {
        n = ::read(pty_.master_fd(), buf, sizeof(buf));
    } while (n < 0 && errno == EINTR);

    if (n > 0) return std::string(buf, static_cast<size_t>(n));

    // Linux reports a hung-up pty slave as EIO on the master
    if (n == 0 || errno == EIO) {
        eof_ = true;
        probe_log(fmt::format("EOF from {}", description_));
        return "";
    }
    if (errno == EAGAIN) return "";

    throw SessionError(SessionError::Kind::IO,
                       fmt::format("Read from '{}' failed: {}", description_, strerror(errno)));
}

void SpawnChannel::write_all(const std::string& data) {
    if (pty_.master_fd() < 0) {
        throw SessionError(SessionError::Kind::IO, "Write on closed channel");
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(pty_.master_fd(), data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw SessionError(SessionError::Kind::IO,
                               fmt::format("Write to '{}' failed: {}", description_, strerror(errno)));
        }
        written += static_cast<size_t>(n);
    }
}

void SpawnChannel::close() {
    if (!pty_.valid()) return;
    pty_.close();
    probe_log(fmt::format("CLOSE {} exit={}", description_, pty_.process().wait(0)));
}

int SpawnChannel::exit_code() {
    if (pty_.process().running()) return -1;
    return pty_.process().wait(0);
}
