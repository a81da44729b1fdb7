#include "tcp_channel.hpp"
#include "session_error.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

TcpChannel::TcpChannel(const std::string& host, int port, std::chrono::seconds connect_timeout)
    : description_(fmt::format("tcp://{}:{}", host, port)) {
    std::string error;
    int timeout_ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(connect_timeout).count());
    sock_ = platform::connect_tcp(host, port, timeout_ms, error);
    if (sock_ == MAILPROBE_INVALID_SOCKET) {
        probe_log(fmt::format("CONNECT failed: {} ({})", description_, error));
        throw SessionError(SessionError::Kind::CONNECT, error);
    }
    probe_log(fmt::format("CONNECT {}", description_));
}

TcpChannel::~TcpChannel() {
    close();
}

std::string TcpChannel::read_some(std::chrono::milliseconds timeout) {
    if (eof_ || sock_ == MAILPROBE_INVALID_SOCKET) {
        eof_ = true;
        return "";
    }

    int revents = platform::poll_socket(sock_, POLLIN, static_cast<int>(timeout.count()));
    if (revents == 0) return "";

    char buf[CHANNEL_READ_BUF_SIZE];
    ssize_t n;
    do {
        n = recv(sock_, buf, sizeof(buf), 0);
    } while (n < 0 && errno == EINTR);

    if (n > 0) return std::string(buf, static_cast<size_t>(n));
    if (n == 0) {
        eof_ = true;
        probe_log(fmt::format("EOF from {}", description_));
        return "";
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) return "";
    if (errno == ECONNRESET) {
        eof_ = true;
        probe_log(fmt::format("Connection reset by {}", description_));
        return "";
    }

    throw SessionError(SessionError::Kind::IO,
                       fmt::format("Read from {} failed: {}", description_, strerror(errno)));
}

void TcpChannel::write_all(const std::string& data) {
    if (sock_ == MAILPROBE_INVALID_SOCKET) {
        throw SessionError(SessionError::Kind::IO, "Write on closed channel");
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = send(sock_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                platform::poll_socket(sock_, POLLOUT, 1000);
                continue;
            }
            throw SessionError(SessionError::Kind::IO,
                               fmt::format("Write to {} failed: {}", description_, strerror(errno)));
        }
        written += static_cast<size_t>(n);
    }
}

void TcpChannel::close() {
    if (sock_ == MAILPROBE_INVALID_SOCKET) return;
    platform::close_socket(sock_);
    sock_ = MAILPROBE_INVALID_SOCKET;
    probe_log(fmt::format("CLOSE {}", description_));
}
