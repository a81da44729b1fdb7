#pragma once

#include <string>
#include <platform/socket_util.hpp>
#include "channel.hpp"

// Channel over a plain TCP connection (IMAP wire format, CRLF lines).
class TcpChannel : public Channel {
public:
    // Throws SessionError(CONNECT) if the connection cannot be established.
    TcpChannel(const std::string& host, int port, std::chrono::seconds connect_timeout);
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    std::string read_some(std::chrono::milliseconds timeout) override;
    void write_all(const std::string& data) override;
    void close() override;
    bool eof() const override { return eof_; }
    const char* line_ending() const override { return "\r\n"; }
    std::string describe() const override { return description_; }

private:
    socket_t sock_ = MAILPROBE_INVALID_SOCKET;
    std::string description_;
    bool eof_ = false;
};
