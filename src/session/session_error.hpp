#pragma once

#include <stdexcept>
#include <string>

// Raised when the scripted conversation cannot continue. Nothing is retried;
// the caller decides how to report it.
class SessionError : public std::runtime_error {
public:
    enum class Kind {
        CONNECT,    // spawn or socket connect failed
        TIMEOUT,    // expected marker never arrived
        END_OF_STREAM,
        REJECTED,   // server answered the tagged command with NO/BAD
        IO,         // read/write on the channel failed
    };

    SessionError(Kind kind, const std::string& msg, std::string step = "",
                 std::string buffer_tail = "")
        : std::runtime_error(msg), kind_(kind), step_(std::move(step)),
          buffer_tail_(std::move(buffer_tail)) {}

    Kind kind() const { return kind_; }
    const std::string& step() const { return step_; }
    const std::string& buffer_tail() const { return buffer_tail_; }

private:
    Kind kind_;
    std::string step_;
    std::string buffer_tail_;
};

inline const char* to_string(SessionError::Kind kind) {
    switch (kind) {
    case SessionError::Kind::CONNECT:       return "connect";
    case SessionError::Kind::TIMEOUT:       return "timeout";
    case SessionError::Kind::END_OF_STREAM: return "eof";
    case SessionError::Kind::REJECTED:      return "rejected";
    case SessionError::Kind::IO:            return "io";
    }
    return "unknown";
}
