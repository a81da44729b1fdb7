#pragma once

#include <string>
#include <vector>
#include <memory>
#include <ostream>
#include <functional>
#include <core/config.hpp>
#include "channel.hpp"
#include "expect.hpp"
#include "imap_command.hpp"
#include "session_error.hpp"

// One scripted IMAP conversation:
//   remove stale lock -> connect -> banner -> login -> select -> fetch...
//
// Each command is sent only after the previous one was acknowledged. Any
// timeout, end of stream or tagged NO/BAD aborts the run with a
// SessionError; nothing is retried.
//
// Usage:
//   SessionScript script(config);
//   script.set_transcript(&std::cout);
//   script.run();
//
class SessionScript {
public:
    using ChannelFactory = std::function<std::unique_ptr<Channel>(const ServerConfig&)>;

    explicit SessionScript(const Config& config);

    // Where the session transcript is mirrored (both directions). nullptr = off.
    void set_transcript(std::ostream* out) { transcript_ = out; }

    // Progress messages ("Connected to ...", "login ok")
    void set_status_callback(StatusCallback callback) { status_ = std::move(callback); }

    // Replace how the channel is opened (default: open_channel)
    void set_channel_factory(ChannelFactory factory) { factory_ = std::move(factory); }

    // Run the whole script. Throws SessionError on the first failed step.
    void run();

    const std::vector<Step>& steps() const { return steps_; }

    // Commands written to the channel so far, in order (passwords included)
    const std::vector<std::string>& sent_commands() const { return sent_; }

    // Whether the lock pre-step removed a file
    bool lock_removed() const { return lock_removed_; }

private:
    Config config_;
    std::vector<Step> steps_;
    std::vector<std::string> sent_;
    bool lock_removed_ = false;

    std::ostream* transcript_ = nullptr;
    StatusCallback status_;
    ChannelFactory factory_;

    void report(const std::string& msg) const;
    void wait_for_banner(Channel& channel, ExpectMatcher& matcher);
    void run_step(Channel& channel, ExpectMatcher& matcher, const Step& step);

    [[noreturn]] void fail(const MatchResult& result, const std::string& step,
                           const std::string& waiting_for, const Channel& channel) const;
};
