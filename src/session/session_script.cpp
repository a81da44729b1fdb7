#include "session_script.hpp"
#include <core/constants.hpp>
#include <core/lock_file.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

static std::string tail(const std::string& s, size_t n = LOG_EXCERPT_LEN) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

SessionScript::SessionScript(const Config& config)
    : config_(config),
      steps_(build_script(config.credentials().user, config.credentials().password,
                          config.session().mailbox, config.session().fetch)),
      factory_(open_channel) {
}

void SessionScript::report(const std::string& msg) const {
    probe_log(msg);
    if (status_) status_(msg);
}

void SessionScript::run() {
    sent_.clear();
    lock_removed_ = false;

    const auto& session = config_.session();
    if (!session.lock_file.empty()) {
        lock_removed_ = remove_stale_lock(session.lock_file);
        if (lock_removed_) report("Removed stale lock " + session.lock_file);
    }

    auto channel = factory_(config_.server());
    report("Connected: " + channel->describe());

    // The transcript starts with the first byte from the server
    ExpectMatcher matcher;
    matcher.set_transcript(transcript_);
    wait_for_banner(*channel, matcher);

    if (session.settle_ms > 0) {
        platform::sleep_ms(session.settle_ms);
    }

    for (const auto& step : steps_) {
        run_step(*channel, matcher, step);
    }

    channel->close();
    report(fmt::format("Session complete ({} commands)", sent_.size()));
}

void SessionScript::wait_for_banner(Channel& channel, ExpectMatcher& matcher) {
    const auto& session = config_.session();
    auto result = matcher.expect(channel, {Pattern(session.banner)},
                                 std::chrono::seconds(session.timeout));
    if (!result.matched()) {
        fail(result, "banner", session.banner, channel);
    }
    probe_log_io("BANNER", result.before_text + result.matched_text);
}

void SessionScript::run_step(Channel& channel, ExpectMatcher& matcher, const Step& step) {
    std::vector<Pattern> patterns;
    patterns.reserve(1 + step.failures.size());
    patterns.push_back(step.success);
    patterns.insert(patterns.end(), step.failures.begin(), step.failures.end());

    probe_log_io("SEND", redact_login(step.command));
    matcher.send_line(channel, step.command);
    sent_.push_back(step.command);

    auto result = matcher.expect(channel, patterns,
                                 std::chrono::seconds(config_.session().timeout));
    if (!result.matched()) {
        fail(result, step.label, step.marker, channel);
    }

    if (result.pattern_index != 0) {
        probe_log_io("REJECTED " + step.label, result.matched_text);
        throw SessionError(SessionError::Kind::REJECTED,
                           fmt::format("Server rejected '{}'", step.label),
                           step.label, tail(result.before_text + result.matched_text));
    }

    probe_log_io("MATCH " + step.label, result.matched_text);
    report(step.label + " ok");
}

void SessionScript::fail(const MatchResult& result, const std::string& step,
                         const std::string& waiting_for, const Channel& channel) const {
    std::string buffer = tail(result.before_text);
    probe_log_io(fmt::format("FAIL {} ({})", step,
                             result.status == MatchStatus::TIMEOUT ? "timeout" : "eof"),
                 buffer);

    if (result.status == MatchStatus::END_OF_STREAM) {
        throw SessionError(SessionError::Kind::END_OF_STREAM,
                           fmt::format("{} closed the connection while waiting for '{}' ({})",
                                       channel.describe(), waiting_for, step),
                           step, buffer);
    }
    throw SessionError(SessionError::Kind::TIMEOUT,
                       fmt::format("Timed out after {}s waiting for '{}' ({})",
                                   config_.session().timeout, waiting_for, step),
                       step, buffer);
}
