#pragma once

#include <string>
#include <vector>
#include <regex>
#include <chrono>
#include <ostream>
#include <core/log.hpp>

class Channel;

struct Pattern {
    std::regex regex;
    std::string raw;
    std::string literal_text;   // set by literal(); matched with find()

    Pattern(const std::string& pattern,
            std::regex::flag_type syntax = std::regex::extended) : raw(pattern) {
        try {
            regex = std::regex(pattern, syntax);
        } catch (const std::regex_error& e) {
            probe_log(fmt::format("Invalid regex '{}' ({}), matching it literally", pattern, e.what()));
            literal_text = pattern;
            regex = std::regex(escape(pattern), syntax);
        }
    }

    // Match `text` verbatim (metacharacters escaped)
    static Pattern literal(const std::string& text) {
        Pattern p(escape(text));
        p.literal_text = text;
        return p;
    }

    bool is_literal() const { return !literal_text.empty(); }

    // Only the characters special outside a bracket expression. A lone
    // ']' or '}' is already literal, and POSIX grammars reject "\]".
    static std::string escape(const std::string& text) {
        static const std::string special = "\\^$.|?*+()[{";
        std::string out;
        out.reserve(text.size() * 2);
        for (char c : text) {
            if (special.find(c) != std::string::npos) out += '\\';
            out += c;
        }
        return out;
    }
};

enum class MatchStatus {
    MATCHED,
    TIMEOUT,
    END_OF_STREAM,
};

struct MatchResult {
    MatchStatus status;
    size_t pattern_index;
    std::string matched_text;
    std::string before_text;

    bool matched() const { return status == MatchStatus::MATCHED; }
};

// Accumulates channel output and blocks until one of a set of patterns
// matches, the timeout elapses or the stream ends.
//
// Each read only searches the new bytes plus the tail of the last line
// already searched (at most EXPECT_RESCAN_WINDOW bytes back), so patterns
// are expected to fit on one line.
class ExpectMatcher {
public:
    ExpectMatcher();

    // Mirror every chunk read (and every line sent through send_line) here.
    // nullptr disables mirroring.
    void set_transcript(std::ostream* out) { transcript_ = out; }

    // Patterns are tried in order; the first that matches wins. On a match
    // the buffer is consumed through the end of the match.
    MatchResult expect(
        Channel& channel,
        const std::vector<Pattern>& patterns,
        std::chrono::milliseconds timeout
    );

    // Write `line` plus the channel's line terminator.
    void send_line(Channel& channel, const std::string& line);

    const std::string& get_buffer() const { return buffer_; }

private:
    std::string buffer_;
    std::ostream* transcript_ = nullptr;

    size_t rescan_from(size_t searched) const;
    bool check_patterns(const std::vector<Pattern>& patterns, size_t from, MatchResult& result);
    void mirror(const std::string& data);
};
