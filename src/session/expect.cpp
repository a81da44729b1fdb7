#include "expect.hpp"
#include "channel.hpp"
#include <core/constants.hpp>
#include <algorithm>

ExpectMatcher::ExpectMatcher() = default;

MatchResult ExpectMatcher::expect(
    Channel& channel,
    const std::vector<Pattern>& patterns,
    std::chrono::milliseconds timeout) {

    auto deadline = std::chrono::steady_clock::now() + timeout;
    MatchResult result{MatchStatus::TIMEOUT, 0, "", ""};

    // Bytes of buffer_ already searched with these patterns
    size_t searched = 0;

    while (true) {
        if (check_patterns(patterns, searched, result)) {
            return result;
        }
        searched = buffer_.size();

        if (channel.eof()) {
            result.status = MatchStatus::END_OF_STREAM;
            result.before_text = buffer_;
            return result;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.status = MatchStatus::TIMEOUT;
            result.before_text = buffer_;
            return result;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() <= 0) remaining = std::chrono::milliseconds(1);

        std::string data = channel.read_some(remaining);
        if (data.empty()) continue;

        mirror(data);
        buffer_ += data;
    }
}

void ExpectMatcher::send_line(Channel& channel, const std::string& line) {
    std::string payload = line + channel.line_ending();
    channel.write_all(payload);
    mirror(line + "\n");
}

// Where a regex search resumes once `searched` bytes were already examined:
// the newline ending the last complete searched line (so "(^|\n)" anchors
// still see it), but never more than EXPECT_RESCAN_WINDOW bytes back.
size_t ExpectMatcher::rescan_from(size_t searched) const {
    if (searched == 0) return 0;
    size_t floor = searched > EXPECT_RESCAN_WINDOW ? searched - EXPECT_RESCAN_WINDOW : 0;
    size_t nl = buffer_.rfind('\n', searched - 1);
    if (nl == std::string::npos) return floor;
    return std::max(nl, floor);
}

bool ExpectMatcher::check_patterns(const std::vector<Pattern>& patterns, size_t searched,
                                   MatchResult& result) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        const Pattern& p = patterns[i];
        size_t pos = std::string::npos;
        size_t len = 0;

        if (p.is_literal()) {
            size_t overlap = p.literal_text.size() - 1;
            size_t from = searched > overlap ? searched - overlap : 0;
            pos = buffer_.find(p.literal_text, from);
            len = p.literal_text.size();
        } else {
            size_t from = rescan_from(searched);
            auto flags = from > 0 ? std::regex_constants::match_prev_avail
                                  : std::regex_constants::match_default;
            std::smatch match;
            if (std::regex_search(buffer_.cbegin() + from, buffer_.cend(), match, p.regex, flags)) {
                pos = from + static_cast<size_t>(match.position());
                len = static_cast<size_t>(match.length());
            }
        }

        if (pos != std::string::npos) {
            result.status = MatchStatus::MATCHED;
            result.pattern_index = i;
            result.matched_text = buffer_.substr(pos, len);
            result.before_text = buffer_.substr(0, pos);
            buffer_.erase(0, pos + len);
            return true;
        }
    }
    return false;
}

void ExpectMatcher::mirror(const std::string& data) {
    if (!transcript_) return;
    *transcript_ << data;
    transcript_->flush();
}
