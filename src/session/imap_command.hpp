#pragma once

#include <string>
#include <vector>
#include "expect.hpp"

// Tagged IMAP command lines (`<tag> <command> <args>`) and the markers the
// server answers them with. No response parsing happens here.

// Yields "1", "2", "3", ...
class TagSequence {
public:
    std::string next() { return std::to_string(++counter_); }
    int issued() const { return counter_; }

private:
    int counter_ = 0;
};

std::string build_login(const std::string& tag, const std::string& user,
                        const std::string& password);
std::string build_select(const std::string& tag, const std::string& mailbox);
std::string build_fetch(const std::string& tag, const std::string& fetch_spec);

// "<tag> OK logged in successfully as <user>"
std::string login_marker(const std::string& tag, const std::string& user);

// A tagged NO or BAD for `tag` at the start of a line
Pattern rejection_pattern(const std::string& tag);

// Replace the password of a LOGIN line with "***" (other lines unchanged)
std::string redact_login(const std::string& line);

// One command and the output that acknowledges it.
struct Step {
    std::string label;               // "login", "select", "fetch 1:3 BODY.PEEK[]"
    std::string tag;
    std::string command;
    std::string marker;              // human-readable form of `success`
    Pattern success;
    std::vector<Pattern> failures;
};

// login, select, then one fetch per entry, tagged in that order.
std::vector<Step> build_script(const std::string& user, const std::string& password,
                               const std::string& mailbox,
                               const std::vector<std::string>& fetches);
