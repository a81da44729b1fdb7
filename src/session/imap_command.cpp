#include "imap_command.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

std::string build_login(const std::string& tag, const std::string& user,
                        const std::string& password) {
    return fmt::format("{} login {} {}", tag, user, password);
}

std::string build_select(const std::string& tag, const std::string& mailbox) {
    return fmt::format("{} select {}", tag, mailbox);
}

std::string build_fetch(const std::string& tag, const std::string& fetch_spec) {
    return fmt::format("{} fetch {}", tag, fetch_spec);
}

std::string login_marker(const std::string& tag, const std::string& user) {
    return fmt::format("{} {} {}", tag, LOGIN_OK_TEXT, user);
}

Pattern rejection_pattern(const std::string& tag) {
    return Pattern(fmt::format("(^|\\n){} (NO|BAD)( |\\r|$)", Pattern::escape(tag)),
                   std::regex::ECMAScript);
}

std::string redact_login(const std::string& line) {
    auto parts = split_args(line);
    if (parts.size() < 4) return line;

    std::string cmd = parts[1];
    std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (cmd != "login") return line;

    return fmt::format("{} {} {} ***", parts[0], parts[1], parts[2]);
}

std::vector<Step> build_script(const std::string& user, const std::string& password,
                               const std::string& mailbox,
                               const std::vector<std::string>& fetches) {
    TagSequence tags;
    std::vector<Step> steps;

    std::string tag = tags.next();
    std::string marker = login_marker(tag, user);
    steps.push_back(Step{"login", tag, build_login(tag, user, password),
                         marker, Pattern::literal(marker),
                         {rejection_pattern(tag)}});

    tag = tags.next();
    steps.push_back(Step{"select " + mailbox, tag, build_select(tag, mailbox),
                         SELECT_OK_MARKER, Pattern::literal(SELECT_OK_MARKER),
                         {rejection_pattern(tag)}});

    for (const auto& f : fetches) {
        tag = tags.next();
        steps.push_back(Step{"fetch " + f, tag, build_fetch(tag, f),
                             FETCH_OK_MARKER, Pattern::literal(FETCH_OK_MARKER),
                             {rejection_pattern(tag)}});
    }
    return steps;
}
