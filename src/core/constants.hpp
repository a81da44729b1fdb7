#pragma once

#include <cstddef>

// ── Server defaults ─────────────────────────────────────────
// Local development server (plain IMAP port).
constexpr const char* DEFAULT_HOST           = "127.0.0.1";
constexpr int DEFAULT_PORT                   = 10000;
constexpr const char* DEFAULT_SPAWN_COMMAND  = "telnet {host} {port}";

// ── Test account ────────────────────────────────────────────
constexpr const char* DEFAULT_USER           = "nikitapekin@gmail.com";
constexpr const char* DEFAULT_PASSWORD       = "12345";

// ── Session defaults ────────────────────────────────────────
constexpr const char* DEFAULT_MAILBOX        = "INBOX";
constexpr const char* DEFAULT_FETCH          = "1:3 BODY.PEEK[]";
constexpr const char* DEFAULT_LOCK_FILE      = "../maildir/.lock";
constexpr const char* DEFAULT_BANNER         = "\\* OK";

// ── Timeouts ────────────────────────────────────────────────
constexpr int EXPECT_TIMEOUT_SECS            = 30;    // Per expect
constexpr int CONNECT_TIMEOUT_SECS           = 10;    // TCP connect

// ── Buffer sizes ────────────────────────────────────────────
constexpr int CHANNEL_READ_BUF_SIZE          = 4096;
constexpr int LOG_EXCERPT_LEN                = 200;
constexpr std::size_t EXPECT_RESCAN_WINDOW   = 4096;  // Max already-searched bytes re-examined per read

// ── Response markers ────────────────────────────────────────
constexpr const char* LOGIN_OK_TEXT          = "OK logged in successfully as";
constexpr const char* SELECT_OK_MARKER       = "successful";
constexpr const char* FETCH_OK_MARKER        = "completed";

constexpr const char* MAILPROBE_VERSION      = "0.2.0";
