#include "probe_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <session/session_script.hpp>
#include <ostream>
#include <limits>
#include <fmt/format.h>

// Flags that take a value
static const std::vector<std::string> VALUE_FLAGS = {
    "--config", "--host", "--port", "--transport", "--command", "--user",
    "--password", "--mailbox", "--fetch", "--lock-file", "--banner",
    "--timeout", "--settle-ms", "--log-file",
};

static bool takes_value(const std::string& flag) {
    for (const auto& f : VALUE_FLAGS) {
        if (f == flag) return true;
    }
    return false;
}

static Result<int> parse_int_flag(const std::string& flag, const std::string& value) {
    constexpr int bad = std::numeric_limits<int>::min();
    int v = safe_stoi(value, bad);
    if (v == bad) {
        return Result<int>::Err(fmt::format("{} expects a number, got '{}'", flag, value));
    }
    return Result<int>::Ok(v);
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::string value;
        bool has_inline = false;

        // --flag=value
        auto eq = flag.find('=');
        if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
            has_inline = true;
        }

        if (flag == "--help" || flag == "-h") { opts.help = true; continue; }
        if (flag == "--version") { opts.version = true; continue; }
        if (flag == "--no-lock") { opts.no_lock = true; continue; }

        if (!takes_value(flag)) {
            return Result<CliOptions>::Err("Unknown option: " + args[i]);
        }
        if (!has_inline) {
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::Err("Missing value for " + flag);
            }
            value = args[++i];
        }

        if (flag == "--config") {
            opts.config_path = std::filesystem::path(value);
        } else if (flag == "--host") {
            opts.host = value;
        } else if (flag == "--port") {
            auto r = parse_int_flag(flag, value);
            if (r.is_err()) return Result<CliOptions>::Err(r.error);
            opts.port = r.value;
        } else if (flag == "--transport") {
            opts.transport = value;
        } else if (flag == "--command") {
            opts.command = value;
        } else if (flag == "--user") {
            opts.user = value;
        } else if (flag == "--password") {
            opts.password = value;
        } else if (flag == "--mailbox") {
            opts.mailbox = value;
        } else if (flag == "--fetch") {
            opts.fetch.push_back(value);
        } else if (flag == "--lock-file") {
            opts.lock_file = value;
        } else if (flag == "--banner") {
            opts.banner = value;
        } else if (flag == "--timeout") {
            auto r = parse_int_flag(flag, value);
            if (r.is_err()) return Result<CliOptions>::Err(r.error);
            opts.timeout = r.value;
        } else if (flag == "--settle-ms") {
            auto r = parse_int_flag(flag, value);
            if (r.is_err()) return Result<CliOptions>::Err(r.error);
            opts.settle_ms = r.value;
        } else if (flag == "--log-file") {
            opts.log_file = value;
        }
    }

    return Result<CliOptions>::Ok(opts);
}

Result<void> apply_overrides(Config& config, const CliOptions& options) {
    auto& server = config.server();
    auto& creds = config.credentials();
    auto& session = config.session();

    if (options.host) server.host = *options.host;
    if (options.port) server.port = *options.port;
    if (options.command) server.command = *options.command;
    if (options.transport) {
        auto t = parse_transport(*options.transport);
        if (t.is_err()) return Result<void>::Err(t.error);
        server.transport = t.value;
    }

    if (options.user) creds.user = *options.user;
    if (options.password) creds.password = *options.password;

    if (options.mailbox) session.mailbox = *options.mailbox;
    if (!options.fetch.empty()) session.fetch = options.fetch;
    if (options.lock_file) session.lock_file = *options.lock_file;
    if (options.no_lock) session.lock_file.clear();
    if (options.banner) session.banner = *options.banner;
    if (options.timeout) session.timeout = *options.timeout;
    if (options.settle_ms) session.settle_ms = *options.settle_ms;

    if (options.log_file) config.set_log_file(*options.log_file);

    return config.validate();
}

int exit_code_for(SessionError::Kind kind) {
    switch (kind) {
    case SessionError::Kind::CONNECT:       return EXIT_CONNECT;
    case SessionError::Kind::TIMEOUT:       return EXIT_TIMEOUT;
    case SessionError::Kind::END_OF_STREAM: return EXIT_EOF;
    case SessionError::Kind::REJECTED:      return EXIT_REJECTED;
    case SessionError::Kind::IO:            return EXIT_IO;
    }
    return EXIT_IO;
}

ProbeCLI::ProbeCLI(std::ostream& transcript, std::ostream& status)
    : transcript_(transcript), status_(status) {
}

void ProbeCLI::print_usage() const {
    status_ << theme::section("Usage");
    status_ << theme::blue("    mailprobe ") << theme::amber("[options]") << "\n";
    status_ << theme::section("Options");
    status_ << theme::usage_row("--config <file>", "YAML config (default ./mailprobe.yaml)");
    status_ << theme::usage_row("--host <host>", fmt::format("Server host ({})", DEFAULT_HOST));
    status_ << theme::usage_row("--port <port>", fmt::format("Server port ({})", DEFAULT_PORT));
    status_ << theme::usage_row("--transport <t>", "spawn (runs --command on a pty) or tcp");
    status_ << theme::usage_row("--command <cmd>", fmt::format("Spawn command ({})", DEFAULT_SPAWN_COMMAND));
    status_ << theme::usage_row("--user <user>", "Login user");
    status_ << theme::usage_row("--password <pw>", "Login password");
    status_ << theme::usage_row("--mailbox <name>", fmt::format("Mailbox to select ({})", DEFAULT_MAILBOX));
    status_ << theme::usage_row("--fetch <spec>", fmt::format("Fetch spec, repeatable ({})", DEFAULT_FETCH));
    status_ << theme::usage_row("--lock-file <path>", fmt::format("Stale lock to remove ({})", DEFAULT_LOCK_FILE));
    status_ << theme::usage_row("--no-lock", "Skip lock removal");
    status_ << theme::usage_row("--banner <regex>", "Greeting to wait for before login");
    status_ << theme::usage_row("--timeout <secs>", fmt::format("Per-step timeout ({})", EXPECT_TIMEOUT_SECS));
    status_ << theme::usage_row("--settle-ms <ms>", "Pause after the greeting (0)");
    status_ << theme::usage_row("--log-file <path>", "Debug log path");
    status_ << "\n";
    status_ << theme::usage_row("--version", "Show version");
    status_ << theme::usage_row("--help", "Show this help");
    status_ << "\n";
}

void ProbeCLI::print_version() const {
    status_ << theme::bold("mailprobe") << theme::dim(std::string(" version ") + MAILPROBE_VERSION) << "\n";
}

int ProbeCLI::run(const std::vector<std::string>& args) {
    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        status_ << theme::fail(parsed.error);
        print_usage();
        return EXIT_USAGE;
    }
    const CliOptions& opts = parsed.value;

    if (opts.help) {
        print_usage();
        return EXIT_OK;
    }
    if (opts.version) {
        print_version();
        return EXIT_OK;
    }

    auto loaded = Config::load(opts.config_path);
    if (loaded.is_err()) {
        status_ << theme::fail(loaded.error);
        return EXIT_USAGE;
    }
    Config config = loaded.value;

    auto applied = apply_overrides(config, opts);
    if (applied.is_err()) {
        status_ << theme::fail(applied.error);
        return EXIT_USAGE;
    }

    set_probe_log_path(config.log_file());
    probe_log(fmt::format("=== mailprobe {} started {} ===", MAILPROBE_VERSION, now_iso()));
    if (!config.source().empty()) {
        probe_log("Config: " + config.source().string());
    }

    status_ << theme::kv("server", fmt::format("{}:{} ({})", config.server().host,
                                                config.server().port,
                                                to_string(config.server().transport)));
    status_ << theme::kv("user", config.credentials().user);
    status_ << theme::kv("mailbox", config.session().mailbox);

    SessionScript script(config);
    script.set_transcript(&transcript_);
    script.set_status_callback([this](const std::string& msg) {
        status_ << theme::step(msg);
    });

    try {
        script.run();
    } catch (const SessionError& e) {
        status_ << theme::fail(std::string(e.what()));
        if (!e.buffer_tail().empty()) {
            status_ << theme::info("Last output: " + e.buffer_tail());
        }
        probe_log(fmt::format("Session failed [{}]: {}", to_string(e.kind()), e.what()));
        return exit_code_for(e.kind());
    }

    status_ << theme::ok(fmt::format("All {} commands acknowledged", script.sent_commands().size()));
    return EXIT_OK;
}
