#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <regex>
#include <stdexcept>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".mailprobe";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "mailprobe.yaml";
}

Result<Transport> parse_transport(const std::string& raw) {
    std::string name = raw;
    trim(name);
    if (name == "spawn") return Result<Transport>::Ok(Transport::SPAWN);
    if (name == "tcp") return Result<Transport>::Ok(Transport::TCP);
    return Result<Transport>::Err("Unknown transport '" + name + "' (expected spawn or tcp)");
}

const char* to_string(Transport transport) {
    switch (transport) {
    case Transport::SPAWN: return "spawn";
    case Transport::TCP:   return "tcp";
    }
    return "spawn";
}

Config Config::defaults() {
    Config c;
    c.server_.host = DEFAULT_HOST;
    c.server_.port = DEFAULT_PORT;
    c.server_.transport = Transport::SPAWN;
    c.server_.command = DEFAULT_SPAWN_COMMAND;
    c.server_.connect_timeout = CONNECT_TIMEOUT_SECS;

    c.credentials_.user = DEFAULT_USER;
    c.credentials_.password = DEFAULT_PASSWORD;

    c.session_.mailbox = DEFAULT_MAILBOX;
    c.session_.fetch = {DEFAULT_FETCH};
    c.session_.lock_file = DEFAULT_LOCK_FILE;
    c.session_.banner = DEFAULT_BANNER;
    c.session_.timeout = EXPECT_TIMEOUT_SECS;
    c.session_.settle_ms = 0;
    return c;
}

// Overlay a scalar key if present. Bad conversions throw YAML::Exception.
template <typename T>
static void read_key(const YAML::Node& node, const char* key, T& out) {
    if (node[key] && !node[key].IsNull()) {
        out = node[key].as<T>();
    }
}

static void parse_server(const YAML::Node& node, ServerConfig& server) {
    read_key(node, "host", server.host);
    read_key(node, "port", server.port);
    read_key(node, "command", server.command);
    read_key(node, "connect_timeout", server.connect_timeout);

    if (node["transport"]) {
        auto t = parse_transport(node["transport"].as<std::string>());
        if (t.is_err()) throw std::invalid_argument(t.error);
        server.transport = t.value;
    }
}

static void parse_credentials(const YAML::Node& node, CredentialsConfig& creds) {
    read_key(node, "user", creds.user);
    read_key(node, "password", creds.password);
}

static void parse_session(const YAML::Node& node, SessionConfig& session) {
    read_key(node, "mailbox", session.mailbox);
    read_key(node, "lock_file", session.lock_file);
    read_key(node, "banner", session.banner);
    read_key(node, "timeout", session.timeout);
    read_key(node, "settle_ms", session.settle_ms);

    // fetch: a single spec or a list of specs
    const YAML::Node fetch = node["fetch"];
    if (fetch) {
        session.fetch.clear();
        if (fetch.IsSequence()) {
            for (const auto& item : fetch) {
                session.fetch.push_back(item.as<std::string>());
            }
        } else if (fetch.IsScalar()) {
            session.fetch.push_back(fetch.as<std::string>());
        }
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config = defaults();
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (root["server"]) parse_server(root["server"], config.server_);
        if (root["credentials"]) parse_credentials(root["credentials"], config.credentials_);
        if (root["session"]) parse_session(root["session"], config.session_);
        read_key(root, "log_file", config.log_file_);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return Result<Config>::Err(e.what());
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    result.value.source_ = path;
    return result;
}

Result<Config> Config::load(const std::optional<fs::path>& explicit_path, const fs::path& dir) {
    if (explicit_path) {
        if (!fs::exists(*explicit_path)) {
            return Result<Config>::Err("Config file not found: " + explicit_path->string());
        }
        return load_file(*explicit_path);
    }

    fs::path project = get_project_config_path(dir);
    if (fs::exists(project)) {
        return load_file(project);
    }

    fs::path global = get_global_config_path();
    if (fs::exists(global)) {
        return load_file(global);
    }

    return Result<Config>::Ok(defaults());
}

Result<void> Config::validate() const {
    if (server_.host.empty()) {
        return Result<void>::Err("server.host must not be empty");
    }
    if (server_.port < 1 || server_.port > 65535) {
        return Result<void>::Err(fmt::format("server.port out of range: {}", server_.port));
    }
    if (server_.transport == Transport::SPAWN && server_.command.empty()) {
        return Result<void>::Err("server.command must not be empty for the spawn transport");
    }
    if (server_.connect_timeout <= 0) {
        return Result<void>::Err("server.connect_timeout must be positive");
    }
    if (credentials_.user.empty()) {
        return Result<void>::Err("credentials.user must not be empty");
    }
    if (session_.mailbox.empty()) {
        return Result<void>::Err("session.mailbox must not be empty");
    }
    if (session_.banner.empty()) {
        return Result<void>::Err("session.banner must not be empty");
    }
    try {
        std::regex check(session_.banner, std::regex::extended);
    } catch (const std::regex_error& e) {
        return Result<void>::Err(fmt::format("session.banner is not a valid regex: '{}' ({})",
                                             session_.banner, e.what()));
    }
    if (session_.timeout <= 0) {
        return Result<void>::Err("session.timeout must be positive");
    }
    if (session_.settle_ms < 0) {
        return Result<void>::Err("session.settle_ms must not be negative");
    }
    return Result<void>::Ok();
}
