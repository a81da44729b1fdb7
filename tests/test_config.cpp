#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

// ── defaults / parse ────────────────────────────────────────

TEST(Config, DefaultsMatchLocalTestServer) {
    auto c = Config::defaults();
    EXPECT_EQ(c.server().host, "127.0.0.1");
    EXPECT_EQ(c.server().port, 10000);
    EXPECT_EQ(c.server().transport, Transport::SPAWN);
    EXPECT_EQ(c.server().command, "telnet {host} {port}");
    EXPECT_EQ(c.credentials().user, "nikitapekin@gmail.com");
    EXPECT_EQ(c.credentials().password, "12345");
    EXPECT_EQ(c.session().mailbox, "INBOX");
    ASSERT_EQ(c.session().fetch.size(), 1u);
    EXPECT_EQ(c.session().fetch[0], "1:3 BODY.PEEK[]");
    EXPECT_EQ(c.session().lock_file, "../maildir/.lock");
    EXPECT_EQ(c.session().timeout, 30);
    EXPECT_EQ(c.session().settle_ms, 0);
    EXPECT_TRUE(c.validate().is_ok());
}

TEST(Config, EmptyDocumentKeepsDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.server().port, DEFAULT_PORT);
}

TEST(Config, ParseOverridesOnlyGivenKeys) {
    auto r = Config::parse(R"(
server:
  host: mail.test
  port: 1143
  transport: tcp
credentials:
  user: alice@test
session:
  mailbox: Archive
  timeout: 5
log_file: /tmp/probe.log
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.server().host, "mail.test");
    EXPECT_EQ(c.server().port, 1143);
    EXPECT_EQ(c.server().transport, Transport::TCP);
    EXPECT_EQ(c.server().command, DEFAULT_SPAWN_COMMAND);
    EXPECT_EQ(c.credentials().user, "alice@test");
    EXPECT_EQ(c.credentials().password, DEFAULT_PASSWORD);
    EXPECT_EQ(c.session().mailbox, "Archive");
    EXPECT_EQ(c.session().timeout, 5);
    EXPECT_EQ(c.log_file(), "/tmp/probe.log");
}

TEST(Config, FetchAcceptsScalar) {
    auto r = Config::parse("session:\n  fetch: \"1:2 RFC822.SIZE\"\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.session().fetch.size(), 1u);
    EXPECT_EQ(r.value.session().fetch[0], "1:2 RFC822.SIZE");
}

TEST(Config, FetchAcceptsList) {
    auto r = Config::parse(R"(
session:
  fetch:
    - "1:3 ENVELOPE"
    - "1:3 FLAGS"
    - "1:3 INTERNALDATE"
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& f = r.value.session().fetch;
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "1:3 ENVELOPE");
    EXPECT_EQ(f[2], "1:3 INTERNALDATE");
}

TEST(Config, UnknownTransportRejected) {
    auto r = Config::parse("server:\n  transport: carrier-pigeon\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("carrier-pigeon"), std::string::npos);
}

TEST(Config, NonNumericPortRejected) {
    auto r = Config::parse("server:\n  port: imap\n");
    EXPECT_TRUE(r.is_err());
}

TEST(Config, RootMustBeMapping) {
    auto r = Config::parse("- just\n- a list\n");
    EXPECT_TRUE(r.is_err());
}

TEST(Config, MalformedYamlRejected) {
    auto r = Config::parse("server: [unclosed\n");
    EXPECT_TRUE(r.is_err());
}

// ── validate ────────────────────────────────────────────────

TEST(Config, ValidatePortRange) {
    auto c = Config::defaults();
    c.server().port = 0;
    EXPECT_TRUE(c.validate().is_err());
    c.server().port = 70000;
    EXPECT_TRUE(c.validate().is_err());
    c.server().port = 143;
    EXPECT_TRUE(c.validate().is_ok());
}

TEST(Config, ValidateTimeoutAndUser) {
    auto c = Config::defaults();
    c.session().timeout = 0;
    EXPECT_TRUE(c.validate().is_err());

    c = Config::defaults();
    c.credentials().user.clear();
    EXPECT_TRUE(c.validate().is_err());
}

TEST(Config, ValidateBannerMustBeRegex) {
    auto c = Config::defaults();
    c.session().banner = "(";
    auto r = c.validate();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("session.banner"), std::string::npos);

    c.session().banner = ".\n";
    EXPECT_TRUE(c.validate().is_ok());
}

TEST(Config, ValidateSpawnNeedsCommand) {
    auto c = Config::defaults();
    c.server().command.clear();
    EXPECT_TRUE(c.validate().is_err());
    c.server().transport = Transport::TCP;
    EXPECT_TRUE(c.validate().is_ok());
}

TEST(Config, TransportNames) {
    EXPECT_EQ(parse_transport("tcp").value, Transport::TCP);
    EXPECT_EQ(parse_transport("spawn").value, Transport::SPAWN);
    EXPECT_TRUE(parse_transport("telnet").is_err());
    EXPECT_EQ(parse_transport(" tcp ").value, Transport::TCP);
    EXPECT_TRUE(parse_transport("ssh").is_err());
    EXPECT_STREQ(to_string(Transport::TCP), "tcp");
}

// ── load (filesystem) ───────────────────────────────────────

class ConfigLoadTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;
    bool had_home = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("mailprobe_config_test_" + std::to_string(getpid()));
        fs::create_directories(test_dir / "home");
        if (const char* h = std::getenv("HOME")) {
            saved_home = h;
            had_home = true;
        }
        setenv("HOME", (test_dir / "home").c_str(), 1);
    }

    void TearDown() override {
        if (had_home) setenv("HOME", saved_home.c_str(), 1);
        else unsetenv("HOME");
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }
};

TEST_F(ConfigLoadTest, NoFilesGivesDefaults) {
    auto r = Config::load(std::nullopt, test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.source().empty());
    EXPECT_EQ(r.value.server().port, DEFAULT_PORT);
}

TEST_F(ConfigLoadTest, ProjectFileWins) {
    write_file(test_dir / "mailprobe.yaml", "server:\n  port: 2143\n");
    write_file(test_dir / "home" / ".mailprobe" / "config.yaml", "server:\n  port: 3143\n");

    auto r = Config::load(std::nullopt, test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.server().port, 2143);
    EXPECT_EQ(r.value.source(), test_dir / "mailprobe.yaml");
}

TEST_F(ConfigLoadTest, GlobalFileUsedWithoutProjectFile) {
    write_file(test_dir / "home" / ".mailprobe" / "config.yaml", "server:\n  port: 3143\n");

    auto r = Config::load(std::nullopt, test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.server().port, 3143);
}

TEST_F(ConfigLoadTest, ExplicitPathMustExist) {
    auto r = Config::load(test_dir / "missing.yaml", test_dir);
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigLoadTest, ExplicitPathErrorNamesFile) {
    write_file(test_dir / "bad.yaml", "server:\n  port: nope\n");
    auto r = Config::load(test_dir / "bad.yaml", test_dir);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("bad.yaml"), std::string::npos);
}
