#include <gtest/gtest.h>
#include <session/session_script.hpp>
#include <session/tcp_channel.hpp>
#include <core/log.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

// Single-connection IMAP-ish server on 127.0.0.1, run on a background thread.
// Each CRLF-terminated line received is recorded and handed to `reply`.
class LoopbackServer {
public:
    using Reply = std::function<std::string(const std::string& line)>;

    explicit LoopbackServer(std::string banner, Reply reply)
        : banner_(std::move(banner)), reply_(std::move(reply)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 1);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
    }

    int port() const { return port_; }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mu_);
        return received_;
    }

private:
    void serve() {
        pollfd pfd{listen_fd_, POLLIN, 0};
        while (!stop_ && ::poll(&pfd, 1, 50) == 0) {}
        if (stop_) return;

        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) return;
        send_str(fd, banner_);

        std::string buf;
        char chunk[1024];
        while (!stop_) {
            pollfd cfd{fd, POLLIN, 0};
            if (::poll(&cfd, 1, 50) <= 0) continue;
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) break;
            buf.append(chunk, n);

            size_t pos;
            while ((pos = buf.find("\r\n")) != std::string::npos) {
                std::string line = buf.substr(0, pos);
                buf.erase(0, pos + 2);
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    received_.push_back(line);
                }
                std::string out = reply_(line);
                if (out == "<close>") {
                    ::close(fd);
                    return;
                }
                send_str(fd, out);
            }
        }
        ::close(fd);
    }

    static void send_str(int fd, const std::string& s) {
        size_t off = 0;
        while (off < s.size()) {
            ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
            if (n <= 0) return;
            off += static_cast<size_t>(n);
        }
    }

    int listen_fd_ = -1;
    int port_ = 0;
    std::string banner_;
    Reply reply_;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::mutex mu_;
    std::vector<std::string> received_;
};

static std::string imap_reply(const std::string& line) {
    std::string tag = line.substr(0, line.find(' '));
    if (line.find(" login ") != std::string::npos)
        return tag + " OK logged in successfully as nikitapekin@gmail.com\r\n";
    if (line.find(" select ") != std::string::npos)
        return "* 3 EXISTS\r\n" + tag + " OK [READ-WRITE] SELECT command was successful\r\n";
    if (line.find(" fetch ") != std::string::npos)
        return "* 1 FETCH (BODY[] {5}\r\nhello)\r\n" + tag + " OK FETCH completed\r\n";
    return tag + " BAD unknown command\r\n";
}

class TcpSessionTest : public ::testing::Test {
protected:
    fs::path test_dir;
    Config config = Config::defaults();

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("mailprobe_tcp_test_" + std::to_string(getpid()));
        fs::create_directories(test_dir);
        set_probe_log_path((test_dir / "debug.log").string());

        config.server().transport = Transport::TCP;
        config.server().host = "127.0.0.1";
        config.server().connect_timeout = 2;
        config.session().timeout = 2;
        config.session().lock_file.clear();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(TcpSessionTest, FullSessionWithCrlfCommands) {
    LoopbackServer server("* OK IMAP4rev1 ready\r\n", imap_reply);
    config.server().port = server.port();

    SessionScript script(config);
    std::ostringstream transcript;
    script.set_transcript(&transcript);
    ASSERT_NO_THROW(script.run());

    auto lines = server.received();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "1 login nikitapekin@gmail.com 12345");
    EXPECT_EQ(lines[1], "2 select INBOX");
    EXPECT_EQ(lines[2], "3 fetch 1:3 BODY.PEEK[]");
    EXPECT_EQ(transcript.str().rfind("* OK IMAP4rev1 ready\r\n", 0), 0u);
    EXPECT_NE(transcript.str().find("3 OK FETCH completed"), std::string::npos);
}

TEST_F(TcpSessionTest, RejectedLoginStopsSession) {
    LoopbackServer server("* OK IMAP4rev1 ready\r\n", [](const std::string& line) {
        std::string tag = line.substr(0, line.find(' '));
        return tag + " NO [AUTHENTICATIONFAILED] invalid credentials\r\n";
    });
    config.server().port = server.port();

    SessionScript script(config);
    try {
        script.run();
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.kind(), SessionError::Kind::REJECTED);
        EXPECT_EQ(e.step(), "login");
    }
    EXPECT_EQ(server.received().size(), 1u);
}

TEST_F(TcpSessionTest, ServerCloseIsEndOfStream) {
    LoopbackServer server("* OK IMAP4rev1 ready\r\n", [](const std::string&) {
        return std::string("<close>");
    });
    config.server().port = server.port();

    SessionScript script(config);
    try {
        script.run();
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.kind(), SessionError::Kind::END_OF_STREAM);
        EXPECT_EQ(e.step(), "login");
    }
}

TEST_F(TcpSessionTest, RefusedConnectionIsConnectError) {
    // Grab a free port, then release it so nothing is listening there
    int port = 0;
    {
        LoopbackServer probe("", [](const std::string&) { return std::string(); });
        port = probe.port();
    }
    config.server().port = port;

    SessionScript script(config);
    try {
        script.run();
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.kind(), SessionError::Kind::CONNECT);
    }
    EXPECT_TRUE(script.sent_commands().empty());
}

TEST(TcpChannelTest, DescribeNamesEndpoint) {
    LoopbackServer server("* OK\r\n", [](const std::string&) { return std::string(); });
    TcpChannel ch("127.0.0.1", server.port(), std::chrono::seconds(2));
    EXPECT_EQ(ch.describe(), "tcp://127.0.0.1:" + std::to_string(server.port()));
    EXPECT_STREQ(ch.line_ending(), "\r\n");
    ch.close();
}
