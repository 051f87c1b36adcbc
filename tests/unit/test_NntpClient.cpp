#include <gtest/gtest.h>
#include "nntp/Client.hpp"
#include "FakeNntpServer.hpp"

#include <algorithm>
#include <thread>

using namespace np::nntp;
using namespace np::test;
using np::concurrency::CancellationError;
using np::concurrency::Context;
using namespace std::chrono_literals;

namespace {

std::string articleServer(const std::string& line) {
    if (line == "STAT <present@test>") return "223 0 <present@test> article exists";
    if (line == "STAT <numbered@test>") return "423 no article with that number";
    if (line.rfind("STAT ", 0) == 0) return "430 no such article";
    return "500 what?";
}

}

class NntpClientTest : public ::testing::Test {
protected:
    static np::config::UsenetProviderConfig plain(const uint16_t port) {
        np::config::UsenetProviderConfig p;
        p.name = "loopback";
        p.host = "127.0.0.1";
        p.port = port;
        p.use_tls = false;
        return p;
    }

    static bool sawCommand(const FakeNntpServer& server, const std::string& cmd) {
        const auto cmds = server.commands();
        return std::find(cmds.begin(), cmds.end(), cmd) != cmds.end();
    }
};

TEST_F(NntpClientTest, StatReportsArticleStatus) {
    FakeNntpServer server("200 ready", articleServer);
    Client client(plain(server.port()), 2000ms);

    client.connect(Context());
    ASSERT_TRUE(client.isConnected());

    EXPECT_EQ(client.stat(Context(), "<present@test>"), ARTICLE_EXISTS);
    EXPECT_EQ(client.stat(Context(), "<gone@test>"), NO_SUCH_ARTICLE);
    EXPECT_EQ(client.stat(Context(), "<numbered@test>"), NO_ARTICLE_WITH_NUMBER);

    EXPECT_TRUE(client.checkArticle(Context(), "<present@test>"));
    EXPECT_FALSE(client.checkArticle(Context(), "<gone@test>"));
}

TEST_F(NntpClientTest, PostingProhibitedGreetingIsAccepted) {
    FakeNntpServer server("201 ready, no posting", articleServer);
    Client client(plain(server.port()), 2000ms);

    EXPECT_NO_THROW(client.connect(Context()));
}

TEST_F(NntpClientTest, CloseSendsQuit) {
    FakeNntpServer server("200 ready", articleServer);
    {
        Client client(plain(server.port()), 2000ms);
        client.connect(Context());
        client.close();
        EXPECT_FALSE(client.isConnected());
    }

    // QUIT reaches the server asynchronously
    for (int i = 0; i < 100 && !sawCommand(server, "QUIT"); ++i) std::this_thread::sleep_for(10ms);
    EXPECT_TRUE(sawCommand(server, "QUIT"));
}

TEST_F(NntpClientTest, AuthenticatesWithUserAndPass) {
    FakeNntpServer server("200 ready", [](const std::string& line) -> std::string {
        if (line == "AUTHINFO USER alice") return "381 password required";
        if (line == "AUTHINFO PASS s3cret") return "281 authentication accepted";
        return articleServer(line);
    });

    auto p = plain(server.port());
    p.username = "alice";
    p.password = "s3cret";
    Client client(p, 2000ms);

    client.connect(Context());

    EXPECT_EQ(client.stat(Context(), "<present@test>"), ARTICLE_EXISTS);
    const auto cmds = server.commands();
    ASSERT_GE(cmds.size(), 2u);
    EXPECT_EQ(cmds[0], "AUTHINFO USER alice");
    EXPECT_EQ(cmds[1], "AUTHINFO PASS s3cret");
}

TEST_F(NntpClientTest, RejectedCredentialsThrow) {
    FakeNntpServer server("200 ready", [](const std::string& line) -> std::string {
        if (line.rfind("AUTHINFO USER", 0) == 0) return "381 password required";
        return "481 authentication failed";
    });

    auto p = plain(server.port());
    p.username = "alice";
    p.password = "wrong";
    Client client(p, 2000ms);

    try {
        client.connect(Context());
        FAIL() << "expected NntpError";
    } catch (const NntpError& e) {
        EXPECT_EQ(e.code, 481);
    }
}

TEST_F(NntpClientTest, RefusingGreetingThrows) {
    FakeNntpServer server("502 service unavailable");
    Client client(plain(server.port()), 2000ms);

    try {
        client.connect(Context());
        FAIL() << "expected NntpError";
    } catch (const NntpError& e) {
        EXPECT_EQ(e.code, 502);
    }
    EXPECT_FALSE(client.isConnected());
}

TEST_F(NntpClientTest, MalformedReplyThrows) {
    FakeNntpServer server("hello there");
    Client client(plain(server.port()), 2000ms);

    EXPECT_THROW(client.connect(Context()), NntpError);
}

TEST_F(NntpClientTest, SilentServerTimesOut) {
    FakeNntpServer server("");
    Client client(plain(server.port()), 150ms);

    const auto started = std::chrono::steady_clock::now();
    try {
        client.connect(Context());
        FAIL() << "expected NntpError";
    } catch (const NntpError& e) {
        EXPECT_EQ(e.code, 0);
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_FALSE(client.isConnected());
}

TEST_F(NntpClientTest, CancellationInterruptsRead) {
    FakeNntpServer server("");
    Client client(plain(server.port()), 10s);
    const auto ctx = Context().withCancel();

    std::thread canceller([ctx] {
        std::this_thread::sleep_for(50ms);
        ctx.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client.connect(ctx), CancellationError);
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST_F(NntpClientTest, ContextDeadlineBeatsLongIoTimeout) {
    FakeNntpServer server("");
    Client client(plain(server.port()), 10s);

    try {
        client.connect(Context().withTimeout(100ms));
        FAIL() << "expected CancellationError";
    } catch (const CancellationError& e) {
        EXPECT_TRUE(e.deadline_exceeded);
    }
}

TEST_F(NntpClientTest, ConnectionRefusedThrows) {
    uint16_t port = 0;
    {
        FakeNntpServer server;
        port = server.port();
    }

    Client client(plain(port), 2000ms);
    EXPECT_THROW(client.connect(Context()), NntpError);
}

TEST_F(NntpClientTest, RejectsMessageIdsWithLineBreaks) {
    FakeNntpServer server("200 ready", articleServer);
    Client client(plain(server.port()), 2000ms);
    client.connect(Context());

    EXPECT_THROW(client.stat(Context(), "<a@x>\r\nQUIT"), NntpError);
    EXPECT_THROW(client.stat(Context(), ""), NntpError);
    EXPECT_TRUE(client.isConnected());
}

TEST_F(NntpClientTest, CheckArticleThrowsOnUnexpectedStatus) {
    FakeNntpServer server("200 ready", [](const std::string&) -> std::string { return "480 authentication required"; });
    Client client(plain(server.port()), 2000ms);
    client.connect(Context());

    try {
        client.checkArticle(Context(), "<a@x>");
        FAIL() << "expected NntpError";
    } catch (const NntpError& e) {
        EXPECT_EQ(e.code, 480);
    }
}

TEST_F(NntpClientTest, StatBeforeConnectThrows) {
    Client client(plain(1), 100ms);
    EXPECT_THROW(client.stat(Context(), "<a@x>"), NntpError);
}

TEST_F(NntpClientTest, DialerReturnsConnectedClient) {
    FakeNntpServer server("200 ready", articleServer);
    const auto dial = Client::dialer(2000ms);

    const auto conn = dial(Context(), plain(server.port()));

    ASSERT_NE(conn, nullptr);
    EXPECT_TRUE(conn->checkArticle(Context(), "<present@test>"));
    conn->close();
}
