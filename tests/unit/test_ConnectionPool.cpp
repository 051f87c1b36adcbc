#include <gtest/gtest.h>
#include "nntp/ConnectionPool.hpp"
#include "nntp/Client.hpp"
#include "FakeUsenet.hpp"
#include "FakeNntpServer.hpp"

#include <thread>

using namespace np::nntp;
using namespace np::test;
using np::concurrency::CancellationError;
using np::concurrency::Context;
using namespace std::chrono_literals;

class ConnectionPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeUsenet> net = std::make_shared<FakeUsenet>();
};

TEST_F(ConnectionPoolTest, PresentOnFirstProviderReturnsImmediately) {
    net->addArticles("primary", {"<a@x>"});
    ConnectionPool pool({provider("primary"), provider("backup")}, net->dialer());

    EXPECT_EQ(pool.stat(Context(), "<a@x>", {}), ARTICLE_EXISTS);
    EXPECT_EQ(net->dials("backup"), 0);
}

TEST_F(ConnectionPoolTest, FallsBackToLaterProvider) {
    net->addArticles("backup", {"<a@x>"});
    ConnectionPool pool({provider("primary"), provider("backup")}, net->dialer());

    EXPECT_EQ(pool.stat(Context(), "<a@x>", {"alt.binaries.test"}), ARTICLE_EXISTS);
    EXPECT_EQ(net->dials("primary"), 1);
    EXPECT_EQ(net->dials("backup"), 1);
}

TEST_F(ConnectionPoolTest, AbsentEverywhereThrowsSentinel) {
    ConnectionPool pool({provider("primary"), provider("backup")}, net->dialer());

    try {
        pool.stat(Context(), "<gone@x>", {});
        FAIL() << "expected ArticleNotFoundInProviders";
    } catch (const ArticleNotFoundInProviders& e) {
        EXPECT_EQ(e.message_id, "<gone@x>");
    }
}

TEST_F(ConnectionPoolTest, TransientFailureIsNotDefinitiveAbsence) {
    net->failStats("backup");
    ConnectionPool pool({provider("primary"), provider("backup")}, net->dialer());

    EXPECT_THROW(pool.stat(Context(), "<gone@x>", {}), NntpError);
    EXPECT_EQ(pool.openConnections(1), 0u);
}

TEST_F(ConnectionPoolTest, UnexpectedStatusIsNotDefinitiveAbsence) {
    net->overrideStatus("primary", "<a@x>", 480);
    ConnectionPool pool({provider("primary")}, net->dialer());

    try {
        pool.stat(Context(), "<a@x>", {});
        FAIL() << "expected NntpError";
    } catch (const NntpError& e) {
        EXPECT_EQ(e.code, 480);
    }
}

TEST_F(ConnectionPoolTest, ConnectionsAreReused) {
    net->addArticles("primary", {"<a@x>", "<b@x>", "<c@x>"});
    ConnectionPool pool({provider("primary")}, net->dialer());

    for (const auto* id : {"<a@x>", "<b@x>", "<c@x>"}) EXPECT_EQ(pool.stat(Context(), id, {}), ARTICLE_EXISTS);

    EXPECT_EQ(net->dials("primary"), 1);
    EXPECT_EQ(pool.idleConnections(0), 1u);
    EXPECT_EQ(pool.openConnections(0), 1u);
}

TEST_F(ConnectionPoolTest, RefusedDialReleasesSlot) {
    net->refuseDials("primary");
    ConnectionPool pool({provider("primary", 1)}, net->dialer());

    EXPECT_THROW(pool.stat(Context(), "<a@x>", {}), NntpError);
    EXPECT_THROW(pool.stat(Context(), "<a@x>", {}), NntpError);
    EXPECT_EQ(net->dials("primary"), 2);
    EXPECT_EQ(pool.openConnections(0), 0u);
}

TEST_F(ConnectionPoolTest, ConcurrentCallersShareBoundedConnections) {
    net->setStatDelay(10ms);
    net->addArticles("primary", {"<a@x>"});
    ConnectionPool pool({provider("primary", 2)}, net->dialer());

    std::vector<std::thread> callers;
    std::atomic<int> present{0};
    for (int i = 0; i < 8; ++i)
        callers.emplace_back([&] {
            if (pool.stat(Context(), "<a@x>", {}) == ARTICLE_EXISTS) ++present;
        });
    for (auto& t : callers) t.join();

    EXPECT_EQ(present.load(), 8);
    EXPECT_LE(net->peakOpen(), 2);
    EXPECT_LE(net->dials("primary"), 2);
}

TEST_F(ConnectionPoolTest, WaitingForSlotHonoursCancellation) {
    net->setStatDelay(500ms);
    net->addArticles("primary", {"<a@x>"});
    ConnectionPool pool({provider("primary", 1)}, net->dialer());

    std::thread holder([&] { EXPECT_EQ(pool.stat(Context(), "<a@x>", {}), ARTICLE_EXISTS); });
    std::this_thread::sleep_for(50ms);

    EXPECT_THROW(pool.stat(Context().withTimeout(50ms), "<a@x>", {}), CancellationError);
    holder.join();
}

TEST_F(ConnectionPoolTest, ClosedPoolRefusesWork) {
    ConnectionPool pool({provider("primary")}, net->dialer());
    pool.close();

    EXPECT_THROW(pool.stat(Context(), "<a@x>", {}), NntpError);
}

TEST_F(ConnectionPoolTest, ManagerWithoutUsableProvidersHasNoPool) {
    auto off = provider("off");
    off.enabled = false;
    ConnectionPoolManager manager({off}, net->dialer());

    EXPECT_FALSE(manager.hasPool());
    EXPECT_THROW(manager.getPool(), std::runtime_error);
}

TEST_F(ConnectionPoolTest, ManagerBuildsPoolFromUsableProviders) {
    net->addArticles("primary", {"<a@x>"});
    ConnectionPoolManager manager({provider("primary")}, net->dialer());

    ASSERT_TRUE(manager.hasPool());
    EXPECT_EQ(manager.getPool()->stat(Context(), "<a@x>", {}), ARTICLE_EXISTS);
}

TEST_F(ConnectionPoolTest, WorksOverRealClientConnections) {
    FakeNntpServer server("200 ready", [](const std::string& line) -> std::string {
        return line == "STAT <a@x>" ? "223 0 <a@x>" : "430 no such article";
    });

    auto p = provider("loopback", 1);
    p.host = "127.0.0.1";
    p.port = server.port();
    p.use_tls = false;

    ConnectionPool pool({p}, Client::dialer(2000ms));

    EXPECT_EQ(pool.stat(Context(), "<a@x>", {}), ARTICLE_EXISTS);
    EXPECT_THROW(pool.stat(Context(), "<b@x>", {}), ArticleNotFoundInProviders);
    EXPECT_EQ(server.accepted(), 1);
}
