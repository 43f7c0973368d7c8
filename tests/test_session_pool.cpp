#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "fake_transport.hpp"
#include "resilient_rest/connection/session_pool.hpp"

using namespace resilient_rest;
using resilient_rest::testing::ScriptedServer;
using resilient_rest::testing::fake_transport_factory;

namespace {
    Endpoint endpoint(const std::string& host, bool https = true) {
        Endpoint ep;
        ep.host = host;
        ep.https = https;
        return ep;
    }

    SessionPoolConfiguration capacity(std::size_t n) {
        SessionPoolConfiguration cfg;
        cfg.max_sessions = n;
        return cfg;
    }
}  // namespace

TEST(SessionPoolTest, HitReturnsSameTransport) {
    auto server = std::make_shared<ScriptedServer>();
    SessionPool pool(capacity(4), fake_transport_factory(server));

    auto a = pool.lease(endpoint("api.example.com"));
    auto b = pool.lease(endpoint("API.example.com"));
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(a.key(), "https://api.example.com:443");
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.metrics().created.load(), 1u);
    EXPECT_EQ(pool.metrics().reused.load(), 1u);
}

TEST(SessionPoolTest, SchemeAndPortAreDistinctKeys) {
    auto server = std::make_shared<ScriptedServer>();
    SessionPool pool(capacity(4), fake_transport_factory(server));

    auto https = pool.lease(endpoint("h"));
    auto http = pool.lease(endpoint("h", false));
    auto other_port = pool.lease(Endpoint{"h", "8443", true});
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_TRUE(pool.contains("http://h:80"));
    EXPECT_TRUE(pool.contains("https://h:8443"));
}

TEST(SessionPoolTest, EvictsAndClosesLeastRecentlyUsed) {
    auto server = std::make_shared<ScriptedServer>();
    SessionPool pool(capacity(2), fake_transport_factory(server));

    auto a = pool.lease(endpoint("a"));
    (void)pool.lease(endpoint("b"));
    (void)pool.lease(endpoint("a"));  // a is now most recent
    (void)pool.lease(endpoint("c"));  // evicts b

    EXPECT_EQ(pool.size(), 2u);
    EXPECT_FALSE(pool.contains("https://b:443"));
    EXPECT_EQ(pool.keys(), (std::vector<std::string>{"https://c:443",
                                                     "https://a:443"}));
    EXPECT_EQ(server->transports_closed.load(), 1);
    EXPECT_EQ(pool.metrics().evicted.load(), 1u);
    EXPECT_FALSE(a->is_closed());
}

TEST(SessionPoolTest, ClosedEntryIsReplaced) {
    auto server = std::make_shared<ScriptedServer>();
    SessionPool pool(capacity(2), fake_transport_factory(server));

    auto first = pool.lease(endpoint("a"));
    first->close();
    auto second = pool.lease(endpoint("a"));
    EXPECT_NE(first.get(), second.get());
    EXPECT_FALSE(second->is_closed());
    EXPECT_EQ(pool.metrics().replaced.load(), 1u);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(SessionPoolTest, NeverExceedsCapacityUnderConcurrency) {
    auto server = std::make_shared<ScriptedServer>();
    SessionPool pool(capacity(3), fake_transport_factory(server));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&pool, t] {
            for (int i = 0; i < 200; ++i) {
                auto lease =
                    pool.lease(endpoint("h" + std::to_string((t + i) % 7)));
                ASSERT_TRUE(lease);
                ASSERT_LE(pool.size(), 3u);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(pool.size(), 3u);
    // Every transport that left the cache was closed.
    EXPECT_EQ(server->transports_created.load() - server->transports_closed.load(),
              static_cast<int>(pool.size()));
}

TEST(SessionPoolTest, CloseAllClosesEverything) {
    auto server = std::make_shared<ScriptedServer>();
    {
        SessionPool pool(capacity(5), fake_transport_factory(server));
        (void)pool.lease(endpoint("a"));
        (void)pool.lease(endpoint("b"));
        pool.close_all();
        EXPECT_EQ(pool.size(), 0u);
        EXPECT_EQ(server->transports_closed.load(), 2);
        (void)pool.lease(endpoint("c"));
    }
    // Destructor closes what is left.
    EXPECT_EQ(server->transports_closed.load(), 3);
}

TEST(SessionPoolTest, RejectsBadConstruction) {
    auto server = std::make_shared<ScriptedServer>();
    EXPECT_THROW(SessionPool(capacity(0), fake_transport_factory(server)),
                 std::invalid_argument);
    EXPECT_THROW(SessionPool(capacity(1), TransportFactory{}),
                 std::invalid_argument);
}

TEST(SessionPoolTest, FactoryReturningNothingThrows) {
    SessionPool pool(capacity(1), [](const Endpoint&) {
        return std::shared_ptr<Transport>{};
    });
    EXPECT_THROW((void)pool.lease(endpoint("a")), std::runtime_error);
}
