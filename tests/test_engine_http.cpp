// End-to-end checks against a local cpp-httplib server, over real sockets.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "httplib.h"
#include "resilient_rest/request_engine.hpp"
#include "resilient_rest/serialize.hpp"

using namespace resilient_rest;
using namespace std::chrono_literals;

namespace {

    struct Widget {
        int id;
        std::string name;
    };
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Widget, id, name)

    /// Runs an httplib server on an ephemeral port for the test's lifetime.
    class LocalServer {
       public:
        LocalServer() { port_ = svr.bind_to_any_port("127.0.0.1"); }

        void start() {
            thread_ = std::thread([this] { svr.listen_after_bind(); });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        ~LocalServer() {
            svr.stop();
            if (thread_.joinable()) thread_.join();
        }

        std::string base_url() const {
            return "http://127.0.0.1:" + std::to_string(port_);
        }

        httplib::Server svr;

       private:
        int port_{0};
        std::thread thread_;
    };

    EngineConfiguration local_config(const std::string& base) {
        EngineConfiguration cfg;
        cfg.base_url = base;
        cfg.rate_limit.enabled = false;
        cfg.retry.max_retries = 3;
        cfg.retry.base_delay = 10ms;
        cfg.retry.max_delay = 50ms;
        cfg.retry.backoff_factor = 2.0;
        cfg.request_timeout = 5s;
        cfg.polling.poll_interval = 50ms;
        cfg.polling.max_wait = 10s;
        return cfg;
    }

}  // namespace

TEST(EngineHttpTest, RetriesUnavailableThenDecodesBody) {
    LocalServer server;
    std::atomic<int> hits{0};
    server.svr.Get("/widgets/7", [&](const httplib::Request&,
                                     httplib::Response& res) {
        if (++hits < 3) {
            res.status = 503;
            return;
        }
        res.set_content(R"({"ok":true})", "application/json");
    });
    server.start();

    RequestEngine engine(local_config(server.base_url()));
    auto result = engine.get("/widgets/7");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 3u);
    EXPECT_TRUE(result.json()["ok"].get<bool>());
    EXPECT_EQ(hits.load(), 3);
}

TEST(EngineHttpTest, TypedRoundTrip) {
    LocalServer server;
    server.svr.Post("/widgets", [](const httplib::Request& req,
                                   httplib::Response& res) {
        auto in = nlohmann::json::parse(req.body);
        in["id"] = 42;
        res.status = 201;
        res.set_content(in.dump(), "application/json");
    });
    server.start();

    RequestEngine engine(local_config(server.base_url()));
    auto result = engine.post("/widgets", to_json_body(Widget{0, "gear"}));
    auto widget = deserialize<Widget>(result);

    EXPECT_EQ(result.status_code, 201);
    EXPECT_EQ(widget.id, 42);
    EXPECT_EQ(widget.name, "gear");
}

TEST(EngineHttpTest, BearerTokenReachesServer) {
    LocalServer server;
    server.svr.Get("/me", [](const httplib::Request& req,
                             httplib::Response& res) {
        if (req.get_header_value("Authorization") == "Bearer secret-token") {
            res.set_content("{}", "application/json");
        } else {
            res.status = 401;
        }
    });
    server.start();

    RequestEngine authed(local_config(server.base_url()),
                         std::string("secret-token"));
    EXPECT_EQ(authed.get("/me").status_code, 200);

    RequestEngine anonymous(local_config(server.base_url()));
    EXPECT_THROW((void)anonymous.get("/me"), AuthenticationError);
}

TEST(EngineHttpTest, OpenCircuitStopsTraffic) {
    LocalServer server;
    std::atomic<int> hits{0};
    server.svr.Post("/orders", [&](const httplib::Request&,
                                   httplib::Response& res) {
        ++hits;
        res.status = 500;
    });
    server.start();

    auto cfg = local_config(server.base_url());
    cfg.circuit_breaker.failure_threshold = 1;
    RequestEngine engine(cfg);

    EXPECT_THROW((void)engine.post("/orders", std::string("{}")),
                 OperationError);
    EXPECT_EQ(engine.breaker().state(), CircuitState::Open);

    auto rejected = engine.execute(make_request(HttpMethod::Post, "/orders", "{}"));
    EXPECT_EQ(rejected.error_kind, ErrorKind::CircuitOpen);
    EXPECT_EQ(rejected.attempts, 0u);
    EXPECT_EQ(hits.load(), 1);
}

TEST(EngineHttpTest, PollsDeferredOperation) {
    LocalServer server;
    std::atomic<int> polls{0};
    server.svr.Post("/exports", [](const httplib::Request&,
                                   httplib::Response& res) {
        res.status = 202;
        res.set_header("Location", "/status/1");
        res.set_header("Retry-After", "1");
    });
    server.svr.Get("/status/1", [&](const httplib::Request&,
                                    httplib::Response& res) {
        if (++polls < 2) {
            res.status = 202;
            return;
        }
        res.set_content(R"({"done":true})", "application/json");
    });
    server.start();

    RequestEngine engine(local_config(server.base_url()));
    const auto start = std::chrono::steady_clock::now();
    auto result = engine.post("/exports", std::string("{}"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status_code, 200);
    EXPECT_EQ(result.polls, 2u);
    EXPECT_TRUE(result.json()["done"].get<bool>());
    // Both waits follow the one-second Retry-After hint.
    EXPECT_GE(std::chrono::steady_clock::now() - start, 1900ms);
}

TEST(EngineHttpTest, SlowServerHitsAttemptTimeout) {
    LocalServer server;
    server.svr.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(600ms);
        res.set_content("{}", "application/json");
    });
    server.start();

    auto cfg = local_config(server.base_url());
    cfg.request_timeout = 100ms;
    cfg.retry.max_retries = 0;
    RequestEngine engine(cfg);

    auto result = engine.execute(make_request(HttpMethod::Get, "/slow"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Timeout);
    EXPECT_EQ(engine.breaker().consecutive_failures(), 1u);
}

TEST(EngineHttpTest, CallerDeadlineInterruptsInFlightRequest) {
    LocalServer server;
    server.svr.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(600ms);
        res.set_content("{}", "application/json");
    });
    server.start();

    RequestEngine engine(local_config(server.base_url()));
    const auto start = std::chrono::steady_clock::now();
    auto result = engine.execute(make_request(HttpMethod::Get, "/slow"),
                                 CancellationToken::with_timeout(100ms));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
    EXPECT_EQ(engine.breaker().consecutive_failures(), 0u);
}

TEST(EngineHttpTest, KeepAliveConnectionIsReused) {
    LocalServer server;
    server.svr.Get("/ping", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{}", "application/json");
    });
    server.start();

    RequestEngine engine(local_config(server.base_url()));
    for (int i = 0; i < 5; ++i) EXPECT_TRUE(engine.get("/ping").success);
    EXPECT_EQ(engine.sessions().size(), 1u);
    EXPECT_EQ(engine.sessions().metrics().created.load(), 1u);
}
