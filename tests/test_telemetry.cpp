#include <gtest/gtest.h>
#include "telemetry/HttpServer.hpp"
#include "telemetry/TelemetryState.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace tandem;

TEST(TelemetryStateTest, CountersAreIndependent) {
    TelemetryState t;
    t.increment(Counter::FEE_REJECT);
    t.increment(Counter::FEE_REJECT, 2);
    t.increment(Counter::NAKED_EXPOSURE);
    EXPECT_EQ(t.count(Counter::FEE_REJECT), 3u);
    EXPECT_EQ(t.count(Counter::NAKED_EXPOSURE), 1u);
    EXPECT_EQ(t.count(Counter::TRADES), 0u);
}

TEST(TelemetryStateTest, JsonCarriesSnapshotAndCounters) {
    TelemetryState t;
    t.increment(Counter::TRADES);
    t.publish({{"cumulative_pnl", 12.5}, {"trades", 1}});

    nlohmann::json j = nlohmann::json::parse(t.to_json());
    EXPECT_DOUBLE_EQ(j["cumulative_pnl"].get<double>(), 12.5);
    EXPECT_EQ(j["counters"]["trades"].get<uint64_t>(), 1u);
    EXPECT_EQ(j["counters"]["naked_exposure"].get<uint64_t>(), 0u);
}

TEST(TelemetryStateTest, PrometheusRendering) {
    TelemetryState t;
    t.increment(Counter::RISK_REJECT, 4);
    t.publish({{"cumulative_pnl", -3.0},
               {"win_rate", 0.5},
               {"risk", {{"kill_switch", true}}},
               {"symbols", {{"BTC/USDT", {{"trades", 2}, {"pnl", 1.5}}}}},
               {"fees", {{"binance", 0.25}}}});

    const std::string text = t.to_prometheus();
    EXPECT_NE(text.find("tandem_risk_reject_total 4"), std::string::npos);
    EXPECT_NE(text.find("tandem_kill_switch 1"), std::string::npos);
    EXPECT_NE(text.find("tandem_symbol_trades{symbol=\"BTC/USDT\"} 2"), std::string::npos);
    EXPECT_NE(text.find("tandem_fees{venue=\"binance\"} 0.25"), std::string::npos);
}

TEST(HttpServerTest, Routes) {
    TelemetryState t;
    t.increment(Counter::TRADES);
    std::atomic<bool> running{true};
    HttpServer server(0, t, running);

    auto metrics = server.handle("GET", "/metrics");
    EXPECT_EQ(metrics.status, 200u);
    EXPECT_NE(metrics.body.find("tandem_trades_total 1"), std::string::npos);

    auto snap = server.handle("GET", "/?pretty=1");
    EXPECT_EQ(snap.status, 200u);
    EXPECT_EQ(snap.content_type, "application/json");

    EXPECT_EQ(server.handle("GET", "/health").body, "ok\n");
    EXPECT_EQ(server.handle("GET", "/nope").status, 404u);
    EXPECT_EQ(server.handle("POST", "/metrics").status, 405u);

    running = false;
    EXPECT_EQ(server.handle("GET", "/health").body, "stopping\n");
}

TEST(HttpServerTest, IdleClientIsDroppedAfterTimeout) {
    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = beast::http;
    using tcp = asio::ip::tcp;

    TelemetryState t;
    std::atomic<bool> running{true};
    HttpServer server(0, t, running, std::chrono::milliseconds(100));
    std::thread srv([&server] { server.run(); });

    for (int i = 0; i < 200 && server.bound_port() == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_NE(server.bound_port(), 0);
    const tcp::endpoint ep(asio::ip::make_address("127.0.0.1"), server.bound_port());

    asio::io_context ioc;
    tcp::socket idle(ioc);
    idle.connect(ep);  // never sends a request

    tcp::socket client(ioc);
    client.connect(ep);
    http::request<http::empty_body> req(http::verb::get, "/health", 11);
    req.set(http::field::host, "localhost");
    http::write(client, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(client, buffer, res);
    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(res.body(), "ok\n");

    running = false;
    srv.join();
}
