#include <gtest/gtest.h>
#include "exchange/BoundedChannel.hpp"
#include "exchange/FeedMessage.hpp"
#include "exchange/FeedSession.hpp"
#include "exchange/PaperOrderAdapter.hpp"
#include "exchange/ReplayFeed.hpp"
#include "exchange/ReplayPacer.hpp"
#include "telemetry/TelemetryState.hpp"
#include "Fakes.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <future>
#include <thread>
#include <vector>

using namespace tandem;
using tandem::test::FakeMarketData;
using tandem::test::feed_line;
using tandem::test::make_depth;

// ---------------------------------------------------------------------------
// FeedMessage
// ---------------------------------------------------------------------------
TEST(FeedMessageTest, ParsesNormalizedIncrement) {
    FeedMessage m = FeedMessage::parse(
        R"({"symbol":"BTC/USDT","side":"ask","price":30000.5,"quantity":0.25,"ts":1700000000000000000})");
    EXPECT_EQ(m.symbol, "BTC/USDT");
    EXPECT_EQ(m.side, BookSide::ASK);
    EXPECT_DOUBLE_EQ(m.price, 30000.5);
    EXPECT_DOUBLE_EQ(m.quantity, 0.25);
    EXPECT_EQ(m.ts_ns, 1700000000000000000ULL);
}

TEST(FeedMessageTest, ZeroQuantityIsValid) {
    FeedMessage m = FeedMessage::parse(
        R"({"symbol":"X","side":"bid","price":1,"quantity":0,"ts":0})");
    EXPECT_DOUBLE_EQ(m.quantity, 0.0);
}

TEST(FeedMessageTest, RejectsMalformedMessages) {
    const char* bad[] = {
        "not json",
        "[1, 2, 3]",
        R"({"side":"bid","price":1,"quantity":1,"ts":1})",
        R"({"symbol":"","side":"bid","price":1,"quantity":1,"ts":1})",
        R"({"symbol":"X","side":"mid","price":1,"quantity":1,"ts":1})",
        R"({"symbol":"X","side":"bid","price":0,"quantity":1,"ts":1})",
        R"({"symbol":"X","side":"bid","price":"1","quantity":1,"ts":1})",
        R"({"symbol":"X","side":"bid","price":1,"quantity":-1,"ts":1})",
        R"({"symbol":"X","side":"bid","price":1,"quantity":1,"ts":1.5})",
        R"({"symbol":"X","side":"bid","price":1,"quantity":1,"ts":-5})",
        R"({"symbol":"X","side":"bid","price":1,"quantity":1})",
        // No expression evaluation, ever.
        R"j({"symbol":"X","side":"bid","price":"__import__('os')","quantity":1,"ts":1})j",
    };
    for (const char* raw : bad)
        EXPECT_THROW(FeedMessage::parse(raw), FeedProtocolError) << raw;
}

// ---------------------------------------------------------------------------
// BoundedChannel
// ---------------------------------------------------------------------------
TEST(BoundedChannelTest, DrainRespectsMax) {
    BoundedChannel<int> ch(8);
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(ch.push(i));

    std::vector<int> out;
    EXPECT_EQ(ch.drain(out, 3), 3u);
    EXPECT_EQ(out, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(ch.size(), 2u);
}

TEST(BoundedChannelTest, ProducerBlocksWhileFull) {
    BoundedChannel<int> ch(1);
    ASSERT_TRUE(ch.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        ch.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    int v = 0;
    ASSERT_TRUE(ch.try_pop(v));
    EXPECT_EQ(v, 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    ASSERT_TRUE(ch.try_pop(v));
    EXPECT_EQ(v, 2);
}

TEST(BoundedChannelTest, CloseWakesProducerAndKeepsQueuedItems) {
    BoundedChannel<int> ch(1);
    ASSERT_TRUE(ch.push(1));

    std::atomic<bool> result{true};
    std::thread producer([&] { result = ch.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_FALSE(ch.push(3));
    int v = 0;
    EXPECT_TRUE(ch.try_pop(v));
    EXPECT_EQ(v, 1);
    EXPECT_FALSE(ch.try_pop(v));
}

TEST(BoundedChannelTest, WaitForTimesOutWhenEmpty) {
    BoundedChannel<int> ch(4);
    EXPECT_FALSE(ch.wait_for(std::chrono::milliseconds(5)));
    ch.push(1);
    EXPECT_TRUE(ch.wait_for(std::chrono::milliseconds(5)));
}

// ---------------------------------------------------------------------------
// FeedSession
// ---------------------------------------------------------------------------
class FeedSessionTest : public ::testing::Test {
protected:
    FeedChannel channel{64};
    TelemetryState telemetry;
    FakeMarketData md{"binance"};
    FeedSessionConfig cfg{1, 4};

    std::vector<FeedEvent> drain() {
        std::vector<FeedEvent> out;
        channel.drain(out, 1000);
        return out;
    }
};

TEST_F(FeedSessionTest, SnapshotPrecedesIncrements) {
    md.snapshot_depth = make_depth({{29999.0, 1.0}}, {{30001.0, 1.0}}, 5);
    md.scripts.push_back({feed_line("BTC/USDT", "bid", 30000.0, 2.0, 10)});

    FeedSession session(md, {"BTC/USDT"}, channel, telemetry, cfg);
    session.run();

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, FeedEventKind::SNAPSHOT);
    EXPECT_EQ(events[0].venue, "binance");
    EXPECT_EQ(events[0].depth.bids.size(), 1u);
    EXPECT_EQ(events[1].kind, FeedEventKind::INCREMENT);
    EXPECT_EQ(events[1].side, BookSide::BID);
    EXPECT_DOUBLE_EQ(events[1].price, 30000.0);
    EXPECT_EQ(events[1].ts_ns, 10u);
    EXPECT_TRUE(session.finished());
}

TEST_F(FeedSessionTest, ReconnectResnapshotsBeforeResuming) {
    md.scripts.push_back({feed_line("BTC/USDT", "bid", 1.0, 1.0, 1), std::nullopt});
    md.scripts.push_back({feed_line("BTC/USDT", "ask", 2.0, 1.0, 2)});

    FeedSession session(md, {"BTC/USDT"}, channel, telemetry, cfg);
    session.run();

    auto events = drain();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].kind, FeedEventKind::SNAPSHOT);
    EXPECT_EQ(events[1].kind, FeedEventKind::INCREMENT);
    EXPECT_EQ(events[2].kind, FeedEventKind::SNAPSHOT);
    EXPECT_EQ(events[3].kind, FeedEventKind::INCREMENT);
    EXPECT_EQ(events[3].side, BookSide::ASK);

    EXPECT_EQ(md.connects, 2);
    EXPECT_GE(md.closes, 1);
    EXPECT_EQ(session.reconnects(), 1u);
    EXPECT_EQ(telemetry.count(Counter::RECONNECT), 1u);
}

TEST_F(FeedSessionTest, MalformedMessagesAreDroppedAndCounted) {
    md.scripts.push_back({std::string("garbage"),
                          feed_line("BTC/USDT", "bid", 1.0, 1.0, 1),
                          feed_line("DOGE/USDT", "bid", 1.0, 1.0, 1),
                          std::string(R"({"symbol":"BTC/USDT","side":"bid","price":-1,"quantity":1,"ts":1})")});

    FeedSession session(md, {"BTC/USDT"}, channel, telemetry, cfg);
    session.run();

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);  // snapshot + one valid increment
    EXPECT_EQ(telemetry.count(Counter::PROTOCOL_ERROR), 2u);
    EXPECT_EQ(md.connects, 1);
}

TEST_F(FeedSessionTest, ClosedChannelEndsSession) {
    md.scripts.push_back({feed_line("BTC/USDT", "bid", 1.0, 1.0, 1)});
    channel.close();

    FeedSession session(md, {"BTC/USDT"}, channel, telemetry, cfg);
    session.run();
    EXPECT_TRUE(session.finished());
    EXPECT_EQ(channel.size(), 0u);
}

TEST_F(FeedSessionTest, ThreadedSessionStops) {
    // Endless disconnects until stopped.
    for (int i = 0; i < 1000; ++i) md.scripts.push_back({std::nullopt});

    FeedSession session(md, {"BTC/USDT"}, channel, telemetry, FeedSessionConfig{20, 20});
    session.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    session.stop();
    session.join();
    EXPECT_TRUE(session.finished());
    EXPECT_GE(session.reconnects(), 1u);
}

// ---------------------------------------------------------------------------
// ReplayFeed and PaperOrderAdapter
// ---------------------------------------------------------------------------
TEST(ReplayFeedTest, ReadsLinesAndResumesAfterReconnect) {
    const std::string path = ::testing::TempDir() + "tandem_replay_test.jsonl";
    {
        std::ofstream out(path);
        out << "# header\n"
            << feed_line("BTC/USDT", "bid", 1.0, 1.0, 1) << "\n"
            << "\n"
            << feed_line("BTC/USDT", "ask", 2.0, 1.0, 2) << "\n";
    }

    ReplayFeed feed("kraken", path);
    EXPECT_EQ(feed.venue(), "kraken");
    feed.connect();
    EXPECT_TRUE(feed.snapshot("BTC/USDT").bids.empty());

    auto first = feed.read();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(FeedMessage::parse(*first).side, BookSide::BID);

    feed.close();
    EXPECT_THROW(feed.read(), ConnectionLost);

    feed.connect();
    auto second = feed.read();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(FeedMessage::parse(*second).side, BookSide::ASK);
    EXPECT_FALSE(feed.read().has_value());
}

TEST(ReplayFeedTest, MissingFileThrows) {
    EXPECT_THROW(ReplayFeed("kraken", "/nonexistent/tandem.jsonl"), std::runtime_error);
}

TEST(ReplayPacerTest, WaitsForSlowerSlot) {
    ReplayPacer pacer;
    const std::size_t a = pacer.enroll();
    const std::size_t b = pacer.enroll();

    // b has not peeked yet, so a cannot pass 0.
    auto ahead = std::async(std::launch::async, [&] { return pacer.wait_turn(a, 10); });
    EXPECT_EQ(ahead.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    // b at 5 is released once a has published 10; a still waits on b.
    auto behind = std::async(std::launch::async, [&] { return pacer.wait_turn(b, 5); });
    EXPECT_TRUE(behind.get());
    EXPECT_EQ(ahead.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    EXPECT_TRUE(pacer.wait_turn(b, 10));
    EXPECT_TRUE(ahead.get());
}

TEST(ReplayPacerTest, RetiredSlotStopsHoldingOthers) {
    ReplayPacer pacer;
    const std::size_t a = pacer.enroll();
    const std::size_t b = pacer.enroll();
    EXPECT_EQ(pacer.active(), 2u);

    auto ahead = std::async(std::launch::async, [&] { return pacer.wait_turn(a, 10); });
    pacer.retire(b);
    EXPECT_TRUE(ahead.get());
    EXPECT_EQ(pacer.active(), 1u);
}

TEST(ReplayPacerTest, CloseReleasesWaiters) {
    ReplayPacer pacer;
    const std::size_t a = pacer.enroll();
    pacer.enroll();

    auto ahead = std::async(std::launch::async, [&] { return pacer.wait_turn(a, 10); });
    pacer.close();
    EXPECT_FALSE(ahead.get());
    EXPECT_THROW(pacer.wait_turn(7, 1), std::out_of_range);
}

TEST(ReplayPacerTest, PacedSessionsMergeByTimestamp) {
    const std::string dir = ::testing::TempDir();
    const std::string path_a = dir + "tandem_paced_a.jsonl";
    const std::string path_b = dir + "tandem_paced_b.jsonl";
    {
        // A writes three lines per tick, B one, so unpaced A would run ahead.
        std::ofstream a(path_a);
        std::ofstream b(path_b);
        for (uint64_t t = 1; t <= 50; ++t) {
            for (int i = 0; i < 3; ++i)
                a << feed_line("X", "bid", 100.0 + i, 1.0, t) << "\n";
            b << feed_line("X", "ask", 101.0, 1.0, t) << "\n";
        }
    }

    FeedChannel channel(1024);
    TelemetryState telemetry;
    ReplayPacer pacer;
    ReplayFeed feed_a("A", path_a, &pacer);
    ReplayFeed feed_b("B", path_b, &pacer);
    FeedSessionConfig cfg{1, 4};
    FeedSession sa(feed_a, {"X"}, channel, telemetry, cfg);
    FeedSession sb(feed_b, {"X"}, channel, telemetry, cfg);
    sa.start();
    sb.start();
    sa.join();
    sb.join();

    std::vector<FeedEvent> out;
    channel.drain(out, 1024);
    std::size_t increments = 0;
    uint64_t last = 0;
    for (const auto& ev : out) {
        if (ev.kind != FeedEventKind::INCREMENT) continue;
        ++increments;
        EXPECT_GE(ev.ts_ns, last) << ev.venue;
        last = ev.ts_ns;
    }
    EXPECT_EQ(increments, 200u);
    EXPECT_EQ(pacer.active(), 0u);
}

TEST(PaperOrderAdapterTest, FillsWithinLimitAtVwap) {
    BookStore books;
    books.apply_snapshot("A", "X", make_depth({{99.0, 1.0}, {98.0, 1.0}},
                                              {{100.0, 1.0}, {101.0, 1.0}, {102.0, 5.0}}, 1));
    PaperOrderAdapter paper(books);

    OrderRequest buy;
    buy.venue = "A";
    buy.symbol = "X";
    buy.side = OrderSide::BUY;
    buy.amount = 3.0;
    buy.price = 101.0;
    OrderResult r = paper.place(buy);
    EXPECT_DOUBLE_EQ(r.filled, 2.0);
    EXPECT_DOUBLE_EQ(r.average, 100.5);
    EXPECT_EQ(r.status, OrderStatus::OPEN);
    EXPECT_EQ(r.id, "A-1");

    OrderRequest sell = buy;
    sell.side = OrderSide::SELL;
    sell.amount = 0.5;
    sell.price = 99.0;
    OrderResult s = paper.place(sell);
    EXPECT_DOUBLE_EQ(s.filled, 0.5);
    EXPECT_EQ(s.status, OrderStatus::CLOSED);

    paper.cancel("A", r.id, "X");
    EXPECT_EQ(paper.cancelled().size(), 1u);
    EXPECT_EQ(paper.placed().size(), 2u);
}

TEST(PaperOrderAdapterTest, UnknownBookThrows) {
    BookStore books;
    PaperOrderAdapter paper(books);
    OrderRequest req;
    req.venue = "A";
    req.symbol = "X";
    req.amount = 1.0;
    EXPECT_THROW(paper.place(req), VenueError);
}
