#include <gtest/gtest.h>
#include "book/BookStore.hpp"
#include "Fakes.hpp"

#include <limits>

using namespace tandem;
using tandem::test::make_depth;

namespace {
constexpr uint64_t SEC = 1'000'000'000ULL;
}

class BookStoreTest : public ::testing::Test {
protected:
    BookStore books{5 * SEC};

    void seed(const std::string& venue, uint64_t ts) {
        books.apply_update(venue, "BTC/USDT", BookSide::BID, 30000.0, 1.0, ts);
        books.apply_update(venue, "BTC/USDT", BookSide::ASK, 30001.0, 2.0, ts);
    }
};

TEST_F(BookStoreTest, TopOfBookReportsBestLevels) {
    seed("binance", 10 * SEC);
    books.apply_update("binance", "BTC/USDT", BookSide::BID, 29999.0, 5.0, 10 * SEC);
    books.apply_update("binance", "BTC/USDT", BookSide::ASK, 30002.0, 5.0, 10 * SEC);

    auto top = books.top_of_book("binance", "BTC/USDT", 11 * SEC);
    ASSERT_TRUE(top.has_value());
    EXPECT_DOUBLE_EQ(top->bid, 30000.0);
    EXPECT_DOUBLE_EQ(top->bid_qty, 1.0);
    EXPECT_DOUBLE_EQ(top->ask, 30001.0);
    EXPECT_DOUBLE_EQ(top->ask_qty, 2.0);
}

TEST_F(BookStoreTest, MissingBookIsUnavailable) {
    EXPECT_FALSE(books.top_of_book("kraken", "BTC/USDT", 0).has_value());
    EXPECT_FALSE(books.has_book("kraken", "BTC/USDT"));
}

TEST_F(BookStoreTest, StaleBookIsUnavailable) {
    seed("binance", 10 * SEC);
    EXPECT_TRUE(books.top_of_book("binance", "BTC/USDT", 15 * SEC).has_value());
    EXPECT_FALSE(books.top_of_book("binance", "BTC/USDT", 15 * SEC + 1).has_value());
    EXPECT_FALSE(books.depth("binance", "BTC/USDT", 16 * SEC, 10).has_value());

    // Any update refreshes the book.
    books.apply_update("binance", "BTC/USDT", BookSide::BID, 29990.0, 1.0, 16 * SEC);
    EXPECT_TRUE(books.top_of_book("binance", "BTC/USDT", 16 * SEC).has_value());
}

TEST_F(BookStoreTest, EmptySideIsUnavailable) {
    books.apply_update("binance", "BTC/USDT", BookSide::BID, 30000.0, 1.0, SEC);
    EXPECT_TRUE(books.has_book("binance", "BTC/USDT"));
    EXPECT_FALSE(books.top_of_book("binance", "BTC/USDT", SEC).has_value());
}

TEST_F(BookStoreTest, ZeroQuantityRemovesLevel) {
    seed("binance", SEC);
    books.apply_update("binance", "BTC/USDT", BookSide::BID, 29999.0, 3.0, SEC);
    books.apply_update("binance", "BTC/USDT", BookSide::BID, 30000.0, 0.0, 2 * SEC);

    auto top = books.top_of_book("binance", "BTC/USDT", 2 * SEC);
    ASSERT_TRUE(top.has_value());
    EXPECT_DOUBLE_EQ(top->bid, 29999.0);

    // Removing a level that is not there is harmless.
    books.apply_update("binance", "BTC/USDT", BookSide::BID, 12345.0, 0.0, 2 * SEC);
    EXPECT_DOUBLE_EQ(books.top_of_book("binance", "BTC/USDT", 2 * SEC)->bid, 29999.0);
}

TEST_F(BookStoreTest, RepeatedUpdateIsIdempotent) {
    seed("binance", SEC);
    books.apply_update("binance", "BTC/USDT", BookSide::ASK, 30001.0, 4.0, 2 * SEC);
    auto once = books.depth("binance", "BTC/USDT", 2 * SEC, 10);
    books.apply_update("binance", "BTC/USDT", BookSide::ASK, 30001.0, 4.0, 2 * SEC);
    auto twice = books.depth("binance", "BTC/USDT", 2 * SEC, 10);

    ASSERT_TRUE(once && twice);
    ASSERT_EQ(once->asks.size(), twice->asks.size());
    EXPECT_DOUBLE_EQ(twice->asks[0].quantity, 4.0);
}

TEST_F(BookStoreTest, InvalidUpdatesRejected) {
    EXPECT_FALSE(books.apply_update("binance", "BTC/USDT", BookSide::BID, 0.0, 1.0, SEC));
    EXPECT_FALSE(books.apply_update("binance", "BTC/USDT", BookSide::BID, -1.0, 1.0, SEC));
    EXPECT_FALSE(books.apply_update("binance", "BTC/USDT", BookSide::BID, 100.0, -1.0, SEC));
    EXPECT_FALSE(books.apply_update("binance", "BTC/USDT", BookSide::BID,
                                    std::numeric_limits<double>::quiet_NaN(), 1.0, SEC));
    EXPECT_FALSE(books.has_book("binance", "BTC/USDT"));
}

TEST_F(BookStoreTest, CrossedBookIsFlaggedNotRejected) {
    seed("binance", SEC);
    EXPECT_FALSE(books.crossed("binance", "BTC/USDT"));
    EXPECT_TRUE(books.apply_update("binance", "BTC/USDT", BookSide::BID, 30005.0, 1.0, SEC));
    EXPECT_TRUE(books.crossed("binance", "BTC/USDT"));
}

TEST_F(BookStoreTest, SnapshotReplacesBook) {
    seed("binance", SEC);
    books.apply_snapshot("binance", "BTC/USDT",
                         make_depth({{29000.0, 1.0}, {28999.0, 2.0}},
                                    {{29001.0, 1.0}}, 3 * SEC));
    auto d = books.depth("binance", "BTC/USDT", 3 * SEC, 10);
    ASSERT_TRUE(d.has_value());
    ASSERT_EQ(d->bids.size(), 2u);
    ASSERT_EQ(d->asks.size(), 1u);
    EXPECT_DOUBLE_EQ(d->bids[0].price, 29000.0);
    EXPECT_DOUBLE_EQ(d->bids[1].price, 28999.0);
    EXPECT_DOUBLE_EQ(d->asks[0].price, 29001.0);
}

TEST_F(BookStoreTest, DepthIsPriceOrderedAndTruncated) {
    for (int i = 0; i < 5; ++i) {
        books.apply_update("kraken", "ETH/USDT", BookSide::BID, 2000.0 - i, 1.0, SEC);
        books.apply_update("kraken", "ETH/USDT", BookSide::ASK, 2001.0 + i, 1.0, SEC);
    }
    auto d = books.depth("kraken", "ETH/USDT", SEC, 3);
    ASSERT_TRUE(d.has_value());
    ASSERT_EQ(d->bids.size(), 3u);
    ASSERT_EQ(d->asks.size(), 3u);
    EXPECT_GT(d->bids[0].price, d->bids[1].price);
    EXPECT_LT(d->asks[0].price, d->asks[1].price);
    EXPECT_DOUBLE_EQ(d->bid_depth(), 3.0);
}

TEST_F(BookStoreTest, LatestDepthIgnoresStaleness) {
    seed("binance", SEC);
    EXPECT_FALSE(books.depth("binance", "BTC/USDT", 100 * SEC, 10).has_value());
    auto d = books.latest_depth("binance", "BTC/USDT", 10);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->bids.size(), 1u);
}

TEST_F(BookStoreTest, VenuesAndSymbolsAreIndependent) {
    seed("binance", SEC);
    EXPECT_FALSE(books.top_of_book("kraken", "BTC/USDT", SEC).has_value());
    EXPECT_FALSE(books.top_of_book("binance", "ETH/USDT", SEC).has_value());
}
