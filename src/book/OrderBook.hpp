#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

#include "book/MarketTypes.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Price-level book for one (venue, symbol).
//
// Levels are keyed by price; a quantity of 0 removes the level whatever it
// held before, any other quantity overwrites it. Applying the same update
// twice leaves the book unchanged.
//
// Crossed books (best bid >= best ask) are accepted as delivered and
// reported through crossed(); the feed is the source of truth.
// ---------------------------------------------------------------------------
class OrderBook {
public:
    void apply(BookSide side, double price, double quantity, uint64_t ts_ns);
    void load(const BookDepth& depth);
    void clear(uint64_t ts_ns);

    bool empty() const { return bids_.empty() && asks_.empty(); }
    bool two_sided() const { return !bids_.empty() && !asks_.empty(); }
    bool crossed() const;

    std::optional<TopOfBook> top() const;
    BookDepth depth(std::size_t max_levels) const;

    std::size_t bid_levels() const { return bids_.size(); }
    std::size_t ask_levels() const { return asks_.size(); }
    uint64_t last_update_ns() const { return last_update_ns_; }

private:
    std::map<double, double, std::greater<double>> bids_;
    std::map<double, double> asks_;
    uint64_t last_update_ns_{0};
};

}
