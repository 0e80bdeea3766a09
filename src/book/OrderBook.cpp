#include "book/OrderBook.hpp"
#include <algorithm>

using namespace tandem;

void OrderBook::apply(BookSide side, double price, double quantity, uint64_t ts_ns) {
    if (side == BookSide::BID) {
        if (quantity == 0.0) bids_.erase(price);
        else bids_[price] = quantity;
    } else {
        if (quantity == 0.0) asks_.erase(price);
        else asks_[price] = quantity;
    }
    last_update_ns_ = ts_ns;
}

void OrderBook::load(const BookDepth& depth) {
    bids_.clear();
    asks_.clear();
    for (const auto& l : depth.bids)
        if (l.quantity > 0.0) bids_[l.price] = l.quantity;
    for (const auto& l : depth.asks)
        if (l.quantity > 0.0) asks_[l.price] = l.quantity;
    last_update_ns_ = depth.ts_ns;
}

void OrderBook::clear(uint64_t ts_ns) {
    bids_.clear();
    asks_.clear();
    last_update_ns_ = ts_ns;
}

bool OrderBook::crossed() const {
    if (!two_sided()) return false;
    return bids_.begin()->first >= asks_.begin()->first;
}

std::optional<TopOfBook> OrderBook::top() const {
    if (!two_sided()) return std::nullopt;

    TopOfBook t;
    t.bid     = bids_.begin()->first;
    t.bid_qty = bids_.begin()->second;
    t.ask     = asks_.begin()->first;
    t.ask_qty = asks_.begin()->second;
    t.ts_ns   = last_update_ns_;
    return t;
}

BookDepth OrderBook::depth(std::size_t max_levels) const {
    BookDepth d;
    d.ts_ns = last_update_ns_;
    d.bids.reserve(std::min(max_levels, bids_.size()));
    d.asks.reserve(std::min(max_levels, asks_.size()));

    for (const auto& kv : bids_) {
        if (d.bids.size() >= max_levels) break;
        d.bids.push_back({kv.first, kv.second});
    }
    for (const auto& kv : asks_) {
        if (d.asks.size() >= max_levels) break;
        d.asks.push_back({kv.first, kv.second});
    }
    return d;
}
