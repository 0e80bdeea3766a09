#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tandem {

enum class BookSide { BID, ASK };
enum class OrderSide { BUY, SELL };

inline const char* to_string(BookSide s) { return s == BookSide::BID ? "bid" : "ask"; }
inline const char* to_string(OrderSide s) { return s == OrderSide::BUY ? "buy" : "sell"; }

struct PriceLevel {
    double price{0.0};
    double quantity{0.0};
};

// Immutable top-of-book view handed to the coordinator.
struct TopOfBook {
    double bid{0.0};
    double bid_qty{0.0};
    double ask{0.0};
    double ask_qty{0.0};
    uint64_t ts_ns{0};
};

// Depth copy of one book. Bids descending, asks ascending.
struct BookDepth {
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    uint64_t ts_ns{0};

    double bid_depth() const {
        double d = 0.0;
        for (const auto& l : bids) d += l.quantity;
        return d;
    }

    double ask_depth() const {
        double d = 0.0;
        for (const auto& l : asks) d += l.quantity;
        return d;
    }
};

}
