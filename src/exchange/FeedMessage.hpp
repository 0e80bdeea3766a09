#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

#include "book/MarketTypes.hpp"

namespace tandem {

// Malformed feed message. The message is dropped; the connection is kept.
class FeedProtocolError : public std::runtime_error {
public:
    explicit FeedProtocolError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// Normalized increment:
//   {"symbol":"BTC/USDT","side":"bid","price":30000.5,"quantity":0.25,"ts":1700000000000000000}
//
// price must be a finite number > 0, quantity a finite number >= 0 (0 removes
// the level), ts a non-negative integer in nanoseconds. Anything else throws
// FeedProtocolError.
// ---------------------------------------------------------------------------
struct FeedMessage {
    std::string symbol;
    BookSide side{BookSide::BID};
    double price{0.0};
    double quantity{0.0};
    uint64_t ts_ns{0};

    static FeedMessage parse(const std::string& raw);
};

}
