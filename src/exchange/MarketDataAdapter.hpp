#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "book/MarketTypes.hpp"

namespace tandem {

// Feed connection dropped or could not be established.
class ConnectionLost : public std::runtime_error {
public:
    explicit ConnectionLost(const std::string& what)
        : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// One venue's market data source. Venue-specific decoding happens behind
// this seam: read() yields normalized JSON increments (see FeedMessage).
//
// connect(), snapshot() and read() throw ConnectionLost when the connection
// fails. read() blocks until a message arrives and returns nullopt on an
// orderly end of stream.
// ---------------------------------------------------------------------------
class MarketDataAdapter {
public:
    virtual ~MarketDataAdapter() = default;

    virtual const std::string& venue() const = 0;
    virtual void connect() = 0;
    virtual BookDepth snapshot(const std::string& symbol) = 0;
    virtual std::optional<std::string> read() = 0;
    virtual void close() = 0;
};

}
