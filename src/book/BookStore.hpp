#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "book/OrderBook.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Per-venue, per-symbol book state with staleness detection.
//
// A book whose last update is older than the staleness limit is reported
// exactly like a missing one: callers never see stale prices. A book with
// an empty side is also reported as missing.
// ---------------------------------------------------------------------------
class BookStore {
public:
    static constexpr uint64_t DEFAULT_STALENESS_NS = 5'000'000'000ULL;

    explicit BookStore(uint64_t staleness_ns = DEFAULT_STALENESS_NS);

    // Returns false (and leaves the book untouched) for a non-finite or
    // non-positive price, or a negative/non-finite quantity.
    bool apply_update(const std::string& venue, const std::string& symbol,
                      BookSide side, double price, double quantity, uint64_t ts_ns);

    // Full replacement, used after (re)connect before increments resume.
    void apply_snapshot(const std::string& venue, const std::string& symbol,
                        const BookDepth& depth);

    std::optional<TopOfBook> top_of_book(const std::string& venue,
                                         const std::string& symbol,
                                         uint64_t now_ns) const;

    std::optional<BookDepth> depth(const std::string& venue,
                                   const std::string& symbol,
                                   uint64_t now_ns,
                                   std::size_t max_levels) const;

    // Latest depth regardless of age; nullopt only when no book exists.
    std::optional<BookDepth> latest_depth(const std::string& venue,
                                          const std::string& symbol,
                                          std::size_t max_levels) const;

    bool crossed(const std::string& venue, const std::string& symbol) const;
    bool has_book(const std::string& venue, const std::string& symbol) const;

    uint64_t staleness_ns() const { return staleness_ns_; }

private:
    using Key = std::pair<std::string, std::string>;

    const OrderBook* find_fresh(const Key& key, uint64_t now_ns) const;

    uint64_t staleness_ns_;
    std::map<Key, OrderBook> books_;
    mutable std::mutex mtx_;
};

}
