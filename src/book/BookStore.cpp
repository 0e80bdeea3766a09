#include "book/BookStore.hpp"
#include <cmath>
#include <iostream>

using namespace tandem;

BookStore::BookStore(uint64_t staleness_ns)
    : staleness_ns_(staleness_ns) {}

bool BookStore::apply_update(const std::string& venue, const std::string& symbol,
                             BookSide side, double price, double quantity, uint64_t ts_ns) {
    if (!std::isfinite(price) || price <= 0.0) return false;
    if (!std::isfinite(quantity) || quantity < 0.0) return false;

    std::lock_guard<std::mutex> lock(mtx_);
    OrderBook& book = books_[Key(venue, symbol)];
    book.apply(side, price, quantity, ts_ns);

    if (book.crossed()) {
        std::cout << "[BOOK] Crossed book " << venue << ":" << symbol
                  << " after " << to_string(side) << " " << price << "\n";
    }
    return true;
}

void BookStore::apply_snapshot(const std::string& venue, const std::string& symbol,
                               const BookDepth& depth) {
    std::lock_guard<std::mutex> lock(mtx_);
    books_[Key(venue, symbol)].load(depth);
}

// Caller holds mtx_.
const OrderBook* BookStore::find_fresh(const Key& key, uint64_t now_ns) const {
    auto it = books_.find(key);
    if (it == books_.end()) return nullptr;

    const OrderBook& book = it->second;
    uint64_t last = book.last_update_ns();
    if (now_ns > last && now_ns - last > staleness_ns_) return nullptr;
    return &book;
}

std::optional<TopOfBook> BookStore::top_of_book(const std::string& venue,
                                                const std::string& symbol,
                                                uint64_t now_ns) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const OrderBook* book = find_fresh(Key(venue, symbol), now_ns);
    if (!book) return std::nullopt;
    return book->top();
}

std::optional<BookDepth> BookStore::depth(const std::string& venue,
                                          const std::string& symbol,
                                          uint64_t now_ns,
                                          std::size_t max_levels) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const OrderBook* book = find_fresh(Key(venue, symbol), now_ns);
    if (!book || !book->two_sided()) return std::nullopt;
    return book->depth(max_levels);
}

std::optional<BookDepth> BookStore::latest_depth(const std::string& venue,
                                                 const std::string& symbol,
                                                 std::size_t max_levels) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = books_.find(Key(venue, symbol));
    if (it == books_.end()) return std::nullopt;
    return it->second.depth(max_levels);
}

bool BookStore::crossed(const std::string& venue, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = books_.find(Key(venue, symbol));
    return it != books_.end() && it->second.crossed();
}

bool BookStore::has_book(const std::string& venue, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return books_.count(Key(venue, symbol)) > 0;
}
