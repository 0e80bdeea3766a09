#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "book/BookStore.hpp"
#include "execution/OrderAdapter.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Paper venue: fills limit orders against the latest BookStore depth for the
// order's venue. A buy takes asks at or below its limit, a sell takes bids at
// or above it; the average is the VWAP of the levels taken. The book itself
// is not consumed. Cancels always succeed.
// ---------------------------------------------------------------------------
class PaperOrderAdapter : public OrderAdapter {
public:
    explicit PaperOrderAdapter(const BookStore& books, std::size_t depth_levels = 50);

    OrderResult place(const OrderRequest& req) override;
    void cancel(const std::string& venue, const std::string& order_id,
                const std::string& symbol) override;

    std::vector<OrderResult> placed() const;
    std::vector<std::string> cancelled() const;

private:
    const BookStore& books_;
    std::size_t depth_levels_;
    uint64_t next_id_{1};

    std::vector<OrderResult> placed_;
    std::vector<std::string> cancelled_;
    mutable std::mutex mtx_;
};

}
