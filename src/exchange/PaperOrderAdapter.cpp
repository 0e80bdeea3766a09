#include "exchange/PaperOrderAdapter.hpp"
#include <algorithm>

using namespace tandem;

PaperOrderAdapter::PaperOrderAdapter(const BookStore& books, std::size_t depth_levels)
    : books_(books)
    , depth_levels_(depth_levels) {}

OrderResult PaperOrderAdapter::place(const OrderRequest& req) {
    if (req.amount <= 0.0) throw VenueError("paper: non-positive amount");

    auto depth = books_.latest_depth(req.venue, req.symbol, depth_levels_);
    if (!depth) throw VenueError("paper: no book for " + req.venue + ":" + req.symbol);

    const bool buy = req.side == OrderSide::BUY;
    const auto& levels = buy ? depth->asks : depth->bids;

    double remaining = req.amount;
    double cost = 0.0;
    for (const auto& l : levels) {
        if (remaining <= 0.0) break;
        if (req.type == OrderType::LIMIT) {
            if (buy && l.price > req.price) break;
            if (!buy && l.price < req.price) break;
        }
        const double taken = std::min(remaining, l.quantity);
        cost += taken * l.price;
        remaining -= taken;
    }

    OrderResult r;
    r.venue   = req.venue;
    r.side    = req.side;
    r.amount  = req.amount;
    r.filled  = req.amount - remaining;
    r.average = r.filled > 0.0 ? cost / r.filled : 0.0;
    r.status  = remaining <= 0.0 ? OrderStatus::CLOSED : OrderStatus::OPEN;

    std::lock_guard<std::mutex> lock(mtx_);
    r.id = req.venue + "-" + std::to_string(next_id_++);
    placed_.push_back(r);
    return r;
}

void PaperOrderAdapter::cancel(const std::string&, const std::string& order_id,
                               const std::string&) {
    std::lock_guard<std::mutex> lock(mtx_);
    cancelled_.push_back(order_id);
}

std::vector<OrderResult> PaperOrderAdapter::placed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return placed_;
}

std::vector<std::string> PaperOrderAdapter::cancelled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cancelled_;
}
