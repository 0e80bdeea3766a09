#pragma once
#include <stdexcept>
#include <string>

#include "book/MarketTypes.hpp"

namespace tandem {

enum class OrderType { LIMIT, MARKET };
enum class OrderStatus { OPEN, CLOSED, CANCELED, REJECTED };

inline const char* to_string(OrderStatus s) {
    switch (s) {
        case OrderStatus::OPEN:     return "open";
        case OrderStatus::CLOSED:   return "closed";
        case OrderStatus::CANCELED: return "canceled";
        case OrderStatus::REJECTED: return "rejected";
    }
    return "unknown";
}

struct OrderRequest {
    std::string venue;
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    OrderType type{OrderType::LIMIT};
    double amount{0.0};
    double price{0.0};
};

struct OrderResult {
    std::string id;
    std::string venue;
    OrderSide side{OrderSide::BUY};
    double amount{0.0};
    double filled{0.0};
    double average{0.0};
    OrderStatus status{OrderStatus::OPEN};
};

// Transport failure or venue-side rejection of a place/cancel call.
class VenueError : public std::runtime_error {
public:
    explicit VenueError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// Order placement seam. place() and cancel() throw VenueError on failure;
// a returned OrderResult may still be partially filled.
// ---------------------------------------------------------------------------
class OrderAdapter {
public:
    virtual ~OrderAdapter() = default;

    virtual OrderResult place(const OrderRequest& req) = 0;
    virtual void cancel(const std::string& venue, const std::string& order_id,
                        const std::string& symbol) = 0;
};

}
