#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <utility>

namespace tandem {

// ---------------------------------------------------------------------------
// Per-symbol return history feeding volatility estimates and a pairwise
// correlation matrix.
//
// The matrix is rebuilt whenever a symbol's observation count hits a
// multiple of `recompute_every`. Pairs with fewer than `min_samples` aligned
// returns correlate at 0.
// ---------------------------------------------------------------------------
class CorrelationTracker {
public:
    CorrelationTracker(std::size_t volatility_lookback, std::size_t correlation_lookback,
                       std::size_t recompute_every, std::size_t min_samples,
                       double default_volatility);

    void observe(const std::string& symbol, double price);

    double volatility(const std::string& symbol) const;
    double correlation(const std::string& a, const std::string& b) const;
    std::size_t returns(const std::string& symbol) const;

    void recompute();

private:
    struct Series {
        double last_price{0.0};
        bool has_price{false};
        std::deque<double> returns;
        std::size_t observed{0};
        double volatility{0.0};
        bool has_volatility{false};
    };

    double pearson(const Series& a, const Series& b) const;

    std::size_t volatility_lookback_;
    std::size_t correlation_lookback_;
    std::size_t recompute_every_;
    std::size_t min_samples_;
    double default_volatility_;

    std::map<std::string, Series> series_;
    std::map<std::pair<std::string, std::string>, double> matrix_;
};

}
