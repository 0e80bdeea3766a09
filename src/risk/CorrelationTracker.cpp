#include "risk/CorrelationTracker.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

using namespace tandem;

CorrelationTracker::CorrelationTracker(std::size_t volatility_lookback,
                                       std::size_t correlation_lookback,
                                       std::size_t recompute_every,
                                       std::size_t min_samples,
                                       double default_volatility)
    : volatility_lookback_(volatility_lookback)
    , correlation_lookback_(correlation_lookback)
    , recompute_every_(recompute_every == 0 ? 1 : recompute_every)
    , min_samples_(min_samples)
    , default_volatility_(default_volatility) {}

void CorrelationTracker::observe(const std::string& symbol, double price) {
    Series& s = series_[symbol];
    if (s.has_price && s.last_price > 0.0) {
        s.returns.push_back((price - s.last_price) / s.last_price);
        const std::size_t cap = std::max(volatility_lookback_, correlation_lookback_);
        while (s.returns.size() > cap) s.returns.pop_front();
        ++s.observed;

        // Volatility over the most recent volatility_lookback returns.
        const std::size_t n = std::min(volatility_lookback_, s.returns.size());
        if (n >= min_samples_ && n >= 2) {
            double sum = 0.0;
            for (std::size_t i = s.returns.size() - n; i < s.returns.size(); ++i)
                sum += s.returns[i];
            const double m = sum / static_cast<double>(n);
            double acc = 0.0;
            for (std::size_t i = s.returns.size() - n; i < s.returns.size(); ++i)
                acc += (s.returns[i] - m) * (s.returns[i] - m);
            s.volatility = std::sqrt(acc / static_cast<double>(n));
            s.has_volatility = true;
        }
    }
    s.last_price = price;
    s.has_price = true;

    if (s.observed > 0 && s.observed % recompute_every_ == 0) recompute();
}

double CorrelationTracker::volatility(const std::string& symbol) const {
    auto it = series_.find(symbol);
    if (it == series_.end() || !it->second.has_volatility) return default_volatility_;
    return it->second.volatility;
}

double CorrelationTracker::correlation(const std::string& a, const std::string& b) const {
    auto it = matrix_.find({a, b});
    return it == matrix_.end() ? 0.0 : it->second;
}

std::size_t CorrelationTracker::returns(const std::string& symbol) const {
    auto it = series_.find(symbol);
    return it == series_.end() ? 0 : it->second.returns.size();
}

double CorrelationTracker::pearson(const Series& a, const Series& b) const {
    const std::size_t n = std::min({a.returns.size(), b.returns.size(), correlation_lookback_});
    if (n < min_samples_ || n < 2) return 0.0;

    const std::size_t oa = a.returns.size() - n;
    const std::size_t ob = b.returns.size() - n;

    double ma = 0.0, mb = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        ma += a.returns[oa + i];
        mb += b.returns[ob + i];
    }
    ma /= static_cast<double>(n);
    mb /= static_cast<double>(n);

    double cov = 0.0, va = 0.0, vb = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double da = a.returns[oa + i] - ma;
        const double db = b.returns[ob + i] - mb;
        cov += da * db;
        va  += da * da;
        vb  += db * db;
    }
    if (va <= 0.0 || vb <= 0.0) return 0.0;
    const double c = cov / std::sqrt(va * vb);
    return std::isfinite(c) ? c : 0.0;
}

void CorrelationTracker::recompute() {
    matrix_.clear();
    for (auto i = series_.begin(); i != series_.end(); ++i) {
        for (auto j = std::next(i); j != series_.end(); ++j) {
            const double c = pearson(i->second, j->second);
            matrix_[{i->first, j->first}] = c;
            matrix_[{j->first, i->first}] = c;
        }
    }
}
