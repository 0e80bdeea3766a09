#include "risk/EnhancedRiskPolicy.hpp"
#include <algorithm>
#include <cmath>

using namespace tandem;

EnhancedRiskPolicy::EnhancedRiskPolicy(const RiskConfig& cfg)
    : cfg_(cfg)
    , tracker_(cfg.volatility_lookback, cfg.correlation_lookback,
               cfg.correlation_every, cfg.min_samples, cfg.default_volatility) {}

void EnhancedRiskPolicy::on_market_data(const std::string& symbol, double price, uint64_t) {
    tracker_.observe(symbol, price);
}

double EnhancedRiskPolicy::exposure(const PositionMap& positions) {
    double total = 0.0;
    for (const auto& kv : positions)
        total += std::fabs(kv.second.size * kv.second.price);
    return total;
}

double EnhancedRiskPolicy::portfolio_heat(const PositionMap& positions) const {
    if (cfg_.reference_portfolio_value <= 0.0) return 0.0;
    return exposure(positions) / cfg_.reference_portfolio_value;
}

double EnhancedRiskPolicy::correlation_adjustment(const std::string& symbol,
                                                  const PositionMap& positions) const {
    double total = 0.0;
    int open = 0;
    for (const auto& kv : positions) {
        if (kv.first == symbol || kv.second.size == 0.0) continue;
        total += std::fabs(tracker_.correlation(symbol, kv.first));
        ++open;
    }
    if (open == 0) return 1.0;
    return 1.0 / (1.0 + total / open);
}

double EnhancedRiskPolicy::size(const std::string& symbol, double signal_strength, double price,
                                const PositionMap& positions) const {
    const double base = cfg_.base_size.get(symbol);

    const double vol_adj    = 1.0 / (1.0 + tracker_.volatility(symbol) * cfg_.volatility_scaling);
    const double signal_adj = std::sqrt(std::max(0.0, signal_strength));
    const double heat_adj   = 1.0 / (1.0 + portfolio_heat(positions));
    const double corr_adj   = correlation_adjustment(symbol, positions);

    const double sized = base * vol_adj * signal_adj * heat_adj * corr_adj;
    if (price <= 0.0) return sized;
    return std::min(sized, cfg_.max_position_value.get(symbol) / price);
}

bool EnhancedRiskPolicy::admit(const std::string& symbol, double amount, double price,
                               const PositionMap& positions, const DrawdownState& dd,
                               std::string& reason) const {
    const double value = std::fabs(amount * price);
    if (value > cfg_.max_position_value.get(symbol)) {
        reason = "max_position_value";
        return false;
    }
    if (dd.fractional_drawdown > cfg_.drawdown_limit.get(symbol)) {
        reason = "drawdown_limit";
        return false;
    }
    const double var = cfg_.var_fraction * (exposure(positions) + value);
    if (var > cfg_.max_var.get(symbol)) {
        reason = "max_var";
        return false;
    }
    return true;
}
