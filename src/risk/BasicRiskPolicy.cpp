#include "risk/BasicRiskPolicy.hpp"
#include <algorithm>
#include <cmath>

using namespace tandem;

BasicRiskPolicy::BasicRiskPolicy(const RiskConfig& cfg)
    : cfg_(cfg) {}

double BasicRiskPolicy::size(const std::string& symbol, double, double price,
                             const PositionMap&) const {
    const double base = cfg_.base_size.get(symbol);
    if (price <= 0.0) return base;
    return std::min(base, cfg_.max_position_value.get(symbol) / price);
}

bool BasicRiskPolicy::admit(const std::string& symbol, double amount, double,
                            const PositionMap& positions, const DrawdownState& dd,
                            std::string& reason) const {
    if (dd.daily_pnl <= -cfg_.max_daily_loss) {
        reason = "max_daily_loss";
        return false;
    }

    double current = 0.0;
    auto it = positions.find(symbol);
    if (it != positions.end()) current = it->second.size;

    if (std::fabs(current) + std::fabs(amount) > cfg_.max_position_size) {
        reason = "max_position_size";
        return false;
    }
    return true;
}
