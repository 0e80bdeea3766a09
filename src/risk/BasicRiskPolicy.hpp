#pragma once
#include "risk/RiskPolicy.hpp"

namespace tandem {

// Fixed base size capped by max_position_value / price; rejects entries
// whose resulting position would exceed max_position_size, and every entry
// once the UTC day's PnL is at or below -max_daily_loss.
class BasicRiskPolicy : public RiskPolicy {
public:
    explicit BasicRiskPolicy(const RiskConfig& cfg);

    void on_market_data(const std::string&, double, uint64_t) override {}

    double size(const std::string& symbol, double signal_strength, double price,
                const PositionMap& positions) const override;

    bool admit(const std::string& symbol, double amount, double price,
               const PositionMap& positions, const DrawdownState& dd,
               std::string& reason) const override;

    const char* name() const override { return "basic"; }

private:
    RiskConfig cfg_;
};

}
