#pragma once
#include "risk/CorrelationTracker.hpp"
#include "risk/RiskPolicy.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Volatility-, strength-, heat- and correlation-scaled sizing:
//
//   size = base * 1/(1+vol*k) * strength^0.5 * 1/(1+heat) * 1/(1+avg|corr|)
//
// capped by max_position_value / price. Admission additionally checks the
// position value cap, the per-symbol fractional drawdown limit and the
// simplified VaR (var_fraction of total exposure including the new trade).
// ---------------------------------------------------------------------------
class EnhancedRiskPolicy : public RiskPolicy {
public:
    explicit EnhancedRiskPolicy(const RiskConfig& cfg);

    void on_market_data(const std::string& symbol, double price, uint64_t ts_ns) override;

    double size(const std::string& symbol, double signal_strength, double price,
                const PositionMap& positions) const override;

    bool admit(const std::string& symbol, double amount, double price,
               const PositionMap& positions, const DrawdownState& dd,
               std::string& reason) const override;

    const char* name() const override { return "enhanced"; }

    double portfolio_heat(const PositionMap& positions) const;
    double correlation_adjustment(const std::string& symbol, const PositionMap& positions) const;
    static double exposure(const PositionMap& positions);

    const CorrelationTracker& tracker() const { return tracker_; }

private:
    RiskConfig cfg_;
    CorrelationTracker tracker_;
};

}
