#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "risk/RiskTypes.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Sizing and per-trade limit policy. RiskGate owns the policy and calls it
// under its own lock; policies never see a half-updated portfolio.
// ---------------------------------------------------------------------------
class RiskPolicy {
public:
    virtual ~RiskPolicy() = default;

    virtual void on_market_data(const std::string& symbol, double price, uint64_t ts_ns) = 0;

    // Base-unit size for a prospective entry.
    virtual double size(const std::string& symbol, double signal_strength, double price,
                        const PositionMap& positions) const = 0;

    // False when the policy's own limits reject `amount` at `price`. On
    // rejection `reason` names the limit.
    virtual bool admit(const std::string& symbol, double amount, double price,
                       const PositionMap& positions, const DrawdownState& dd,
                       std::string& reason) const = 0;

    virtual const char* name() const = 0;
};

std::unique_ptr<RiskPolicy> make_risk_policy(const RiskConfig& cfg);

}
