#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "risk/RiskPolicy.hpp"
#include "risk/RiskTypes.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Admission control and per-symbol entry state (FLAT -> ENTERED -> FLAT).
//
// can_enter() enforces the structural limits: one open entry per symbol,
// per-trade and aggregate notional caps, and the global drawdown kill switch.
// Sizing and the remaining limits (position value, fractional drawdown, VaR)
// belong to the configured RiskPolicy.
//
// The kill switch trips once cumulative PnL <= max_drawdown, or on an
// explicit trip_kill_switch(), and blocks every symbol until
// reset_drawdown(). Daily PnL restarts at each UTC day boundary of the
// feed timestamps. Existing entries are never liquidated by it; they leave
// through the stop-loss or mean-reversion paths.
//
// Threading: mutated by the coordinator thread only; accessors lock mtx_ so
// telemetry can read a consistent view.
// ---------------------------------------------------------------------------
class RiskGate {
public:
    explicit RiskGate(RiskConfig cfg);

    void on_market_data(const std::string& symbol, double price, uint64_t ts_ns);

    bool can_enter(const std::string& symbol, double notional) const;
    double size(const std::string& symbol, double signal_strength, double price) const;
    bool admit(const std::string& symbol, double amount, double price, std::string& reason) const;

    void register_entry(const std::string& symbol, double spread, int direction,
                        const WindowSpec& window, double amount, double price, uint64_t ts_ns);
    void record_pnl(double pnl, uint64_t ts_ns);

    // Both reset the symbol to FLAT when they fire.
    bool check_stop_loss(const std::string& symbol, double current_spread);
    bool check_mean_reversion_exit(const std::string& symbol, double zscore);

    void exit_position(const std::string& symbol);

    void trip_kill_switch(const std::string& reason);
    void reset_drawdown();
    bool killed() const { return killed_.load(); }

    EntryState state(const std::string& symbol) const;
    std::optional<SymbolRisk> entry(const std::string& symbol) const;
    std::map<std::string, SymbolRisk> entries() const;
    PositionMap positions() const;
    DrawdownState drawdown() const;
    double open_notional() const;

    const RiskConfig& config() const { return cfg_; }
    const char* policy_name() const { return policy_->name(); }

private:
    void reset_entry_locked(const std::string& symbol);
    void roll_day_locked(uint64_t ts_ns);
    double open_notional_locked() const;

    RiskConfig cfg_;
    std::unique_ptr<RiskPolicy> policy_;

    std::map<std::string, SymbolRisk> entries_;
    PositionMap positions_;
    DrawdownState dd_;

    std::atomic<bool> killed_{false};
    mutable std::mutex mtx_;
};

}
