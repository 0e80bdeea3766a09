#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>

#include "runtime/SymbolMap.hpp"
#include "signal/WindowBuffer.hpp"

namespace tandem {

enum class RiskPolicyKind { BASIC, ENHANCED };
enum class NakedExposurePolicy { HALT, ALERT };
enum class EntryState { FLAT, ENTERED };

inline const char* to_string(EntryState s) {
    return s == EntryState::FLAT ? "FLAT" : "ENTERED";
}

struct RiskConfig {
    RiskPolicyKind policy{RiskPolicyKind::ENHANCED};
    NakedExposurePolicy naked_exposure_policy{NakedExposurePolicy::HALT};

    // Sizing, in base-asset units and quote-currency values.
    SymbolMap<double> base_size{0.001};
    SymbolMap<double> max_position_value{std::numeric_limits<double>::infinity()};
    double max_position_size{0.1};  // basic policy, base units

    // Admission caps, quote-currency notional.
    SymbolMap<double> max_notional_per_trade{std::numeric_limits<double>::infinity()};
    double max_total_notional{std::numeric_limits<double>::infinity()};

    // Global kill switch: trips once cumulative PnL <= max_drawdown.
    double max_drawdown{-50.0};
    double max_daily_loss{std::numeric_limits<double>::infinity()};  // basic policy, per UTC day
    // Enhanced policy: fractional drawdown from peak PnL, per symbol.
    SymbolMap<double> drawdown_limit{0.1};
    // Enhanced policy: var_fraction * total exposure must stay <= max_var.
    SymbolMap<double> max_var{std::numeric_limits<double>::infinity()};
    double var_fraction{0.01};

    // Exits.
    SymbolMap<double> stop_loss_amount{5.0};
    double exit_z{0.3};

    // Enhanced sizing.
    double volatility_scaling{0.5};
    double reference_portfolio_value{10000.0};
    double default_volatility{0.1};
    std::size_t volatility_lookback{300};
    std::size_t correlation_lookback{900};
    std::size_t correlation_every{100};
    std::size_t min_samples{20};
};

struct Position {
    double size{0.0};        // signed, base units
    double avg_price{0.0};
    double price{0.0};       // last mark
    double unrealized_pnl{0.0};
    uint64_t last_update_ns{0};
};

struct SymbolRisk {
    EntryState state{EntryState::FLAT};
    double entry_spread{0.0};
    int direction{0};
    WindowSpec entry_window;
    double notional{0.0};
    uint64_t entry_ns{0};
};

struct DrawdownState {
    double cumulative_pnl{0.0};
    double peak_pnl{0.0};
    double current_drawdown{0.0};     // peak - cumulative
    double fractional_drawdown{0.0};  // (peak - cumulative) / |peak|
    double daily_pnl{0.0};
    uint64_t day{0};                  // UTC days since epoch
};

using PositionMap = std::map<std::string, Position>;

}
