#include "risk/RiskGate.hpp"
#include "risk/BasicRiskPolicy.hpp"
#include "risk/EnhancedRiskPolicy.hpp"
#include <cmath>
#include <iostream>
#include <utility>

using namespace tandem;

namespace {
constexpr uint64_t NS_PER_DAY = 86'400'000'000'000ULL;
}

std::unique_ptr<RiskPolicy> tandem::make_risk_policy(const RiskConfig& cfg) {
    if (cfg.policy == RiskPolicyKind::BASIC)
        return std::make_unique<BasicRiskPolicy>(cfg);
    return std::make_unique<EnhancedRiskPolicy>(cfg);
}

RiskGate::RiskGate(RiskConfig cfg)
    : cfg_(std::move(cfg))
    , policy_(make_risk_policy(cfg_)) {}

void RiskGate::on_market_data(const std::string& symbol, double price, uint64_t ts_ns) {
    std::lock_guard<std::mutex> lock(mtx_);
    roll_day_locked(ts_ns);
    policy_->on_market_data(symbol, price, ts_ns);

    auto it = positions_.find(symbol);
    if (it == positions_.end()) return;
    Position& p = it->second;
    p.price = price;
    p.unrealized_pnl = p.size * (price - p.avg_price);
    p.last_update_ns = ts_ns;
}

// Caller holds mtx_.
double RiskGate::open_notional_locked() const {
    double total = 0.0;
    for (const auto& kv : entries_)
        if (kv.second.state == EntryState::ENTERED) total += kv.second.notional;
    return total;
}

bool RiskGate::can_enter(const std::string& symbol, double notional) const {
    if (killed_.load()) return false;

    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(symbol);
    if (it != entries_.end() && it->second.state == EntryState::ENTERED) return false;

    if (notional > cfg_.max_notional_per_trade.get(symbol)) return false;
    if (open_notional_locked() + notional > cfg_.max_total_notional) return false;
    return true;
}

double RiskGate::size(const std::string& symbol, double signal_strength, double price) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return policy_->size(symbol, signal_strength, price, positions_);
}

bool RiskGate::admit(const std::string& symbol, double amount, double price,
                     std::string& reason) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return policy_->admit(symbol, amount, price, positions_, dd_, reason);
}

void RiskGate::register_entry(const std::string& symbol, double spread, int direction,
                              const WindowSpec& window, double amount, double price,
                              uint64_t ts_ns) {
    std::lock_guard<std::mutex> lock(mtx_);

    SymbolRisk& e = entries_[symbol];
    e.state        = EntryState::ENTERED;
    e.entry_spread = spread;
    e.direction    = direction;
    e.entry_window = window;
    e.notional     = std::fabs(amount * price);
    e.entry_ns     = ts_ns;

    Position& p = positions_[symbol];
    p.size           = direction * amount;
    p.avg_price      = price;
    p.price          = price;
    p.unrealized_pnl = 0.0;
    p.last_update_ns = ts_ns;
}

// Caller holds mtx_.
void RiskGate::roll_day_locked(uint64_t ts_ns) {
    const uint64_t day = ts_ns / NS_PER_DAY;
    if (day <= dd_.day) return;
    if (dd_.day != 0)
        std::cout << "[RISK] Day rollover, daily PnL " << dd_.daily_pnl << " reset\n";
    dd_.day = day;
    dd_.daily_pnl = 0.0;
}

void RiskGate::record_pnl(double pnl, uint64_t ts_ns) {
    std::lock_guard<std::mutex> lock(mtx_);
    roll_day_locked(ts_ns);

    const bool was_within = dd_.daily_pnl > -cfg_.max_daily_loss;
    dd_.daily_pnl += pnl;
    if (was_within && dd_.daily_pnl <= -cfg_.max_daily_loss)
        std::cout << "[RISK] Daily loss limit reached: " << dd_.daily_pnl
                  << " <= -" << cfg_.max_daily_loss << "\n";

    dd_.cumulative_pnl += pnl;
    if (dd_.cumulative_pnl > dd_.peak_pnl) dd_.peak_pnl = dd_.cumulative_pnl;
    dd_.current_drawdown = dd_.peak_pnl - dd_.cumulative_pnl;
    dd_.fractional_drawdown = dd_.peak_pnl != 0.0
        ? dd_.current_drawdown / std::fabs(dd_.peak_pnl) : 0.0;

    if (dd_.cumulative_pnl <= cfg_.max_drawdown && !killed_.load()) {
        killed_.store(true);
        std::cout << "[RISK] Kill switch: cumulative PnL " << dd_.cumulative_pnl
                  << " <= max drawdown " << cfg_.max_drawdown << "\n";
    }
}

// Caller holds mtx_.
void RiskGate::reset_entry_locked(const std::string& symbol) {
    auto it = entries_.find(symbol);
    if (it != entries_.end()) it->second = SymbolRisk{};
    positions_.erase(symbol);
}

bool RiskGate::check_stop_loss(const std::string& symbol, double current_spread) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(symbol);
    if (it == entries_.end() || it->second.state != EntryState::ENTERED) return false;

    const SymbolRisk& e = it->second;
    const double stop = cfg_.stop_loss_amount.get(symbol);
    bool hit = false;
    if (e.direction > 0) hit = current_spread >= e.entry_spread + stop;
    else if (e.direction < 0) hit = current_spread <= e.entry_spread - stop;
    if (!hit) return false;

    std::cout << "[RISK] Stop loss " << symbol << " entry=" << e.entry_spread
              << " spread=" << current_spread << " dir=" << e.direction << "\n";
    reset_entry_locked(symbol);
    return true;
}

bool RiskGate::check_mean_reversion_exit(const std::string& symbol, double zscore) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(symbol);
    if (it == entries_.end() || it->second.state != EntryState::ENTERED) return false;

    const int dir = it->second.direction;
    bool hit = false;
    if (dir > 0) hit = zscore < cfg_.exit_z;
    else if (dir < 0) hit = zscore > -cfg_.exit_z;
    if (!hit) return false;

    std::cout << "[RISK] Mean reversion exit " << symbol << " z=" << zscore
              << " dir=" << dir << "\n";
    reset_entry_locked(symbol);
    return true;
}

void RiskGate::exit_position(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mtx_);
    reset_entry_locked(symbol);
}

void RiskGate::trip_kill_switch(const std::string& reason) {
    if (!killed_.exchange(true))
        std::cout << "[RISK] Kill switch: " << reason << "\n";
}

void RiskGate::reset_drawdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    dd_ = DrawdownState{};
    killed_.store(false);
    std::cout << "[RISK] Drawdown state reset\n";
}

EntryState RiskGate::state(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(symbol);
    return it == entries_.end() ? EntryState::FLAT : it->second.state;
}

std::optional<SymbolRisk> RiskGate::entry(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(symbol);
    if (it == entries_.end() || it->second.state != EntryState::ENTERED) return std::nullopt;
    return it->second;
}

std::map<std::string, SymbolRisk> RiskGate::entries() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_;
}

PositionMap RiskGate::positions() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return positions_;
}

DrawdownState RiskGate::drawdown() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dd_;
}

double RiskGate::open_notional() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_notional_locked();
}
