#include "fees/FeeSchedule.hpp"
#include <stdexcept>
#include <utility>

using namespace tandem;

FeeSchedule::FeeSchedule(FeeConfig cfg)
    : cfg_(std::move(cfg)) {
    for (const auto& kv : cfg_.venues) ledgers_[kv.first];
}

const VenueFees& FeeSchedule::venue_fees(const std::string& venue) const {
    auto it = cfg_.venues.find(venue);
    if (it == cfg_.venues.end())
        throw std::invalid_argument("unknown fee venue: " + venue);
    return it->second;
}

void FeeSchedule::add_volume(const std::string& venue, double notional, uint64_t ts_ns,
                             double base_amount) {
    venue_fees(venue);

    std::lock_guard<std::mutex> lock(mtx_);
    auto& ledger = ledgers_[venue];
    ledger.push_back({ts_ns, notional, base_amount});

    if (ts_ns < cfg_.ledger_window_ns) return;
    const uint64_t cutoff = ts_ns - cfg_.ledger_window_ns;
    while (!ledger.empty() && ledger.front().ts_ns <= cutoff)
        ledger.pop_front();
}

// Caller holds mtx_.
double FeeSchedule::rolling_volume_locked(const std::string& venue) const {
    const VenueFees& vf = venue_fees(venue);
    auto it = ledgers_.find(venue);
    if (it == ledgers_.end()) return 0.0;

    double total = 0.0;
    for (const auto& e : it->second)
        total += vf.volume_unit == VolumeUnit::BASE ? e.base_amount : e.notional;
    return total;
}

double FeeSchedule::rolling_volume(const std::string& venue) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return rolling_volume_locked(venue);
}

double FeeSchedule::fee(const std::string& venue, bool is_maker) const {
    const VenueFees& vf = venue_fees(venue);

    std::lock_guard<std::mutex> lock(mtx_);
    const double volume = rolling_volume_locked(venue);

    double rate = is_maker ? vf.default_maker : vf.default_taker;
    for (const auto& tier : vf.tiers) {
        if (volume < tier.min_volume) break;
        rate = is_maker ? tier.maker_fee : tier.taker_fee;
    }
    return rate;
}

double FeeSchedule::effective_price(double price, const std::string& venue,
                                    bool is_buy, bool is_maker) const {
    const double rate = fee(venue, is_maker);
    return is_buy ? price * (1.0 + rate) : price * (1.0 - rate);
}

double FeeSchedule::fee_amount(const std::string& venue, double notional, bool is_maker) const {
    return notional * fee(venue, is_maker);
}

double FeeSchedule::min_profit(const std::string& symbol) const {
    return cfg_.min_profit_after_fees.get(symbol);
}

Profitability FeeSchedule::check(const std::string& symbol,
                                 const std::string& buy_venue, double buy_price,
                                 const std::string& sell_venue, double sell_price,
                                 bool is_maker) const {
    Profitability p;
    p.buy_effective  = effective_price(buy_price, buy_venue, true, is_maker);
    p.sell_effective = effective_price(sell_price, sell_venue, false, is_maker);
    p.edge           = p.sell_effective - p.buy_effective;
    p.min_profit     = min_profit(symbol);
    p.ok             = p.edge >= p.min_profit;
    return p;
}

std::size_t FeeSchedule::ledger_size(const std::string& venue) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = ledgers_.find(venue);
    return it == ledgers_.end() ? 0 : it->second.size();
}
