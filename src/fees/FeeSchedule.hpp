#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "runtime/SymbolMap.hpp"

namespace tandem {

enum class VolumeUnit { QUOTE, BASE };

struct FeeTier {
    double min_volume{0.0};
    double maker_fee{0.0};
    double taker_fee{0.0};
    std::string currency;
};

struct VenueFees {
    double default_maker{0.001};
    double default_taker{0.001};
    VolumeUnit volume_unit{VolumeUnit::QUOTE};
    std::vector<FeeTier> tiers;  // ascending min_volume
};

struct FeeConfig {
    std::map<std::string, VenueFees> venues;
    SymbolMap<double> min_profit_after_fees{0.0};
    uint64_t ledger_window_ns{30ULL * 24 * 3600 * 1'000'000'000ULL};
};

struct Profitability {
    double buy_effective{0.0};
    double sell_effective{0.0};
    double edge{0.0};       // sell_effective - buy_effective
    double min_profit{0.0};
    bool ok{false};
};

// ---------------------------------------------------------------------------
// Tiered maker/taker fees driven by a rolling 30-day volume ledger per venue.
//
// Rate lookup starts at the venue default and walks the tiers in ascending
// min_volume order, taking each tier whose volume is reached and stopping at
// the first that is not. Ledger entries at or before `ts - window` are pruned
// on every insert.
// ---------------------------------------------------------------------------
class FeeSchedule {
public:
    explicit FeeSchedule(FeeConfig cfg);

    // base_amount is only consulted by venues whose tiers are denominated in
    // the base asset.
    void add_volume(const std::string& venue, double notional, uint64_t ts_ns,
                    double base_amount = 0.0);

    // Throws std::invalid_argument for an unknown venue.
    double fee(const std::string& venue, bool is_maker) const;
    double rolling_volume(const std::string& venue) const;

    double effective_price(double price, const std::string& venue,
                           bool is_buy, bool is_maker) const;
    double fee_amount(const std::string& venue, double notional, bool is_maker) const;

    Profitability check(const std::string& symbol,
                        const std::string& buy_venue, double buy_price,
                        const std::string& sell_venue, double sell_price,
                        bool is_maker = false) const;

    double min_profit(const std::string& symbol) const;
    std::size_t ledger_size(const std::string& venue) const;

private:
    struct LedgerEntry {
        uint64_t ts_ns;
        double notional;
        double base_amount;
    };

    const VenueFees& venue_fees(const std::string& venue) const;
    double rolling_volume_locked(const std::string& venue) const;

    FeeConfig cfg_;
    std::map<std::string, std::deque<LedgerEntry>> ledgers_;
    mutable std::mutex mtx_;
};

}
