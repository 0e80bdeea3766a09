#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tandem {

// One completed round trip. Never mutated after append.
struct TradeRecord {
    uint64_t ts_ns{0};
    std::string symbol;
    std::string buy_venue;
    double buy_price{0.0};
    std::string sell_venue;
    double sell_price{0.0};
    double amount{0.0};
    double buy_fees{0.0};
    double sell_fees{0.0};
    double fees{0.0};
    double pnl{0.0};
};

nlohmann::json to_json(const TradeRecord& r);

struct SymbolStats {
    std::size_t trades{0};
    double pnl{0.0};
};

struct LedgerStats {
    std::size_t trades{0};
    std::size_t wins{0};
    std::size_t losses{0};
    double total_pnl{0.0};
    double total_fees{0.0};
    double win_rate{0.0};
    double avg_pnl{0.0};
    double std_pnl{0.0};
    double sharpe{0.0};        // avg / std * sqrt(n)
    double max_drawdown{0.0};  // largest peak-to-trough drop of cumulative PnL
};

// ---------------------------------------------------------------------------
// Append-only in-memory trade log with running aggregates. append() folds
// each record into the totals, so stats() costs the same at any log size.
// ---------------------------------------------------------------------------
class TradeLedger {
public:
    void append(const TradeRecord& r);

    std::size_t size() const;
    std::vector<TradeRecord> all() const;
    // Most recent first.
    std::vector<TradeRecord> recent(std::size_t n) const;

    LedgerStats stats() const;
    std::map<std::string, SymbolStats> by_symbol() const;
    std::map<std::string, double> fees_by_venue() const;

private:
    std::vector<TradeRecord> trades_;
    LedgerStats totals_;     // counts, sums and max_drawdown only
    double mean_pnl_{0.0};   // Welford
    double m2_pnl_{0.0};
    double cumulative_{0.0};
    double peak_{0.0};
    std::map<std::string, SymbolStats> by_symbol_;
    std::map<std::string, double> fees_by_venue_;
    mutable std::mutex mtx_;
};

}
