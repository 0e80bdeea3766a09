#include "control/TradeLedger.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

using namespace tandem;

nlohmann::json tandem::to_json(const TradeRecord& r) {
    return nlohmann::json{
        {"ts", r.ts_ns},
        {"symbol", r.symbol},
        {"buy_venue", r.buy_venue},
        {"buy_price", r.buy_price},
        {"sell_venue", r.sell_venue},
        {"sell_price", r.sell_price},
        {"amount", r.amount},
        {"fees", r.fees},
        {"pnl", r.pnl}
    };
}

void TradeLedger::append(const TradeRecord& r) {
    std::lock_guard<std::mutex> lock(mtx_);
    trades_.push_back(r);

    totals_.trades += 1;
    totals_.total_pnl  += r.pnl;
    totals_.total_fees += r.fees;
    if (r.pnl > 0.0) ++totals_.wins;
    else if (r.pnl < 0.0) ++totals_.losses;

    const double delta = r.pnl - mean_pnl_;
    mean_pnl_ += delta / static_cast<double>(totals_.trades);
    m2_pnl_   += delta * (r.pnl - mean_pnl_);

    cumulative_ += r.pnl;
    peak_ = std::max(peak_, cumulative_);
    totals_.max_drawdown = std::max(totals_.max_drawdown, peak_ - cumulative_);

    SymbolStats& s = by_symbol_[r.symbol];
    s.trades += 1;
    s.pnl += r.pnl;

    fees_by_venue_[r.buy_venue]  += r.buy_fees;
    fees_by_venue_[r.sell_venue] += r.sell_fees;
}

std::size_t TradeLedger::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return trades_.size();
}

std::vector<TradeRecord> TradeLedger::all() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return trades_;
}

std::vector<TradeRecord> TradeLedger::recent(std::size_t n) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t take = std::min(n, trades_.size());
    return std::vector<TradeRecord>(trades_.rbegin(),
                                    trades_.rbegin() + static_cast<std::ptrdiff_t>(take));
}

LedgerStats TradeLedger::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    LedgerStats st = totals_;
    if (st.trades == 0) return st;

    const double n = static_cast<double>(st.trades);
    st.win_rate = static_cast<double>(st.wins) / n;
    st.avg_pnl  = st.total_pnl / n;
    st.std_pnl  = std::sqrt(std::max(0.0, m2_pnl_ / n));
    st.sharpe   = st.std_pnl > 0.0 ? st.avg_pnl / st.std_pnl * std::sqrt(n) : 0.0;
    return st;
}

std::map<std::string, SymbolStats> TradeLedger::by_symbol() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return by_symbol_;
}

std::map<std::string, double> TradeLedger::fees_by_venue() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return fees_by_venue_;
}
