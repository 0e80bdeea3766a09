#include "control/Coordinator.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <utility>
#include <vector>

using namespace tandem;

namespace {

uint64_t wall_clock_ns() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

}

Coordinator::Coordinator(Context& ctx)
    : Coordinator(ctx, [&ctx](const std::string&) {
          return make_signal_source(ctx.config.signal);
      }) {}

Coordinator::Coordinator(Context& ctx, SignalFactory factory)
    : ctx_(ctx)
    , venue_a_(ctx.config.venues.at(0))
    , venue_b_(ctx.config.venues.at(1)) {
    for (const auto& sym : ctx_.config.symbols) {
        SymbolState& st = symbols_[sym];
        st.signal = factory(sym);
        std::cout << "[COORD] " << sym << " signal=" << st.signal->name()
                  << " A=" << venue_a_ << " B=" << venue_b_ << "\n";
    }
}

// ---------------------------------------------------------------------------
// Ingestion
// ---------------------------------------------------------------------------
void Coordinator::apply(const FeedEvent& ev) {
    if (ev.kind == FeedEventKind::SNAPSHOT) {
        ctx_.books.apply_snapshot(ev.venue, ev.symbol, ev.depth);
    } else if (!ctx_.books.apply_update(ev.venue, ev.symbol, ev.side,
                                        ev.price, ev.quantity, ev.ts_ns)) {
        std::cerr << "[BOOK] Rejected update " << ev.venue << ":" << ev.symbol
                  << " " << to_string(ev.side) << " " << ev.price
                  << "x" << ev.quantity << "\n";
    }

    if (ev.ts_ns > frontier_ns_) frontier_ns_ = ev.ts_ns;
    if (ev.venue == venue_a_ && ev.ts_ns > venue_a_ts_) venue_a_ts_ = ev.ts_ns;
    if (ev.venue == venue_b_ && ev.ts_ns > venue_b_ts_) venue_b_ts_ = ev.ts_ns;

    const uint64_t hi = std::max(venue_a_ts_, venue_b_ts_);
    const uint64_t lo = std::min(venue_a_ts_, venue_b_ts_);
    uint64_t next = lo;
    if (lo == 0 || hi - lo > ctx_.config.book.staleness_ns) next = hi;
    clock_ = std::max(clock_, next);
}

std::size_t Coordinator::ingest(std::size_t max_events) {
    std::vector<FeedEvent> batch;
    batch.reserve(max_events);
    const std::size_t n = ctx_.channel.drain(batch, max_events);
    for (const auto& ev : batch) apply(ev);
    return n;
}

std::size_t Coordinator::step_feed(std::size_t max_events) {
    std::vector<FeedEvent> batch;
    batch.reserve(max_events);
    const std::size_t n = ctx_.channel.drain(batch, max_events);

    for (const auto& ev : batch) {
        if (ev.ts_ns > frontier_ns_ && clock_ > last_cycle_ns_) feed_cycle(clock_);
        apply(ev);
    }
    return n;
}

void Coordinator::feed_cycle(uint64_t now_ns) {
    run_cycle(now_ns);
    publish_metrics(now_ns);
    last_cycle_ns_ = now_ns;
}

// ---------------------------------------------------------------------------
// Cycle
// ---------------------------------------------------------------------------
void Coordinator::run_cycle(uint64_t now_ns) {
    std::vector<Evaluation> evals;
    evals.reserve(symbols_.size());

    for (const auto& sym : ctx_.config.symbols) {
        auto a = ctx_.books.top_of_book(venue_a_, sym, now_ns);
        auto b = ctx_.books.top_of_book(venue_b_, sym, now_ns);
        if (!a || !b) {
            ctx_.telemetry.increment(Counter::DATA_UNAVAILABLE);
            continue;
        }

        Evaluation ev;
        ev.symbol = sym;
        ev.a = *a;
        ev.b = *b;
        ev.spread = a->ask - b->bid;
        ev.volume = (a->ask * a->ask_qty + b->bid * b->bid_qty) / 2.0;
        evals.push_back(std::move(ev));

        ctx_.risk.on_market_data(sym, (a->bid + a->ask) / 2.0, now_ns);
    }

    // Each source belongs to one symbol, so at most one task touches it.
    std::vector<std::future<SignalReadings>> pending;
    pending.reserve(evals.size());
    for (const auto& ev : evals) {
        SignalSource* src = symbols_.at(ev.symbol).signal.get();
        const double spread = ev.spread;
        const double volume = ev.volume;
        auto task = std::make_shared<std::packaged_task<SignalReadings()>>(
            [src, spread, volume, now_ns] { return src->update(spread, volume, now_ns); });
        pending.push_back(task->get_future());
        boost::asio::post(ctx_.pool, [task] { (*task)(); });
    }

    for (std::size_t i = 0; i < evals.size(); ++i) {
        Evaluation& ev = evals[i];
        ev.readings = pending[i].get();

        SymbolState& st = symbols_.at(ev.symbol);
        st.readings = ev.readings;

        if (handle_exits(ev)) continue;

        if (st.traded && (now_ns < st.last_trade_ns ||
                          now_ns - st.last_trade_ns < ctx_.config.trade.cooldown_ns)) {
            ctx_.telemetry.increment(Counter::COOLDOWN);
            continue;
        }

        try_enter(ev, st, now_ns);
    }
}

bool Coordinator::handle_exits(const Evaluation& ev) {
    auto entry = ctx_.risk.entry(ev.symbol);
    if (!entry) return false;

    if (ctx_.risk.check_stop_loss(ev.symbol, ev.spread)) {
        ctx_.telemetry.increment(Counter::STOP_LOSS_EXIT);
        return true;
    }

    auto it = ev.readings.find(entry->entry_window);
    if (it != ev.readings.end() &&
        ctx_.risk.check_mean_reversion_exit(ev.symbol, it->second.zscore)) {
        ctx_.telemetry.increment(Counter::MEAN_REVERSION_EXIT);
        return true;
    }
    return false;
}

void Coordinator::try_enter(const Evaluation& ev, SymbolState& st, uint64_t now_ns) {
    const std::string& sym = ev.symbol;

    const TradeConfig& tc = ctx_.config.trade;
    const double mid = (ev.a.ask + ev.b.bid) / 2.0;
    const double ratio = mid > 0.0 ? std::fabs(ev.spread) / mid : 0.0;
    if (ratio < tc.min_spread_ratio || ratio > tc.max_spread_ratio) {
        ctx_.telemetry.increment(Counter::SPREAD_REJECT);
        return;
    }

    auto sel = select_signal(ev.readings);
    if (!sel) {
        ctx_.telemetry.increment(Counter::NO_SIGNAL);
        return;
    }

    const int dir = sel->direction();
    // Spread above its mean: A is rich, sell A and buy B.
    const std::string& sell_venue = dir > 0 ? venue_a_ : venue_b_;
    const std::string& buy_venue  = dir > 0 ? venue_b_ : venue_a_;
    const double sell_price = dir > 0 ? ev.a.bid : ev.b.bid;
    const double buy_price  = dir > 0 ? ev.b.ask : ev.a.ask;

    const Profitability prof = ctx_.fees.check(sym, buy_venue, buy_price,
                                               sell_venue, sell_price, false);
    if (!prof.ok) {
        ctx_.telemetry.increment(Counter::FEE_REJECT);
        std::cout << "[COORD] Fee reject " << sym << " z=" << sel->zscore
                  << " edge=" << prof.edge << " min=" << prof.min_profit << "\n";
        return;
    }

    const double ref_price = (buy_price + sell_price) / 2.0;
    const double amount = ctx_.risk.size(sym, sel->strength, ref_price);
    if (!(amount > 0.0)) {
        ctx_.telemetry.increment(Counter::RISK_REJECT);
        return;
    }
    if (!ctx_.risk.can_enter(sym, amount * ref_price)) {
        ctx_.telemetry.increment(Counter::RISK_REJECT);
        return;
    }
    std::string reason;
    if (!ctx_.risk.admit(sym, amount, ref_price, reason)) {
        ctx_.telemetry.increment(Counter::RISK_REJECT);
        std::cout << "[RISK] Reject " << sym << ": " << reason << "\n";
        return;
    }

    const std::size_t levels = ctx_.config.execution.depth_levels;
    auto sell_book = ctx_.books.depth(sell_venue, sym, now_ns, levels);
    auto buy_book  = ctx_.books.depth(buy_venue, sym, now_ns, levels);
    if (!sell_book || !buy_book) {
        ctx_.telemetry.increment(Counter::DATA_UNAVAILABLE);
        return;
    }

    auto sell = ctx_.execution.execute(sell_venue, sym, OrderSide::SELL, amount, *sell_book);
    if (!sell) return;

    auto buy = ctx_.execution.execute(buy_venue, sym, OrderSide::BUY,
                                      sell->filled_amount, *buy_book);
    if (!buy) {
        on_leg_failure(sym, *sell);
        return;
    }

    const double sell_value = sell->filled_amount * sell->average_price;
    const double buy_value  = buy->filled_amount * buy->average_price;

    TradeRecord rec;
    rec.ts_ns      = now_ns;
    rec.symbol     = sym;
    rec.buy_venue  = buy_venue;
    rec.buy_price  = buy->average_price;
    rec.sell_venue = sell_venue;
    rec.sell_price = sell->average_price;
    rec.amount     = buy->filled_amount;
    rec.buy_fees   = ctx_.fees.fee_amount(buy_venue, buy_value, false);
    rec.sell_fees  = ctx_.fees.fee_amount(sell_venue, sell_value, false);
    rec.fees       = rec.buy_fees + rec.sell_fees;
    rec.pnl        = sell_value - buy_value - rec.fees;
    ctx_.ledger.append(rec);

    ctx_.fees.add_volume(sell_venue, sell_value, now_ns, sell->filled_amount);
    ctx_.fees.add_volume(buy_venue, buy_value, now_ns, buy->filled_amount);

    ctx_.risk.record_pnl(rec.pnl, now_ns);
    ctx_.risk.register_entry(sym, ev.spread, dir, sel->window,
                             buy->filled_amount, ref_price, now_ns);

    st.last_trade_ns = now_ns;
    st.traded = true;
    ctx_.telemetry.increment(Counter::TRADES);

    std::cout << "[COORD] Trade " << sym << " window=" << sel->window.label()
              << " z=" << sel->zscore
              << " sell " << sell_venue << "@" << rec.sell_price
              << " buy " << buy_venue << "@" << rec.buy_price
              << " qty=" << rec.amount << " fees=" << rec.fees
              << " pnl=" << rec.pnl << "\n";
}

void Coordinator::on_leg_failure(const std::string& symbol, const ExecutionReport& sell_leg) {
    ctx_.telemetry.increment(Counter::LEG_FAILURE);
    std::cout << "[COORD] Buy leg failed " << symbol << ", unwinding "
              << sell_leg.filled_amount << " sold on " << sell_leg.venue << "\n";

    if (ctx_.execution.cancel_report(sell_leg)) return;

    ctx_.telemetry.increment(Counter::NAKED_EXPOSURE);
    std::cerr << "[RISK] NAKED EXPOSURE " << symbol << " " << sell_leg.venue
              << " sold " << sell_leg.filled_amount << " @ " << sell_leg.average_price
              << " unhedged, manual intervention required\n";

    if (ctx_.config.risk.naked_exposure_policy == NakedExposurePolicy::HALT)
        ctx_.risk.trip_kill_switch("naked exposure on " + symbol);
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------
void Coordinator::run(const std::function<bool()>& feeds_done) {
    const TradeConfig& tc = ctx_.config.trade;
    const auto idle = std::chrono::milliseconds(tc.idle_wait_ms);

    std::cout << "[COORD] Running, clock="
              << (tc.clock == ClockMode::FEED ? "feed" : "wall") << "\n";

    while (ctx_.running.load()) {
        std::size_t n = 0;
        if (tc.clock == ClockMode::WALL) {
            n = ingest(tc.batch_size);
            const uint64_t now = wall_clock_ns();
            run_cycle(now);
            publish_metrics(now);
        } else {
            n = step_feed(tc.batch_size);
        }

        if (n == 0) {
            if (feeds_done() && ctx_.channel.size() == 0) {
                if (tc.clock == ClockMode::FEED && clock_ > last_cycle_ns_)
                    feed_cycle(clock_);
                std::cout << "[COORD] All feeds finished\n";
                break;
            }
            ctx_.channel.wait_for(idle);
        }
    }
}

uint64_t Coordinator::last_trade_ns(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    return it == symbols_.end() ? 0 : it->second.last_trade_ns;
}

const SignalReadings& Coordinator::last_readings(const std::string& symbol) const {
    return symbols_.at(symbol).readings;
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------
void Coordinator::publish_metrics(uint64_t now_ns) {
    ctx_.telemetry.publish(metrics_snapshot(now_ns));
}

nlohmann::json Coordinator::metrics_snapshot(uint64_t now_ns) const {
    using nlohmann::json;

    const LedgerStats ls = ctx_.ledger.stats();
    const DrawdownState dd = ctx_.risk.drawdown();

    json j;
    j["ts_ns"]          = now_ns;
    j["cumulative_pnl"] = ls.total_pnl;
    j["trades"]         = ls.trades;
    j["wins"]           = ls.wins;
    j["losses"]         = ls.losses;
    j["win_rate"]       = ls.win_rate;
    j["avg_pnl"]        = ls.avg_pnl;
    j["sharpe"]         = ls.sharpe;
    j["max_drawdown"]   = ls.max_drawdown;
    j["total_fees"]     = ls.total_fees;

    const auto entries = ctx_.risk.entries();
    const auto by_symbol = ctx_.ledger.by_symbol();
    json symbols = json::object();
    for (const auto& sym : ctx_.config.symbols) {
        json s;
        auto bs = by_symbol.find(sym);
        s["trades"] = bs == by_symbol.end() ? 0 : bs->second.trades;
        s["pnl"]    = bs == by_symbol.end() ? 0.0 : bs->second.pnl;
        auto es = entries.find(sym);
        s["state"]  = to_string(es == entries.end() ? EntryState::FLAT : es->second.state);

        auto st = symbols_.find(sym);
        if (st != symbols_.end()) {
            json w = json::object();
            for (const auto& kv : st->second.readings)
                w[kv.first.label()] = {{"z", kv.second.zscore},
                                       {"threshold", kv.second.threshold}};
            s["signals"] = w;
        }
        symbols[sym] = s;
    }
    j["symbols"] = symbols;

    json fees = json::object();
    for (const auto& kv : ctx_.ledger.fees_by_venue()) fees[kv.first] = kv.second;
    j["fees"] = fees;

    json risk;
    risk["policy"]              = ctx_.risk.policy_name();
    risk["kill_switch"]         = ctx_.risk.killed();
    risk["cumulative_pnl"]      = dd.cumulative_pnl;
    risk["peak_pnl"]            = dd.peak_pnl;
    risk["current_drawdown"]    = dd.current_drawdown;
    risk["fractional_drawdown"] = dd.fractional_drawdown;
    risk["open_notional"]       = ctx_.risk.open_notional();
    json open = json::object();
    for (const auto& kv : entries) {
        if (kv.second.state != EntryState::ENTERED) continue;
        open[kv.first] = {{"direction", kv.second.direction},
                          {"entry_spread", kv.second.entry_spread},
                          {"window", kv.second.entry_window.label()},
                          {"notional", kv.second.notional},
                          {"entry_ns", kv.second.entry_ns}};
    }
    risk["entries"] = open;
    j["risk"] = risk;

    json recent = json::array();
    for (const auto& r : ctx_.ledger.recent(ctx_.config.trade.recent_trades))
        recent.push_back(to_json(r));
    j["recent_trades"] = recent;

    const ExecutionAverages ea = ctx_.execution.metrics().averages();
    j["execution"] = {{"samples", ea.samples},
                      {"slippage", ea.slippage},
                      {"fill_ratio", ea.fill_ratio},
                      {"latency_ms", ea.latency_ms},
                      {"impact", ea.impact}};
    return j;
}
