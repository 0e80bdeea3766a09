#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "book/MarketTypes.hpp"
#include "runtime/Context.hpp"
#include "signal/SignalSource.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// The control loop. Each cycle:
//
//   1. drain feed events into BookStore
//   2. per symbol, read both tops of book (missing or stale: skip)
//   3. offload signal updates to the worker pool, merge serially
//   4. exits first: stop loss, then mean reversion on the entry window
//   5. cooldown, signal selection, fee check, sizing and admission
//   6. sell leg, then buy leg; unwind the sell leg if the buy leg fails
//
// With the feed clock, "now" follows the older of the two venues' latest
// timestamps. Once one venue leads by more than book.staleness the clock
// jumps to the leader, so the lagging venue reads as stale. The clock never
// moves backwards. A cycle runs at the current clock just before the first
// event stamped later than anything applied so far. With feeds merged by ts
// (ReplayPacer) each cycle therefore sees every event of its tick and none
// of the next.
//
// Spread is venues[0].ask - venues[1].bid. A positive z sells on venues[0]
// at its bid and buys on venues[1] at its ask; a negative z does the reverse.
//
// All Position/RiskState/book mutation happens on the calling thread.
// ---------------------------------------------------------------------------
class Coordinator {
public:
    using SignalFactory = std::function<std::unique_ptr<SignalSource>(const std::string& symbol)>;

    explicit Coordinator(Context& ctx);
    Coordinator(Context& ctx, SignalFactory factory);

    // Applies up to max_events without running cycles. Returns the number
    // of events applied.
    std::size_t ingest(std::size_t max_events);
    // Feed-clock step: applies up to max_events, running a cycle before each
    // event that opens a new tick.
    std::size_t step_feed(std::size_t max_events);
    void run_cycle(uint64_t now_ns);

    // Runs until ctx.running drops, or until feeds_done() reports every
    // feed finished and the channel is empty.
    void run(const std::function<bool()>& feeds_done);

    void publish_metrics(uint64_t now_ns);
    nlohmann::json metrics_snapshot(uint64_t now_ns) const;

    uint64_t feed_clock() const { return clock_; }
    uint64_t last_trade_ns(const std::string& symbol) const;
    const SignalReadings& last_readings(const std::string& symbol) const;

private:
    struct SymbolState {
        std::unique_ptr<SignalSource> signal;
        SignalReadings readings;
        uint64_t last_trade_ns{0};
        bool traded{false};
    };

    struct Evaluation {
        std::string symbol;
        TopOfBook a;
        TopOfBook b;
        double spread{0.0};
        double volume{0.0};
        SignalReadings readings;
    };

    void apply(const FeedEvent& ev);
    void feed_cycle(uint64_t now_ns);

    bool handle_exits(const Evaluation& ev);
    void try_enter(const Evaluation& ev, SymbolState& st, uint64_t now_ns);
    void on_leg_failure(const std::string& symbol, const ExecutionReport& sell_leg);

    Context& ctx_;
    const std::string venue_a_;
    const std::string venue_b_;
    std::map<std::string, SymbolState> symbols_;
    uint64_t venue_a_ts_{0};
    uint64_t venue_b_ts_{0};
    uint64_t clock_{0};
    uint64_t frontier_ns_{0};  // newest ts applied
    uint64_t last_cycle_ns_{0};
};

}
