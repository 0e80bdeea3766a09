#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace tandem {

// Every rejection class and lifecycle event the pipeline reports.
enum class Counter : std::size_t {
    DATA_UNAVAILABLE,
    COOLDOWN,
    SPREAD_REJECT,
    NO_SIGNAL,
    FEE_REJECT,
    RISK_REJECT,
    LIQUIDITY_REJECT,
    IMPACT_REJECT,
    LOW_FILL_RETRY,
    ORDER_ABORT,
    LEG_FAILURE,
    NAKED_EXPOSURE,
    PROTOCOL_ERROR,
    RECONNECT,
    STOP_LOSS_EXIT,
    MEAN_REVERSION_EXIT,
    TRADES,
    COUNT
};

const char* counter_name(Counter c);

// ---------------------------------------------------------------------------
// Process-wide observability state.
//
// Counters are lock-free atomics bumped from the coordinator, the execution
// engine and the feed threads. The metrics snapshot is a JSON document
// rebuilt by the coordinator after every cycle and read by the HTTP server.
// ---------------------------------------------------------------------------
class TelemetryState {
public:
    void increment(Counter c, uint64_t n = 1);
    uint64_t count(Counter c) const;

    void publish(nlohmann::json snapshot);
    nlohmann::json snapshot() const;

    std::string to_json() const;
    std::string to_prometheus() const;

private:
    std::array<std::atomic<uint64_t>, static_cast<std::size_t>(Counter::COUNT)> counters_{};

    mutable std::mutex mtx_;
    nlohmann::json snapshot_ = nlohmann::json::object();
};

}
