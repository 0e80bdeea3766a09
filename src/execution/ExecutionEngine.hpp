#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "book/MarketTypes.hpp"
#include "execution/ExecutionMetrics.hpp"
#include "execution/OrderAdapter.hpp"

namespace tandem {

class TelemetryState;

struct ExecutionConfig {
    double min_liquidity_ratio{0.3};
    double max_price_impact{0.0001};
    double iceberg_threshold{1.0};
    double chunk_fraction{0.2};   // of the order amount
    double depth_fraction{0.1};   // of total two-sided book depth
    double min_chunk{0.1};
    double min_fill_ratio{0.95};
    int max_retries{3};
    uint64_t retry_delay_ms{100};
    std::size_t metrics_capacity{1000};
    std::size_t depth_levels{20};
};

struct ImpactEstimate {
    bool sufficient{false};
    double impact{0.0};         // |vwap - best| / best, infinite when depth runs out
    double vwap{0.0};
    double best_price{0.0};
    double worst_price{0.0};    // deepest level touched
};

struct SlicePlan {
    bool iceberg{false};
    double chunk{0.0};
};

struct ExecutionReport {
    std::string venue;
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    double requested{0.0};
    double filled_amount{0.0};
    double average_price{0.0};
    double reference_price{0.0};
    double limit_price{0.0};
    double impact{0.0};
    bool iceberg{false};
    double latency_ms{0.0};
    std::vector<OrderResult> child_orders;
};

enum class ExecReject { NONE, LIQUIDITY, IMPACT, ABORTED };

// ---------------------------------------------------------------------------
// Places one side of a trade on one venue.
//
// Pre-submission checks (liquidity score, depth walk for price impact) reject
// without sending anything. Orders at or above the iceberg threshold are
// sliced into chunks; each chunk is retried until its fill ratio reaches
// min_fill_ratio or max_retries is exhausted, in which case every accepted
// child order of the call is cancelled and the call returns nullopt.
//
// The report lists only accepted child orders, so their fills sum to the
// reported total.
// ---------------------------------------------------------------------------
class ExecutionEngine {
public:
    ExecutionEngine(ExecutionConfig cfg, OrderAdapter& adapter, TelemetryState& telemetry);

    std::optional<ExecutionReport> execute(const std::string& venue,
                                           const std::string& symbol,
                                           OrderSide side,
                                           double amount,
                                           const BookDepth& book,
                                           ExecReject* why = nullptr);

    // Best-effort cancel of every child order. False if any cancel failed.
    bool cancel_report(const ExecutionReport& report);

    static double liquidity_score(const BookDepth& book, OrderSide side, double amount);
    static ImpactEstimate estimate_impact(const BookDepth& book, OrderSide side, double amount);
    SlicePlan plan(double amount, const BookDepth& book) const;

    const ExecutionMetrics& metrics() const { return metrics_; }
    const ExecutionConfig& config() const { return cfg_; }

private:
    std::optional<OrderResult> place_chunk(const std::string& venue, const std::string& symbol,
                                           OrderSide side, double chunk, double price);
    bool cancel_orders(const std::string& symbol, const std::vector<OrderResult>& orders);

    ExecutionConfig cfg_;
    OrderAdapter& adapter_;
    TelemetryState& telemetry_;
    ExecutionMetrics metrics_;
};

}
