#include "execution/ExecutionEngine.hpp"
#include "telemetry/TelemetryState.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <thread>
#include <utility>

using namespace tandem;

ExecutionEngine::ExecutionEngine(ExecutionConfig cfg, OrderAdapter& adapter,
                                 TelemetryState& telemetry)
    : cfg_(std::move(cfg))
    , adapter_(adapter)
    , telemetry_(telemetry)
    , metrics_(cfg_.metrics_capacity) {}

double ExecutionEngine::liquidity_score(const BookDepth& book, OrderSide side, double amount) {
    if (amount <= 0.0) return 0.0;
    const double depth = side == OrderSide::SELL ? book.bid_depth() : book.ask_depth();
    return std::min(1.0, depth / amount);
}

// Sells walk the bids from the top down, buys walk the asks from the top up.
ImpactEstimate ExecutionEngine::estimate_impact(const BookDepth& book, OrderSide side,
                                                double amount) {
    const auto& levels = side == OrderSide::SELL ? book.bids : book.asks;

    ImpactEstimate est;
    est.impact = std::numeric_limits<double>::infinity();
    if (levels.empty() || amount <= 0.0) return est;

    est.best_price = levels.front().price;

    double remaining = amount;
    double cost = 0.0;
    for (const auto& l : levels) {
        const double taken = std::min(remaining, l.quantity);
        cost += taken * l.price;
        remaining -= taken;
        est.worst_price = l.price;
        if (remaining <= 0.0) break;
    }
    if (remaining > 0.0) return est;

    est.sufficient = true;
    est.vwap = cost / amount;
    est.impact = std::fabs(est.vwap - est.best_price) / est.best_price;
    return est;
}

SlicePlan ExecutionEngine::plan(double amount, const BookDepth& book) const {
    if (amount < cfg_.iceberg_threshold) return {false, amount};

    const double total_depth = book.bid_depth() + book.ask_depth();
    double chunk = std::min(amount * cfg_.chunk_fraction, total_depth * cfg_.depth_fraction);
    chunk = std::max(chunk, cfg_.min_chunk);
    return {true, chunk};
}

std::optional<OrderResult> ExecutionEngine::place_chunk(const std::string& venue,
                                                        const std::string& symbol,
                                                        OrderSide side, double chunk,
                                                        double price) {
    OrderRequest req;
    req.venue  = venue;
    req.symbol = symbol;
    req.side   = side;
    req.type   = OrderType::LIMIT;
    req.amount = chunk;
    req.price  = price;

    for (int attempt = 0; attempt < cfg_.max_retries; ++attempt) {
        OrderResult r;
        try {
            r = adapter_.place(req);
        } catch (const VenueError& e) {
            std::cerr << "[EXEC] place failed " << venue << ":" << symbol
                      << " attempt " << attempt + 1 << ": " << e.what() << "\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.retry_delay_ms));
            continue;
        }
        r.venue = venue;
        r.side  = side;

        const double ratio = chunk > 0.0 ? r.filled / chunk : 0.0;
        if (r.filled > 0.0 && ratio >= cfg_.min_fill_ratio) return r;

        telemetry_.increment(Counter::LOW_FILL_RETRY);
        std::cout << "[EXEC] Low fill " << venue << ":" << symbol << " order " << r.id
                  << " ratio=" << ratio << " -> cancel/retry\n";
        try {
            adapter_.cancel(venue, r.id, symbol);
        } catch (const VenueError& e) {
            std::cerr << "[EXEC] cancel failed " << venue << " order " << r.id
                      << ": " << e.what() << "\n";
        }
    }
    return std::nullopt;
}

bool ExecutionEngine::cancel_orders(const std::string& symbol,
                                    const std::vector<OrderResult>& orders) {
    bool ok = true;
    for (const auto& o : orders) {
        try {
            adapter_.cancel(o.venue, o.id, symbol);
        } catch (const VenueError& e) {
            ok = false;
            std::cerr << "[EXEC] cancel failed " << o.venue << " order " << o.id
                      << ": " << e.what() << "\n";
        }
    }
    return ok;
}

bool ExecutionEngine::cancel_report(const ExecutionReport& report) {
    return cancel_orders(report.symbol, report.child_orders);
}

std::optional<ExecutionReport> ExecutionEngine::execute(const std::string& venue,
                                                        const std::string& symbol,
                                                        OrderSide side,
                                                        double amount,
                                                        const BookDepth& book,
                                                        ExecReject* why) {
    auto reject = [why](ExecReject r) {
        if (why) *why = r;
        return std::optional<ExecutionReport>{};
    };
    if (why) *why = ExecReject::NONE;

    const auto start = std::chrono::steady_clock::now();

    const double liquidity = liquidity_score(book, side, amount);
    if (liquidity < cfg_.min_liquidity_ratio) {
        telemetry_.increment(Counter::LIQUIDITY_REJECT);
        std::cout << "[EXEC] Insufficient liquidity " << venue << ":" << symbol
                  << " score=" << liquidity << " < " << cfg_.min_liquidity_ratio << "\n";
        return reject(ExecReject::LIQUIDITY);
    }

    const ImpactEstimate est = estimate_impact(book, side, amount);
    if (!est.sufficient || est.impact > cfg_.max_price_impact) {
        telemetry_.increment(Counter::IMPACT_REJECT);
        std::cout << "[EXEC] Excessive impact " << venue << ":" << symbol
                  << " impact=" << est.impact << " > " << cfg_.max_price_impact << "\n";
        return reject(ExecReject::IMPACT);
    }

    const SlicePlan slices = plan(amount, book);
    if (slices.iceberg) {
        std::cout << "[EXEC] Iceberg " << venue << ":" << symbol << " " << to_string(side)
                  << " amount=" << amount << " chunk=" << slices.chunk << "\n";
    }

    ExecutionReport report;
    report.venue           = venue;
    report.symbol          = symbol;
    report.side            = side;
    report.requested       = amount;
    report.reference_price = est.vwap;
    report.limit_price     = est.worst_price;
    report.iceberg         = slices.iceberg;

    // Done once what is left is within the fill tolerance of the whole order.
    const double tolerance = std::max(amount * (1.0 - cfg_.min_fill_ratio), 1e-12);
    double cost = 0.0;
    double remaining = amount;

    while (remaining > tolerance) {
        const double chunk = slices.iceberg ? std::min(slices.chunk, remaining) : remaining;
        auto r = place_chunk(venue, symbol, side, chunk, est.worst_price);
        if (!r) {
            telemetry_.increment(Counter::ORDER_ABORT);
            std::cout << "[EXEC] Abort " << venue << ":" << symbol << " after "
                      << report.child_orders.size() << " filled chunks\n";
            cancel_orders(symbol, report.child_orders);
            return reject(ExecReject::ABORTED);
        }

        report.filled_amount += r->filled;
        cost += r->filled * r->average;
        report.child_orders.push_back(*r);
        remaining = amount - report.filled_amount;

        if (!slices.iceberg) break;
    }

    report.average_price = report.filled_amount > 0.0 ? cost / report.filled_amount : 0.0;
    report.impact = est.best_price > 0.0
        ? std::fabs(report.average_price - est.best_price) / est.best_price : 0.0;
    report.latency_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    ExecutionSample sample;
    sample.slippage   = est.vwap > 0.0
        ? std::fabs(report.average_price - est.vwap) / est.vwap : 0.0;
    sample.fill_ratio = report.filled_amount / amount;
    sample.latency_ms = report.latency_ms;
    sample.impact     = report.impact;
    metrics_.record(sample);

    return report;
}
