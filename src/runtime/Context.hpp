#pragma once
#include <atomic>
#include <memory>

#include <boost/asio/thread_pool.hpp>

#include "book/BookStore.hpp"
#include "control/TradeLedger.hpp"
#include "exchange/FeedSession.hpp"
#include "exchange/PaperOrderAdapter.hpp"
#include "execution/ExecutionEngine.hpp"
#include "execution/OrderAdapter.hpp"
#include "fees/FeeSchedule.hpp"
#include "risk/RiskGate.hpp"
#include "runtime/Config.hpp"
#include "telemetry/TelemetryState.hpp"

namespace tandem {

// Single owner of all run state. Constructed once in main() (or per test),
// passed by reference to the coordinator, feed sessions and telemetry.
// shutdown() closes the feed channel and joins the worker pool.
struct Context {
    // Paper venue over this context's own books.
    explicit Context(AppConfig cfg);
    // External venue, e.g. a test double.
    Context(AppConfig cfg, OrderAdapter& orders);
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void shutdown();

    const AppConfig config;
    std::atomic<bool> running{true};

    TelemetryState telemetry;
    BookStore books;
    FeeSchedule fees;
    RiskGate risk;
    TradeLedger ledger;

    // Feed threads -> coordinator.
    FeedChannel channel;
    // CPU-bound signal updates.
    boost::asio::thread_pool pool;

    std::unique_ptr<PaperOrderAdapter> paper;
    OrderAdapter& orders;
    ExecutionEngine execution;

private:
    Context(AppConfig cfg, OrderAdapter* external);

    std::atomic<bool> shut_down_{false};
};

}
