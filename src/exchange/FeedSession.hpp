#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "book/MarketTypes.hpp"
#include "exchange/BoundedChannel.hpp"
#include "exchange/MarketDataAdapter.hpp"

namespace tandem {

class TelemetryState;

enum class FeedEventKind { SNAPSHOT, INCREMENT };

struct FeedEvent {
    FeedEventKind kind{FeedEventKind::INCREMENT};
    std::string venue;
    std::string symbol;
    BookDepth depth;              // SNAPSHOT
    BookSide side{BookSide::BID}; // INCREMENT
    double price{0.0};
    double quantity{0.0};
    uint64_t ts_ns{0};
};

using FeedChannel = BoundedChannel<FeedEvent>;

struct FeedSessionConfig {
    uint64_t backoff_initial_ms{100};
    uint64_t backoff_max_ms{5000};
};

// ---------------------------------------------------------------------------
// Drives one venue's MarketDataAdapter on its own thread.
//
// After every (re)connect a full snapshot is pushed for each symbol before
// increments resume. ConnectionLost closes the adapter and reconnects after
// an exponential backoff. Malformed messages are counted and dropped.
// The session ends on stop(), on end of stream, or when the channel closes.
// ---------------------------------------------------------------------------
class FeedSession {
public:
    FeedSession(MarketDataAdapter& adapter, std::vector<std::string> symbols,
                FeedChannel& channel, TelemetryState& telemetry,
                FeedSessionConfig cfg = {});
    ~FeedSession();

    FeedSession(const FeedSession&) = delete;
    FeedSession& operator=(const FeedSession&) = delete;

    void start();
    void stop();
    void join();

    // Thread body; callable inline.
    void run();

    bool finished() const { return finished_.load(); }
    uint64_t reconnects() const { return reconnects_.load(); }

private:
    // Returns false once the session should end.
    bool publish_snapshots();
    bool stream();
    void backoff_wait(uint64_t ms);

    MarketDataAdapter& adapter_;
    std::vector<std::string> symbols_;
    std::set<std::string> symbol_set_;
    FeedChannel& channel_;
    TelemetryState& telemetry_;
    FeedSessionConfig cfg_;

    std::atomic<bool> running_{true};
    std::atomic<bool> finished_{false};
    std::atomic<uint64_t> reconnects_{0};

    std::mutex wait_mtx_;
    std::condition_variable wait_cv_;
    std::thread thread_;
};

}
