#include "exchange/FeedSession.hpp"
#include "exchange/FeedMessage.hpp"
#include "telemetry/TelemetryState.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

using namespace tandem;

FeedSession::FeedSession(MarketDataAdapter& adapter, std::vector<std::string> symbols,
                         FeedChannel& channel, TelemetryState& telemetry,
                         FeedSessionConfig cfg)
    : adapter_(adapter)
    , symbols_(std::move(symbols))
    , symbol_set_(symbols_.begin(), symbols_.end())
    , channel_(channel)
    , telemetry_(telemetry)
    , cfg_(cfg) {}

FeedSession::~FeedSession() {
    stop();
    join();
}

void FeedSession::start() {
    thread_ = std::thread([this] { run(); });
}

void FeedSession::stop() {
    running_.store(false);
    wait_cv_.notify_all();
}

void FeedSession::join() {
    if (thread_.joinable()) thread_.join();
}

void FeedSession::backoff_wait(uint64_t ms) {
    std::unique_lock<std::mutex> lock(wait_mtx_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(ms),
                      [this] { return !running_.load(); });
}

bool FeedSession::publish_snapshots() {
    for (const auto& sym : symbols_) {
        FeedEvent ev;
        ev.kind   = FeedEventKind::SNAPSHOT;
        ev.venue  = adapter_.venue();
        ev.symbol = sym;
        ev.depth  = adapter_.snapshot(sym);
        ev.ts_ns  = ev.depth.ts_ns;
        if (!channel_.push(std::move(ev))) return false;
    }
    return true;
}

bool FeedSession::stream() {
    while (running_.load()) {
        auto raw = adapter_.read();
        if (!raw) {
            std::cout << "[FEED] " << adapter_.venue() << " end of stream\n";
            return false;
        }

        FeedMessage msg;
        try {
            msg = FeedMessage::parse(*raw);
        } catch (const FeedProtocolError& e) {
            telemetry_.increment(Counter::PROTOCOL_ERROR);
            std::cerr << "[FEED] " << adapter_.venue() << " dropped message: " << e.what() << "\n";
            continue;
        }
        if (!symbol_set_.count(msg.symbol)) continue;

        FeedEvent ev;
        ev.kind     = FeedEventKind::INCREMENT;
        ev.venue    = adapter_.venue();
        ev.symbol   = msg.symbol;
        ev.side     = msg.side;
        ev.price    = msg.price;
        ev.quantity = msg.quantity;
        ev.ts_ns    = msg.ts_ns;
        if (!channel_.push(std::move(ev))) return false;
    }
    return false;
}

void FeedSession::run() {
    uint64_t backoff = cfg_.backoff_initial_ms;

    while (running_.load() && !channel_.closed()) {
        try {
            adapter_.connect();
            std::cout << "[FEED] " << adapter_.venue() << " connected\n";
            if (!publish_snapshots()) break;
            backoff = cfg_.backoff_initial_ms;
            if (!stream()) break;
        } catch (const ConnectionLost& e) {
            adapter_.close();
            if (!running_.load()) break;

            reconnects_.fetch_add(1);
            telemetry_.increment(Counter::RECONNECT);
            std::cout << "[FEED] " << adapter_.venue() << " reconnect in " << backoff
                      << "ms (" << e.what() << ")\n";
            backoff_wait(backoff);
            backoff = std::min(backoff * 2, cfg_.backoff_max_ms);
        }
    }

    adapter_.close();
    finished_.store(true);
}
