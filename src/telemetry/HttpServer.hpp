#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "telemetry/TelemetryState.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Read-only HTTP view of TelemetryState.
//
//   GET /metrics   Prometheus text
//   GET /health    "ok" while running
//   GET /          full JSON snapshot with counters
//
// run() blocks, polling a non-blocking acceptor until `running` drops.
// Connections are served one at a time; a client that has not finished its
// request (or taken the reply) within io_timeout is dropped.
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(uint16_t port, const TelemetryState& telemetry, const std::atomic<bool>& running,
               std::chrono::milliseconds io_timeout = std::chrono::milliseconds(5000));

    void run();

    // Port actually bound; 0 until run() is listening. Port 0 binds an
    // ephemeral port.
    uint16_t bound_port() const { return bound_port_.load(); }

    struct Reply {
        unsigned status;
        std::string content_type;
        std::string body;
    };
    // Routing, separate from the socket code.
    Reply handle(const std::string& method, const std::string& target) const;

private:
    uint16_t port_;
    const TelemetryState& telemetry_;
    const std::atomic<bool>& running_;
    std::chrono::milliseconds io_timeout_;
    std::atomic<uint16_t> bound_port_{0};
};

}
