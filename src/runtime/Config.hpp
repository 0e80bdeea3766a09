#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "exchange/FeedSession.hpp"
#include "execution/ExecutionEngine.hpp"
#include "fees/FeeSchedule.hpp"
#include "risk/RiskTypes.hpp"
#include "signal/SignalTypes.hpp"

namespace tandem {

// Invalid configuration. what() names the offending JSON path.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

enum class ClockMode { FEED, WALL };

struct BookConfig {
    uint64_t staleness_ns{5'000'000'000ULL};
    std::size_t depth_levels{20};  // levels the paper venue matches against
};

struct TradeConfig {
    uint64_t cooldown_ns{30'000'000'000ULL};
    std::size_t workers{2};
    std::size_t batch_size{256};
    std::size_t channel_capacity{4096};
    uint64_t idle_wait_ms{50};
    ClockMode clock{ClockMode::FEED};
    std::size_t recent_trades{20};
    // |spread| / ((A.ask + B.bid) / 2) must fall inside this band to enter.
    double min_spread_ratio{0.0};
    double max_spread_ratio{std::numeric_limits<double>::infinity()};
};

struct FeedsConfig {
    FeedSessionConfig session;
    std::map<std::string, std::string> replay;  // venue -> JSONL path
};

struct TelemetryConfig {
    uint16_t port{0};
    uint64_t io_timeout_ms{5000};
};

// ---------------------------------------------------------------------------
// Whole-run configuration. Loaded once at startup, immutable afterwards.
// venues[0] is the venue whose ask forms the spread, venues[1] the venue
// whose bid is subtracted from it.
// ---------------------------------------------------------------------------
struct AppConfig {
    std::vector<std::string> symbols;
    std::vector<std::string> venues;
    BookConfig book;
    SignalConfig signal;
    FeeConfig fees;
    TradeConfig trade;
    RiskConfig risk;
    ExecutionConfig execution;
    FeedsConfig feeds;
    TelemetryConfig telemetry;
};

AppConfig default_config();
AppConfig parse_config(const nlohmann::json& j);
AppConfig load_config_file(const std::string& path);

}
