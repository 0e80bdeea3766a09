#include "runtime/Config.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <set>
#include <utility>

using namespace tandem;
using json = nlohmann::json;

namespace {

constexpr uint64_t NS_PER_MS = 1'000'000ULL;
constexpr uint64_t NS_PER_S  = 1'000'000'000ULL;

// ---------------------------------------------------------------------------
// Typed view of one JSON object. Every accessor validates the value type and
// reports failures against the full dotted path.
// ---------------------------------------------------------------------------
class Section {
public:
    Section(const json& j, std::string path, std::initializer_list<const char*> allowed)
        : j_(j), path_(std::move(path)) {
        if (!j_.is_object()) fail(path_, "expected an object");
        std::set<std::string> ok(allowed.begin(), allowed.end());
        for (const auto& item : j_.items())
            if (!ok.count(item.key())) fail(at(item.key()), "unknown key");
    }

    bool has(const char* key) const { return j_.contains(key); }
    const json& raw(const char* key) const { return j_.at(key); }
    std::string at(const std::string& key) const {
        return path_.empty() ? key : path_ + "." + key;
    }

    double number(const char* key, double def) const {
        if (!has(key)) return def;
        const json& v = j_.at(key);
        if (!v.is_number()) fail(at(key), "expected a number");
        const double d = v.get<double>();
        if (!std::isfinite(d)) fail(at(key), "expected a finite number");
        return d;
    }

    double positive(const char* key, double def) const {
        const double d = number(key, def);
        if (d <= 0.0) fail(at(key), "must be > 0");
        return d;
    }

    double ratio(const char* key, double def) const {
        const double d = number(key, def);
        if (d < 0.0 || d > 1.0) fail(at(key), "must be within [0, 1]");
        return d;
    }

    uint64_t uint(const char* key, uint64_t def) const {
        if (!has(key)) return def;
        const json& v = j_.at(key);
        if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0))
            fail(at(key), "expected a non-negative integer");
        return v.get<uint64_t>();
    }

    uint64_t positive_uint(const char* key, uint64_t def) const {
        const uint64_t v = uint(key, def);
        if (v == 0) fail(at(key), "must be > 0");
        return v;
    }

    std::string str(const char* key, const std::string& def) const {
        if (!has(key)) return def;
        const json& v = j_.at(key);
        if (!v.is_string()) fail(at(key), "expected a string");
        return v.get<std::string>();
    }

    [[noreturn]] static void fail(const std::string& path, const std::string& msg) {
        throw ConfigError("config " + (path.empty() ? std::string("<root>") : path) + ": " + msg);
    }

private:
    const json& j_;
    std::string path_;
};

std::vector<std::string> string_list(const json& v, const std::string& path) {
    if (!v.is_array() || v.empty()) Section::fail(path, "expected a non-empty array of strings");
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const std::string p = path + "[" + std::to_string(i) + "]";
        if (!v[i].is_string() || v[i].get<std::string>().empty())
            Section::fail(p, "expected a non-empty string");
        const std::string s = v[i].get<std::string>();
        if (!seen.insert(s).second) Section::fail(p, "duplicate entry " + s);
        out.push_back(s);
    }
    return out;
}

// A bare number sets the default; an object may carry "default" plus one
// entry per configured symbol.
void symbol_map(const Section& sec, const char* key, SymbolMap<double>& out,
                const std::set<std::string>& symbols, bool require_positive) {
    if (!sec.has(key)) return;
    const json& v = sec.raw(key);
    const std::string path = sec.at(key);

    auto check = [&](const json& x, const std::string& p) {
        if (!x.is_number() || !std::isfinite(x.get<double>()))
            Section::fail(p, "expected a finite number");
        const double d = x.get<double>();
        if (require_positive && d <= 0.0) Section::fail(p, "must be > 0");
        return d;
    };

    if (v.is_number()) {
        out.fallback = check(v, path);
        return;
    }
    if (!v.is_object()) Section::fail(path, "expected a number or an object");
    for (const auto& item : v.items()) {
        const std::string p = path + "." + item.key();
        if (item.key() == "default") {
            out.fallback = check(item.value(), p);
        } else {
            if (!symbols.count(item.key())) Section::fail(p, "unknown symbol");
            out.set(item.key(), check(item.value(), p));
        }
    }
}

std::pair<int, int> hour_range(const Section& sec, const char* key, std::pair<int, int> def) {
    if (!sec.has(key)) return def;
    const json& v = sec.raw(key);
    const std::string path = sec.at(key);
    if (!v.is_array() || v.size() != 2 || !v[0].is_number_integer() || !v[1].is_number_integer())
        Section::fail(path, "expected [start_hour, end_hour]");
    const int a = v[0].get<int>();
    const int b = v[1].get<int>();
    if (a < 0 || a > 23 || b < 0 || b > 23 || a > b)
        Section::fail(path, "hours must satisfy 0 <= start <= end <= 23");
    return {a, b};
}

void parse_book(const json& j, BookConfig& c) {
    Section s(j, "book", {"staleness_ms", "depth_levels"});
    c.staleness_ns = s.positive_uint("staleness_ms", c.staleness_ns / NS_PER_MS) * NS_PER_MS;
    c.depth_levels = s.positive_uint("depth_levels", c.depth_levels);
}

void parse_signal(const json& j, SignalConfig& c) {
    Section s(j, "signal", {"mode", "count_window", "windows_s", "base_threshold", "vol_impact",
                            "threshold_min", "threshold_max", "vol_window", "vol_adjust_min",
                            "vol_adjust_max", "momentum_window", "volume_lookback",
                            "active_hours", "quiet_hours", "active_factor", "quiet_factor"});

    const std::string mode = s.str("mode", c.mode == SignalMode::SINGLE ? "single" : "multi");
    if (mode == "single") c.mode = SignalMode::SINGLE;
    else if (mode == "multi") c.mode = SignalMode::MULTI;
    else Section::fail(s.at("mode"), "expected \"single\" or \"multi\"");

    c.count_window = s.positive_uint("count_window", c.count_window);
    if (c.count_window < 2) Section::fail(s.at("count_window"), "must be >= 2");

    if (s.has("windows_s")) {
        const json& w = s.raw("windows_s");
        if (!w.is_array() || w.empty()) Section::fail(s.at("windows_s"), "expected a non-empty array");
        c.windows_ns.clear();
        std::set<uint64_t> seen;
        for (std::size_t i = 0; i < w.size(); ++i) {
            const std::string p = s.at("windows_s") + "[" + std::to_string(i) + "]";
            if (!w[i].is_number() || w[i].get<double>() <= 0.0) Section::fail(p, "must be > 0");
            const uint64_t ns = static_cast<uint64_t>(w[i].get<double>() * NS_PER_S);
            if (!seen.insert(ns).second) Section::fail(p, "duplicate window");
            c.windows_ns.push_back(ns);
        }
    }

    c.base_threshold = s.positive("base_threshold", c.base_threshold);
    c.vol_impact     = s.number("vol_impact", c.vol_impact);
    c.threshold_min  = s.positive("threshold_min", c.threshold_min);
    c.threshold_max  = s.positive("threshold_max", c.threshold_max);
    if (c.threshold_min > c.threshold_max)
        Section::fail(s.at("threshold_min"), "must be <= threshold_max");

    c.vol_window     = s.positive_uint("vol_window", c.vol_window);
    c.vol_adjust_min = s.positive("vol_adjust_min", c.vol_adjust_min);
    c.vol_adjust_max = s.positive("vol_adjust_max", c.vol_adjust_max);
    if (c.vol_adjust_min > c.vol_adjust_max)
        Section::fail(s.at("vol_adjust_min"), "must be <= vol_adjust_max");

    c.momentum_window = s.positive_uint("momentum_window", c.momentum_window);
    c.volume_lookback = s.positive_uint("volume_lookback", c.volume_lookback);

    auto active = hour_range(s, "active_hours", {c.active_hour_start, c.active_hour_end});
    auto quiet  = hour_range(s, "quiet_hours", {c.quiet_hour_start, c.quiet_hour_end});
    c.active_hour_start = active.first;
    c.active_hour_end   = active.second;
    c.quiet_hour_start  = quiet.first;
    c.quiet_hour_end    = quiet.second;
    c.active_factor = s.positive("active_factor", c.active_factor);
    c.quiet_factor  = s.positive("quiet_factor", c.quiet_factor);
}

VenueFees parse_venue_fees(const json& j, const std::string& path) {
    Section s(j, path, {"maker", "taker", "volume_unit", "tiers"});
    VenueFees vf;
    vf.default_maker = s.ratio("maker", vf.default_maker);
    vf.default_taker = s.ratio("taker", vf.default_taker);

    const std::string unit = s.str("volume_unit", "quote");
    if (unit == "quote") vf.volume_unit = VolumeUnit::QUOTE;
    else if (unit == "base") vf.volume_unit = VolumeUnit::BASE;
    else Section::fail(s.at("volume_unit"), "expected \"quote\" or \"base\"");

    if (s.has("tiers")) {
        const json& tiers = s.raw("tiers");
        if (!tiers.is_array()) Section::fail(s.at("tiers"), "expected an array");
        for (std::size_t i = 0; i < tiers.size(); ++i) {
            Section t(tiers[i], s.at("tiers") + "[" + std::to_string(i) + "]",
                      {"min_volume", "maker", "taker", "currency"});
            FeeTier tier;
            tier.min_volume = t.positive("min_volume", -1.0);
            tier.maker_fee  = t.ratio("maker", vf.default_maker);
            tier.taker_fee  = t.ratio("taker", vf.default_taker);
            tier.currency   = t.str("currency", "");
            if (!vf.tiers.empty() && tier.min_volume <= vf.tiers.back().min_volume)
                Section::fail(t.at("min_volume"), "tiers must be strictly ascending");
            vf.tiers.push_back(tier);
        }
    }
    return vf;
}

void parse_fees(const json& j, FeeConfig& c, const std::vector<std::string>& venues,
                const std::set<std::string>& symbols) {
    Section s(j, "fees", {"venues", "min_profit_after_fees", "ledger_days"});

    if (s.has("venues")) {
        const json& v = s.raw("venues");
        if (!v.is_object()) Section::fail(s.at("venues"), "expected an object");
        std::map<std::string, VenueFees> parsed;
        for (const auto& item : v.items()) {
            if (std::find(venues.begin(), venues.end(), item.key()) == venues.end())
                Section::fail(s.at("venues") + "." + item.key(), "unknown venue");
            parsed[item.key()] = parse_venue_fees(item.value(), s.at("venues") + "." + item.key());
        }
        c.venues = parsed;
    }
    for (const auto& venue : venues)
        if (!c.venues.count(venue)) Section::fail(s.at("venues") + "." + venue, "missing fee table");

    symbol_map(s, "min_profit_after_fees", c.min_profit_after_fees, symbols, false);
    c.ledger_window_ns = s.positive_uint("ledger_days", c.ledger_window_ns / (86400 * NS_PER_S))
                       * 86400 * NS_PER_S;
}

void parse_trade(const json& j, TradeConfig& c) {
    Section s(j, "trade", {"cooldown_s", "workers", "batch_size", "channel_capacity",
                           "idle_wait_ms", "clock", "recent_trades",
                           "min_spread_ratio", "max_spread_ratio"});
    const double cooldown_s = s.number("cooldown_s", static_cast<double>(c.cooldown_ns) / 1e9);
    if (cooldown_s < 0.0) Section::fail(s.at("cooldown_s"), "must be >= 0");
    c.cooldown_ns      = static_cast<uint64_t>(cooldown_s * 1e9);
    c.workers          = s.positive_uint("workers", c.workers);
    c.batch_size       = s.positive_uint("batch_size", c.batch_size);
    c.channel_capacity = s.positive_uint("channel_capacity", c.channel_capacity);
    c.idle_wait_ms     = s.uint("idle_wait_ms", c.idle_wait_ms);
    c.recent_trades    = s.uint("recent_trades", c.recent_trades);

    c.min_spread_ratio = s.number("min_spread_ratio", c.min_spread_ratio);
    if (c.min_spread_ratio < 0.0) Section::fail(s.at("min_spread_ratio"), "must be >= 0");
    c.max_spread_ratio = s.positive("max_spread_ratio", c.max_spread_ratio);
    if (c.min_spread_ratio > c.max_spread_ratio)
        Section::fail(s.at("min_spread_ratio"), "must be <= max_spread_ratio");

    const std::string clock = s.str("clock", c.clock == ClockMode::FEED ? "feed" : "wall");
    if (clock == "feed") c.clock = ClockMode::FEED;
    else if (clock == "wall") c.clock = ClockMode::WALL;
    else Section::fail(s.at("clock"), "expected \"feed\" or \"wall\"");
}

void parse_risk(const json& j, RiskConfig& c, const std::set<std::string>& symbols) {
    Section s(j, "risk", {"policy", "naked_exposure_policy", "base_size", "max_position_value",
                          "max_position_size", "max_notional_per_trade", "max_total_notional",
                          "max_drawdown", "drawdown_limit", "max_var", "var_fraction",
                          "stop_loss_amount", "exit_z", "volatility_scaling",
                          "reference_portfolio_value", "default_volatility",
                          "volatility_lookback", "correlation_lookback", "correlation_every",
                          "min_samples", "max_daily_loss"});

    const std::string policy = s.str("policy", c.policy == RiskPolicyKind::BASIC ? "basic" : "enhanced");
    if (policy == "basic") c.policy = RiskPolicyKind::BASIC;
    else if (policy == "enhanced") c.policy = RiskPolicyKind::ENHANCED;
    else Section::fail(s.at("policy"), "expected \"basic\" or \"enhanced\"");

    const std::string naked = s.str("naked_exposure_policy",
        c.naked_exposure_policy == NakedExposurePolicy::HALT ? "halt" : "alert");
    if (naked == "halt") c.naked_exposure_policy = NakedExposurePolicy::HALT;
    else if (naked == "alert") c.naked_exposure_policy = NakedExposurePolicy::ALERT;
    else Section::fail(s.at("naked_exposure_policy"), "expected \"halt\" or \"alert\"");

    symbol_map(s, "base_size", c.base_size, symbols, true);
    symbol_map(s, "max_position_value", c.max_position_value, symbols, true);
    symbol_map(s, "max_notional_per_trade", c.max_notional_per_trade, symbols, true);
    symbol_map(s, "drawdown_limit", c.drawdown_limit, symbols, true);
    symbol_map(s, "max_var", c.max_var, symbols, true);
    symbol_map(s, "stop_loss_amount", c.stop_loss_amount, symbols, true);

    c.max_position_size  = s.positive("max_position_size", c.max_position_size);
    c.max_total_notional = s.positive("max_total_notional", c.max_total_notional);
    c.max_drawdown       = s.number("max_drawdown", c.max_drawdown);
    c.max_daily_loss     = s.positive("max_daily_loss", c.max_daily_loss);
    c.var_fraction       = s.ratio("var_fraction", c.var_fraction);
    c.exit_z             = s.number("exit_z", c.exit_z);
    c.volatility_scaling = s.number("volatility_scaling", c.volatility_scaling);
    c.reference_portfolio_value = s.positive("reference_portfolio_value", c.reference_portfolio_value);
    c.default_volatility   = s.number("default_volatility", c.default_volatility);
    c.volatility_lookback  = s.positive_uint("volatility_lookback", c.volatility_lookback);
    c.correlation_lookback = s.positive_uint("correlation_lookback", c.correlation_lookback);
    c.correlation_every    = s.positive_uint("correlation_every", c.correlation_every);
    c.min_samples          = s.positive_uint("min_samples", c.min_samples);
}

void parse_execution(const json& j, ExecutionConfig& c) {
    Section s(j, "execution", {"min_liquidity_ratio", "max_price_impact", "iceberg_threshold",
                               "chunk_fraction", "depth_fraction", "min_chunk", "min_fill_ratio",
                               "max_retries", "retry_delay_ms", "metrics_capacity",
                               "depth_levels"});
    c.min_liquidity_ratio = s.ratio("min_liquidity_ratio", c.min_liquidity_ratio);
    c.max_price_impact    = s.number("max_price_impact", c.max_price_impact);
    if (c.max_price_impact < 0.0) Section::fail(s.at("max_price_impact"), "must be >= 0");
    c.iceberg_threshold   = s.positive("iceberg_threshold", c.iceberg_threshold);
    c.chunk_fraction      = s.ratio("chunk_fraction", c.chunk_fraction);
    c.depth_fraction      = s.ratio("depth_fraction", c.depth_fraction);
    c.min_chunk           = s.positive("min_chunk", c.min_chunk);
    c.min_fill_ratio      = s.ratio("min_fill_ratio", c.min_fill_ratio);
    if (c.min_fill_ratio <= 0.0) Section::fail(s.at("min_fill_ratio"), "must be > 0");
    c.max_retries         = static_cast<int>(s.positive_uint("max_retries", c.max_retries));
    c.retry_delay_ms      = s.uint("retry_delay_ms", c.retry_delay_ms);
    c.metrics_capacity    = s.positive_uint("metrics_capacity", c.metrics_capacity);
    c.depth_levels        = s.positive_uint("depth_levels", c.depth_levels);
}

void parse_feeds(const json& j, FeedsConfig& c, const std::vector<std::string>& venues) {
    Section s(j, "feeds", {"backoff_initial_ms", "backoff_max_ms", "replay"});
    c.session.backoff_initial_ms = s.positive_uint("backoff_initial_ms", c.session.backoff_initial_ms);
    c.session.backoff_max_ms     = s.positive_uint("backoff_max_ms", c.session.backoff_max_ms);
    if (c.session.backoff_initial_ms > c.session.backoff_max_ms)
        Section::fail(s.at("backoff_initial_ms"), "must be <= backoff_max_ms");

    if (s.has("replay")) {
        const json& r = s.raw("replay");
        if (!r.is_object()) Section::fail(s.at("replay"), "expected an object");
        for (const auto& item : r.items()) {
            const std::string p = s.at("replay") + "." + item.key();
            if (std::find(venues.begin(), venues.end(), item.key()) == venues.end())
                Section::fail(p, "unknown venue");
            if (!item.value().is_string()) Section::fail(p, "expected a path string");
            c.replay[item.key()] = item.value().get<std::string>();
        }
    }
}

void parse_telemetry(const json& j, TelemetryConfig& c) {
    Section s(j, "telemetry", {"port", "io_timeout_ms"});
    const uint64_t port = s.uint("port", c.port);
    if (port > 65535) Section::fail(s.at("port"), "must be <= 65535");
    c.port = static_cast<uint16_t>(port);
    c.io_timeout_ms = s.positive_uint("io_timeout_ms", c.io_timeout_ms);
}

}

AppConfig tandem::default_config() {
    AppConfig c;
    c.symbols = {"BTC/USDT"};
    c.venues  = {"binance", "kraken"};

    VenueFees binance;
    binance.default_maker = 0.0010;
    binance.default_taker = 0.0010;
    binance.volume_unit   = VolumeUnit::BASE;
    binance.tiers = {{50.0, 0.0009, 0.0009, "BTC"},
                     {100.0, 0.0008, 0.0008, "BTC"},
                     {500.0, 0.0007, 0.0007, "BTC"}};

    VenueFees kraken;
    kraken.default_maker = 0.0016;
    kraken.default_taker = 0.0026;
    kraken.volume_unit   = VolumeUnit::QUOTE;
    kraken.tiers = {{50000.0, 0.0014, 0.0024, "USD"},
                    {100000.0, 0.0012, 0.0022, "USD"},
                    {250000.0, 0.0010, 0.0020, "USD"}};

    c.fees.venues["binance"] = binance;
    c.fees.venues["kraken"]  = kraken;
    return c;
}

AppConfig tandem::parse_config(const json& j) {
    Section root(j, "", {"symbols", "venues", "book", "signal", "fees", "trade", "risk",
                         "execution", "feeds", "telemetry"});
    if (!root.has("symbols")) Section::fail("symbols", "missing required key");
    if (!root.has("venues")) Section::fail("venues", "missing required key");

    AppConfig c = default_config();
    c.symbols = string_list(root.raw("symbols"), "symbols");
    c.venues  = string_list(root.raw("venues"), "venues");
    if (c.venues.size() != 2) Section::fail("venues", "exactly two venues are required");

    const std::set<std::string> symbols(c.symbols.begin(), c.symbols.end());

    // Fee tables for venues other than the configured pair do not carry over.
    for (auto it = c.fees.venues.begin(); it != c.fees.venues.end();) {
        if (std::find(c.venues.begin(), c.venues.end(), it->first) == c.venues.end())
            it = c.fees.venues.erase(it);
        else
            ++it;
    }

    if (root.has("book"))      parse_book(root.raw("book"), c.book);
    if (root.has("signal"))    parse_signal(root.raw("signal"), c.signal);
    parse_fees(root.has("fees") ? root.raw("fees") : json::object(), c.fees, c.venues, symbols);
    if (root.has("trade"))     parse_trade(root.raw("trade"), c.trade);
    if (root.has("risk"))      parse_risk(root.raw("risk"), c.risk, symbols);
    if (root.has("execution")) parse_execution(root.raw("execution"), c.execution);
    if (root.has("feeds"))     parse_feeds(root.raw("feeds"), c.feeds, c.venues);
    if (root.has("telemetry")) parse_telemetry(root.raw("telemetry"), c.telemetry);
    return c;
}

AppConfig tandem::load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("cannot open config file: " + path);

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("config " + path + ": " + e.what());
    }
    return parse_config(j);
}
