#include "signal/SingleWindowSignal.hpp"

using namespace tandem;

SingleWindowSignal::SingleWindowSignal(const SignalConfig& cfg)
    : cfg_(cfg)
    , buffer_(WindowSpec::count(cfg.count_window))
    , series_(cfg.momentum_window, cfg.volume_lookback) {}

SignalReadings SingleWindowSignal::update(double spread, double volume, uint64_t ts_ns) {
    series_.push(spread, volume);
    buffer_.push(ts_ns, spread);

    SignalReadings out;
    out[buffer_.spec()] = compute_reading(cfg_, buffer_, spread, volume, ts_ns, series_);
    return out;
}

std::vector<WindowSpec> SingleWindowSignal::windows() const {
    return {buffer_.spec()};
}
