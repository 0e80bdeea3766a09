#include "signal/MultiWindowSignal.hpp"

using namespace tandem;

MultiWindowSignal::MultiWindowSignal(const SignalConfig& cfg)
    : cfg_(cfg)
    , series_(cfg.momentum_window, cfg.volume_lookback) {
    buffers_.reserve(cfg.windows_ns.size());
    for (uint64_t ns : cfg.windows_ns)
        buffers_.emplace_back(WindowSpec::duration_ns(ns));
}

SignalReadings MultiWindowSignal::update(double spread, double volume, uint64_t ts_ns) {
    series_.push(spread, volume);

    SignalReadings out;
    for (auto& buf : buffers_) {
        buf.push(ts_ns, spread);
        out[buf.spec()] = compute_reading(cfg_, buf, spread, volume, ts_ns, series_);
    }
    return out;
}

std::vector<WindowSpec> MultiWindowSignal::windows() const {
    std::vector<WindowSpec> v;
    v.reserve(buffers_.size());
    for (const auto& b : buffers_) v.push_back(b.spec());
    return v;
}
