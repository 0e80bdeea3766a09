#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>

#include "signal/SignalTypes.hpp"
#include "signal/WindowBuffer.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Per-symbol series shared by every window: recent spreads for momentum and
// recent volume estimates for the volume factor.
// ---------------------------------------------------------------------------
class SpreadSeries {
public:
    SpreadSeries(std::size_t momentum_window, std::size_t volume_lookback);

    void push(double spread, double volume);

    // Sum of the last momentum_window fractional spread returns (fewer if
    // the series is shorter). Zero-based returns contribute nothing.
    double momentum() const;

    // Mean of the last volume_lookback volumes once that many exist,
    // otherwise the latest volume.
    double avg_volume() const;

private:
    std::size_t momentum_window_;
    std::size_t volume_lookback_;
    std::deque<double> spreads_;
    std::deque<double> volumes_;
};

double volume_factor(double volume, double avg_volume);
double volume_ratio(double volume, double avg_volume);
double time_of_day_factor(const SignalConfig& cfg, uint64_t ts_ns);

double adaptive_threshold(const SignalConfig& cfg, double volatility,
                          double vol_factor, double tod_factor, double momentum);

// Recent-window std over full-window std, clamped.
double vol_adjustment(const SignalConfig& cfg, const WindowBuffer& buf);

// Reading for a buffer that already holds the latest spread.
SignalReading compute_reading(const SignalConfig& cfg, const WindowBuffer& buf,
                              double spread, double volume, uint64_t ts_ns,
                              const SpreadSeries& series);

}
