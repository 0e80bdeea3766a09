#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "signal/WindowBuffer.hpp"

namespace tandem {

enum class SignalMode { SINGLE, MULTI };

struct SignalConfig {
    SignalMode mode{SignalMode::MULTI};

    // SINGLE mode: one count-bounded window.
    std::size_t count_window{100};
    // MULTI mode: duration-bounded windows.
    std::vector<uint64_t> windows_ns{15'000'000'000ULL, 60'000'000'000ULL,
                                     180'000'000'000ULL, 360'000'000'000ULL};

    double base_threshold{1.0};
    double vol_impact{0.3};
    double threshold_min{0.5};
    double threshold_max{5.0};

    std::size_t vol_window{30};
    double vol_adjust_min{0.5};
    double vol_adjust_max{2.0};

    std::size_t momentum_window{20};
    std::size_t volume_lookback{20};

    // UTC hours, inclusive on both ends.
    int active_hour_start{8};
    int active_hour_end{16};
    int quiet_hour_start{0};
    int quiet_hour_end{4};
    double active_factor{0.9};
    double quiet_factor{1.2};
};

struct SignalReading {
    WindowSpec window;
    double zscore{0.0};
    double volume_weighted_zscore{0.0};
    double threshold{0.0};
    double volatility{0.0};
    double momentum{0.0};
    double strength{0.0};
    std::size_t samples{0};

    int direction() const { return zscore > 0.0 ? 1 : (zscore < 0.0 ? -1 : 0); }
};

using SignalReadings = std::map<WindowSpec, SignalReading>;

}
