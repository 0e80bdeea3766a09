#include "signal/SignalSource.hpp"
#include "signal/MultiWindowSignal.hpp"
#include "signal/SingleWindowSignal.hpp"
#include <cmath>

using namespace tandem;

std::optional<SignalReading> tandem::select_signal(const SignalReadings& readings) {
    std::optional<SignalReading> best;
    for (const auto& kv : readings) {
        const SignalReading& r = kv.second;
        const double az = std::fabs(r.zscore);
        if (az == 0.0 || az < r.threshold) continue;
        if (!best || az > std::fabs(best->zscore)) best = r;
    }
    return best;
}

std::unique_ptr<SignalSource> tandem::make_signal_source(const SignalConfig& cfg) {
    if (cfg.mode == SignalMode::SINGLE)
        return std::make_unique<SingleWindowSignal>(cfg);
    return std::make_unique<MultiWindowSignal>(cfg);
}
