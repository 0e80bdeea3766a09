#pragma once
#include "signal/SignalMath.hpp"
#include "signal/SignalSource.hpp"
#include "signal/WindowBuffer.hpp"

namespace tandem {

// One count-bounded window of the last `count_window` spreads.
class SingleWindowSignal : public SignalSource {
public:
    explicit SingleWindowSignal(const SignalConfig& cfg);

    SignalReadings update(double spread, double volume, uint64_t ts_ns) override;
    std::vector<WindowSpec> windows() const override;
    const char* name() const override { return "single"; }

private:
    SignalConfig cfg_;
    WindowBuffer buffer_;
    SpreadSeries series_;
};

}
