#pragma once
#include <vector>

#include "signal/SignalMath.hpp"
#include "signal/SignalSource.hpp"
#include "signal/WindowBuffer.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// One duration-bounded window per configured length (15s/60s/180s/360s by
// default). Each update evicts expired samples, appends the spread and
// yields one reading per window.
// ---------------------------------------------------------------------------
class MultiWindowSignal : public SignalSource {
public:
    explicit MultiWindowSignal(const SignalConfig& cfg);

    SignalReadings update(double spread, double volume, uint64_t ts_ns) override;
    std::vector<WindowSpec> windows() const override;
    const char* name() const override { return "multi"; }

private:
    SignalConfig cfg_;
    std::vector<WindowBuffer> buffers_;
    SpreadSeries series_;
};

}
