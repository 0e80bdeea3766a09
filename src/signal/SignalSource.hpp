#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "signal/SignalTypes.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// Rolling z-score signal for one symbol. Implementations own their window
// buffers; a source is never shared across symbols.
// ---------------------------------------------------------------------------
class SignalSource {
public:
    virtual ~SignalSource() = default;

    virtual SignalReadings update(double spread, double volume, uint64_t ts_ns) = 0;
    virtual std::vector<WindowSpec> windows() const = 0;
    virtual const char* name() const = 0;
};

// Window with the largest |z| among readings where |z| >= threshold.
std::optional<SignalReading> select_signal(const SignalReadings& readings);

std::unique_ptr<SignalSource> make_signal_source(const SignalConfig& cfg);

}
