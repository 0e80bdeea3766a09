#include "execution/ExecutionMetrics.hpp"

using namespace tandem;

ExecutionMetrics::ExecutionMetrics(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ExecutionMetrics::record(const ExecutionSample& s) {
    std::lock_guard<std::mutex> lock(mtx_);
    samples_.push_back(s);
    while (samples_.size() > capacity_) samples_.pop_front();
}

std::size_t ExecutionMetrics::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return samples_.size();
}

std::vector<ExecutionSample> ExecutionMetrics::samples() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return {samples_.begin(), samples_.end()};
}

ExecutionAverages ExecutionMetrics::averages() const {
    std::lock_guard<std::mutex> lock(mtx_);
    ExecutionAverages a;
    a.samples = samples_.size();
    if (samples_.empty()) return a;

    for (const auto& s : samples_) {
        a.slippage   += s.slippage;
        a.fill_ratio += s.fill_ratio;
        a.latency_ms += s.latency_ms;
        a.impact     += s.impact;
    }
    const double n = static_cast<double>(samples_.size());
    a.slippage   /= n;
    a.fill_ratio /= n;
    a.latency_ms /= n;
    a.impact     /= n;
    return a;
}
