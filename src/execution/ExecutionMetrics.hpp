#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace tandem {

struct ExecutionSample {
    double slippage{0.0};
    double fill_ratio{0.0};
    double latency_ms{0.0};
    double impact{0.0};
};

struct ExecutionAverages {
    std::size_t samples{0};
    double slippage{0.0};
    double fill_ratio{0.0};
    double latency_ms{0.0};
    double impact{0.0};
};

// Bounded rolling buffer of per-execution quality samples; the oldest sample
// is dropped once capacity is reached.
class ExecutionMetrics {
public:
    explicit ExecutionMetrics(std::size_t capacity = 1000);

    void record(const ExecutionSample& s);

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::vector<ExecutionSample> samples() const;
    ExecutionAverages averages() const;

private:
    std::size_t capacity_;
    std::deque<ExecutionSample> samples_;
    mutable std::mutex mtx_;
};

}
