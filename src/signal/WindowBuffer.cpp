#include "signal/WindowBuffer.hpp"
#include <cmath>
#include <vector>

using namespace tandem;

namespace {

double pop_std(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    double sum = 0.0;
    for (double x : v) sum += x;
    const double m = sum / static_cast<double>(v.size());
    double acc = 0.0;
    for (double x : v) acc += (x - m) * (x - m);
    return std::sqrt(acc / static_cast<double>(v.size()));
}

}

std::string WindowSpec::label() const {
    if (kind == WindowKind::COUNT) return "n" + std::to_string(length);
    return std::to_string(length / 1'000'000'000ULL) + "s";
}

WindowBuffer::WindowBuffer(WindowSpec spec)
    : spec_(spec) {}

void WindowBuffer::evict(uint64_t ts_ns) {
    if (spec_.kind == WindowKind::COUNT) {
        while (samples_.size() > spec_.length) samples_.pop_front();
        return;
    }
    if (ts_ns < spec_.length) return;
    const uint64_t cutoff = ts_ns - spec_.length;
    while (!samples_.empty() && samples_.front().ts_ns < cutoff)
        samples_.pop_front();
}

void WindowBuffer::push(uint64_t ts_ns, double value) {
    if (spec_.kind == WindowKind::DURATION) evict(ts_ns);
    samples_.push_back({ts_ns, value});
    if (spec_.kind == WindowKind::COUNT) evict(ts_ns);
}

double WindowBuffer::mean() const {
    if (samples_.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& s : samples_) sum += s.value;
    return sum / static_cast<double>(samples_.size());
}

double WindowBuffer::stddev() const {
    if (samples_.size() < 2) return 0.0;
    const double m = mean();
    double acc = 0.0;
    for (const auto& s : samples_) acc += (s.value - m) * (s.value - m);
    return std::sqrt(acc / static_cast<double>(samples_.size()));
}

double WindowBuffer::recent_stddev(std::size_t n) const {
    const std::size_t take = n < samples_.size() ? n : samples_.size();
    std::vector<double> v;
    v.reserve(take);
    for (std::size_t i = samples_.size() - take; i < samples_.size(); ++i)
        v.push_back(samples_[i].value);
    return pop_std(v);
}

double WindowBuffer::return_volatility() const {
    std::vector<double> rets;
    if (samples_.size() > 1) rets.reserve(samples_.size() - 1);
    for (std::size_t i = 1; i < samples_.size(); ++i) {
        const double base = samples_[i - 1].value;
        if (base == 0.0) continue;
        rets.push_back((samples_[i].value - base) / base);
    }
    return pop_std(rets);
}
