#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace tandem {

enum class WindowKind { COUNT, DURATION };

// Window identity: either the last N samples or the samples of the last
// `length` nanoseconds.
struct WindowSpec {
    WindowKind kind{WindowKind::DURATION};
    uint64_t length{0};

    static WindowSpec count(std::size_t n) { return {WindowKind::COUNT, n}; }
    static WindowSpec duration_ns(uint64_t ns) { return {WindowKind::DURATION, ns}; }

    std::string label() const;

    bool operator<(const WindowSpec& o) const {
        if (kind != o.kind) return kind < o.kind;
        return length < o.length;
    }
    bool operator==(const WindowSpec& o) const {
        return kind == o.kind && length == o.length;
    }
};

struct WindowSample {
    uint64_t ts_ns;
    double value;
};

// ---------------------------------------------------------------------------
// Time-ordered spread samples for one (symbol, window). Count windows drop
// the oldest sample past capacity; duration windows drop samples older than
// `ts - length` before each append.
// ---------------------------------------------------------------------------
class WindowBuffer {
public:
    explicit WindowBuffer(WindowSpec spec);

    void push(uint64_t ts_ns, double value);

    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    const WindowSpec& spec() const { return spec_; }
    const std::deque<WindowSample>& samples() const { return samples_; }

    // Population statistics over the buffered values.
    double mean() const;
    double stddev() const;

    // Population std of the most recent n values (all values if fewer).
    double recent_stddev(std::size_t n) const;

    // Population std of the fractional returns between consecutive values.
    // Returns whose base value is 0 are skipped.
    double return_volatility() const;

private:
    void evict(uint64_t ts_ns);

    WindowSpec spec_;
    std::deque<WindowSample> samples_;
};

}
