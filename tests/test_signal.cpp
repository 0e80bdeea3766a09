#include <gtest/gtest.h>
#include "signal/MultiWindowSignal.hpp"
#include "signal/SignalMath.hpp"
#include "signal/SignalSource.hpp"
#include "signal/SingleWindowSignal.hpp"
#include "signal/WindowBuffer.hpp"

#include <cmath>

using namespace tandem;

namespace {
constexpr uint64_t SEC  = 1'000'000'000ULL;
constexpr uint64_t HOUR = 3600 * SEC;
// 2026-01-05 00:00:00 UTC
constexpr uint64_t DAY0 = 1767571200ULL * SEC;

SignalConfig single_cfg(std::size_t n) {
    SignalConfig c;
    c.mode = SignalMode::SINGLE;
    c.count_window = n;
    return c;
}

SignalReading only(const SignalReadings& r) {
    EXPECT_EQ(r.size(), 1u);
    return r.begin()->second;
}
}

// ---------------------------------------------------------------------------
// WindowBuffer
// ---------------------------------------------------------------------------
TEST(WindowBufferTest, CountWindowKeepsLastN) {
    WindowBuffer buf(WindowSpec::count(3));
    for (int i = 1; i <= 5; ++i) buf.push(static_cast<uint64_t>(i), i);
    ASSERT_EQ(buf.size(), 3u);
    EXPECT_DOUBLE_EQ(buf.samples().front().value, 3.0);
    EXPECT_DOUBLE_EQ(buf.mean(), 4.0);
}

TEST(WindowBufferTest, DurationWindowEvictsExpiredSamples) {
    WindowBuffer buf(WindowSpec::duration_ns(15 * SEC));
    buf.push(100 * SEC, 1.0);
    buf.push(110 * SEC, 2.0);
    buf.push(115 * SEC, 3.0);
    EXPECT_EQ(buf.size(), 3u);  // 100s is exactly at the cutoff

    buf.push(120 * SEC, 4.0);
    ASSERT_EQ(buf.size(), 3u);
    EXPECT_DOUBLE_EQ(buf.samples().front().value, 2.0);
}

TEST(WindowBufferTest, PopulationStddev) {
    WindowBuffer buf(WindowSpec::count(10));
    buf.push(1, 2.0);
    buf.push(2, 4.0);
    buf.push(3, 4.0);
    buf.push(4, 4.0);
    buf.push(5, 5.0);
    buf.push(6, 5.0);
    buf.push(7, 7.0);
    buf.push(8, 9.0);
    EXPECT_DOUBLE_EQ(buf.mean(), 5.0);
    EXPECT_DOUBLE_EQ(buf.stddev(), 2.0);
    EXPECT_DOUBLE_EQ(buf.recent_stddev(2), 1.0);
}

TEST(WindowBufferTest, ReturnVolatilitySkipsZeroBase) {
    WindowBuffer buf(WindowSpec::count(10));
    buf.push(1, 100.0);
    buf.push(2, 110.0);
    buf.push(3, 99.0);
    EXPECT_NEAR(buf.return_volatility(), 0.1, 1e-12);

    WindowBuffer zero(WindowSpec::count(10));
    zero.push(1, 0.0);
    zero.push(2, 5.0);
    EXPECT_DOUBLE_EQ(zero.return_volatility(), 0.0);
}

TEST(WindowBufferTest, Labels) {
    EXPECT_EQ(WindowSpec::count(100).label(), "n100");
    EXPECT_EQ(WindowSpec::duration_ns(60 * SEC).label(), "60s");
}

// ---------------------------------------------------------------------------
// Z-score
// ---------------------------------------------------------------------------
TEST(SignalTest, IdenticalValuesGiveZeroZ) {
    SingleWindowSignal sig(single_cfg(10));
    for (int i = 0; i < 25; ++i) {
        auto r = only(sig.update(5.0, 1.0, DAY0 + static_cast<uint64_t>(i) * SEC));
        EXPECT_EQ(r.zscore, 0.0);
        EXPECT_EQ(r.volume_weighted_zscore, 0.0);
    }
}

TEST(SignalTest, ThreeSampleWindowUsesPopulationStd) {
    SingleWindowSignal sig(single_cfg(3));
    sig.update(1.0, 1.0, DAY0 + 1 * SEC);
    sig.update(2.0, 1.0, DAY0 + 2 * SEC);
    auto r = only(sig.update(3.0, 1.0, DAY0 + 3 * SEC));
    EXPECT_NEAR(r.zscore, 1.2247, 1e-4);
    EXPECT_EQ(r.direction(), 1);
}

TEST(SignalTest, FirstSampleIsNeutral) {
    SignalConfig cfg = single_cfg(10);
    SingleWindowSignal sig(cfg);
    auto r = only(sig.update(42.0, 1.0, DAY0));
    EXPECT_EQ(r.zscore, 0.0);
    EXPECT_DOUBLE_EQ(r.threshold, cfg.base_threshold);
    EXPECT_EQ(r.samples, 1u);
}

TEST(SignalTest, VolumeWeightingScalesByRecentVolume) {
    SignalConfig cfg = single_cfg(10);
    cfg.volume_lookback = 2;
    SingleWindowSignal sig(cfg);
    sig.update(1.0, 100.0, DAY0 + 20 * HOUR);
    auto r = only(sig.update(2.0, 300.0, DAY0 + 20 * HOUR + SEC));
    // avg volume over the last two = 200, ratio 1.5
    EXPECT_NEAR(r.volume_weighted_zscore, r.zscore * 1.5, 1e-12);
    EXPECT_NEAR(r.strength, std::fabs(r.volume_weighted_zscore), 1e-12);
}

TEST(SignalTest, MultiWindowProducesOneReadingPerWindow) {
    SignalConfig cfg;
    cfg.windows_ns = {15 * SEC, 60 * SEC};
    MultiWindowSignal sig(cfg);
    EXPECT_EQ(sig.windows().size(), 2u);

    SignalReadings last;
    for (int i = 0; i < 30; ++i)
        last = sig.update(static_cast<double>(i % 4), 1.0, DAY0 + static_cast<uint64_t>(i) * SEC);

    ASSERT_EQ(last.size(), 2u);
    const auto& short_w = last.at(WindowSpec::duration_ns(15 * SEC));
    const auto& long_w  = last.at(WindowSpec::duration_ns(60 * SEC));
    EXPECT_EQ(short_w.samples, 16u);  // 14s..29s inclusive
    EXPECT_EQ(long_w.samples, 30u);
}

TEST(SignalTest, FactoryHonoursMode) {
    SignalConfig cfg;
    cfg.mode = SignalMode::SINGLE;
    EXPECT_STREQ(make_signal_source(cfg)->name(), "single");
    cfg.mode = SignalMode::MULTI;
    EXPECT_STREQ(make_signal_source(cfg)->name(), "multi");
}

// ---------------------------------------------------------------------------
// Threshold components
// ---------------------------------------------------------------------------
TEST(SignalMathTest, ThresholdIsClamped) {
    SignalConfig cfg;
    EXPECT_DOUBLE_EQ(adaptive_threshold(cfg, 0.0, 1.0, 1.0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(adaptive_threshold(cfg, 0.0, 0.1, 1.0, 0.0), cfg.threshold_min);
    EXPECT_DOUBLE_EQ(adaptive_threshold(cfg, 100.0, 1.0, 1.0, 0.0), cfg.threshold_max);
    EXPECT_NEAR(adaptive_threshold(cfg, 1.0, 1.0, 1.0, 2.0), 1.3 * 1.2, 1e-12);
}

TEST(SignalMathTest, TimeOfDayUsesUtcHour) {
    SignalConfig cfg;
    EXPECT_DOUBLE_EQ(time_of_day_factor(cfg, DAY0 + 10 * HOUR), 0.9);
    EXPECT_DOUBLE_EQ(time_of_day_factor(cfg, DAY0 + 16 * HOUR + 59 * 60 * SEC), 0.9);
    EXPECT_DOUBLE_EQ(time_of_day_factor(cfg, DAY0 + 2 * HOUR), 1.2);
    EXPECT_DOUBLE_EQ(time_of_day_factor(cfg, DAY0 + 4 * HOUR + 30 * 60 * SEC), 1.2);
    EXPECT_DOUBLE_EQ(time_of_day_factor(cfg, DAY0 + 20 * HOUR), 1.0);
}

TEST(SignalMathTest, VolumeFactor) {
    EXPECT_NEAR(volume_factor(100.0, 100.0), 1.0 / (1.0 + std::log(2.0)), 1e-12);
    EXPECT_DOUBLE_EQ(volume_ratio(5.0, 0.0), 1.0);
    EXPECT_LT(volume_factor(1000.0, 100.0), volume_factor(10.0, 100.0));
}

TEST(SignalMathTest, VolAdjustmentClamped) {
    SignalConfig cfg;
    cfg.vol_window = 2;
    WindowBuffer buf(WindowSpec::count(10));
    for (double v : {0.0, 10.0, 0.0, 10.0, 5.0, 5.0}) buf.push(1, v);
    EXPECT_DOUBLE_EQ(vol_adjustment(cfg, buf), cfg.vol_adjust_min);

    WindowBuffer flat(WindowSpec::count(10));
    flat.push(1, 3.0);
    flat.push(2, 3.0);
    EXPECT_DOUBLE_EQ(vol_adjustment(cfg, flat), 1.0);
}

TEST(SignalMathTest, MomentumSumsRecentReturns) {
    SpreadSeries s(2, 3);
    s.push(1.0, 10.0);
    s.push(2.0, 20.0);
    s.push(4.0, 30.0);
    EXPECT_DOUBLE_EQ(s.momentum(), 2.0);
    EXPECT_DOUBLE_EQ(s.avg_volume(), 20.0);

    s.push(8.0, 40.0);
    EXPECT_DOUBLE_EQ(s.momentum(), 2.0);
    EXPECT_DOUBLE_EQ(s.avg_volume(), 30.0);

    SpreadSeries z(5, 20);
    z.push(0.0, 1.0);
    z.push(1.0, 7.0);
    EXPECT_DOUBLE_EQ(z.momentum(), 0.0);
    EXPECT_DOUBLE_EQ(z.avg_volume(), 7.0);  // fewer than the lookback
}

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------
TEST(SelectSignalTest, PicksLargestQualifyingZ) {
    SignalReadings rs;
    SignalReading a;
    a.window = WindowSpec::duration_ns(15 * SEC);
    a.zscore = 1.5;
    a.threshold = 1.0;
    SignalReading b;
    b.window = WindowSpec::duration_ns(60 * SEC);
    b.zscore = -2.5;
    b.threshold = 1.0;
    SignalReading c;
    c.window = WindowSpec::duration_ns(180 * SEC);
    c.zscore = 4.0;
    c.threshold = 4.5;  // below its own threshold
    rs[a.window] = a;
    rs[b.window] = b;
    rs[c.window] = c;

    auto sel = select_signal(rs);
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->window, b.window);
    EXPECT_EQ(sel->direction(), -1);
}

TEST(SelectSignalTest, NoneWhenNothingQualifies) {
    SignalReadings rs;
    SignalReading r;
    r.window = WindowSpec::count(10);
    r.zscore = 0.0;
    r.threshold = 0.0;
    rs[r.window] = r;
    EXPECT_FALSE(select_signal(rs).has_value());
    EXPECT_FALSE(select_signal(SignalReadings{}).has_value());
}
