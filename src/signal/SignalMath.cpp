#include "signal/SignalMath.hpp"
#include <algorithm>
#include <cmath>

using namespace tandem;

SpreadSeries::SpreadSeries(std::size_t momentum_window, std::size_t volume_lookback)
    : momentum_window_(momentum_window)
    , volume_lookback_(volume_lookback) {}

void SpreadSeries::push(double spread, double volume) {
    spreads_.push_back(spread);
    while (spreads_.size() > momentum_window_ + 1) spreads_.pop_front();

    volumes_.push_back(volume);
    while (volumes_.size() > volume_lookback_) volumes_.pop_front();
}

double SpreadSeries::momentum() const {
    double sum = 0.0;
    for (std::size_t i = 1; i < spreads_.size(); ++i) {
        const double base = spreads_[i - 1];
        if (base == 0.0) continue;
        sum += (spreads_[i] - base) / base;
    }
    return sum;
}

double SpreadSeries::avg_volume() const {
    if (volumes_.empty()) return 0.0;
    if (volumes_.size() < volume_lookback_) return volumes_.back();
    double sum = 0.0;
    for (double v : volumes_) sum += v;
    return sum / static_cast<double>(volumes_.size());
}

double tandem::volume_ratio(double volume, double avg_volume) {
    return avg_volume > 0.0 ? volume / avg_volume : 1.0;
}

double tandem::volume_factor(double volume, double avg_volume) {
    return 1.0 / (1.0 + std::log1p(volume_ratio(volume, avg_volume)));
}

double tandem::time_of_day_factor(const SignalConfig& cfg, uint64_t ts_ns) {
    constexpr uint64_t NS_PER_HOUR = 3'600'000'000'000ULL;
    const int hour = static_cast<int>((ts_ns / NS_PER_HOUR) % 24);

    if (hour >= cfg.active_hour_start && hour <= cfg.active_hour_end) return cfg.active_factor;
    if (hour >= cfg.quiet_hour_start && hour <= cfg.quiet_hour_end) return cfg.quiet_factor;
    return 1.0;
}

double tandem::adaptive_threshold(const SignalConfig& cfg, double volatility,
                                  double vol_factor, double tod_factor, double momentum) {
    double t = cfg.base_threshold
             * (1.0 + volatility * cfg.vol_impact)
             * vol_factor
             * tod_factor
             * (1.0 + 0.1 * std::fabs(momentum));
    return std::clamp(t, cfg.threshold_min, cfg.threshold_max);
}

double tandem::vol_adjustment(const SignalConfig& cfg, const WindowBuffer& buf) {
    const double full = buf.stddev();
    if (full <= 0.0) return 1.0;
    const double recent = buf.recent_stddev(cfg.vol_window);
    return std::clamp(recent / full, cfg.vol_adjust_min, cfg.vol_adjust_max);
}

SignalReading tandem::compute_reading(const SignalConfig& cfg, const WindowBuffer& buf,
                                      double spread, double volume, uint64_t ts_ns,
                                      const SpreadSeries& series) {
    SignalReading r;
    r.window   = buf.spec();
    r.samples  = buf.size();
    r.momentum = series.momentum();

    if (buf.size() < 2) {
        r.threshold = cfg.base_threshold;
        return r;
    }

    const double avg_vol = series.avg_volume();
    r.volatility = buf.return_volatility();
    r.threshold  = adaptive_threshold(cfg, r.volatility,
                                      volume_factor(volume, avg_vol),
                                      time_of_day_factor(cfg, ts_ns),
                                      r.momentum);

    const double sd = buf.stddev();
    if (sd > 0.0) {
        r.zscore = (spread - buf.mean()) / (sd * vol_adjustment(cfg, buf));
        r.volume_weighted_zscore = r.zscore * volume_ratio(volume, avg_vol);
    }
    r.strength = std::fabs(r.volume_weighted_zscore);
    return r;
}
