#include "telemetry/TelemetryState.hpp"
#include <sstream>
#include <utility>

using namespace tandem;

const char* tandem::counter_name(Counter c) {
    switch (c) {
        case Counter::DATA_UNAVAILABLE:    return "data_unavailable";
        case Counter::COOLDOWN:            return "cooldown";
        case Counter::SPREAD_REJECT:       return "spread_reject";
        case Counter::NO_SIGNAL:           return "no_signal";
        case Counter::FEE_REJECT:          return "fee_reject";
        case Counter::RISK_REJECT:         return "risk_reject";
        case Counter::LIQUIDITY_REJECT:    return "liquidity_reject";
        case Counter::IMPACT_REJECT:       return "impact_reject";
        case Counter::LOW_FILL_RETRY:      return "low_fill_retry";
        case Counter::ORDER_ABORT:         return "order_abort";
        case Counter::LEG_FAILURE:         return "leg_failure";
        case Counter::NAKED_EXPOSURE:      return "naked_exposure";
        case Counter::PROTOCOL_ERROR:      return "protocol_error";
        case Counter::RECONNECT:           return "reconnect";
        case Counter::STOP_LOSS_EXIT:      return "stop_loss_exit";
        case Counter::MEAN_REVERSION_EXIT: return "mean_reversion_exit";
        case Counter::TRADES:              return "trades";
        case Counter::COUNT:               break;
    }
    return "unknown";
}

void TelemetryState::increment(Counter c, uint64_t n) {
    counters_[static_cast<std::size_t>(c)].fetch_add(n);
}

uint64_t TelemetryState::count(Counter c) const {
    return counters_[static_cast<std::size_t>(c)].load();
}

void TelemetryState::publish(nlohmann::json snapshot) {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshot_ = std::move(snapshot);
}

nlohmann::json TelemetryState::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return snapshot_;
}

std::string TelemetryState::to_json() const {
    nlohmann::json out = snapshot();

    nlohmann::json counters = nlohmann::json::object();
    for (std::size_t i = 0; i < static_cast<std::size_t>(Counter::COUNT); ++i)
        counters[counter_name(static_cast<Counter>(i))] = counters_[i].load();
    out["counters"] = counters;

    return out.dump();
}

std::string TelemetryState::to_prometheus() const {
    std::ostringstream out;
    for (std::size_t i = 0; i < static_cast<std::size_t>(Counter::COUNT); ++i) {
        out << "tandem_" << counter_name(static_cast<Counter>(i)) << "_total "
            << counters_[i].load() << "\n";
    }

    const nlohmann::json snap = snapshot();
    if (snap.contains("cumulative_pnl"))
        out << "tandem_cumulative_pnl " << snap["cumulative_pnl"].get<double>() << "\n";
    if (snap.contains("win_rate"))
        out << "tandem_win_rate " << snap["win_rate"].get<double>() << "\n";
    if (snap.contains("risk") && snap["risk"].contains("kill_switch"))
        out << "tandem_kill_switch " << (snap["risk"]["kill_switch"].get<bool>() ? 1 : 0) << "\n";

    if (snap.contains("symbols")) {
        for (const auto& item : snap["symbols"].items()) {
            const auto& s = item.value();
            out << "tandem_symbol_trades{symbol=\"" << item.key() << "\"} "
                << s.value("trades", 0) << "\n"
                << "tandem_symbol_pnl{symbol=\"" << item.key() << "\"} "
                << s.value("pnl", 0.0) << "\n";
        }
    }
    if (snap.contains("fees")) {
        for (const auto& item : snap["fees"].items()) {
            out << "tandem_fees{venue=\"" << item.key() << "\"} "
                << item.value().get<double>() << "\n";
        }
    }
    return out.str();
}
