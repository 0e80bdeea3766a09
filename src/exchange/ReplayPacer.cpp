#include "exchange/ReplayPacer.hpp"
#include <stdexcept>

using namespace tandem;

std::size_t ReplayPacer::enroll() {
    std::lock_guard<std::mutex> lock(mtx_);
    slots_.push_back(Slot{});
    return slots_.size() - 1;
}

bool ReplayPacer::clear_locked(std::size_t slot, uint64_t ts_ns) const {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (i == slot || !slots_[i].active) continue;
        if (slots_[i].bound < ts_ns) return false;
    }
    return true;
}

bool ReplayPacer::wait_turn(std::size_t slot, uint64_t ts_ns) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (slot >= slots_.size()) throw std::out_of_range("unknown replay slot");

    Slot& s = slots_[slot];
    s.active = true;
    if (ts_ns > s.bound) s.bound = ts_ns;
    cv_.notify_all();

    cv_.wait(lock, [&] { return closed_ || clear_locked(slot, ts_ns); });
    return !closed_;
}

void ReplayPacer::resume(std::size_t slot) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (slot >= slots_.size()) throw std::out_of_range("unknown replay slot");
    slots_[slot].active = true;
}

void ReplayPacer::retire(std::size_t slot) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (slot >= slots_.size()) throw std::out_of_range("unknown replay slot");
        slots_[slot].active = false;
    }
    cv_.notify_all();
}

void ReplayPacer::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::size_t ReplayPacer::active() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = 0;
    for (const auto& s : slots_)
        if (s.active) ++n;
    return n;
}
