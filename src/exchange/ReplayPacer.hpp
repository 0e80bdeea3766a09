#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace tandem {

// ---------------------------------------------------------------------------
// Keeps several ReplayFeeds, each on its own FeedSession thread, in global
// timestamp order. A feed may hand out a line stamped ts only once every
// other active feed has reached ts, so the feed channel sees the venues
// merged by ts (ties in any order).
//
// Each slot publishes a lower bound on the ts of its next line: the ts of
// the line it is delivering. A new slot starts at 0, which holds the others
// back until it has peeked its first line. Retired slots stop counting.
// ---------------------------------------------------------------------------
class ReplayPacer {
public:
    std::size_t enroll();

    // Blocks until no other active slot is behind ts. Returns false once the
    // pacer is closed.
    bool wait_turn(std::size_t slot, uint64_t ts_ns);

    void resume(std::size_t slot);
    void retire(std::size_t slot);

    // Releases every waiter; wait_turn() no longer blocks.
    void close();

    std::size_t active() const;

private:
    struct Slot {
        uint64_t bound{0};
        bool active{true};
    };

    bool clear_locked(std::size_t slot, uint64_t ts_ns) const;

    std::vector<Slot> slots_;
    bool closed_{false};
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

}
