#include "exchange/ReplayFeed.hpp"
#include "exchange/FeedMessage.hpp"
#include <cstdint>
#include <stdexcept>
#include <utility>

using namespace tandem;

ReplayFeed::ReplayFeed(std::string venue, std::string path, ReplayPacer* pacer)
    : venue_(std::move(venue))
    , path_(std::move(path))
    , pacer_(pacer) {
    std::ifstream check(path_);
    if (!check.is_open())
        throw std::runtime_error("cannot open replay file: " + path_);
    if (pacer_) slot_ = pacer_->enroll();
}

void ReplayFeed::connect() {
    in_.close();
    in_.clear();
    in_.open(path_);
    if (!in_.is_open()) throw ConnectionLost("cannot open replay file: " + path_);
    if (pacer_) pacer_->resume(slot_);

    std::string skip;
    for (std::size_t i = 0; i < lines_read_ && std::getline(in_, skip); ++i) {}
}

BookDepth ReplayFeed::snapshot(const std::string&) {
    return BookDepth{};
}

std::optional<std::string> ReplayFeed::read() {
    if (!in_.is_open()) throw ConnectionLost("replay file not open: " + path_);

    std::string line;
    while (std::getline(in_, line)) {
        ++lines_read_;
        if (line.empty() || line[0] == '#') continue;
        if (pacer_) {
            bool parsed = true;
            uint64_t ts = 0;
            try {
                ts = FeedMessage::parse(line).ts_ns;
            } catch (const FeedProtocolError&) {
                parsed = false;
            }
            // A closed pacer ends the replay.
            if (parsed && !pacer_->wait_turn(slot_, ts)) return std::nullopt;
        }
        return line;
    }
    if (pacer_) pacer_->retire(slot_);
    return std::nullopt;
}

void ReplayFeed::close() {
    if (in_.is_open()) in_.close();
    if (pacer_) pacer_->retire(slot_);
}
