#pragma once
#include <cstddef>
#include <fstream>
#include <string>

#include "exchange/MarketDataAdapter.hpp"
#include "exchange/ReplayPacer.hpp"

namespace tandem {

// ---------------------------------------------------------------------------
// MarketDataAdapter over a recorded JSON-lines file of normalized increments,
// one FeedMessage per line. Snapshots are empty; a reconnect resumes after
// the last line delivered. End of file ends the stream.
//
// Feeds sharing a ReplayPacer hand out lines in global ts order; lines that
// do not parse skip the pacer and are left for the session to drop.
// ---------------------------------------------------------------------------
class ReplayFeed : public MarketDataAdapter {
public:
    // Throws std::runtime_error if the file cannot be opened.
    ReplayFeed(std::string venue, std::string path, ReplayPacer* pacer = nullptr);

    const std::string& venue() const override { return venue_; }
    void connect() override;
    BookDepth snapshot(const std::string& symbol) override;
    std::optional<std::string> read() override;
    void close() override;

    std::size_t lines_read() const { return lines_read_; }

private:
    std::string venue_;
    std::string path_;
    std::ifstream in_;
    std::size_t lines_read_{0};

    ReplayPacer* pacer_;
    std::size_t slot_{0};
};

}
