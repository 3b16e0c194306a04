#pragma once

#include "gesture_types.hpp"
#include <chrono>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace landmarks {

// One frame from the external hand landmark detector
struct LandmarkFrame {
    double timestamp;                       // Monotonic seconds
    bool has_hand;
    std::vector<gesture::Point> landmarks;  // 21 points when has_hand

    LandmarkFrame() : timestamp(0.0), has_hand(false) {}
};

struct ReaderStats {
    uint64_t lines_read{0};
    uint64_t frames_delivered{0};
    uint64_t malformed_lines{0};

    void reset() noexcept {
        lines_read = 0;
        frames_delivered = 0;
        malformed_lines = 0;
    }
};

// Reads line-delimited JSON landmark frames:
//   {"t": 0.033, "landmarks": [[x, y], [x, y, z], ...]}
//   {"t": 0.066, "landmarks": null}                      (no hand)
//   {"t": 0.100, "hands": [{"lmList": [[x, y, z], ...]}]} (first hand used)
// A missing "t" is replaced by seconds since the reader was created.
class LandmarkReader {
public:
    explicit LandmarkReader(std::istream& in, bool verbose = false);

    // False at end of stream. Malformed lines come back as no-hand frames.
    bool next(LandmarkFrame& frame);

    const ReaderStats& get_stats() const { return stats_; }

private:
    std::istream& in_;
    bool verbose_;
    ReaderStats stats_;
    double last_timestamp_{0.0};
    std::chrono::steady_clock::time_point start_;

    double clock_seconds() const;
    bool parse_line(const std::string& line, LandmarkFrame& frame);
};

// Serializes a frame in the format LandmarkReader accepts (no trailing newline)
std::string to_json_line(const LandmarkFrame& frame);

} // namespace landmarks
