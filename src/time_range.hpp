#pragma once

#include <cstdint>
#include <limits>
#include <tuple>

namespace pathtrie {

// Inclusive [start, end] range of timestamps, e.g. a deletion applied to
// every series a pattern matches.
struct time_range {
    int64_t start = std::numeric_limits<int64_t>::min();
    int64_t end = std::numeric_limits<int64_t>::max();

    bool contains(int64_t t) const { return start <= t && t <= end; }

    // Overlapping or directly adjacent ([1,3] and [4,9]).
    bool joinable(const time_range& other) const {
        if (end < other.start) return end + 1 == other.start;
        if (other.end < start) return other.end + 1 == start;
        return true;
    }

    bool overlaps(const time_range& other) const {
        return start <= other.end && other.start <= end;
    }

    friend bool operator==(const time_range& a, const time_range& b) {
        return a.start == b.start && a.end == b.end;
    }
    friend bool operator!=(const time_range& a, const time_range& b) { return !(a == b); }
    friend bool operator<(const time_range& a, const time_range& b) {
        return std::tie(a.start, a.end) < std::tie(b.start, b.end);
    }
};

} // namespace pathtrie
