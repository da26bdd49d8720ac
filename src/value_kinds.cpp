#include "value_kinds.hpp"
#include <algorithm>
#include <vector>

namespace pathtrie {

listener_map make_listener_map() {
    return listener_map(
        [] { return std::unordered_set<std::string>{}; },
        [](const std::string& v, std::unordered_set<std::string>& s) { s.insert(v); },
        [](const std::string& v, std::unordered_set<std::string>& s) { s.erase(v); });
}

subscription_map make_subscription_map() {
    return subscription_map(
        [] { return std::set<uint64_t>{}; },
        [](uint64_t v, std::set<uint64_t>& s) { s.insert(v); },
        [](uint64_t v, std::set<uint64_t>& s) { s.erase(v); });
}

deletion_map make_deletion_map() {
    return deletion_map(
        [] { return std::set<time_range>{}; },
        merge_time_range,
        split_time_range);
}

void merge_time_range(const time_range& range, std::set<time_range>& ranges) {
    time_range merged = range;
    for (auto it = ranges.begin(); it != ranges.end();) {
        if (it->joinable(merged)) {
            merged.start = std::min(merged.start, it->start);
            merged.end = std::max(merged.end, it->end);
            it = ranges.erase(it);
        } else {
            ++it;
        }
    }
    ranges.insert(merged);
}

void split_time_range(const time_range& range, std::set<time_range>& ranges) {
    std::vector<time_range> remainders;
    for (auto it = ranges.begin(); it != ranges.end();) {
        if (!it->overlaps(range)) {
            ++it;
            continue;
        }
        if (it->start < range.start) remainders.push_back({it->start, range.start - 1});
        if (it->end > range.end) remainders.push_back({range.end + 1, it->end});
        it = ranges.erase(it);
    }
    ranges.insert(remainders.begin(), remainders.end());
}

} // namespace pathtrie
