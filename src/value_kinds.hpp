#pragma once

#include "pattern_tree_map.hpp"
#include "time_range.hpp"
#include "value_serializer.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <unordered_set>

namespace pathtrie {

// Listener handles (e.g. trigger names): plain insert / erase.
using listener_map = pattern_tree_map<std::string, string_serializer>;

// Subscription ids. Ordered so that query results come back sorted.
using subscription_map = pattern_tree_map<uint64_t, id_serializer, std::set<uint64_t>>;

// Deleted time ranges. Ranges stored on one node are kept disjoint and
// non-adjacent: appending collapses, removing subtracts.
using deletion_map = pattern_tree_map<time_range, time_range_serializer, std::set<time_range>>;

listener_map make_listener_map();
subscription_map make_subscription_map();
deletion_map make_deletion_map();

// Merge `range` into `ranges`, collapsing every range it overlaps or touches.
void merge_time_range(const time_range& range, std::set<time_range>& ranges);

// Subtract `range` from every stored range, splitting where needed.
void split_time_range(const time_range& range, std::set<time_range>& ranges);

} // namespace pathtrie
