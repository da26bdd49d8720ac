#pragma once

#include "time_range.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pathtrie {

// Per-value serializers handed to pattern_tree_map. Each one turns a value
// into bytes and back; decoding bad input throws serialization_error.
// Values are encoded as MessagePack.

struct string_serializer {
    std::vector<std::uint8_t> serialize(const std::string& value) const;
    std::string deserialize(std::span<const std::uint8_t> bytes) const;
};

struct id_serializer {
    std::vector<std::uint8_t> serialize(uint64_t value) const;
    uint64_t deserialize(std::span<const std::uint8_t> bytes) const;
};

// Encoded as a two-element array [start, end].
struct time_range_serializer {
    std::vector<std::uint8_t> serialize(const time_range& value) const;
    time_range deserialize(std::span<const std::uint8_t> bytes) const;
};

} // namespace pathtrie
