#include "value_serializer.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

namespace pathtrie {

namespace {

nlohmann::json decode(std::span<const std::uint8_t> bytes) {
    try {
        return nlohmann::json::from_msgpack(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::exception& e) {
        throw serialization_error(std::string("malformed value: ") + e.what());
    }
}

} // anonymous namespace

std::vector<std::uint8_t> string_serializer::serialize(const std::string& value) const {
    return nlohmann::json::to_msgpack(nlohmann::json(value));
}

std::string string_serializer::deserialize(std::span<const std::uint8_t> bytes) const {
    auto j = decode(bytes);
    if (!j.is_string()) throw serialization_error("expected a string value");
    return j.get<std::string>();
}

std::vector<std::uint8_t> id_serializer::serialize(uint64_t value) const {
    return nlohmann::json::to_msgpack(nlohmann::json(value));
}

uint64_t id_serializer::deserialize(std::span<const std::uint8_t> bytes) const {
    auto j = decode(bytes);
    if (!j.is_number_unsigned()) throw serialization_error("expected an unsigned id");
    return j.get<uint64_t>();
}

std::vector<std::uint8_t> time_range_serializer::serialize(const time_range& value) const {
    return nlohmann::json::to_msgpack(nlohmann::json::array({value.start, value.end}));
}

time_range time_range_serializer::deserialize(std::span<const std::uint8_t> bytes) const {
    auto j = decode(bytes);
    if (!j.is_array() || j.size() != 2 || !j[0].is_number_integer() || !j[1].is_number_integer()) {
        throw serialization_error("expected [start, end]");
    }
    time_range r{j[0].get<int64_t>(), j[1].get<int64_t>()};
    if (r.start > r.end) throw serialization_error("time range start after end");
    return r;
}

} // namespace pathtrie
