#pragma once

#include "errors.hpp"
#include "path_pattern.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace pathtrie {

// Registrations file format (MessagePack):
//   {"version": 1, "entries": [{"pattern": ["root", "sg", "*"], "value": <bin>}]}
// Values are encoded with the map's own serializer. This persists what was
// registered, not the shape of the trie.

inline constexpr int registrations_version = 1;

// Whole-file helpers. Both throw serialization_error on I/O failure.
std::vector<std::uint8_t> read_file_bytes(const std::string& file);
void write_file_bytes(const std::string& file, std::span<const std::uint8_t> bytes);

// Parse a MessagePack document and check its version field.
nlohmann::json decode_document(std::span<const std::uint8_t> bytes);

// Write every (pattern, value) registration of `map` to `file`.
template <typename Map>
void save_registrations(const Map& map, const std::string& file) {
    auto entries = nlohmann::json::array();
    map.for_each([&](const path& pattern, const auto& value) {
        entries.push_back({
            {"pattern", pattern},
            {"value", nlohmann::json::binary(map.serializer().serialize(value))}
        });
    });

    nlohmann::json doc = {{"version", registrations_version}, {"entries", std::move(entries)}};
    auto bytes = nlohmann::json::to_msgpack(doc);
    write_file_bytes(file, bytes);
}

// Append every registration stored in `file` to `map`. Returns the number
// of entries loaded. Nothing is appended if the document is malformed.
template <typename Map>
std::size_t load_registrations(Map& map, const std::string& file) {
    auto doc = decode_document(read_file_bytes(file));

    auto it = doc.find("entries");
    if (it == doc.end() || !it->is_array()) {
        throw serialization_error("registrations: 'entries' must be a list");
    }

    std::vector<std::pair<path, typename Map::value_type>> decoded;
    decoded.reserve(it->size());
    for (const auto& entry : *it) {
        if (!entry.is_object() || !entry.contains("pattern") || !entry.contains("value") ||
            !entry["pattern"].is_array() || !entry["value"].is_binary()) {
            throw serialization_error("registrations: malformed entry");
        }
        path pattern;
        for (const auto& seg : entry["pattern"]) {
            if (!seg.is_string()) throw serialization_error("registrations: segment is not a string");
            if (seg.get_ref<const std::string&>().empty()) {
                throw serialization_error("registrations: empty segment");
            }
            pattern.push_back(seg.get<std::string>());
        }
        if (pattern.empty()) throw serialization_error("registrations: empty pattern");
        const auto& bin = entry["value"].get_binary();
        decoded.emplace_back(std::move(pattern),
                             map.serializer().deserialize(std::span<const std::uint8_t>(bin.data(), bin.size())));
    }

    for (const auto& [pattern, value] : decoded) map.append(pattern, value);
    return decoded.size();
}

} // namespace pathtrie
