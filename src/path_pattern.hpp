#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pathtrie {

// A path is already split into segments; the index never parses text.
using path = std::vector<std::string>;

inline constexpr std::string_view one_level_wildcard = "*";
inline constexpr std::string_view multi_level_wildcard = "**";
inline constexpr char path_separator = '.';

// Split dotted text into segments. A segment wrapped in backquotes may
// contain dots. Throws invalid_path on empty input, empty segments or an
// unterminated backquote.
path parse_path(std::string_view text);

// Inverse of parse_path.
std::string join_path(const path& p);

bool is_wildcard(std::string_view segment);

// True when no segment is a wildcard.
bool is_concrete(const path& p);

// Throws invalid_path for zero segments.
void validate_pattern(const path& p);

// Throws invalid_path for zero segments or any wildcard segment.
void validate_concrete(const path& p);

// Device path plus one trailing measurement.
path append_segment(const path& p, const std::string& segment);

} // namespace pathtrie
