#include "path_pattern.hpp"
#include "errors.hpp"
#include <algorithm>

namespace pathtrie {

path parse_path(std::string_view text) {
    if (text.empty()) throw invalid_path("path is empty");

    path segments;
    std::size_t pos = 0;
    while (true) {
        std::string segment;
        if (pos < text.size() && text[pos] == '`') {
            auto close = text.find('`', pos + 1);
            if (close == std::string_view::npos) {
                throw invalid_path("unterminated backquote in '" + std::string(text) + "'");
            }
            segment = std::string(text.substr(pos + 1, close - pos - 1));
            pos = close + 1;
            if (pos < text.size() && text[pos] != path_separator) {
                throw invalid_path("unexpected character after backquoted segment in '" +
                                   std::string(text) + "'");
            }
        } else {
            auto dot = text.find(path_separator, pos);
            if (dot == std::string_view::npos) dot = text.size();
            segment = std::string(text.substr(pos, dot - pos));
            pos = dot;
        }

        if (segment.empty()) {
            throw invalid_path("empty segment in '" + std::string(text) + "'");
        }
        segments.push_back(std::move(segment));

        if (pos == text.size()) break;
        ++pos; // skip separator
        if (pos == text.size()) {
            throw invalid_path("trailing separator in '" + std::string(text) + "'");
        }
    }
    return segments;
}

std::string join_path(const path& p) {
    std::string out;
    for (std::size_t i = 0; i < p.size(); ++i) {
        if (i > 0) out += path_separator;
        if (p[i].find(path_separator) != std::string::npos) {
            out += '`';
            out += p[i];
            out += '`';
        } else {
            out += p[i];
        }
    }
    return out;
}

bool is_wildcard(std::string_view segment) {
    return segment == one_level_wildcard || segment == multi_level_wildcard;
}

bool is_concrete(const path& p) {
    return std::none_of(p.begin(), p.end(),
                        [](const std::string& s) { return is_wildcard(s); });
}

void validate_pattern(const path& p) {
    if (p.empty()) throw invalid_path("path has no segments");
}

void validate_concrete(const path& p) {
    validate_pattern(p);
    if (!is_concrete(p)) {
        throw invalid_path("wildcard in concrete path '" + join_path(p) + "'");
    }
}

path append_segment(const path& p, const std::string& segment) {
    path out;
    out.reserve(p.size() + 1);
    out.insert(out.end(), p.begin(), p.end());
    out.push_back(segment);
    return out;
}

} // namespace pathtrie
