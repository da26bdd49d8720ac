#pragma once

#include <stdexcept>
#include <string>

namespace pathtrie {

class error : public std::runtime_error {
public:
    explicit error(const std::string& what) : std::runtime_error(what) {}
};

// append/remove on a map built without the matching merge/split function.
class unsupported_operation : public error {
public:
    explicit unsupported_operation(const std::string& what) : error(what) {}
};

// Zero-segment path, malformed path text, or a wildcard where a concrete
// path is required.
class invalid_path : public error {
public:
    explicit invalid_path(const std::string& what) : error(what) {}
};

class serialization_error : public error {
public:
    explicit serialization_error(const std::string& what) : error(what) {}
};

class config_error : public error {
public:
    explicit config_error(const std::string& what) : error(what) {}
};

} // namespace pathtrie
