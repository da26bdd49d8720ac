#pragma once

#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>
#include <vector>

namespace pathtrie {

// One subscription registered at startup.
struct subscription_def {
    std::string pattern;
    std::string client_id;
};

struct config {
    // Subscriptions registered before any query is answered
    std::vector<subscription_def> subscriptions;

    // Optional snapshot of the subscription index, restored on start
    std::string snapshot_file;

    // Operational
    std::string log_level = "info";
};

// Parse config from YAML file. Throws config_error on error.
config load_config(const std::string& path);

// Parse an already loaded YAML document.
config parse_config(const YAML::Node& root);

// Parse a log level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace pathtrie
