#include "config.hpp"
#include "errors.hpp"
#include "path_pattern.hpp"

namespace pathtrie {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "debug")                  return spdlog::level::debug;
    if (s == "info")                   return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error")                  return spdlog::level::err;
    return std::nullopt;
}

config load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw config_error("config: cannot load '" + path + "': " + e.what());
    }
    return parse_config(root);
}

config parse_config(const YAML::Node& root) {
    config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw config_error("config: root must be a map");

    try {
        if (auto subs = root["subscriptions"]) {
            if (!subs.IsSequence()) throw config_error("config: 'subscriptions' must be a list");
            for (const auto& item : subs) {
                if (!item["pattern"])   throw config_error("config: subscription without 'pattern'");
                if (!item["client_id"]) throw config_error("config: subscription without 'client_id'");

                subscription_def def;
                def.pattern = item["pattern"].as<std::string>();
                def.client_id = item["client_id"].as<std::string>();
                try {
                    parse_path(def.pattern);
                } catch (const invalid_path& e) {
                    throw config_error("config: invalid pattern '" + def.pattern + "': " + e.what());
                }
                if (def.client_id.empty()) throw config_error("config: empty 'client_id'");
                cfg.subscriptions.push_back(std::move(def));
            }
        }

        if (auto n = root["snapshot_file"]) cfg.snapshot_file = n.as<std::string>();

        if (auto n = root["log_level"]) {
            cfg.log_level = n.as<std::string>();
            if (!parse_log_level(cfg.log_level)) {
                throw config_error("config: invalid 'log_level': " + cfg.log_level);
            }
        }
    } catch (const YAML::Exception& e) {
        throw config_error(std::string("config: ") + e.what());
    }

    return cfg;
}

} // namespace pathtrie
