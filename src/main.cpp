#include "config.hpp"
#include "errors.hpp"
#include "subscription_index.hpp"
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    cxxopts::Options options("pathtrie",
        "Match concrete paths against registered path-pattern subscriptions");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("q,query", "Concrete path to match (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("d,device", "Device path for a batch query", cxxopts::value<std::string>())
        ("m,measurements", "Comma-separated measurements under --device", cxxopts::value<std::vector<std::string>>())
        ("device-overlap", "Device path for a coarse device-level query", cxxopts::value<std::string>())
        ("s,save", "Write the subscriptions to the configured snapshot file")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger on stderr; stdout carries the JSON replies
    auto console = spdlog::stderr_color_mt("pathtrie");

    // Load config
    pathtrie::config cfg;
    try {
        cfg = pathtrie::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("verbose")) cfg.log_level = "debug";

    auto level = pathtrie::parse_log_level(cfg.log_level);
    spdlog::set_level(level ? *level : spdlog::level::info);

    console->info("pathtrie starting");
    console->info("  subscriptions in config: {}", cfg.subscriptions.size());
    if (!cfg.snapshot_file.empty()) {
        console->info("  snapshot file: {}", cfg.snapshot_file);
    }

    pathtrie::subscription_index index(console);

    try {
        if (!cfg.snapshot_file.empty() && std::filesystem::exists(cfg.snapshot_file)) {
            index.load(cfg.snapshot_file);
        }
        for (const auto& sub : cfg.subscriptions) {
            index.subscribe(sub.pattern, sub.client_id);
        }
    } catch (const pathtrie::error& e) {
        console->error("Failed to register subscriptions: {}", e.what());
        return 1;
    }

    console->info("  active subscriptions: {} ({} trie nodes)",
                 index.active_count(), index.node_count());

    try {
        if (result.count("query")) {
            for (const auto& q : result["query"].as<std::vector<std::string>>()) {
                nlohmann::json reply = {{"path", q}, {"matches", index.match(q)}};
                std::cout << reply.dump() << "\n";
            }
        }

        if (result.count("device")) {
            auto device = result["device"].as<std::string>();
            std::vector<std::string> measurements;
            if (result.count("measurements")) {
                measurements = result["measurements"].as<std::vector<std::string>>();
            }

            auto matches = index.match(device, measurements);
            auto per_measurement = nlohmann::json::object();
            for (std::size_t i = 0; i < measurements.size(); ++i) {
                per_measurement[measurements[i]] = matches[i];
            }
            nlohmann::json reply = {{"device", device}, {"matches", per_measurement}};
            std::cout << reply.dump() << "\n";
        }

        if (result.count("device-overlap")) {
            auto device = result["device-overlap"].as<std::string>();
            nlohmann::json reply = {{"device", device}, {"candidates", index.match_device(device)}};
            std::cout << reply.dump() << "\n";
        }

        if (result.count("save")) {
            if (cfg.snapshot_file.empty()) {
                console->error("--save given but no 'snapshot_file' configured");
                return 1;
            }
            index.save(cfg.snapshot_file);
        }
    } catch (const pathtrie::error& e) {
        console->error("{}", e.what());
        return 1;
    }

    std::cout.flush();
    return 0;
}
