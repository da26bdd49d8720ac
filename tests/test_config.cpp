#include "config.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

TEST(config_parsing, full_document) {
    auto cfg = pathtrie::parse_config(YAML::Load(R"(
log_level: debug
snapshot_file: /tmp/subs.bin
subscriptions:
  - pattern: root.sg.*.s1
    client_id: alice
  - pattern: root.**
    client_id: bob
)"));

    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.snapshot_file, "/tmp/subs.bin");
    ASSERT_EQ(cfg.subscriptions.size(), 2u);
    EXPECT_EQ(cfg.subscriptions[0].pattern, "root.sg.*.s1");
    EXPECT_EQ(cfg.subscriptions[0].client_id, "alice");
    EXPECT_EQ(cfg.subscriptions[1].pattern, "root.**");
    EXPECT_EQ(cfg.subscriptions[1].client_id, "bob");
}

TEST(config_parsing, defaults) {
    auto cfg = pathtrie::parse_config(YAML::Load("{}"));
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_TRUE(cfg.snapshot_file.empty());
    EXPECT_TRUE(cfg.subscriptions.empty());

    auto empty = pathtrie::parse_config(YAML::Load(""));
    EXPECT_TRUE(empty.subscriptions.empty());
}

TEST(config_parsing, rejects_invalid_documents) {
    EXPECT_THROW(pathtrie::parse_config(YAML::Load("- a\n- b\n")), pathtrie::config_error);
    EXPECT_THROW(pathtrie::parse_config(YAML::Load("subscriptions: 3")), pathtrie::config_error);
    EXPECT_THROW(pathtrie::parse_config(YAML::Load("log_level: loud")), pathtrie::config_error);
    EXPECT_THROW(pathtrie::parse_config(YAML::Load(R"(
subscriptions:
  - client_id: alice
)")), pathtrie::config_error);
    EXPECT_THROW(pathtrie::parse_config(YAML::Load(R"(
subscriptions:
  - pattern: root..sg
    client_id: alice
)")), pathtrie::config_error);
    EXPECT_THROW(pathtrie::parse_config(YAML::Load(R"(
subscriptions:
  - pattern: root.sg
    client_id: [a, b]
)")), pathtrie::config_error);
}

TEST(config_parsing, missing_file) {
    EXPECT_THROW(pathtrie::load_config("/nonexistent/pathtrie.yaml"), pathtrie::config_error);
}

TEST(config_parsing, parse_log_level) {
    EXPECT_EQ(pathtrie::parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(pathtrie::parse_log_level("info"),  spdlog::level::info);
    EXPECT_EQ(pathtrie::parse_log_level("warn"),  spdlog::level::warn);
    EXPECT_EQ(pathtrie::parse_log_level("error"), spdlog::level::err);
    EXPECT_FALSE(pathtrie::parse_log_level("invalid").has_value());
}
