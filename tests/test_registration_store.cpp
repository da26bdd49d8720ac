#include "registration_store.hpp"
#include "value_kinds.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace {

std::string temp_file(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST(registration_store, save_and_load_deletions) {
    auto file = temp_file("pathtrie_registrations_test.bin");
    using pathtrie::time_range;

    {
        auto map = pathtrie::make_deletion_map();
        map.append({"root", "sg", "d1", "s1"}, time_range{0, 10});
        map.append({"root", "sg", "*", "s1"}, time_range{30, 40});
        map.append({"root", "**"}, time_range{100, 200});
        pathtrie::save_registrations(map, file);
    }

    auto restored = pathtrie::make_deletion_map();
    EXPECT_EQ(pathtrie::load_registrations(restored, file), 3u);
    EXPECT_EQ(restored.get_overlapped({"root", "sg", "d1", "s1"}),
              (std::vector<time_range>{{0, 10}, {30, 40}, {100, 200}}));
    EXPECT_EQ(restored.get_overlapped({"root", "sg", "d2", "s1"}),
              (std::vector<time_range>{{30, 40}, {100, 200}}));

    std::remove(file.c_str());
}

TEST(registration_store, save_and_load_listeners) {
    auto file = temp_file("pathtrie_listeners_test.bin");

    {
        auto map = pathtrie::make_listener_map();
        map.append({"root", "sg", "d1"}, "trigger-a");
        map.append({"root", "sg", "d1"}, "trigger-b");
        pathtrie::save_registrations(map, file);
    }

    auto restored = pathtrie::make_listener_map();
    pathtrie::load_registrations(restored, file);
    auto values = restored.get_overlapped({"root", "sg", "d1"});
    std::sort(values.begin(), values.end());
    EXPECT_EQ(values, (std::vector<std::string>{"trigger-a", "trigger-b"}));

    std::remove(file.c_str());
}

TEST(registration_store, empty_map_round_trip) {
    auto file = temp_file("pathtrie_empty_test.bin");

    auto map = pathtrie::make_listener_map();
    pathtrie::save_registrations(map, file);

    auto restored = pathtrie::make_listener_map();
    EXPECT_EQ(pathtrie::load_registrations(restored, file), 0u);
    EXPECT_TRUE(restored.empty());

    std::remove(file.c_str());
}

TEST(registration_store, rejects_bad_documents) {
    auto file = temp_file("pathtrie_bad_test.bin");
    auto map = pathtrie::make_listener_map();

    // Wrong version
    pathtrie::write_file_bytes(file, nlohmann::json::to_msgpack(
        {{"version", 99}, {"entries", nlohmann::json::array()}}));
    EXPECT_THROW(pathtrie::load_registrations(map, file), pathtrie::serialization_error);

    // Not MessagePack
    std::vector<std::uint8_t> garbage = {0xc1, 0x00};
    pathtrie::write_file_bytes(file, garbage);
    EXPECT_THROW(pathtrie::load_registrations(map, file), pathtrie::serialization_error);

    // Second entry is broken: nothing from the file is applied
    nlohmann::json doc = {
        {"version", pathtrie::registrations_version},
        {"entries", {
            {{"pattern", {"root", "sg"}},
             {"value", nlohmann::json::binary(pathtrie::string_serializer{}.serialize("ok"))}},
            {{"pattern", nlohmann::json::array()},
             {"value", nlohmann::json::binary(pathtrie::string_serializer{}.serialize("bad"))}},
        }}
    };
    pathtrie::write_file_bytes(file, nlohmann::json::to_msgpack(doc));
    EXPECT_THROW(pathtrie::load_registrations(map, file), pathtrie::serialization_error);
    EXPECT_TRUE(map.empty());

    std::remove(file.c_str());

    EXPECT_THROW(pathtrie::load_registrations(map, temp_file("pathtrie_missing.bin")),
                 pathtrie::serialization_error);
}

TEST(registration_store, rejects_directory) {
    auto map = pathtrie::make_listener_map();
    auto dir = std::filesystem::temp_directory_path().string();

    EXPECT_THROW(pathtrie::read_file_bytes(dir), pathtrie::serialization_error);
    EXPECT_THROW(pathtrie::load_registrations(map, dir), pathtrie::serialization_error);
    EXPECT_TRUE(map.empty());
}

TEST(registration_store, rejects_empty_segment) {
    auto file = temp_file("pathtrie_empty_segment_test.bin");
    auto map = pathtrie::make_listener_map();

    nlohmann::json doc = {
        {"version", pathtrie::registrations_version},
        {"entries", nlohmann::json::array({
            {{"pattern", {"root", ""}},
             {"value", nlohmann::json::binary(pathtrie::string_serializer{}.serialize("x"))}},
        })}
    };
    pathtrie::write_file_bytes(file, nlohmann::json::to_msgpack(doc));
    EXPECT_THROW(pathtrie::load_registrations(map, file), pathtrie::serialization_error);
    EXPECT_TRUE(map.empty());

    std::remove(file.c_str());
}
