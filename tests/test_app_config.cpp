/**
 * Copyright (c) 2026 The uavlog Authors
 */
// =============================================================================
// Application Config Tests
// =============================================================================

#include <gtest/gtest.h>

#include "app_config.h"
#include "utils/fs_utils.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>

using uavlog::AppConfig;
using uavlog::load_app_config;
using uavlog::parse_app_config;

TEST(AppConfigTest, EmptyObjectKeepsDefaults) {
    const AppConfig cfg = parse_app_config(nlohmann::json::object());
    EXPECT_EQ(cfg.endpoint, "http://localhost:5000/api/set-flight-data");
    EXPECT_EQ(cfg.timeout_ms, 30000);
    EXPECT_TRUE(cfg.send_remote);
    EXPECT_FALSE(cfg.output_dir.has_value());
    EXPECT_FALSE(cfg.debug);

    ASSERT_EQ(cfg.legacy_preload_types.size(), 19u);
    EXPECT_EQ(cfg.legacy_preload_types.front(), "CMD");
    EXPECT_EQ(std::count(cfg.legacy_preload_types.begin(), cfg.legacy_preload_types.end(), "MSG"), 2);
}

TEST(AppConfigTest, OverridesEveryKey) {
    const auto j = nlohmann::json::parse(R"({
        "endpoint": "http://example.invalid/api",
        "timeoutMs": 500,
        "sendRemote": false,
        "legacyPreloadTypes": ["ATT", "GPS"],
        "outputDir": "/tmp/uavlog_out",
        "debug": true
    })");
    const AppConfig cfg = parse_app_config(j);
    EXPECT_EQ(cfg.endpoint, "http://example.invalid/api");
    EXPECT_EQ(cfg.timeout_ms, 500);
    EXPECT_FALSE(cfg.send_remote);
    EXPECT_EQ(cfg.legacy_preload_types, (std::vector<std::string>{"ATT", "GPS"}));
    ASSERT_TRUE(cfg.output_dir.has_value());
    EXPECT_EQ(*cfg.output_dir, std::filesystem::path("/tmp/uavlog_out"));
    EXPECT_TRUE(cfg.debug);
}

TEST(AppConfigTest, EmptyPreloadListIsAllowed) {
    const AppConfig cfg = parse_app_config(nlohmann::json::parse(R"({"legacyPreloadTypes": []})"));
    EXPECT_TRUE(cfg.legacy_preload_types.empty());
}

TEST(AppConfigTest, WrongTypesThrow) {
    EXPECT_THROW(parse_app_config(nlohmann::json::parse(R"({"endpoint": 5})")), std::runtime_error);
    EXPECT_THROW(parse_app_config(nlohmann::json::parse(R"({"timeoutMs": "fast"})")), std::runtime_error);
    EXPECT_THROW(parse_app_config(nlohmann::json::parse(R"({"sendRemote": 1})")), std::runtime_error);
    EXPECT_THROW(
        parse_app_config(nlohmann::json::parse(R"({"legacyPreloadTypes": ["ATT", 3]})")), std::runtime_error
    );
    EXPECT_THROW(parse_app_config(nlohmann::json::parse(R"({"outputDir": []})")), std::runtime_error);

    try {
        parse_app_config(nlohmann::json::parse(R"({"debug": "yes"})"));
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Config key 'debug'"), std::string::npos);
    }
}

TEST(AppConfigTest, NonObjectRootThrows) {
    EXPECT_THROW(parse_app_config(nlohmann::json::array()), std::runtime_error);
    EXPECT_THROW(parse_app_config(nlohmann::json("endpoint")), std::runtime_error);
}

class AppConfigFileTest : public ::testing::Test {
   protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "uavlog_app_config_test";
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
};

TEST_F(AppConfigFileTest, LoadsFromDisk) {
    const auto path = dir / "config.json";
    uavlog::fs_utils::write_text_file(path, R"({"sendRemote": false, "timeoutMs": 1000})");
    const AppConfig cfg = load_app_config(path);
    EXPECT_FALSE(cfg.send_remote);
    EXPECT_EQ(cfg.timeout_ms, 1000);
    EXPECT_EQ(cfg.legacy_preload_types.size(), 19u);
}

TEST_F(AppConfigFileTest, EmptyOrInvalidFileThrows) {
    const auto empty = dir / "empty.json";
    uavlog::fs_utils::write_text_file(empty, "");
    EXPECT_THROW(load_app_config(empty), std::runtime_error);

    const auto broken = dir / "broken.json";
    uavlog::fs_utils::write_text_file(broken, "{ \"endpoint\": ");
    EXPECT_THROW(load_app_config(broken), std::runtime_error);

    EXPECT_THROW(load_app_config(dir / "missing.json"), std::runtime_error);
}
