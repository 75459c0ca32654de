/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace uavlog {

std::vector<std::string> default_legacy_preload_types();

struct AppConfig {
    std::string endpoint = "http://localhost:5000/api/set-flight-data";
    long timeout_ms = 30000;
    bool send_remote = true;
    std::vector<std::string> legacy_preload_types = default_legacy_preload_types();
    std::optional<std::filesystem::path> output_dir;
    bool debug = false;
};

// Keys missing from the document keep their defaults; a key of the wrong type throws.
AppConfig parse_app_config(const nlohmann::json& j);
AppConfig load_app_config(const std::filesystem::path& path);

}  // namespace uavlog
