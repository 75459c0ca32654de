/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "app_config.h"

#include "utils/fs_utils.h"

#include <stdexcept>

namespace uavlog {

std::vector<std::string> default_legacy_preload_types() {
    return {"CMD",  "MSG",  "FILE", "MODE", "AHR2", "ATT",  "GPS",  "POS", "XKQ1", "XKQ",
            "NKQ1", "NKQ2", "XKQ2", "PARM", "MSG",  "STAT", "EV",   "XKF4", "FNCE"};
}

static void expect_type(const nlohmann::json& v, bool ok, const char* key, const char* what) {
    if (!ok) {
        throw std::runtime_error(
            std::string("Config key '") + key + "' must be " + what + " (got " + v.type_name() + ")"
        );
    }
}

AppConfig parse_app_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error(std::string("Config root must be an object"));
    }

    AppConfig cfg{};
    if (j.contains("endpoint")) {
        const auto& v = j.at("endpoint");
        expect_type(v, v.is_string(), "endpoint", "a string");
        cfg.endpoint = v.get<std::string>();
    }
    if (j.contains("timeoutMs")) {
        const auto& v = j.at("timeoutMs");
        expect_type(v, v.is_number_integer(), "timeoutMs", "an integer");
        cfg.timeout_ms = v.get<long>();
    }
    if (j.contains("sendRemote")) {
        const auto& v = j.at("sendRemote");
        expect_type(v, v.is_boolean(), "sendRemote", "a boolean");
        cfg.send_remote = v.get<bool>();
    }
    if (j.contains("legacyPreloadTypes")) {
        const auto& v = j.at("legacyPreloadTypes");
        expect_type(v, v.is_array(), "legacyPreloadTypes", "an array of strings");
        cfg.legacy_preload_types.clear();
        for (const auto& el : v) {
            expect_type(el, el.is_string(), "legacyPreloadTypes", "an array of strings");
            cfg.legacy_preload_types.push_back(el.get<std::string>());
        }
    }
    if (j.contains("outputDir")) {
        const auto& v = j.at("outputDir");
        expect_type(v, v.is_string(), "outputDir", "a string");
        cfg.output_dir = std::filesystem::path(v.get<std::string>());
    }
    if (j.contains("debug")) {
        const auto& v = j.at("debug");
        expect_type(v, v.is_boolean(), "debug", "a boolean");
        cfg.debug = v.get<bool>();
    }
    return cfg;
}

AppConfig load_app_config(const std::filesystem::path& path) {
    const std::string text = fs_utils::read_text_file(path);
    if (text.empty()) {
        throw std::runtime_error("Config file is empty: " + path.string());
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    }
    return parse_app_config(j);
}

}  // namespace uavlog
