/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace uavlog::fs_utils {
std::filesystem::path executable_dir();
// .bin, .log and .tlog; .txt flight records only when include_flight_records is set.
bool is_log_file(const std::filesystem::path& path, bool include_flight_records = false);
std::vector<std::filesystem::path>
collect_inputs(const std::filesystem::path& root, bool include_flight_records = false);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
std::string read_text_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace uavlog::fs_utils
