/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace uavlog::df {

struct ParserDecodeOptions {
    bool collect_metadata = true;
    bool debug = false;
};

struct DecodeResult {
    // {message type name: {field label: [values]}}
    nlohmann::ordered_json tables = nlohmann::ordered_json::object();
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
};

/**
 * Two-pass DataFlash decoder. The first pass learns every format definition in the buffer, the
 * second decodes data records against the complete registry, so records that precede their
 * definition are still decoded. Content errors never throw; whatever decodes is returned.
 */
class UniversalParser {
   public:
    static DecodeResult
    DecodeLogFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeLogBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );
};

}  // namespace uavlog::df
