/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include <nlohmann/json.hpp>

namespace uavlog::df {

using FieldValue = nlohmann::ordered_json;
using FieldDecodeFn = FieldValue (*)(std::span<const std::uint8_t> bytes);

/**
 * One entry per format-code character.
 *  - width: bytes consumed from the record payload
 *  - decode: nullptr for fixed-width text (n, N, Z); the cursor moves but no value is produced
 *  - divisor: applied after decode for fixed-point centi-unit codes (e, E)
 */
struct TypeCodec {
    char tag = 0;
    std::size_t width = 0;
    FieldDecodeFn decode = nullptr;
    std::optional<double> divisor;

    bool produces_value() const { return decode != nullptr; }
};

const TypeCodec* find_type_codec(char tag);

// nullopt when the codec carries no value or fewer than width bytes are available.
std::optional<FieldValue> try_decode_field(const TypeCodec& codec, std::span<const std::uint8_t> bytes);

std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off);
std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off);
std::uint64_t read_u64_le(std::span<const std::uint8_t> s, std::size_t off);

}  // namespace uavlog::df
