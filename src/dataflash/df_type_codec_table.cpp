/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "dataflash/df_type_codec_table.h"

#include <array>
#include <cstring>

namespace uavlog::df {

std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint16_t>(s[off] | (static_cast<std::uint16_t>(s[off + 1]) << 8));
}

std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint32_t>(s[off]) | (static_cast<std::uint32_t>(s[off + 1]) << 8)
           | (static_cast<std::uint32_t>(s[off + 2]) << 16)
           | (static_cast<std::uint32_t>(s[off + 3]) << 24);
}

std::uint64_t read_u64_le(std::span<const std::uint8_t> s, std::size_t off) {
    std::uint64_t v = 0;
    for (int i = 0; i < 8; i++) {
        v |= static_cast<std::uint64_t>(s[off + static_cast<std::size_t>(i)]) << (8 * i);
    }
    return v;
}

namespace {
FieldValue decode_i8(std::span<const std::uint8_t> b) {
    return static_cast<std::int8_t>(b[0]);
}

FieldValue decode_u8(std::span<const std::uint8_t> b) {
    return b[0];
}

FieldValue decode_i16(std::span<const std::uint8_t> b) {
    return static_cast<std::int16_t>(read_u16_le(b, 0));
}

FieldValue decode_u16(std::span<const std::uint8_t> b) {
    return read_u16_le(b, 0);
}

FieldValue decode_i32(std::span<const std::uint8_t> b) {
    return static_cast<std::int32_t>(read_u32_le(b, 0));
}

FieldValue decode_u32(std::span<const std::uint8_t> b) {
    return read_u32_le(b, 0);
}

// 64-bit integers are carried as doubles downstream.
FieldValue decode_i64(std::span<const std::uint8_t> b) {
    return static_cast<double>(static_cast<std::int64_t>(read_u64_le(b, 0)));
}

FieldValue decode_u64(std::span<const std::uint8_t> b) {
    return static_cast<double>(read_u64_le(b, 0));
}

FieldValue decode_f32(std::span<const std::uint8_t> b) {
    const std::uint32_t bits = read_u32_le(b, 0);
    float v = 0.0f;
    std::memcpy(&v, &bits, sizeof(v));
    return static_cast<double>(v);
}

FieldValue decode_f64(std::span<const std::uint8_t> b) {
    const std::uint64_t bits = read_u64_le(b, 0);
    double v = 0.0;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

const std::array<TypeCodec, 17> kTypeCodecs = {{
    {'b', 1, &decode_i8, std::nullopt},
    {'B', 1, &decode_u8, std::nullopt},
    {'h', 2, &decode_i16, std::nullopt},
    {'H', 2, &decode_u16, std::nullopt},
    {'i', 4, &decode_i32, std::nullopt},
    {'I', 4, &decode_u32, std::nullopt},
    {'q', 8, &decode_i64, std::nullopt},
    {'Q', 8, &decode_u64, std::nullopt},
    {'f', 4, &decode_f32, std::nullopt},
    {'d', 8, &decode_f64, std::nullopt},
    {'e', 4, &decode_i32, 100.0},
    {'E', 4, &decode_u32, 100.0},
    {'L', 4, &decode_i32, std::nullopt},
    {'M', 1, &decode_u8, std::nullopt},
    {'n', 4, nullptr, std::nullopt},
    {'N', 16, nullptr, std::nullopt},
    {'Z', 64, nullptr, std::nullopt},
}};
}  // namespace

const TypeCodec* find_type_codec(char tag) {
    for (const auto& codec : kTypeCodecs) {
        if (codec.tag == tag) {
            return &codec;
        }
    }
    return nullptr;
}

std::optional<FieldValue> try_decode_field(const TypeCodec& codec, std::span<const std::uint8_t> bytes) {
    if (!codec.produces_value() || bytes.size() < codec.width) {
        return std::nullopt;
    }
    FieldValue v = codec.decode(bytes.first(codec.width));
    if (codec.divisor.has_value()) {
        return FieldValue(v.get<double>() / *codec.divisor);
    }
    return v;
}

}  // namespace uavlog::df
