/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include "df_format_registry.h"
#include "df_type_codec_table.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uavlog::df {

struct DecodedField {
    std::string label;
    FieldValue value;
};

struct DecodedRecord {
    std::uint8_t type_id = 0;
    std::string type_name;
    std::vector<DecodedField> fields;

    const FieldValue* find(std::string_view label) const;
    // Replaces the value of an existing label in place, otherwise appends.
    void set(const std::string& label, FieldValue value);
};

struct DecodeStats {
    std::size_t records = 0;
    std::size_t truncated_records = 0;
    std::size_t unknown_type_hits = 0;
    std::size_t field_errors = 0;
};

/**
 * Decodes the record whose sync marker sits at offset. Returns nullopt when the declared length
 * runs past the end of the buffer. A field that cannot be decoded is left out of the row and
 * counted in stats; the remaining fields are still decoded.
 */
std::optional<DecodedRecord> decode_record(
    const MessageFormatDescriptor& fmt,
    std::span<const std::uint8_t> data,
    std::size_t offset,
    DecodeStats* stats = nullptr
);

}  // namespace uavlog::df
