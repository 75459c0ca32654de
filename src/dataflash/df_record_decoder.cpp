/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "dataflash/df_record_decoder.h"

#include "dataflash/df_sync_scanner.h"

namespace uavlog::df {

const FieldValue* DecodedRecord::find(std::string_view label) const {
    for (const auto& f : fields) {
        if (f.label == label) {
            return &f.value;
        }
    }
    return nullptr;
}

void DecodedRecord::set(const std::string& label, FieldValue value) {
    for (auto& f : fields) {
        if (f.label == label) {
            f.value = std::move(value);
            return;
        }
    }
    fields.push_back(DecodedField{label, std::move(value)});
}

std::optional<DecodedRecord> decode_record(
    const MessageFormatDescriptor& fmt,
    std::span<const std::uint8_t> data,
    std::size_t offset,
    DecodeStats* stats
) {
    if (offset > data.size() || fmt.declared_length > data.size() - offset) {
        if (stats) {
            stats->truncated_records++;
        }
        return std::nullopt;
    }

    DecodedRecord out{};
    out.type_id = fmt.type_id;
    out.type_name = fmt.name;

    std::size_t cursor = offset + kRecordHeaderSize;
    const std::size_t count = fmt.field_count();
    for (std::size_t i = 0; i < count; i++) {
        const TypeCodec* codec = find_type_codec(fmt.format_codes[i]);
        if (!codec) {
            // Zero width: every later field in this record reads from a shifted cursor.
            if (stats) {
                stats->field_errors++;
            }
            continue;
        }
        if (!codec->produces_value()) {
            cursor += codec->width;
            continue;
        }

        const auto bytes = cursor < data.size() ? data.subspan(cursor)
                                                : std::span<const std::uint8_t>{};
        auto value = try_decode_field(*codec, bytes);
        if (!value.has_value()) {
            if (stats) {
                stats->field_errors++;
            }
            continue;
        }
        out.set(fmt.field_labels[i], std::move(*value));
        cursor += codec->width;
    }

    if (stats) {
        stats->records++;
    }
    return out;
}

}  // namespace uavlog::df
