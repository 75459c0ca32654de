/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "dataflash/df_format_registry.h"

#include "dataflash/df_sync_scanner.h"
#include "utils/log.h"

namespace uavlog::df {

std::string read_fixed_string(std::span<const std::uint8_t> data, std::size_t off, std::size_t max_len) {
    std::string out;
    for (std::size_t i = 0; i < max_len && off + i < data.size(); i++) {
        const std::uint8_t c = data[off + i];
        if (c == 0) {
            break;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::optional<std::string>
try_read_fixed_string(std::span<const std::uint8_t> data, std::size_t off, std::size_t max_len) {
    std::string out;
    for (std::size_t i = 0; i < max_len; i++) {
        if (off + i >= data.size()) {
            return std::nullopt;
        }
        const std::uint8_t c = data[off + i];
        if (c == 0) {
            break;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> split_labels(const std::string& labels) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = labels.find(',', start);
        if (comma == std::string::npos) {
            out.push_back(labels.substr(start));
            break;
        }
        out.push_back(labels.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

std::optional<MessageFormatDescriptor>
try_parse_format_record(std::span<const std::uint8_t> data, std::size_t offset) {
    if (offset + kFmtNameOffset > data.size()) {
        return std::nullopt;
    }
    if (data[offset] != kSyncByte0 || data[offset + 1] != kSyncByte1
        || data[offset + 2] != kFormatMessageId) {
        return std::nullopt;
    }

    auto name = try_read_fixed_string(data, offset + kFmtNameOffset, kFmtNameSize);
    auto format = try_read_fixed_string(data, offset + kFmtFormatOffset, kFmtFormatSize);
    auto labels = try_read_fixed_string(data, offset + kFmtLabelsOffset, kFmtLabelsSize);
    if (!name || !format || !labels) {
        return std::nullopt;
    }

    MessageFormatDescriptor out{};
    out.type_id = data[offset + kFmtTypeOffset];
    out.declared_length = data[offset + kFmtLengthOffset];
    out.name = std::move(*name);
    out.format_codes = std::move(*format);
    out.field_labels = split_labels(*labels);
    return out;
}

FormatRegistry FormatRegistry::learn(std::span<const std::uint8_t> data, bool debug) {
    FormatRegistry registry;
    for (const std::size_t offset : SyncScanner(data)) {
        if (data[offset + 2] != kFormatMessageId) {
            continue;
        }
        auto fmt = try_parse_format_record(data, offset);
        if (!fmt.has_value()) {
            continue;
        }
        registry._format_records_seen++;
        if (debug) {
            std::string labels;
            for (const auto& l : fmt->field_labels) {
                if (!labels.empty()) {
                    labels += ", ";
                }
                labels += l;
            }
            UAVLOG_LOG_INFO(
                "FMT %u: %s format=%s labels=[%s]", static_cast<unsigned>(fmt->type_id),
                fmt->name.c_str(), fmt->format_codes.c_str(), labels.c_str()
            );
        }
        registry.insert(std::move(*fmt));
    }
    return registry;
}

void FormatRegistry::insert(MessageFormatDescriptor descriptor) {
    const std::uint8_t id = descriptor.type_id;
    _formats[id] = std::move(descriptor);
}

const MessageFormatDescriptor* FormatRegistry::find(std::uint8_t type_id) const {
    auto it = _formats.find(type_id);
    if (it == _formats.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace uavlog::df
