/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace uavlog::df {

inline constexpr std::uint8_t kFormatMessageId = 128;

// Offsets relative to the sync marker of a format-definition record.
inline constexpr std::size_t kFmtTypeOffset = 3;
inline constexpr std::size_t kFmtLengthOffset = 4;
inline constexpr std::size_t kFmtNameOffset = 5;
inline constexpr std::size_t kFmtNameSize = 4;
inline constexpr std::size_t kFmtFormatOffset = 9;
inline constexpr std::size_t kFmtFormatSize = 16;
inline constexpr std::size_t kFmtLabelsOffset = 25;
inline constexpr std::size_t kFmtLabelsSize = 64;

struct MessageFormatDescriptor {
    std::uint8_t type_id = 0;
    std::string name;
    std::uint8_t declared_length = 0;
    std::string format_codes;
    std::vector<std::string> field_labels;

    // Fields walked per record: codes and labels consumed in lockstep.
    std::size_t field_count() const {
        return format_codes.size() < field_labels.size() ? format_codes.size()
                                                         : field_labels.size();
    }
};

// Stops at a zero byte, max_len or the end of data.
std::string read_fixed_string(std::span<const std::uint8_t> data, std::size_t off, std::size_t max_len);
// nullopt when the string runs past the end of data before a zero byte or max_len.
std::optional<std::string>
try_read_fixed_string(std::span<const std::uint8_t> data, std::size_t off, std::size_t max_len);
std::vector<std::string> split_labels(const std::string& labels);

// A record cut off by the end of the buffer is still accepted when each of its strings
// terminates before that end.
std::optional<MessageFormatDescriptor>
try_parse_format_record(std::span<const std::uint8_t> data, std::size_t offset);

class FormatRegistry {
   public:
    // Full pass over the buffer; later definitions of a type id replace earlier ones.
    static FormatRegistry learn(std::span<const std::uint8_t> data, bool debug = false);

    void insert(MessageFormatDescriptor descriptor);
    const MessageFormatDescriptor* find(std::uint8_t type_id) const;

    std::size_t size() const { return _formats.size(); }
    bool empty() const { return _formats.empty(); }
    std::size_t format_records_seen() const { return _format_records_seen; }
    const std::map<std::uint8_t, MessageFormatDescriptor>& formats() const { return _formats; }

   private:
    std::map<std::uint8_t, MessageFormatDescriptor> _formats;
    std::size_t _format_records_seen = 0;
};

}  // namespace uavlog::df
