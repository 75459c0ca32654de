/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>

namespace uavlog::df {

inline constexpr std::uint8_t kSyncByte0 = 0xA3;
inline constexpr std::uint8_t kSyncByte1 = 0x95;
inline constexpr std::size_t kRecordHeaderSize = 3;

/**
 * Lazy sequence of offsets where the two sync bytes occur. Advances one byte at a time so a
 * corrupt length never hides the next valid header; hits inside payload bytes are left for the
 * caller to reject. A hit needs at least one byte after the type id. Every begin() restarts
 * from offset zero.
 */
class SyncScanner {
   public:
    class iterator {
       public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::size_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::size_t*;
        using reference = std::size_t;

        iterator() = default;
        iterator(std::span<const std::uint8_t> data, std::size_t pos) : _data(data), _pos(pos) {
            seek_hit();
        }

        std::size_t operator*() const { return _pos; }

        iterator& operator++() {
            _pos++;
            seek_hit();
            return *this;
        }

        iterator operator++(int) {
            iterator prev = *this;
            ++*this;
            return prev;
        }

        bool operator==(const iterator& other) const { return _pos == other._pos; }
        bool operator!=(const iterator& other) const { return _pos != other._pos; }

       private:
        void seek_hit() {
            const std::size_t limit = scan_limit(_data);
            while (_pos < limit) {
                if (_data[_pos] == kSyncByte0 && _data[_pos + 1] == kSyncByte1) {
                    return;
                }
                _pos++;
            }
            _pos = limit;
        }

        std::span<const std::uint8_t> _data;
        std::size_t _pos = 0;
    };

    explicit SyncScanner(std::span<const std::uint8_t> data) : _data(data) {}

    iterator begin() const { return iterator(_data, 0); }
    iterator end() const { return iterator(_data, scan_limit(_data)); }

    static std::size_t scan_limit(std::span<const std::uint8_t> data) {
        return data.size() > kRecordHeaderSize ? data.size() - kRecordHeaderSize : 0;
    }

   private:
    std::span<const std::uint8_t> _data;
};

}  // namespace uavlog::df
