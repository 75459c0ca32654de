/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "worker/legacy_dataflash_parser.h"

#include "dataflash/df_columnar.h"
#include "dataflash/df_record_decoder.h"
#include "dataflash/df_sync_scanner.h"
#include "utils/log.h"

#include <span>

namespace uavlog::worker {

LegacyDataflashParser::LegacyDataflashParser(UiChannel& ui, std::vector<std::string> preload_types)
    : _ui(ui), _preload_types(std::move(preload_types)) {}

void LegacyDataflashParser::process_data(const LogBuffer& buffer) {
    _buffer = buffer;
    _type_order.clear();
    _types.clear();
    _loaded.clear();
    if (!_buffer) {
        _registry = df::FormatRegistry{};
        _ui.post({{"messagesDoneLoading", true}});
        return;
    }

    _registry = df::FormatRegistry::learn(*_buffer);
    index_records();
    post_available_messages();
    for (const auto& type_name : _preload_types) {
        if (_loaded.count(type_name) != 0) {
            continue;
        }
        post_type(type_name);
    }
    _ui.post({{"messagesDoneLoading", true}});
}

void LegacyDataflashParser::load_type(const std::string& type_name) {
    if (!post_type(type_name)) {
        UAVLOG_LOG_INFO("No %s messages in log, ignoring loadType request.", type_name.c_str());
    }
}

bool LegacyDataflashParser::is_loaded(const std::string& type_name) const {
    return _loaded.count(type_name) != 0;
}

void LegacyDataflashParser::index_records() {
    const std::span<const std::uint8_t> data(*_buffer);
    for (const std::size_t offset : df::SyncScanner(data)) {
        const std::uint8_t type_id = data[offset + 2];
        const df::MessageFormatDescriptor* fmt = _registry.find(type_id);
        if (!fmt) {
            continue;
        }
        auto it = _types.find(fmt->name);
        if (it == _types.end()) {
            it = _types.emplace(fmt->name, TypeIndex{type_id, {}}).first;
            _type_order.push_back(fmt->name);
        }
        it->second.offsets.push_back(offset);
    }
}

void LegacyDataflashParser::post_available_messages() {
    nlohmann::ordered_json available = nlohmann::ordered_json::object();
    for (const auto& name : _type_order) {
        const auto& idx = _types.at(name);
        available[name] = {{"id", idx.first_id}, {"count", idx.offsets.size()}};
    }
    _ui.post({{"availableMessages", std::move(available)}});
}

bool LegacyDataflashParser::post_type(const std::string& type_name) {
    auto it = _types.find(type_name);
    if (it == _types.end() || !_buffer) {
        return false;
    }

    const std::span<const std::uint8_t> data(*_buffer);
    std::vector<df::DecodedRecord> rows;
    rows.reserve(it->second.offsets.size());
    for (const std::size_t offset : it->second.offsets) {
        const df::MessageFormatDescriptor* fmt = _registry.find(data[offset + 2]);
        if (!fmt) {
            continue;
        }
        auto record = df::decode_record(*fmt, data, offset);
        if (record.has_value()) {
            rows.push_back(std::move(*record));
        }
    }

    _loaded.insert(type_name);
    _ui.post({{"messageType", type_name}, {"messageList", df::materialize_rows(rows)}});
    return true;
}

}  // namespace uavlog::worker
