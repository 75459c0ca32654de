/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include "dataflash/df_format_registry.h"
#include "worker/incremental_parser.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace uavlog::worker {

/**
 * Per-type DataFlash parser driving the interactive view. process_data() indexes the buffer,
 * announces the available message types and streams the preloaded ones; load_type() decodes
 * one more type on demand.
 *
 * Posted messages:
 *   {"availableMessages": {name: {"id": n, "count": n}}}
 *   {"messageType": name, "messageList": {label: [values]}}
 *   {"messagesDoneLoading": true}
 */
class LegacyDataflashParser : public IncrementalParser {
   public:
    LegacyDataflashParser(UiChannel& ui, std::vector<std::string> preload_types);

    void process_data(const LogBuffer& buffer) override;
    void load_type(const std::string& type_name) override;

    bool is_loaded(const std::string& type_name) const;

   private:
    struct TypeIndex {
        std::uint8_t first_id = 0;
        std::vector<std::size_t> offsets;
    };

    void index_records();
    void post_available_messages();
    bool post_type(const std::string& type_name);

    UiChannel& _ui;
    std::vector<std::string> _preload_types;
    LogBuffer _buffer;
    df::FormatRegistry _registry;
    std::vector<std::string> _type_order;
    std::unordered_map<std::string, TypeIndex> _types;
    std::unordered_set<std::string> _loaded;
};

}  // namespace uavlog::worker
