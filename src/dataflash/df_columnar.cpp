/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "dataflash/df_columnar.h"

#include <unordered_set>

namespace uavlog::df {

nlohmann::ordered_json materialize_rows(const std::vector<DecodedRecord>& rows) {
    nlohmann::ordered_json table = nlohmann::ordered_json::object();
    if (rows.empty()) {
        return table;
    }

    // Keys actually emitted, which can be fewer than the declared labels.
    std::vector<std::string> keys;
    std::unordered_set<std::string> seen;
    for (const auto& row : rows) {
        for (const auto& f : row.fields) {
            if (seen.insert(f.label).second) {
                keys.push_back(f.label);
            }
        }
    }

    for (const auto& key : keys) {
        nlohmann::ordered_json column = nlohmann::ordered_json::array();
        for (const auto& row : rows) {
            const FieldValue* v = row.find(key);
            column.push_back(v ? *v : nlohmann::ordered_json(nullptr));
        }
        table[key] = std::move(column);
    }
    return table;
}

void ColumnarMaterializer::append(DecodedRecord record) {
    auto it = _index.find(record.type_name);
    if (it == _index.end()) {
        it = _index.emplace(record.type_name, _types.size()).first;
        _types.push_back(TypeRows{record.type_name, {}});
    }
    _types[it->second].rows.push_back(std::move(record));
}

std::size_t ColumnarMaterializer::row_count(std::string_view type_name) const {
    auto it = _index.find(std::string(type_name));
    if (it == _index.end()) {
        return 0;
    }
    return _types[it->second].rows.size();
}

nlohmann::ordered_json ColumnarMaterializer::finish() const {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& t : _types) {
        out[t.name] = materialize_rows(t.rows);
    }
    return out;
}

}  // namespace uavlog::df
