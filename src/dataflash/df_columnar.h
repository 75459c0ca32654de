/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include "df_record_decoder.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace uavlog::df {

// Rows of one message type -> {label: [value per row]}, null where a row lacks the label.
nlohmann::ordered_json materialize_rows(const std::vector<DecodedRecord>& rows);

class ColumnarMaterializer {
   public:
    void append(DecodedRecord record);

    std::size_t type_count() const { return _types.size(); }
    std::size_t row_count(std::string_view type_name) const;

    // {type name: columnar table}, types in first-appearance order.
    nlohmann::ordered_json finish() const;

   private:
    struct TypeRows {
        std::string name;
        std::vector<DecodedRecord> rows;
    };

    std::vector<TypeRows> _types;
    std::unordered_map<std::string, std::size_t> _index;
};

}  // namespace uavlog::df
