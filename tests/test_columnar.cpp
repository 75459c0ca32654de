/**
 * Copyright (c) 2026 The uavlog Authors
 */
// =============================================================================
// Columnar Materializer Tests
// =============================================================================

#include <gtest/gtest.h>

#include "dataflash/df_columnar.h"

using namespace uavlog::df;

static DecodedRecord row(const std::string& type, std::vector<DecodedField> fields) {
    DecodedRecord r{};
    r.type_name = type;
    r.fields = std::move(fields);
    return r;
}

TEST(ColumnarTest, EmptyRowsGiveEmptyTable) {
    const auto table = materialize_rows({});
    EXPECT_TRUE(table.is_object());
    EXPECT_TRUE(table.empty());
}

TEST(ColumnarTest, MissingKeysAreFilledWithNull) {
    std::vector<DecodedRecord> rows;
    rows.push_back(row("GPS", {{"TimeUS", 1}, {"Lat", 10}}));
    rows.push_back(row("GPS", {{"TimeUS", 2}}));
    rows.push_back(row("GPS", {{"TimeUS", 3}, {"Alt", 7.5}}));

    const auto table = materialize_rows(rows);
    const nlohmann::ordered_json expected = {
        {"TimeUS", {1, 2, 3}},
        {"Lat", {10, nullptr, nullptr}},
        {"Alt", {nullptr, nullptr, 7.5}},
    };
    EXPECT_EQ(table, expected);
}

TEST(ColumnarTest, EveryColumnHasOneSlotPerRow) {
    std::vector<DecodedRecord> rows;
    for (int i = 0; i < 25; i++) {
        std::vector<DecodedField> fields;
        fields.push_back({"Idx", i});
        if (i % 2 == 0) {
            fields.push_back({"Even", i});
        }
        if (i % 5 == 0) {
            fields.push_back({"Fifth", i});
        }
        rows.push_back(row("X", std::move(fields)));
    }
    const auto table = materialize_rows(rows);
    ASSERT_EQ(table.size(), 3u);
    for (const auto& kv : table.items()) {
        EXPECT_EQ(kv.value().size(), rows.size()) << kv.key();
    }
}

TEST(ColumnarTest, GroupsRowsByTypeInFirstAppearanceOrder) {
    ColumnarMaterializer m;
    m.append(row("BARO", {{"Alt", 1.0}}));
    m.append(row("ATT", {{"Roll", 0.1}}));
    m.append(row("BARO", {{"Alt", 2.0}}));

    EXPECT_EQ(m.type_count(), 2u);
    EXPECT_EQ(m.row_count("BARO"), 2u);
    EXPECT_EQ(m.row_count("ATT"), 1u);
    EXPECT_EQ(m.row_count("GPS"), 0u);

    const auto out = m.finish();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out.begin().key(), "BARO");
    EXPECT_EQ(out["BARO"]["Alt"], nlohmann::ordered_json({1.0, 2.0}));
    EXPECT_EQ(out["ATT"]["Roll"], nlohmann::ordered_json({0.1}));
}
