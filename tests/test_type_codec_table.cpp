/**
 * Copyright (c) 2026 The uavlog Authors
 */
// =============================================================================
// Type Codec Table Tests
// =============================================================================

#include <gtest/gtest.h>

#include "dataflash/df_type_codec_table.h"
#include "df_log_builder.h"

#include <string>

using namespace uavlog::df;
using uavlog::test::Payload;

static FieldValue decode_or_fail(char tag, const Payload& p) {
    const TypeCodec* codec = find_type_codec(tag);
    EXPECT_NE(codec, nullptr) << "tag " << tag;
    if (!codec) {
        return nullptr;
    }
    auto v = try_decode_field(*codec, p.bytes);
    EXPECT_TRUE(v.has_value()) << "tag " << tag;
    return v.value_or(FieldValue(nullptr));
}

TEST(TypeCodecTableTest, Widths) {
    const std::string tags = "bBhHiIqQfdeELMnNZ";
    const std::size_t widths[] = {1, 1, 2, 2, 4, 4, 8, 8, 4, 8, 4, 4, 4, 1, 4, 16, 64};
    for (std::size_t i = 0; i < tags.size(); i++) {
        const TypeCodec* codec = find_type_codec(tags[i]);
        ASSERT_NE(codec, nullptr) << "tag " << tags[i];
        EXPECT_EQ(codec->width, widths[i]) << "tag " << tags[i];
    }
}

TEST(TypeCodecTableTest, UnknownTagHasNoEntry) {
    EXPECT_EQ(find_type_codec('x'), nullptr);
    EXPECT_EQ(find_type_codec('c'), nullptr);
    EXPECT_EQ(find_type_codec('\0'), nullptr);
}

TEST(TypeCodecTableTest, TextCodesProduceNoValue) {
    Payload p;
    p.text("ABCD", 64);
    for (const char tag : std::string("nNZ")) {
        const TypeCodec* codec = find_type_codec(tag);
        ASSERT_NE(codec, nullptr);
        EXPECT_FALSE(codec->produces_value());
        EXPECT_FALSE(try_decode_field(*codec, p.bytes).has_value());
    }
}

TEST(TypeCodecTableTest, SignedAndUnsignedIntegers) {
    EXPECT_EQ(decode_or_fail('b', Payload().i8(-5)).get<int>(), -5);
    EXPECT_EQ(decode_or_fail('B', Payload().u8(250)).get<int>(), 250);
    EXPECT_EQ(decode_or_fail('M', Payload().u8(7)).get<int>(), 7);
    EXPECT_EQ(decode_or_fail('h', Payload().i16(-1234)).get<int>(), -1234);
    EXPECT_EQ(decode_or_fail('H', Payload().u16(60000)).get<int>(), 60000);
    EXPECT_EQ(decode_or_fail('i', Payload().i32(-100000)).get<std::int64_t>(), -100000);
    EXPECT_EQ(decode_or_fail('I', Payload().u32(4000000000u)).get<std::uint64_t>(), 4000000000u);
    EXPECT_EQ(decode_or_fail('L', Payload().i32(-353456789)).get<std::int64_t>(), -353456789);
}

TEST(TypeCodecTableTest, SixtyFourBitIntegersBecomeDoubles) {
    const FieldValue q = decode_or_fail('q', Payload().i64(-123456789012LL));
    EXPECT_TRUE(q.is_number_float());
    EXPECT_DOUBLE_EQ(q.get<double>(), -123456789012.0);

    const FieldValue big = decode_or_fail('Q', Payload().u64(1ULL << 63));
    EXPECT_TRUE(big.is_number_float());
    EXPECT_DOUBLE_EQ(big.get<double>(), 9223372036854775808.0);
}

TEST(TypeCodecTableTest, FloatingPoint) {
    EXPECT_DOUBLE_EQ(decode_or_fail('f', Payload().f32(-2.25f)).get<double>(), -2.25);
    EXPECT_DOUBLE_EQ(decode_or_fail('d', Payload().f64(3.141592653589793)).get<double>(), 3.141592653589793);
}

TEST(TypeCodecTableTest, CentiUnitsAreScaled) {
    EXPECT_NEAR(decode_or_fail('e', Payload().i32(12345)).get<double>(), 123.45, 1e-9);
    EXPECT_NEAR(decode_or_fail('e', Payload().i32(-250)).get<double>(), -2.5, 1e-9);
    EXPECT_NEAR(decode_or_fail('E', Payload().u32(4000000000u)).get<double>(), 40000000.0, 1e-6);
}

TEST(TypeCodecTableTest, ShortInputYieldsNothing) {
    const TypeCodec* codec = find_type_codec('I');
    ASSERT_NE(codec, nullptr);
    const std::vector<std::uint8_t> three = {1, 2, 3};
    EXPECT_FALSE(try_decode_field(*codec, three).has_value());
}

TEST(TypeCodecTableTest, LittleEndianReaders) {
    const std::vector<std::uint8_t> b = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(read_u16_le(b, 0), 0x0201u);
    EXPECT_EQ(read_u32_le(b, 1), 0x05040302u);
    EXPECT_EQ(read_u64_le(b, 0), 0x0807060504030201ull);
}
