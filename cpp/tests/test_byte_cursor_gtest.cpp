// ==============================================================================
// test_byte_cursor_gtest.cpp - Тесты ByteCursor (GoogleTest)
// ==============================================================================
//
// Тесты: TST-CUR-001..TST-CUR-014
//
// ==============================================================================

#include "bertread/byte_cursor.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace bertread::io::test {

// ==============================================================================
// Примитивы чтения
// ==============================================================================

TEST(ByteCursorTest, TST_CUR_001_ReadInt32_LittleEndian) {
    std::vector<std::uint8_t> buf = {0x30, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF};
    ByteCursor cur(buf);

    auto a = cur.read_int32(0);
    ASSERT_TRUE(std::holds_alternative<std::int32_t>(a));
    EXPECT_EQ(std::get<std::int32_t>(a), 48);

    // Поле signed: 0xFFFFFFFF == -1
    auto b = cur.read_int32(4);
    ASSERT_TRUE(std::holds_alternative<std::int32_t>(b));
    EXPECT_EQ(std::get<std::int32_t>(b), -1);
}

TEST(ByteCursorTest, TST_CUR_002_ReadByte) {
    std::vector<std::uint8_t> buf = {0x01, 0xFE};
    ByteCursor cur(buf);

    auto r = cur.read_byte(1);
    ASSERT_TRUE(std::holds_alternative<std::uint8_t>(r));
    EXPECT_EQ(std::get<std::uint8_t>(r), 0xFE);
}

TEST(ByteCursorTest, TST_CUR_003_ReadHex_WireOrderLowercase) {
    std::vector<std::uint8_t> buf = {0xAA, 0x0B, 0xC0, 0x01};
    ByteCursor cur(buf);

    auto r = cur.read_hex(0, 4);
    ASSERT_TRUE(std::holds_alternative<std::string>(r));
    EXPECT_EQ(std::get<std::string>(r), "aa 0b c0 01");

    auto empty = cur.read_hex(2, 0);
    ASSERT_TRUE(std::holds_alternative<std::string>(empty));
    EXPECT_EQ(std::get<std::string>(empty), "");
}

TEST(ByteCursorTest, TST_CUR_004_ReadAscii_KeepsNulBytes) {
    std::vector<std::uint8_t> buf = {'T', 'E', 'S', 'T', 0x00, 0x00};
    ByteCursor cur(buf);

    auto r = cur.read_ascii(0, 6);
    ASSERT_TRUE(std::holds_alternative<std::string>(r));
    EXPECT_EQ(std::get<std::string>(r), std::string("TEST\0\0", 6));
}

TEST(ByteCursorTest, TST_CUR_005_ReadAscii_InvalidUtf8) {
    std::vector<std::uint8_t> buf = {'O', 'K', 0xFF, 0xFE};
    ByteCursor cur(buf);

    auto r = cur.read_ascii(0, 4);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(r));
    EXPECT_EQ(std::get<DecodeError>(r).kind, DecodeErrorKind::InvalidEncoding);
    EXPECT_EQ(std::get<DecodeError>(r).offset, 0u);
}

// ==============================================================================
// GUID
// ==============================================================================

TEST(ByteCursorTest, TST_CUR_006_ReadGuid_SwapsFirstThreeGroups) {
    // Firmware Error Record Reference: 81212A96-09ED-4996-9471-8D729C8E69ED
    std::vector<std::uint8_t> wire = {0x96, 0x2A, 0x21, 0x81, 0xED, 0x09, 0x96, 0x49,
                                      0x94, 0x71, 0x8D, 0x72, 0x9C, 0x8E, 0x69, 0xED};
    ByteCursor cur(wire);

    auto r = cur.read_guid(0);
    ASSERT_TRUE(std::holds_alternative<std::string>(r));
    EXPECT_EQ(std::get<std::string>(r), "81212a9609ed499694718d729c8e69ed");
}

TEST(ByteCursorTest, TST_CUR_007_ReadGuid_SequentialBytes) {
    std::vector<std::uint8_t> wire;
    for (std::uint8_t i = 0; i < 16; ++i) {
        wire.push_back(i);
    }
    ByteCursor cur(wire);

    auto r = cur.read_guid(0);
    ASSERT_TRUE(std::holds_alternative<std::string>(r));
    EXPECT_EQ(std::get<std::string>(r), "03020100050407060809" "0a0b0c0d0e0f");
}

TEST(ByteCursorTest, TST_CUR_008_FormatGuid_Dashed) {
    EXPECT_EQ(format_guid("81212a9609ed499694718d729c8e69ed"),
              "81212a96-09ed-4996-9471-8d729c8e69ed");
    // Не канонический GUID возвращается как есть
    EXPECT_EQ(format_guid("abc"), "abc");
}

// ==============================================================================
// Границы
// ==============================================================================

TEST(ByteCursorTest, TST_CUR_009_OutOfBounds_NeverTruncates) {
    std::vector<std::uint8_t> buf = {1, 2, 3};
    ByteCursor cur(buf);

    auto r = cur.read_int32(0);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(r));
    EXPECT_EQ(std::get<DecodeError>(r).kind, DecodeErrorKind::OutOfBounds);

    EXPECT_TRUE(std::holds_alternative<DecodeError>(cur.read_hex(2, 2)));
    EXPECT_TRUE(std::holds_alternative<DecodeError>(cur.read_guid(0)));
    EXPECT_TRUE(std::holds_alternative<DecodeError>(cur.read_byte(3)));
}

TEST(ByteCursorTest, TST_CUR_010_OutOfBounds_HugeOffsetNoOverflow) {
    std::vector<std::uint8_t> buf = {1, 2, 3, 4};
    ByteCursor cur(buf);

    EXPECT_FALSE(cur.contains(static_cast<std::size_t>(-1), 2));
    EXPECT_FALSE(cur.contains(2, static_cast<std::size_t>(-1)));
    EXPECT_TRUE(cur.contains(4, 0));
}

TEST(ByteCursorTest, TST_CUR_011_Slice_ReportsAbsoluteOffset) {
    std::vector<std::uint8_t> buf(32, 0);
    ByteCursor cur(buf);

    auto sub = cur.slice(20, 8);
    ASSERT_TRUE(std::holds_alternative<ByteCursor>(sub));
    const auto& view = std::get<ByteCursor>(sub);
    EXPECT_EQ(view.size(), 8u);
    EXPECT_EQ(view.base_offset(), 20u);

    auto r = view.read_int32(6);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(r));
    EXPECT_EQ(std::get<DecodeError>(r).offset, 26u);
}

TEST(ByteCursorTest, TST_CUR_012_Tail) {
    std::vector<std::uint8_t> buf = {1, 2, 3, 4, 5};
    ByteCursor cur(buf);

    auto t = cur.tail(5);
    ASSERT_TRUE(std::holds_alternative<ByteCursor>(t));
    EXPECT_EQ(std::get<ByteCursor>(t).size(), 0u);

    EXPECT_TRUE(std::holds_alternative<DecodeError>(cur.tail(6)));
}

// ==============================================================================
// FieldReader / helpers
// ==============================================================================

TEST(ByteCursorTest, TST_CUR_013_FieldReader_KeepsFirstError) {
    std::vector<std::uint8_t> buf = {0x01, 0x00, 0x00, 0x00, 0x02};
    FieldReader r{ByteCursor(buf)};

    EXPECT_EQ(r.int32(0), 1);
    EXPECT_EQ(r.int32(4), 0);  // OutOfBounds
    EXPECT_EQ(r.byte(4), 0);   // после ошибки чтения не выполняются
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error()->kind, DecodeErrorKind::OutOfBounds);
    EXPECT_EQ(r.error()->offset, 4u);
}

TEST(ByteCursorTest, TST_CUR_014_Utf8Validation) {
    const std::uint8_t ascii[] = {'A', 'B'};
    const std::uint8_t two_byte[] = {0xC2, 0xAE};        // (R)
    const std::uint8_t overlong[] = {0xC0, 0xAF};        // overlong '/'
    const std::uint8_t surrogate[] = {0xED, 0xA0, 0x80};  // U+D800
    const std::uint8_t truncated[] = {0xE2, 0x82};

    EXPECT_TRUE(is_valid_utf8(ascii, sizeof(ascii)));
    EXPECT_TRUE(is_valid_utf8(two_byte, sizeof(two_byte)));
    EXPECT_FALSE(is_valid_utf8(overlong, sizeof(overlong)));
    EXPECT_FALSE(is_valid_utf8(surrogate, sizeof(surrogate)));
    EXPECT_FALSE(is_valid_utf8(truncated, sizeof(truncated)));

    DecodeError err{DecodeErrorKind::TruncatedEntry, "short", 44};
    EXPECT_EQ(err.format(), "TruncatedEntry at offset 44: short");
}

}  // namespace bertread::io::test
