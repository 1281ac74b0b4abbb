#include "openklv/fixed_int_decode.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <vector>

namespace openklv {
namespace {

    static std::vector<std::byte> make_bytes(std::initializer_list<uint8_t> v)
    {
        std::vector<std::byte> out;
        for (uint8_t b : v) {
            out.push_back(std::byte { b });
        }
        return out;
    }


    static std::vector<std::byte> repeated(uint8_t b, size_t count)
    {
        return std::vector<std::byte>(count, std::byte { b });
    }


    static std::span<const std::byte> as_span(const std::vector<std::byte>& v)
    {
        return std::span<const std::byte>(v.data(), v.size());
    }

}  // namespace

TEST(FixedIntDecodeTest, WidthSelection)
{
    EXPECT_EQ(width_for_length(1), IntegerWidth::W8);
    EXPECT_EQ(width_for_length(2), IntegerWidth::W16);
    EXPECT_EQ(width_for_length(3), IntegerWidth::W32);
    EXPECT_EQ(width_for_length(4), IntegerWidth::W32);
    EXPECT_EQ(width_for_length(5), IntegerWidth::W64);
    EXPECT_EQ(width_for_length(8), IntegerWidth::W64);
    EXPECT_EQ(width_for_length(9), IntegerWidth::W128);
    EXPECT_EQ(width_for_length(16), IntegerWidth::W128);
    EXPECT_EQ(width_bits(IntegerWidth::W32), 32U);
    EXPECT_EQ(width_bits(IntegerWidth::W128), 128U);
}


TEST(FixedIntDecodeTest, SignedMinMaxPerWidth)
{
    Integer v;
    std::vector<std::byte> in = make_bytes({ 0x7F });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W8);
    EXPECT_EQ(v.data.i8, std::numeric_limits<int8_t>::max());

    in = make_bytes({ 0x80 });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.data.i8, std::numeric_limits<int8_t>::min());

    in = make_bytes({ 0x80, 0x00 });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W16);
    EXPECT_EQ(v.data.i16, std::numeric_limits<int16_t>::min());

    in = make_bytes({ 0x7F, 0xFF, 0xFF, 0xFF });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W32);
    EXPECT_EQ(v.data.i32, std::numeric_limits<int32_t>::max());

    in = make_bytes({ 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W64);
    EXPECT_EQ(v.data.i64, std::numeric_limits<int64_t>::min());

    in    = repeated(0xFF, 16);
    in[0] = std::byte { 0x7F };
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W128);
    EXPECT_EQ(static_cast<uint128_t>(v.data.i128), uint128_max() >> 1);

    in    = repeated(0x00, 16);
    in[0] = std::byte { 0x80 };
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(static_cast<uint128_t>(v.data.i128),
              static_cast<uint128_t>(1) << 127);
    EXPECT_LT(v.as_int128(), 0);
}


TEST(FixedIntDecodeTest, SignExtendsOddLengths)
{
    Integer v;
    // 3 bytes 0xFFFFFE = -2 in a 32-bit container.
    std::vector<std::byte> in = make_bytes({ 0xFF, 0xFF, 0xFE });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W32);
    EXPECT_EQ(v.data.i32, -2);

    in = make_bytes({ 0x00, 0x80, 0x00 });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.data.i32, 0x8000);

    in = make_bytes({ 0xFF, 0x00, 0x00, 0x00, 0x00 });
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W64);
    EXPECT_EQ(v.data.i64, -(static_cast<int64_t>(1) << 32));
}


TEST(FixedIntDecodeTest, AllOnesIsMinusOneForWideLengths)
{
    for (uint32_t len = 9; len <= 16; ++len) {
        const std::vector<std::byte> in = repeated(0xFF, len);
        Integer v;
        ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok)
            << "len=" << len;
        EXPECT_EQ(v.width, IntegerWidth::W128);
        EXPECT_EQ(v.as_int128(), static_cast<int128_t>(-1)) << "len=" << len;
    }
}


TEST(FixedIntDecodeTest, NineBytePositiveValue)
{
    std::vector<std::byte> in = repeated(0x00, 9);
    in[0]                     = std::byte { 0x01 };
    in[8]                     = std::byte { 0x02 };
    Integer v;
    ASSERT_EQ(decode_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.as_int128(),
              (static_cast<int128_t>(1) << 64) + static_cast<int128_t>(2));
}


TEST(FixedIntDecodeTest, UnsignedMaxPerWidth)
{
    UnsignedInteger v;
    std::vector<std::byte> in = repeated(0xFF, 1);
    ASSERT_EQ(decode_unsigned_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W8);
    EXPECT_EQ(v.data.u8, 0xFFU);

    in = repeated(0xFF, 2);
    ASSERT_EQ(decode_unsigned_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.data.u16, 0xFFFFU);

    in = repeated(0xFF, 3);
    ASSERT_EQ(decode_unsigned_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W32);
    EXPECT_EQ(v.data.u32, 0x00FFFFFFU);

    in = repeated(0xFF, 8);
    ASSERT_EQ(decode_unsigned_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.data.u64, std::numeric_limits<uint64_t>::max());

    in = repeated(0xFF, 16);
    ASSERT_EQ(decode_unsigned_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.width, IntegerWidth::W128);
    EXPECT_EQ(v.as_uint128(), uint128_max());

    in = repeated(0x00, 5);
    ASSERT_EQ(decode_unsigned_integer(as_span(in), &v).status, KlvStatus::Ok);
    EXPECT_EQ(v.as_uint128(), static_cast<uint128_t>(0));
}


TEST(FixedIntDecodeTest, InvalidLengthReportsKind)
{
    const std::vector<std::byte> in = repeated(0x01, 17);
    ByteCursor cursor(as_span(in));

    Integer s;
    IntegerDecodeResult r = read_integer(cursor, 0, &s);
    EXPECT_EQ(r.status, KlvStatus::InvalidLength);
    EXPECT_EQ(r.kind, IntegerKind::Signed);
    EXPECT_STREQ(integer_kind_name(r.kind), "integer");

    r = read_integer(cursor, 17, &s);
    EXPECT_EQ(r.status, KlvStatus::InvalidLength);
    EXPECT_EQ(cursor.position(), 0U);

    UnsignedInteger u;
    r = read_unsigned_integer(cursor, 17, &u);
    EXPECT_EQ(r.status, KlvStatus::InvalidLength);
    EXPECT_EQ(r.kind, IntegerKind::Unsigned);
    EXPECT_STREQ(integer_kind_name(r.kind), "unsigned_integer");
    EXPECT_EQ(cursor.position(), 0U);

    r = decode_integer(as_span(in), &s);
    EXPECT_EQ(r.status, KlvStatus::InvalidLength);

    const std::vector<std::byte> empty;
    r = decode_unsigned_integer(as_span(empty), &u);
    EXPECT_EQ(r.status, KlvStatus::InvalidLength);
}


TEST(FixedIntDecodeTest, ShortSource)
{
    const std::vector<std::byte> in = make_bytes({ 0x01, 0x02 });
    ByteCursor cursor(as_span(in));
    Integer v;
    EXPECT_EQ(read_integer(cursor, 4, &v).status, KlvStatus::UnexpectedEnd);
    EXPECT_EQ(cursor.position(), 0U);
}


TEST(FixedIntDecodeTest, ExactSizeReaders)
{
    const std::vector<std::byte> in = make_bytes({
        0xFF,                                            // i8
        0x12, 0x34,                                      // u16
        0xFF, 0xFF, 0xFF, 0xFE,                          // i32
        0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,  // u64
    });
    ByteCursor cursor(as_span(in));

    int8_t a = 0;
    ASSERT_EQ(read_i8(cursor, &a), KlvStatus::Ok);
    EXPECT_EQ(a, -1);
    uint16_t b = 0;
    ASSERT_EQ(read_u16(cursor, &b), KlvStatus::Ok);
    EXPECT_EQ(b, 0x1234U);
    int32_t c = 0;
    ASSERT_EQ(read_i32(cursor, &c), KlvStatus::Ok);
    EXPECT_EQ(c, -2);
    uint64_t d = 0;
    ASSERT_EQ(read_u64(cursor, &d), KlvStatus::Ok);
    EXPECT_EQ(d, 0x100000000ULL);
    EXPECT_TRUE(cursor.at_end());

    uint32_t e = 0;
    EXPECT_EQ(read_u32(cursor, &e), KlvStatus::UnexpectedEnd);
}


TEST(FixedIntDecodeTest, ExactSize128)
{
    std::vector<std::byte> in = repeated(0xFF, 16);
    ByteCursor cursor(as_span(in));
    int128_t s = 0;
    ASSERT_EQ(read_i128(cursor, &s), KlvStatus::Ok);
    EXPECT_EQ(s, static_cast<int128_t>(-1));

    ASSERT_EQ(cursor.seek(0), KlvStatus::Ok);
    uint128_t u = 0;
    ASSERT_EQ(read_u128(cursor, &u), KlvStatus::Ok);
    EXPECT_EQ(u, uint128_max());
}

}  // namespace openklv
