#include "openklv/klv.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
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


    static std::span<const std::byte> as_span(const std::vector<std::byte>& v)
    {
        return std::span<const std::byte>(v.data(), v.size());
    }

}  // namespace

TEST(KlvTest, ReadsTripletAndSkipsValue)
{
    // tag=2 len=4 value, then tag=3 len=1
    const std::vector<std::byte> in = make_bytes(
        { 0x02, 0x04, 0xDE, 0xAD, 0xBE, 0xEF, 0x03, 0x01, 0x2A });
    ByteCursor cursor(as_span(in));

    Klv a;
    ASSERT_EQ(read_klv(cursor, &a), KlvStatus::Ok);
    EXPECT_EQ(a.tag, static_cast<uint128_t>(2));
    EXPECT_EQ(a.length, 4U);
    EXPECT_EQ(a.value_offset, 2U);
    EXPECT_EQ(a.end_offset(), 6U);
    EXPECT_EQ(cursor.position(), 6U);

    Klv b;
    ASSERT_EQ(read_klv(cursor, &b), KlvStatus::Ok);
    EXPECT_EQ(b.tag, static_cast<uint128_t>(3));
    EXPECT_EQ(b.value_offset, 8U);
    EXPECT_TRUE(cursor.at_end());
}


TEST(KlvTest, MultiByteTagAndLongLength)
{
    std::vector<std::byte> in = make_bytes({ 0x81, 0x00, 0x81, 0x80 });
    in.insert(in.end(), 128, std::byte { 0x55 });
    ByteCursor cursor(as_span(in));

    Klv klv;
    ASSERT_EQ(read_klv(cursor, &klv), KlvStatus::Ok);
    EXPECT_EQ(klv.tag, static_cast<uint128_t>(128));
    EXPECT_EQ(klv.length, 128U);
    EXPECT_EQ(klv.value_offset, 4U);
    EXPECT_TRUE(cursor.at_end());
}


TEST(KlvTest, ZeroLengthValue)
{
    const std::vector<std::byte> in = make_bytes({ 0x05, 0x00 });
    ByteCursor cursor(as_span(in));
    Klv klv;
    ASSERT_EQ(read_klv(cursor, &klv), KlvStatus::Ok);
    EXPECT_EQ(klv.length, 0U);

    std::vector<std::byte> value = make_bytes({ 0x01 });
    ASSERT_EQ(read_klv_value(cursor, klv, &value), KlvStatus::Ok);
    EXPECT_TRUE(value.empty());
}


TEST(KlvTest, ValueOverrunRestoresCursor)
{
    const std::vector<std::byte> in = make_bytes({ 0x02, 0x05, 0x01, 0x02 });
    ByteCursor cursor(as_span(in));
    Klv klv;
    EXPECT_EQ(read_klv(cursor, &klv), KlvStatus::UnexpectedEnd);
    EXPECT_EQ(cursor.position(), 0U);
}


TEST(KlvTest, LengthFailureRestoresCursor)
{
    const std::vector<std::byte> in = make_bytes({ 0x02, 0x82, 0x01 });
    ByteCursor cursor(as_span(in));
    Klv klv;
    EXPECT_EQ(read_klv(cursor, &klv), KlvStatus::UnexpectedEnd);
    EXPECT_EQ(cursor.position(), 0U);

    const std::vector<std::byte> non_minimal = make_bytes(
        { 0x02, 0x81, 0x01, 0x00 });
    ByteCursor cursor2(as_span(non_minimal));
    EXPECT_EQ(read_klv(cursor2, &klv), KlvStatus::NonMinimal);
    EXPECT_EQ(cursor2.position(), 0U);

    KlvDecodeOptions relaxed;
    relaxed.encoding.strict = false;
    ASSERT_EQ(read_klv(cursor2, &klv, relaxed), KlvStatus::Ok);
    EXPECT_EQ(klv.length, 1U);
    EXPECT_EQ(klv.value_offset, 3U);
}


TEST(KlvTest, ValueLimit)
{
    std::vector<std::byte> in = make_bytes({ 0x01, 0x10 });
    in.insert(in.end(), 16, std::byte { 0x00 });
    ByteCursor cursor(as_span(in));

    KlvDecodeOptions options;
    options.limits.max_value_bytes = 8;
    Klv klv;
    EXPECT_EQ(read_klv(cursor, &klv, options), KlvStatus::LimitExceeded);
    EXPECT_EQ(cursor.position(), 0U);

    options.limits.max_value_bytes = 0;
    EXPECT_EQ(read_klv(cursor, &klv, options), KlvStatus::Ok);
}


TEST(KlvTest, ValueReadIsRepeatableAndRestoresPosition)
{
    const std::vector<std::byte> in = make_bytes(
        { 0x02, 0x03, 0x0A, 0x0B, 0x0C, 0x03, 0x01, 0x7F });
    ByteCursor cursor(as_span(in));

    Klv first;
    ASSERT_EQ(read_klv(cursor, &first), KlvStatus::Ok);
    const uint64_t pos = cursor.position();

    std::vector<std::byte> v1;
    std::vector<std::byte> v2;
    ASSERT_EQ(read_klv_value(cursor, first, &v1), KlvStatus::Ok);
    EXPECT_EQ(cursor.position(), pos);
    ASSERT_EQ(read_klv_value(cursor, first, &v2), KlvStatus::Ok);
    EXPECT_EQ(cursor.position(), pos);
    EXPECT_EQ(v1, v2);
    ASSERT_EQ(v1.size(), 3U);
    EXPECT_EQ(v1[0], std::byte { 0x0A });
    EXPECT_EQ(v1[2], std::byte { 0x0C });

    // Interleaved value reads do not disturb the outer parse.
    Klv second;
    ASSERT_EQ(read_klv(cursor, &second), KlvStatus::Ok);
    EXPECT_EQ(second.tag, static_cast<uint128_t>(3));

    std::span<const std::byte> view;
    ASSERT_EQ(klv_value_span(cursor, first, &view), KlvStatus::Ok);
    ASSERT_EQ(view.size(), 3U);
    EXPECT_EQ(view[1], std::byte { 0x0B });
}


TEST(KlvTest, ValueReadOutsideSourceFails)
{
    const std::vector<std::byte> in = make_bytes({ 0x01, 0x02 });
    ByteCursor cursor(as_span(in));
    ASSERT_EQ(cursor.seek(1), KlvStatus::Ok);

    Klv bogus;
    bogus.tag          = 1;
    bogus.length       = 4;
    bogus.value_offset = 1;

    std::vector<std::byte> value;
    EXPECT_EQ(read_klv_value(cursor, bogus, &value), KlvStatus::UnexpectedEnd);
    EXPECT_TRUE(value.empty());
    EXPECT_EQ(cursor.position(), 1U);

    std::span<const std::byte> view;
    EXPECT_EQ(klv_value_span(cursor, bogus, &view), KlvStatus::UnexpectedEnd);
}

}  // namespace openklv
