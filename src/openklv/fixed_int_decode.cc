#include "openklv/fixed_int_decode.h"

#include <array>

namespace openklv {
namespace {

    static constexpr uint32_t kMaxIntegerBytes = 16;

    // Reads `length` bytes into an unsigned accumulator (big-endian).
    static KlvStatus read_be_bits(ByteCursor& cursor, uint32_t length,
                                  uint128_t* out) noexcept
    {
        std::array<std::byte, kMaxIntegerBytes> raw {};
        const KlvStatus st = cursor.read_bytes(
            std::span<std::byte>(raw.data(), length));
        if (st != KlvStatus::Ok) {
            return st;
        }
        uint128_t v = 0;
        for (uint32_t i = 0; i < length; ++i) {
            v = (v << 8) | static_cast<uint128_t>(static_cast<uint8_t>(raw[i]));
        }
        *out = v;
        return KlvStatus::Ok;
    }


    static uint128_t sign_extend(uint128_t v, uint32_t length) noexcept
    {
        if (length >= kMaxIntegerBytes) {
            return v;
        }
        const uint32_t bits     = length * 8U;
        const uint128_t sign    = static_cast<uint128_t>(1) << (bits - 1U);
        const uint128_t payload = (static_cast<uint128_t>(1) << bits) - 1U;
        if ((v & sign) == 0U) {
            return v;
        }
        return v | ~payload;
    }


    template<typename T>
    static KlvStatus read_exact(ByteCursor& cursor, T* out) noexcept
    {
        if (!out) {
            return KlvStatus::Malformed;
        }
        uint128_t v        = 0;
        const KlvStatus st = read_be_bits(cursor, sizeof(T), &v);
        if (st != KlvStatus::Ok) {
            return st;
        }
        *out = static_cast<T>(v);
        return KlvStatus::Ok;
    }

}  // namespace

const char*
integer_kind_name(IntegerKind kind) noexcept
{
    switch (kind) {
    case IntegerKind::Signed: return "integer";
    case IntegerKind::Unsigned: return "unsigned_integer";
    }
    return "unknown";
}


uint32_t
width_bits(IntegerWidth width) noexcept
{
    switch (width) {
    case IntegerWidth::W8: return 8;
    case IntegerWidth::W16: return 16;
    case IntegerWidth::W32: return 32;
    case IntegerWidth::W64: return 64;
    case IntegerWidth::W128: return 128;
    }
    return 0;
}


IntegerWidth
width_for_length(uint32_t length) noexcept
{
    if (length <= 1U) {
        return IntegerWidth::W8;
    }
    if (length == 2U) {
        return IntegerWidth::W16;
    }
    if (length <= 4U) {
        return IntegerWidth::W32;
    }
    if (length <= 8U) {
        return IntegerWidth::W64;
    }
    return IntegerWidth::W128;
}


int128_t
Integer::as_int128() const noexcept
{
    switch (width) {
    case IntegerWidth::W8: return static_cast<int128_t>(data.i8);
    case IntegerWidth::W16: return static_cast<int128_t>(data.i16);
    case IntegerWidth::W32: return static_cast<int128_t>(data.i32);
    case IntegerWidth::W64: return static_cast<int128_t>(data.i64);
    case IntegerWidth::W128: return data.i128;
    }
    return 0;
}


uint128_t
UnsignedInteger::as_uint128() const noexcept
{
    switch (width) {
    case IntegerWidth::W8: return static_cast<uint128_t>(data.u8);
    case IntegerWidth::W16: return static_cast<uint128_t>(data.u16);
    case IntegerWidth::W32: return static_cast<uint128_t>(data.u32);
    case IntegerWidth::W64: return static_cast<uint128_t>(data.u64);
    case IntegerWidth::W128: return data.u128;
    }
    return 0;
}


IntegerDecodeResult
read_integer(ByteCursor& cursor, uint32_t length, Integer* out) noexcept
{
    IntegerDecodeResult result;
    result.kind = IntegerKind::Signed;

    if (!out || length == 0U || length > kMaxIntegerBytes) {
        result.status = KlvStatus::InvalidLength;
        return result;
    }

    uint128_t raw = 0;
    result.status = read_be_bits(cursor, length, &raw);
    if (result.status != KlvStatus::Ok) {
        return result;
    }

    // Conversions to the narrower signed types are modular (C++20).
    const uint128_t v = sign_extend(raw, length);
    Integer value;
    value.width = width_for_length(length);
    switch (value.width) {
    case IntegerWidth::W8: value.data.i8 = static_cast<int8_t>(v); break;
    case IntegerWidth::W16: value.data.i16 = static_cast<int16_t>(v); break;
    case IntegerWidth::W32: value.data.i32 = static_cast<int32_t>(v); break;
    case IntegerWidth::W64: value.data.i64 = static_cast<int64_t>(v); break;
    case IntegerWidth::W128: value.data.i128 = static_cast<int128_t>(v); break;
    }
    *out = value;
    return result;
}


IntegerDecodeResult
read_unsigned_integer(ByteCursor& cursor, uint32_t length,
                      UnsignedInteger* out) noexcept
{
    IntegerDecodeResult result;
    result.kind = IntegerKind::Unsigned;

    if (!out || length == 0U || length > kMaxIntegerBytes) {
        result.status = KlvStatus::InvalidLength;
        return result;
    }

    uint128_t v   = 0;
    result.status = read_be_bits(cursor, length, &v);
    if (result.status != KlvStatus::Ok) {
        return result;
    }

    UnsignedInteger value;
    value.width = width_for_length(length);
    switch (value.width) {
    case IntegerWidth::W8: value.data.u8 = static_cast<uint8_t>(v); break;
    case IntegerWidth::W16: value.data.u16 = static_cast<uint16_t>(v); break;
    case IntegerWidth::W32: value.data.u32 = static_cast<uint32_t>(v); break;
    case IntegerWidth::W64: value.data.u64 = static_cast<uint64_t>(v); break;
    case IntegerWidth::W128: value.data.u128 = v; break;
    }
    *out = value;
    return result;
}


IntegerDecodeResult
decode_integer(std::span<const std::byte> bytes, Integer* out) noexcept
{
    if (bytes.size() > kMaxIntegerBytes) {
        IntegerDecodeResult result;
        result.status = KlvStatus::InvalidLength;
        result.kind   = IntegerKind::Signed;
        return result;
    }
    ByteCursor cursor(bytes);
    return read_integer(cursor, static_cast<uint32_t>(bytes.size()), out);
}


IntegerDecodeResult
decode_unsigned_integer(std::span<const std::byte> bytes,
                        UnsignedInteger* out) noexcept
{
    if (bytes.size() > kMaxIntegerBytes) {
        IntegerDecodeResult result;
        result.status = KlvStatus::InvalidLength;
        result.kind   = IntegerKind::Unsigned;
        return result;
    }
    ByteCursor cursor(bytes);
    return read_unsigned_integer(cursor, static_cast<uint32_t>(bytes.size()),
                                 out);
}


KlvStatus
read_i8(ByteCursor& cursor, int8_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_i16(ByteCursor& cursor, int16_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_i32(ByteCursor& cursor, int32_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_i64(ByteCursor& cursor, int64_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_i128(ByteCursor& cursor, int128_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_u8(ByteCursor& cursor, uint8_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_u16(ByteCursor& cursor, uint16_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_u32(ByteCursor& cursor, uint32_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_u64(ByteCursor& cursor, uint64_t* out) noexcept
{
    return read_exact(cursor, out);
}


KlvStatus
read_u128(ByteCursor& cursor, uint128_t* out) noexcept
{
    return read_exact(cursor, out);
}

}  // namespace openklv
