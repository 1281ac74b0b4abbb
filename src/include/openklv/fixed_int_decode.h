#pragma once

#include "openklv/byte_cursor.h"
#include "openklv/int128.h"
#include "openklv/klv_status.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file fixed_int_decode.h
 * \brief Big-endian fixed-width integer decode with width selection.
 */

namespace openklv {

/// Container width chosen for a decoded integer.
enum class IntegerWidth : uint8_t {
    W8,
    W16,
    W32,
    W64,
    W128,
};

/// Integer family, reported with \ref KlvStatus::InvalidLength.
enum class IntegerKind : uint8_t {
    Signed,
    Unsigned,
};

/// Returns "integer" or "unsigned_integer".
const char*
integer_kind_name(IntegerKind kind) noexcept;

/// Returns 8, 16, 32, 64 or 128.
uint32_t
width_bits(IntegerWidth width) noexcept;

/// Smallest container width that holds \p length bytes (1..16).
IntegerWidth
width_for_length(uint32_t length) noexcept;

/**
 * \brief A signed integer tagged with the container it was decoded into.
 *
 * The width is decided by the number of bytes read, not by the field's
 * nominal type: a 3-byte value is an `int32_t`, a 9-byte value an `int128_t`.
 */
struct Integer final {
    IntegerWidth width = IntegerWidth::W8;

    union Data {
        int8_t i8;
        int16_t i16;
        int32_t i32;
        int64_t i64;
        int128_t i128;

        Data() noexcept
            : i128(0)
        {
        }
    } data;

    /// Value sign-extended to 128 bits.
    int128_t as_int128() const noexcept;
};

/// An unsigned integer tagged with the container it was decoded into.
struct UnsignedInteger final {
    IntegerWidth width = IntegerWidth::W8;

    union Data {
        uint8_t u8;
        uint16_t u16;
        uint32_t u32;
        uint64_t u64;
        uint128_t u128;

        Data() noexcept
            : u128(0)
        {
        }
    } data;

    /// Value zero-extended to 128 bits.
    uint128_t as_uint128() const noexcept;
};

struct IntegerDecodeResult final {
    KlvStatus status = KlvStatus::Ok;
    IntegerKind kind = IntegerKind::Signed;
};

/**
 * \brief Reads \p length big-endian bytes as a two's-complement integer.
 *
 * Lengths 1, 2, 3-4, 5-8 and 9-16 map to 8, 16, 32, 64 and 128-bit
 * containers; the sign is extended into the container. Length 0 or > 16
 * yields \ref KlvStatus::InvalidLength without consuming bytes.
 */
IntegerDecodeResult
read_integer(ByteCursor& cursor, uint32_t length, Integer* out) noexcept;

/// Unsigned counterpart of \ref read_integer (zero extension).
IntegerDecodeResult
read_unsigned_integer(ByteCursor& cursor, uint32_t length,
                      UnsignedInteger* out) noexcept;

/// Decodes all of \p bytes (typically a triplet value) as a signed integer.
IntegerDecodeResult
decode_integer(std::span<const std::byte> bytes, Integer* out) noexcept;

/// Decodes all of \p bytes as an unsigned integer.
IntegerDecodeResult
decode_unsigned_integer(std::span<const std::byte> bytes,
                        UnsignedInteger* out) noexcept;

/** \name Exact-size big-endian readers
 *  @{
 */
KlvStatus
read_i8(ByteCursor& cursor, int8_t* out) noexcept;
KlvStatus
read_i16(ByteCursor& cursor, int16_t* out) noexcept;
KlvStatus
read_i32(ByteCursor& cursor, int32_t* out) noexcept;
KlvStatus
read_i64(ByteCursor& cursor, int64_t* out) noexcept;
KlvStatus
read_i128(ByteCursor& cursor, int128_t* out) noexcept;
KlvStatus
read_u8(ByteCursor& cursor, uint8_t* out) noexcept;
KlvStatus
read_u16(ByteCursor& cursor, uint16_t* out) noexcept;
KlvStatus
read_u32(ByteCursor& cursor, uint32_t* out) noexcept;
KlvStatus
read_u64(ByteCursor& cursor, uint64_t* out) noexcept;
KlvStatus
read_u128(ByteCursor& cursor, uint128_t* out) noexcept;
/** @} */

}  // namespace openklv
