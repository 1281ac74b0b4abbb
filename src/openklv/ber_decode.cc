#include "openklv/ber_decode.h"

#include <limits>

namespace openklv {

KlvStatus
read_ber_long_form(ByteCursor& cursor, uint32_t num_bytes, uint128_t* out,
                   const EncodingPolicy& policy) noexcept
{
    if (!out) {
        return KlvStatus::Malformed;
    }
    if (num_bytes == 0U || num_bytes > 127U) {
        return KlvStatus::Malformed;
    }

    const uint64_t start = cursor.position();
    if (cursor.remaining() < num_bytes) {
        return KlvStatus::UnexpectedEnd;
    }

    // Leading zero bytes are skipped before counting significant bits, so a
    // long header may still hold a value that fits.
    uint128_t v = 0;
    for (uint32_t i = 0; i < num_bytes; ++i) {
        uint8_t b = 0;
        (void)cursor.read_u8(&b);
        if ((v >> 120) != 0U) {
            (void)cursor.seek(start);
            return KlvStatus::Overflow;
        }
        v = (v << 8) | static_cast<uint128_t>(b);
    }

    if (policy.strict && v <= 127U) {
        (void)cursor.seek(start);
        return KlvStatus::NonMinimal;
    }

    *out = v;
    return KlvStatus::Ok;
}


KlvStatus
read_ber(ByteCursor& cursor, uint128_t* out,
         const EncodingPolicy& policy) noexcept
{
    if (!out) {
        return KlvStatus::Malformed;
    }

    const uint64_t start = cursor.position();
    uint8_t first        = 0;
    if (cursor.read_u8(&first) != KlvStatus::Ok) {
        return KlvStatus::UnexpectedEnd;
    }

    if ((first & 0x80U) == 0) {
        *out = static_cast<uint128_t>(first);
        return KlvStatus::Ok;
    }

    const uint32_t num_bytes = static_cast<uint32_t>(first & 0x7FU);
    if (num_bytes == 0U) {
        (void)cursor.seek(start);
        return KlvStatus::Malformed;
    }

    const KlvStatus st = read_ber_long_form(cursor, num_bytes, out, policy);
    if (st != KlvStatus::Ok) {
        (void)cursor.seek(start);
    }
    return st;
}


KlvStatus
read_ber_length(ByteCursor& cursor, uint64_t* out,
                const EncodingPolicy& policy) noexcept
{
    if (!out) {
        return KlvStatus::Malformed;
    }

    const uint64_t start = cursor.position();
    uint128_t v          = 0;
    const KlvStatus st   = read_ber(cursor, &v, policy);
    if (st != KlvStatus::Ok) {
        return st;
    }
    if (v > static_cast<uint128_t>(std::numeric_limits<uint64_t>::max())) {
        (void)cursor.seek(start);
        return KlvStatus::Overflow;
    }
    *out = static_cast<uint64_t>(v);
    return KlvStatus::Ok;
}


KlvStatus
read_ber_oid(ByteCursor& cursor, uint128_t* out,
             const EncodingPolicy& policy) noexcept
{
    if (!out) {
        return KlvStatus::Malformed;
    }

    const uint64_t start = cursor.position();
    uint128_t v          = 0;
    uint32_t groups      = 0;
    for (;;) {
        uint8_t b = 0;
        if (cursor.read_u8(&b) != KlvStatus::Ok) {
            (void)cursor.seek(start);
            return KlvStatus::UnexpectedEnd;
        }

        const bool more     = (b & 0x80U) != 0;
        const uint8_t chunk = static_cast<uint8_t>(b & 0x7FU);
        if (groups == 0U && more && chunk == 0U && policy.strict) {
            (void)cursor.seek(start);
            return KlvStatus::NonMinimal;
        }
        if ((v >> 121) != 0U) {
            (void)cursor.seek(start);
            return KlvStatus::Overflow;
        }

        v = (v << 7) | static_cast<uint128_t>(chunk);
        groups += 1;
        if (!more) {
            break;
        }
    }

    *out = v;
    return KlvStatus::Ok;
}


KlvStatus
decode_ber(std::span<const std::byte> bytes, uint128_t* out,
           uint64_t* consumed, const EncodingPolicy& policy) noexcept
{
    ByteCursor cursor(bytes);
    const KlvStatus st = read_ber(cursor, out, policy);
    if (consumed) {
        *consumed = cursor.position();
    }
    return st;
}


KlvStatus
decode_ber_oid(std::span<const std::byte> bytes, uint128_t* out,
               uint64_t* consumed, const EncodingPolicy& policy) noexcept
{
    ByteCursor cursor(bytes);
    const KlvStatus st = read_ber_oid(cursor, out, policy);
    if (consumed) {
        *consumed = cursor.position();
    }
    return st;
}

}  // namespace openklv
