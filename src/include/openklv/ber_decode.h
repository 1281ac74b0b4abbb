#pragma once

#include "openklv/byte_cursor.h"
#include "openklv/int128.h"
#include "openklv/klv_status.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file ber_decode.h
 * \brief Variable-length integer codecs: BER lengths and BER-OID tags.
 */

namespace openklv {

/**
 * \brief Reads a BER length (short or long form) at the cursor position.
 *
 * - Short form: one byte with MSB 0; the value is its low 7 bits.
 * - Long form: MSB 1, low 7 bits = N (1..127) following big-endian bytes.
 *
 * Returns:
 * - \ref KlvStatus::UnexpectedEnd if the source ends inside the field
 * - \ref KlvStatus::Malformed for a long-form header with N == 0
 * - \ref KlvStatus::Overflow for more than 128 significant bits
 * - \ref KlvStatus::NonMinimal for a long-form value <= 127 (strict policy)
 *
 * On success the cursor is just past the field; on failure it is unchanged.
 */
KlvStatus
read_ber(ByteCursor& cursor, uint128_t* out,
         const EncodingPolicy& policy = EncodingPolicy {}) noexcept;

/// Reads the \p num_bytes big-endian bytes that follow a long-form BER header.
KlvStatus
read_ber_long_form(ByteCursor& cursor, uint32_t num_bytes, uint128_t* out,
                   const EncodingPolicy& policy = EncodingPolicy {}) noexcept;

/// \ref read_ber narrowed to 64 bits (\ref KlvStatus::Overflow if it does not fit).
KlvStatus
read_ber_length(ByteCursor& cursor, uint64_t* out,
                const EncodingPolicy& policy = EncodingPolicy {}) noexcept;

/**
 * \brief Reads a BER-OID (base-128, continuation-bit) value.
 *
 * Each byte contributes its low 7 bits, most significant group first; a
 * byte with MSB 0 terminates the value.
 *
 * Returns \ref KlvStatus::UnexpectedEnd if the source ends before a
 * terminating byte, \ref KlvStatus::Overflow past 128 significant bits, and
 * \ref KlvStatus::NonMinimal for a multi-byte value whose first group is zero
 * (strict policy). On failure the cursor is unchanged.
 */
KlvStatus
read_ber_oid(ByteCursor& cursor, uint128_t* out,
             const EncodingPolicy& policy = EncodingPolicy {}) noexcept;

/// Decodes a BER value at the start of \p bytes; \p consumed receives its size.
KlvStatus
decode_ber(std::span<const std::byte> bytes, uint128_t* out,
           uint64_t* consumed,
           const EncodingPolicy& policy = EncodingPolicy {}) noexcept;

/// Decodes a BER-OID value at the start of \p bytes; \p consumed receives its size.
KlvStatus
decode_ber_oid(std::span<const std::byte> bytes, uint128_t* out,
               uint64_t* consumed,
               const EncodingPolicy& policy = EncodingPolicy {}) noexcept;

}  // namespace openklv
