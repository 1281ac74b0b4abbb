#pragma once

#include "openklv/byte_cursor.h"
#include "openklv/int128.h"
#include "openklv/klv_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file klv.h
 * \brief Tag/length/value triplet reader with lazy value access.
 */

namespace openklv {

/// Resource limits applied to a single triplet.
struct KlvDecodeLimits final {
    /// Largest accepted value length in bytes (0 = unlimited).
    uint64_t max_value_bytes = 64ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref read_klv.
struct KlvDecodeOptions final {
    EncodingPolicy encoding;
    KlvDecodeLimits limits;
};

/**
 * \brief One parsed tag/length/value unit.
 *
 * A triplet describes its value by offset and length only; the bytes stay in
 * the source and are read on demand with \ref read_klv_value.
 */
struct Klv final {
    /// BER-OID encoded tag number.
    uint128_t tag = 0;
    /// BER encoded value length in bytes.
    uint64_t length = 0;
    /// Absolute offset of the first value byte.
    uint64_t value_offset = 0;

    uint64_t end_offset() const noexcept { return value_offset + length; }
};

/**
 * \brief Reads a triplet at the cursor position.
 *
 * Decodes the tag (BER-OID) and length (BER), records the value offset and
 * skips the value without reading it. On success the cursor is just past the
 * value. On failure the cursor is restored to the triplet start and the
 * first failing status is returned:
 * - codec statuses from \ref read_ber_oid / \ref read_ber_length
 * - \ref KlvStatus::UnexpectedEnd when the value extends past the source
 * - \ref KlvStatus::LimitExceeded when the length exceeds
 *   \ref KlvDecodeLimits::max_value_bytes
 */
KlvStatus
read_klv(ByteCursor& cursor, Klv* out,
         const KlvDecodeOptions& options = KlvDecodeOptions {}) noexcept;

/**
 * \brief Copies the value bytes of \p klv into \p out.
 *
 * The cursor position is saved before and restored after the read (on all
 * paths), so value reads can be interleaved with an outer parse. Repeated
 * calls return identical bytes while the source is unchanged.
 */
KlvStatus
read_klv_value(ByteCursor& cursor, const Klv& klv,
               std::vector<std::byte>* out);

/// Zero-copy view of the value bytes of \p klv. Does not move the cursor.
KlvStatus
klv_value_span(const ByteCursor& cursor, const Klv& klv,
               std::span<const std::byte>* out) noexcept;

}  // namespace openklv
