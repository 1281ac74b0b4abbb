#pragma once

#include <cstdint>

/**
 * \file klv_status.h
 * \brief Status codes shared by all OpenKLV decoders.
 */

namespace openklv {

/// Decode result status.
enum class KlvStatus : uint8_t {
    Ok,
    /// Fewer bytes are available than a field declares (or a seek/skip
    /// would move past the end of the source).
    UnexpectedEnd,
    /// A fixed-width integer length is zero or wider than 16 bytes.
    InvalidLength,
    /// A value needs more bits than its container holds.
    Overflow,
    /// The bytes are structurally inconsistent.
    Malformed,
    /// A producer used a non-minimal encoding (strict policy only).
    NonMinimal,
    /// A tag is repeated in a local set under \ref DuplicateTagPolicy::Reject.
    DuplicateTag,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/// Returns a stable lowercase name for \p status (e.g. "unexpected_end").
const char*
klv_status_name(KlvStatus status) noexcept;

/**
 * \brief Producer well-formedness policy shared by the varint codecs.
 *
 * In strict mode, encodings that a conforming producer never emits
 * (long-form BER for a value <= 127, a BER-OID starting with a 0x80 group)
 * are rejected with \ref KlvStatus::NonMinimal. The policy is identical in
 * debug and release builds.
 */
struct EncodingPolicy final {
    bool strict = true;
};

}  // namespace openklv
