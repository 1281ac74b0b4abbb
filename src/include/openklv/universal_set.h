#pragma once

#include "openklv/byte_cursor.h"
#include "openklv/klv_status.h"
#include "openklv/local_set.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file universal_set.h
 * \brief Locates 16-byte universal keys and decodes the local sets behind them.
 */

namespace openklv {

/// A universal key is always 16 bytes.
static constexpr uint32_t kUniversalKeyLength = 16;

using UniversalKey = std::array<std::byte, kUniversalKeyLength>;

/// MISB ST 0601 UAS Datalink Local Set key.
inline constexpr UniversalKey kUasDatalinkLocalSetKey = {
    std::byte { 0x06 }, std::byte { 0x0E }, std::byte { 0x2B },
    std::byte { 0x34 }, std::byte { 0x02 }, std::byte { 0x0B },
    std::byte { 0x01 }, std::byte { 0x01 }, std::byte { 0x0E },
    std::byte { 0x01 }, std::byte { 0x03 }, std::byte { 0x01 },
    std::byte { 0x01 }, std::byte { 0x00 }, std::byte { 0x00 },
    std::byte { 0x00 },
};

/// Copies \p bytes into \p out. Fails unless exactly 16 bytes are given.
bool
make_universal_key(std::span<const std::byte> bytes, UniversalKey* out) noexcept;

/**
 * \brief Parses 32 hex digits into a key.
 *
 * '.', ':', '-' and ' ' separators are ignored, so both
 * `060E2B34020B01010E01030101000000` and `06.0E.2B.34...` are accepted.
 */
bool
parse_universal_key_hex(std::string_view text, UniversalKey* out) noexcept;

/// Resource limits applied while scanning for universal sets.
struct UniversalSetLimits final {
    /// Maximum number of sets reported for one source (0 = unlimited).
    uint32_t max_sets = 1000000;
};

/// Options for \ref find_universal_key_offsets and \ref read_universal_sets.
struct UniversalSetOptions final {
    LocalSetOptions local_set;
    UniversalSetLimits limits;
    /**
     * Default (false) is fail-fast: a malformed length or local set behind a
     * matched key aborts the whole operation, which suits validating
     * well-formed archives. When true, such a match is counted in
     * \ref UniversalSetResult::sets_skipped and scanning resumes one byte
     * after the match start (recovery scanning of damaged captures).
     */
    bool skip_malformed = false;
};

/// A local set found behind one occurrence of a universal key.
struct UniversalSet final {
    UniversalKey key {};
    /// Absolute offset of the first key byte.
    uint64_t key_offset = 0;
    /// Declared local set length (the BER length after the key).
    uint64_t length = 0;
    LocalSet local_set;
};

struct UniversalSetResult final {
    KlvStatus status = KlvStatus::Ok;
    uint32_t sets_found   = 0;
    uint32_t sets_skipped = 0;
};

/**
 * \brief Scans the whole source for \p key and appends each match offset.
 *
 * A 16-byte window slides over the source one byte at a time. After a match
 * the BER length that follows the key is decoded and the value is skipped
 * entirely, so key-like bytes inside a payload never produce a match.
 *
 * The window is cleared after the skip and refilled from the bytes after the
 * value, instead of continuing to shift the bytes already held. A match can
 * therefore never straddle the key and value just consumed. The results only
 * differ for keys whose trailing bytes repeat their leading bytes.
 *
 * With \ref UniversalSetOptions::skip_malformed the local set behind each
 * match is also parsed during the scan. A match whose set cannot be decoded
 * is counted as skipped and the scan resumes one byte after the match start,
 * so sets inside the bad span are still found.
 *
 * Offsets are appended in ascending order. Sources shorter than the key
 * produce no matches.
 */
UniversalSetResult
find_universal_key_offsets(ByteCursor& cursor, const UniversalKey& key,
                           std::vector<uint64_t>* out,
                           const UniversalSetOptions& options
                           = UniversalSetOptions {});

/**
 * \brief Decodes the universal set whose key starts at \p key_offset.
 *
 * Verifies the key bytes, decodes the following BER length and parses the
 * local set over the value span.
 */
UniversalSetResult
read_universal_set(ByteCursor& cursor, const UniversalKey& key,
                   uint64_t key_offset, UniversalSet* out,
                   const UniversalSetOptions& options = UniversalSetOptions {});

/**
 * \brief Locates every occurrence of \p key and decodes each universal set.
 *
 * In fail-fast mode the first failure is returned; sets decoded before it
 * remain in \p out.
 */
UniversalSetResult
read_universal_sets(ByteCursor& cursor, const UniversalKey& key,
                    std::vector<UniversalSet>* out,
                    const UniversalSetOptions& options = UniversalSetOptions {});

}  // namespace openklv
