#pragma once

#include "openklv/byte_cursor.h"
#include "openklv/int128.h"
#include "openklv/klv.h"
#include "openklv/klv_status.h"

#include <cstddef>
#include <cstdint>
#include <map>

/**
 * \file local_set.h
 * \brief Bounded, tag-indexed collection of triplets.
 */

namespace openklv {

/// What to do when a tag occurs more than once inside one local set.
enum class DuplicateTagPolicy : uint8_t {
    /// The later triplet replaces the earlier one.
    LastWins,
    /// The first triplet is kept; later ones are counted and dropped.
    FirstWins,
    /// Parsing fails with \ref KlvStatus::DuplicateTag.
    Reject,
};

/// Resource limits applied during local set decode.
struct LocalSetLimits final {
    /// Maximum number of triplets parsed from one set (0 = unlimited).
    uint32_t max_entries = 65536;
};

/// Decoder options for \ref read_local_set.
struct LocalSetOptions final {
    KlvDecodeOptions klv;
    LocalSetLimits limits;
    DuplicateTagPolicy duplicates = DuplicateTagPolicy::LastWins;
};

struct LocalSetResult final {
    KlvStatus status = KlvStatus::Ok;
    /// Number of triplets parsed (including replaced/dropped duplicates).
    uint32_t triplets_read = 0;
    /// Number of triplets whose tag was already present.
    uint32_t duplicates = 0;
};

class LocalSet;

/**
 * \brief Parses triplets over `[start_offset, end_offset)` into \p out.
 *
 * The span must be consumed exactly: a triplet that crosses \p end_offset
 * yields \ref KlvStatus::Malformed (or \ref KlvStatus::UnexpectedEnd when
 * \p end_offset is beyond the source). Codec failures propagate unchanged
 * and abort the set.
 *
 * On success the cursor is at \p end_offset; on failure it is at the start of
 * the triplet that failed.
 */
LocalSetResult
read_local_set(ByteCursor& cursor, uint64_t start_offset, uint64_t end_offset,
               LocalSet* out,
               const LocalSetOptions& options = LocalSetOptions {});

/// Parses the value of \p parent as a nested local set.
LocalSetResult
read_local_set(ByteCursor& cursor, const Klv& parent, LocalSet* out,
               const LocalSetOptions& options = LocalSetOptions {});

/**
 * \brief Tag-indexed triplets of one local set.
 *
 * Iteration is in ascending tag order, independent of encounter order.
 */
class LocalSet final {
public:
    using Map            = std::map<uint128_t, Klv>;
    using const_iterator = Map::const_iterator;

    LocalSet() = default;

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    /// Returns the triplet for \p tag, or nullptr.
    const Klv* find(uint128_t tag) const noexcept;
    bool contains(uint128_t tag) const noexcept;

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    /// Absolute byte span the set was parsed from.
    uint64_t start_offset() const noexcept { return start_offset_; }
    uint64_t end_offset() const noexcept { return end_offset_; }

private:
    friend LocalSetResult read_local_set(ByteCursor& cursor,
                                         uint64_t start_offset,
                                         uint64_t end_offset,
                                         LocalSet* out,
                                         const LocalSetOptions& options);

    Map entries_;
    uint64_t start_offset_ = 0;
    uint64_t end_offset_   = 0;
};

}  // namespace openklv
