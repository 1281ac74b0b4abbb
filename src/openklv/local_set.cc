#include "openklv/local_set.h"

namespace openklv {

const Klv*
LocalSet::find(uint128_t tag) const noexcept
{
    const auto it = entries_.find(tag);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}


bool
LocalSet::contains(uint128_t tag) const noexcept
{
    return entries_.find(tag) != entries_.end();
}


LocalSetResult
read_local_set(ByteCursor& cursor, uint64_t start_offset, uint64_t end_offset,
               LocalSet* out, const LocalSetOptions& options)
{
    LocalSetResult result;
    if (!out) {
        result.status = KlvStatus::Malformed;
        return result;
    }
    out->entries_.clear();
    out->start_offset_ = start_offset;
    out->end_offset_   = end_offset;

    if (end_offset < start_offset) {
        result.status = KlvStatus::Malformed;
        return result;
    }
    if (end_offset > cursor.size()) {
        result.status = KlvStatus::UnexpectedEnd;
        return result;
    }
    result.status = cursor.seek(start_offset);
    if (result.status != KlvStatus::Ok) {
        return result;
    }

    // Triplets are read through a view that ends at `end_offset`, so a field
    // crossing the boundary fails instead of reading the next structure.
    ByteCursor bounded(cursor.bytes().first(static_cast<size_t>(end_offset)));
    (void)bounded.seek(start_offset);

    const uint32_t max_entries = options.limits.max_entries;
    while (bounded.position() < end_offset) {
        if (max_entries != 0U && result.triplets_read >= max_entries) {
            result.status = KlvStatus::LimitExceeded;
            break;
        }

        const uint64_t triplet_start = bounded.position();
        Klv klv;
        const KlvStatus st = read_klv(bounded, &klv, options.klv);
        if (st != KlvStatus::Ok) {
            // Bytes exist past the boundary: the triplet overshoots the span.
            if (st == KlvStatus::UnexpectedEnd && end_offset < cursor.size()) {
                result.status = KlvStatus::Malformed;
            } else {
                result.status = st;
            }
            break;
        }
        result.triplets_read += 1;

        const auto it = out->entries_.find(klv.tag);
        if (it == out->entries_.end()) {
            out->entries_.emplace(klv.tag, klv);
            continue;
        }

        result.duplicates += 1;
        if (options.duplicates == DuplicateTagPolicy::Reject) {
            result.status = KlvStatus::DuplicateTag;
            (void)cursor.seek(triplet_start);
            return result;
        }
        if (options.duplicates == DuplicateTagPolicy::LastWins) {
            it->second = klv;
        }
    }

    (void)cursor.seek(bounded.position());
    return result;
}


LocalSetResult
read_local_set(ByteCursor& cursor, const Klv& parent, LocalSet* out,
               const LocalSetOptions& options)
{
    return read_local_set(cursor, parent.value_offset, parent.end_offset(),
                          out, options);
}

}  // namespace openklv
