#include "openklv/klv.h"

#include "openklv/ber_decode.h"

namespace openklv {

KlvStatus
read_klv(ByteCursor& cursor, Klv* out,
         const KlvDecodeOptions& options) noexcept
{
    if (!out) {
        return KlvStatus::Malformed;
    }

    const uint64_t start = cursor.position();

    Klv klv;
    KlvStatus st = read_ber_oid(cursor, &klv.tag, options.encoding);
    if (st != KlvStatus::Ok) {
        return st;
    }
    st = read_ber_length(cursor, &klv.length, options.encoding);
    if (st != KlvStatus::Ok) {
        (void)cursor.seek(start);
        return st;
    }

    const uint64_t max_value = options.limits.max_value_bytes;
    if (max_value != 0U && klv.length > max_value) {
        (void)cursor.seek(start);
        return KlvStatus::LimitExceeded;
    }

    klv.value_offset = cursor.position();
    st               = cursor.skip(klv.length);
    if (st != KlvStatus::Ok) {
        (void)cursor.seek(start);
        return st;
    }

    *out = klv;
    return KlvStatus::Ok;
}


KlvStatus
read_klv_value(ByteCursor& cursor, const Klv& klv,
               std::vector<std::byte>* out)
{
    if (!out) {
        return KlvStatus::Malformed;
    }
    out->clear();

    ScopedCursorRestore restore(cursor);
    KlvStatus st = cursor.seek(klv.value_offset);
    if (st != KlvStatus::Ok) {
        return st;
    }
    if (klv.length > cursor.remaining()) {
        return KlvStatus::UnexpectedEnd;
    }

    out->resize(static_cast<size_t>(klv.length));
    st = cursor.read_bytes(std::span<std::byte>(out->data(), out->size()));
    if (st != KlvStatus::Ok) {
        out->clear();
    }
    return st;
}


KlvStatus
klv_value_span(const ByteCursor& cursor, const Klv& klv,
               std::span<const std::byte>* out) noexcept
{
    return cursor.peek_span(klv.value_offset, klv.length, out);
}

}  // namespace openklv
