#include "openklv/universal_set.h"

#include "openklv/ber_decode.h"

#include <algorithm>
#include <utility>

namespace openklv {
namespace {

    static int hex_digit(char c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }


    // Ring buffer over the most recently read bytes.
    struct SearchWindow final {
        UniversalKey bytes {};
        uint32_t head   = 0;  // index of the oldest byte
        uint32_t filled = 0;

        void reset() noexcept
        {
            head   = 0;
            filled = 0;
        }

        void push(std::byte b) noexcept
        {
            if (filled < kUniversalKeyLength) {
                bytes[filled] = b;
                filled += 1;
                return;
            }
            bytes[head] = b;
            head        = (head + 1U) % kUniversalKeyLength;
        }

        bool matches(const UniversalKey& key) const noexcept
        {
            if (filled < kUniversalKeyLength) {
                return false;
            }
            for (uint32_t i = 0; i < kUniversalKeyLength; ++i) {
                if (bytes[(head + i) % kUniversalKeyLength] != key[i]) {
                    return false;
                }
            }
            return true;
        }
    };

}  // namespace

bool
make_universal_key(std::span<const std::byte> bytes, UniversalKey* out) noexcept
{
    if (!out || bytes.size() != kUniversalKeyLength) {
        return false;
    }
    std::copy(bytes.begin(), bytes.end(), out->begin());
    return true;
}


bool
parse_universal_key_hex(std::string_view text, UniversalKey* out) noexcept
{
    if (!out) {
        return false;
    }
    UniversalKey key {};
    uint32_t nibbles = 0;
    for (char c : text) {
        if (c == '.' || c == ':' || c == '-' || c == ' ') {
            continue;
        }
        const int d = hex_digit(c);
        if (d < 0 || nibbles >= kUniversalKeyLength * 2U) {
            return false;
        }
        const uint32_t i = nibbles / 2U;
        const uint8_t v  = static_cast<uint8_t>(key[i]);
        key[i]           = std::byte { static_cast<uint8_t>((v << 4) | d) };
        nibbles += 1;
    }
    if (nibbles != kUniversalKeyLength * 2U) {
        return false;
    }
    *out = key;
    return true;
}


UniversalSetResult
find_universal_key_offsets(ByteCursor& cursor, const UniversalKey& key,
                           std::vector<uint64_t>* out,
                           const UniversalSetOptions& options)
{
    UniversalSetResult result;
    if (!out) {
        result.status = KlvStatus::Malformed;
        return result;
    }

    const EncodingPolicy& policy = options.local_set.klv.encoding;
    const uint32_t max_sets      = options.limits.max_sets;

    (void)cursor.seek(0);
    SearchWindow window;
    for (;;) {
        uint8_t b = 0;
        if (cursor.read_u8(&b) != KlvStatus::Ok) {
            break;
        }
        window.push(std::byte { b });
        if (!window.matches(key)) {
            continue;
        }

        // Matches complete on the last key byte.
        const uint64_t start_pos = cursor.position() - kUniversalKeyLength;

        uint64_t length = 0;
        KlvStatus st    = read_ber_length(cursor, &length, policy);
        if (st == KlvStatus::Ok) {
            st = cursor.skip(length);
        }
        if (st == KlvStatus::Ok && options.skip_malformed) {
            // A malformed set must not hide keys inside its declared span.
            const uint64_t value_end = cursor.position();
            LocalSet scratch;
            st = read_local_set(cursor, value_end - length, value_end,
                                &scratch, options.local_set)
                     .status;
        }
        if (st != KlvStatus::Ok) {
            if (!options.skip_malformed) {
                result.status = st;
                return result;
            }
            result.sets_skipped += 1;
            (void)cursor.seek(start_pos + 1U);
            window.reset();
            continue;
        }

        if (max_sets != 0U && result.sets_found >= max_sets) {
            result.status = KlvStatus::LimitExceeded;
            return result;
        }
        out->push_back(start_pos);
        result.sets_found += 1;
        window.reset();
    }

    return result;
}


UniversalSetResult
read_universal_set(ByteCursor& cursor, const UniversalKey& key,
                   uint64_t key_offset, UniversalSet* out,
                   const UniversalSetOptions& options)
{
    UniversalSetResult result;
    if (!out) {
        result.status = KlvStatus::Malformed;
        return result;
    }

    std::span<const std::byte> found;
    result.status = cursor.peek_span(key_offset, kUniversalKeyLength, &found);
    if (result.status != KlvStatus::Ok) {
        return result;
    }
    if (!std::equal(found.begin(), found.end(), key.begin())) {
        result.status = KlvStatus::Malformed;
        return result;
    }

    (void)cursor.seek(key_offset + kUniversalKeyLength);
    uint64_t length = 0;
    result.status   = read_ber_length(cursor, &length,
                                      options.local_set.klv.encoding);
    if (result.status != KlvStatus::Ok) {
        return result;
    }
    if (length > cursor.remaining()) {
        result.status = KlvStatus::UnexpectedEnd;
        return result;
    }

    const uint64_t value_start = cursor.position();
    out->key                   = key;
    out->key_offset            = key_offset;
    out->length                = length;
    const LocalSetResult ls    = read_local_set(cursor, value_start,
                                                value_start + length,
                                                &out->local_set,
                                                options.local_set);
    result.status = ls.status;
    if (result.status == KlvStatus::Ok) {
        result.sets_found = 1;
    }
    return result;
}


UniversalSetResult
read_universal_sets(ByteCursor& cursor, const UniversalKey& key,
                    std::vector<UniversalSet>* out,
                    const UniversalSetOptions& options)
{
    UniversalSetResult result;
    if (!out) {
        result.status = KlvStatus::Malformed;
        return result;
    }

    std::vector<uint64_t> offsets;
    const UniversalSetResult located = find_universal_key_offsets(cursor, key,
                                                                  &offsets,
                                                                  options);
    result.sets_skipped = located.sets_skipped;
    if (located.status != KlvStatus::Ok) {
        result.status = located.status;
        return result;
    }

    out->reserve(out->size() + offsets.size());
    for (const uint64_t offset : offsets) {
        UniversalSet set;
        const UniversalSetResult one = read_universal_set(cursor, key, offset,
                                                          &set, options);
        if (one.status != KlvStatus::Ok) {
            if (!options.skip_malformed) {
                result.status = one.status;
                return result;
            }
            result.sets_skipped += 1;
            continue;
        }
        out->push_back(std::move(set));
        result.sets_found += 1;
    }

    return result;
}

}  // namespace openklv
