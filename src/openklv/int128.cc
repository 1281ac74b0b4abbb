#include "openklv/int128.h"

#include <bit>

namespace openklv {

uint32_t
bit_width_u128(uint128_t v) noexcept
{
    const uint64_t hi = uint128_hi(v);
    if (hi != 0U) {
        return 64U + static_cast<uint32_t>(std::bit_width(hi));
    }
    return static_cast<uint32_t>(std::bit_width(uint128_lo(v)));
}


void
append_u128_decimal(uint128_t v, std::string* out)
{
    if (!out) {
        return;
    }
    // 2^128-1 has 39 decimal digits.
    char buf[40];
    size_t n = 0;
    do {
        buf[n++] = static_cast<char>('0' + static_cast<unsigned>(v % 10U));
        v /= 10U;
    } while (v != 0U);

    out->reserve(out->size() + n);
    while (n > 0) {
        out->push_back(buf[--n]);
    }
}


void
append_i128_decimal(int128_t v, std::string* out)
{
    if (!out) {
        return;
    }
    if (v < 0) {
        out->push_back('-');
        // Negate in the unsigned domain so INT128_MIN does not overflow.
        append_u128_decimal(~static_cast<uint128_t>(v) + 1U, out);
        return;
    }
    append_u128_decimal(static_cast<uint128_t>(v), out);
}


std::string
u128_to_string(uint128_t v)
{
    std::string s;
    append_u128_decimal(v, &s);
    return s;
}


std::string
i128_to_string(int128_t v)
{
    std::string s;
    append_i128_decimal(v, &s);
    return s;
}

}  // namespace openklv
