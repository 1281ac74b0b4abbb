#pragma once

#include <cstdint>
#include <string>

/**
 * \file int128.h
 * \brief 128-bit integer aliases and text formatting helpers.
 */

namespace openklv {

/// Unsigned 128-bit integer (GCC/Clang extension).
using uint128_t = unsigned __int128;
/// Signed 128-bit integer (GCC/Clang extension).
using int128_t = __int128;

static constexpr uint128_t
uint128_max() noexcept
{
    return ~static_cast<uint128_t>(0);
}


static constexpr uint128_t
make_uint128(uint64_t hi, uint64_t lo) noexcept
{
    return (static_cast<uint128_t>(hi) << 64) | static_cast<uint128_t>(lo);
}


static constexpr uint64_t
uint128_hi(uint128_t v) noexcept
{
    return static_cast<uint64_t>(v >> 64);
}


static constexpr uint64_t
uint128_lo(uint128_t v) noexcept
{
    return static_cast<uint64_t>(v);
}

/// Number of significant bits in \p v (0 for zero).
uint32_t
bit_width_u128(uint128_t v) noexcept;

/// Appends the decimal representation of \p v into \p out.
void
append_u128_decimal(uint128_t v, std::string* out);
/// Appends the decimal representation of \p v (with '-' when negative).
void
append_i128_decimal(int128_t v, std::string* out);

/// Convenience wrappers returning a new string.
std::string
u128_to_string(uint128_t v);
std::string
i128_to_string(int128_t v);

}  // namespace openklv
