#pragma once

#include "openklv/int128.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace openklv {

// Appends uppercase hex bytes into `out` (no "0x" prefix, no separators).
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out);

// Appends a terminal-safe ASCII rendering of a value: printable bytes as-is,
// everything else as '.'. Truncates like `append_hex_bytes`.
//
// Returns true when every rendered byte was printable ASCII.
bool
append_ascii_preview(std::span<const std::byte> bytes, uint32_t max_bytes,
                     std::string* out);

// Appends a tag number in decimal, followed by " (0x...)" when it is wider
// than one BER-OID byte.
void
append_tag(uint128_t tag, std::string* out);

}  // namespace openklv
