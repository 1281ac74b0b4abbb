#include "openklv/console_format.h"

#include <cstdio>

namespace openklv {
namespace {

    static uint32_t clamp_count(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return static_cast<uint32_t>(size);
        }
        return max_bytes;
    }

}  // namespace

void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out)
{
    if (!out) {
        return;
    }
    static constexpr char kHex[] = "0123456789ABCDEF";

    const uint32_t n = clamp_count(bytes.size(), max_bytes);
    out->reserve(out->size() + static_cast<size_t>(n) * 2U);
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kHex[v >> 4]);
        out->push_back(kHex[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


bool
append_ascii_preview(std::span<const std::byte> bytes, uint32_t max_bytes,
                     std::string* out)
{
    if (!out) {
        return false;
    }
    bool printable   = true;
    const uint32_t n = clamp_count(bytes.size(), max_bytes);
    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t c = static_cast<uint8_t>(bytes[i]);
        if (c < 0x20U || c >= 0x7FU) {
            out->push_back('.');
            printable = false;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < bytes.size()) {
        out->append("...");
    }
    return printable;
}


void
append_tag(uint128_t tag, std::string* out)
{
    if (!out) {
        return;
    }
    append_u128_decimal(tag, out);
    if (tag < 128U) {
        return;
    }

    char buf[40];
    out->append(" (0x");
    if (uint128_hi(tag) != 0U) {
        std::snprintf(buf, sizeof(buf), "%llX%016llX",
                      static_cast<unsigned long long>(uint128_hi(tag)),
                      static_cast<unsigned long long>(uint128_lo(tag)));
    } else {
        std::snprintf(buf, sizeof(buf), "%llX",
                      static_cast<unsigned long long>(uint128_lo(tag)));
    }
    out->append(buf);
    out->push_back(')');
}

}  // namespace openklv
