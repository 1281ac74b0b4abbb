#pragma once

#include "openklv/klv_status.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file byte_cursor.h
 * \brief Seekable read cursor over a byte span.
 */

namespace openklv {

/**
 * \brief Seekable, readable view over caller-owned bytes with one position.
 *
 * A cursor is the only mutable state of a parse session. Decoders take it by
 * reference, so each call holds exclusive access for its duration; callers
 * that share a cursor across threads must serialize access themselves.
 *
 * Failed reads, seeks and skips never move the position.
 */
class ByteCursor final {
public:
    ByteCursor() noexcept = default;
    explicit ByteCursor(std::span<const std::byte> bytes) noexcept;

    uint64_t size() const noexcept;
    uint64_t position() const noexcept;
    uint64_t remaining() const noexcept;
    bool at_end() const noexcept;
    std::span<const std::byte> bytes() const noexcept;

    /// Moves to absolute \p offset. Offsets up to and including size() are valid.
    KlvStatus seek(uint64_t offset) noexcept;
    /// Moves forward by \p count bytes.
    KlvStatus skip(uint64_t count) noexcept;

    /// Reads one byte.
    KlvStatus read_u8(uint8_t* out) noexcept;
    /// Reads exactly `dst.size()` bytes.
    KlvStatus read_bytes(std::span<std::byte> dst) noexcept;

    /// Returns a view of `[offset, offset + count)` without moving.
    KlvStatus peek_span(uint64_t offset, uint64_t count,
                        std::span<const std::byte>* out) const noexcept;

private:
    std::span<const std::byte> bytes_;
    uint64_t pos_ = 0;
};

/**
 * \brief Restores a cursor's position when the guard goes out of scope.
 *
 * Used for non-destructive reads (e.g. lazy value access) so that an
 * in-progress outer parse over the same cursor is unaffected, on success and
 * on every error path.
 */
class ScopedCursorRestore final {
public:
    explicit ScopedCursorRestore(ByteCursor& cursor) noexcept
        : cursor_(cursor)
        , saved_(cursor.position())
    {
    }

    ~ScopedCursorRestore() noexcept { (void)cursor_.seek(saved_); }

    ScopedCursorRestore(const ScopedCursorRestore&)            = delete;
    ScopedCursorRestore& operator=(const ScopedCursorRestore&) = delete;

    uint64_t saved_position() const noexcept { return saved_; }

private:
    ByteCursor& cursor_;
    uint64_t saved_;
};

}  // namespace openklv
