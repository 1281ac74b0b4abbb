#include "openklv/byte_cursor.h"

#include <cstring>

namespace openklv {

ByteCursor::ByteCursor(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


uint64_t
ByteCursor::size() const noexcept
{
    return static_cast<uint64_t>(bytes_.size());
}


uint64_t
ByteCursor::position() const noexcept
{
    return pos_;
}


uint64_t
ByteCursor::remaining() const noexcept
{
    return size() - pos_;
}


bool
ByteCursor::at_end() const noexcept
{
    return pos_ >= size();
}


std::span<const std::byte>
ByteCursor::bytes() const noexcept
{
    return bytes_;
}


KlvStatus
ByteCursor::seek(uint64_t offset) noexcept
{
    if (offset > size()) {
        return KlvStatus::UnexpectedEnd;
    }
    pos_ = offset;
    return KlvStatus::Ok;
}


KlvStatus
ByteCursor::skip(uint64_t count) noexcept
{
    if (count > remaining()) {
        return KlvStatus::UnexpectedEnd;
    }
    pos_ += count;
    return KlvStatus::Ok;
}


KlvStatus
ByteCursor::read_u8(uint8_t* out) noexcept
{
    if (!out || pos_ >= size()) {
        return KlvStatus::UnexpectedEnd;
    }
    *out = static_cast<uint8_t>(bytes_[static_cast<size_t>(pos_)]);
    pos_ += 1;
    return KlvStatus::Ok;
}


KlvStatus
ByteCursor::read_bytes(std::span<std::byte> dst) noexcept
{
    const uint64_t n = static_cast<uint64_t>(dst.size());
    if (n > remaining()) {
        return KlvStatus::UnexpectedEnd;
    }
    if (n != 0U) {
        std::memcpy(dst.data(), bytes_.data() + static_cast<size_t>(pos_),
                    static_cast<size_t>(n));
    }
    pos_ += n;
    return KlvStatus::Ok;
}


KlvStatus
ByteCursor::peek_span(uint64_t offset, uint64_t count,
                      std::span<const std::byte>* out) const noexcept
{
    if (!out || offset > size() || count > size() - offset) {
        return KlvStatus::UnexpectedEnd;
    }
    *out = bytes_.subspan(static_cast<size_t>(offset),
                          static_cast<size_t>(count));
    return KlvStatus::Ok;
}

}  // namespace openklv
