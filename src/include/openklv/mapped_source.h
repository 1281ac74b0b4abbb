#pragma once

#include "openklv/byte_cursor.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file mapped_source.h
 * \brief Read-only file mapping used as a seekable KLV byte source.
 */

namespace openklv {

/// Status code for \ref MappedSource::open.
enum class SourceStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    TooLarge,
    MapFailed,
};

/// Returns a stable lowercase name for \p status.
const char*
source_status_name(SourceStatus status) noexcept;

/**
 * \brief Whole-file, read-only memory mapping.
 *
 * Motion imagery files are often several GB; mapping keeps them addressable
 * for the random-access reads of \ref ByteCursor without copying.
 * Empty files map to an empty span.
 */
class MappedSource final {
public:
    MappedSource() noexcept = default;
    ~MappedSource() noexcept;

    MappedSource(const MappedSource&)            = delete;
    MappedSource& operator=(const MappedSource&) = delete;

    MappedSource(MappedSource&& other) noexcept;
    MappedSource& operator=(MappedSource&& other) noexcept;

    /// Maps \p path. \p max_file_bytes is a hard cap (0 = unlimited).
    SourceStatus open(const char* path, uint64_t max_file_bytes = 0) noexcept;
    /// Unmaps and closes (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept { return size_; }
    std::span<const std::byte> bytes() const noexcept;

    /// A fresh cursor at offset 0 over the mapped bytes.
    ByteCursor cursor() const noexcept { return ByteCursor(bytes()); }

private:
    void take(MappedSource& other) noexcept;

#if defined(_WIN32)
    void* file_handle_ = nullptr;
    void* map_handle_  = nullptr;
#else
    int fd_ = -1;
#endif
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
};

}  // namespace openklv
