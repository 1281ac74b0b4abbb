#include "openklv/mapped_source.h"

#include <limits>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace openklv {
namespace {

    static SourceStatus check_size(uint64_t size,
                                   uint64_t max_file_bytes) noexcept
    {
        if (max_file_bytes != 0U && size > max_file_bytes) {
            return SourceStatus::TooLarge;
        }
        if (size > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
            return SourceStatus::TooLarge;
        }
        return SourceStatus::Ok;
    }

}  // namespace

const char*
source_status_name(SourceStatus status) noexcept
{
    switch (status) {
    case SourceStatus::Ok: return "ok";
    case SourceStatus::OpenFailed: return "open_failed";
    case SourceStatus::StatFailed: return "stat_failed";
    case SourceStatus::TooLarge: return "too_large";
    case SourceStatus::MapFailed: return "map_failed";
    }
    return "unknown";
}


MappedSource::~MappedSource() noexcept
{
    close();
}


MappedSource::MappedSource(MappedSource&& other) noexcept
{
    take(other);
}


MappedSource&
MappedSource::operator=(MappedSource&& other) noexcept
{
    if (this != &other) {
        close();
        take(other);
    }
    return *this;
}


void
MappedSource::take(MappedSource& other) noexcept
{
#if defined(_WIN32)
    file_handle_       = other.file_handle_;
    map_handle_        = other.map_handle_;
    other.file_handle_ = nullptr;
    other.map_handle_  = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif
    data_       = other.data_;
    size_       = other.size_;
    other.data_ = nullptr;
    other.size_ = 0;
}


#if defined(_WIN32)

SourceStatus
MappedSource::open(const char* path, uint64_t max_file_bytes) noexcept
{
    close();
    if (!path || !*path) {
        return SourceStatus::OpenFailed;
    }

    HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                             OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return SourceStatus::OpenFailed;
    }

    LARGE_INTEGER sz;
    if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
        ::CloseHandle(h);
        return SourceStatus::StatFailed;
    }
    const uint64_t size   = static_cast<uint64_t>(sz.QuadPart);
    const SourceStatus st = check_size(size, max_file_bytes);
    if (st != SourceStatus::Ok) {
        ::CloseHandle(h);
        return st;
    }

    HANDLE map = nullptr;
    if (size != 0U) {
        map = ::CreateFileMappingA(h, nullptr, PAGE_READONLY,
                                   static_cast<DWORD>(size >> 32),
                                   static_cast<DWORD>(size & 0xFFFFFFFFu),
                                   nullptr);
        void* p = map ? ::MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0) : nullptr;
        if (!p) {
            if (map) {
                ::CloseHandle(map);
            }
            ::CloseHandle(h);
            return SourceStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(p);
    }

    file_handle_ = static_cast<void*>(h);
    map_handle_  = static_cast<void*>(map);
    size_        = size;
    return SourceStatus::Ok;
}


void
MappedSource::close() noexcept
{
    if (data_) {
        ::UnmapViewOfFile(const_cast<void*>(static_cast<const void*>(data_)));
    }
    if (map_handle_) {
        ::CloseHandle(static_cast<HANDLE>(map_handle_));
    }
    if (file_handle_) {
        ::CloseHandle(static_cast<HANDLE>(file_handle_));
    }
    file_handle_ = nullptr;
    map_handle_  = nullptr;
    data_        = nullptr;
    size_        = 0;
}


bool
MappedSource::is_open() const noexcept
{
    return file_handle_ != nullptr;
}

#else

SourceStatus
MappedSource::open(const char* path, uint64_t max_file_bytes) noexcept
{
    close();
    if (!path || !*path) {
        return SourceStatus::OpenFailed;
    }

    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return SourceStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        ::close(fd);
        return SourceStatus::StatFailed;
    }
    const uint64_t size            = static_cast<uint64_t>(st.st_size);
    const SourceStatus size_status = check_size(size, max_file_bytes);
    if (size_status != SourceStatus::Ok) {
        ::close(fd);
        return size_status;
    }

    if (size != 0U) {
        void* p = ::mmap(nullptr, static_cast<size_t>(size), PROT_READ,
                         MAP_PRIVATE, fd, 0);
        if (p == MAP_FAILED) {
            ::close(fd);
            return SourceStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(p);
    }

    fd_   = fd;
    size_ = size;
    return SourceStatus::Ok;
}


void
MappedSource::close() noexcept
{
    if (data_ && size_ != 0U) {
        (void)::munmap(const_cast<void*>(static_cast<const void*>(data_)),
                       static_cast<size_t>(size_));
    }
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_   = -1;
    data_ = nullptr;
    size_ = 0;
}


bool
MappedSource::is_open() const noexcept
{
    return fd_ >= 0;
}

#endif


std::span<const std::byte>
MappedSource::bytes() const noexcept
{
    if (size_ == 0U) {
        return {};
    }
    return std::span<const std::byte>(data_, static_cast<size_t>(size_));
}

}  // namespace openklv
