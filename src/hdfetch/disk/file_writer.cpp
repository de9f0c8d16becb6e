// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace hdfetch::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t size) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    path_ = path;
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return errno_to_error_code(errno);
    }

    // Pre-size so every segment can write straight to its final offset
    if (size > 0 && ::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        auto ec = errno_to_error_code(errno);
        close();
        return ec;
    }

    return {};
}

std::error_code FileWriter::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd_, p, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        p += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace hdfetch::disk
