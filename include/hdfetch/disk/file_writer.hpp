// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hdfetch::disk {

// Positional writer over a POSIX file descriptor. Writes at explicit
// offsets (pwrite), so segments may write disjoint regions concurrently
// without a lock.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate `path`; a non-zero size pre-sizes the file
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t size = 0) noexcept;

    // Write all of `data` at `offset` (thread-safe for disjoint regions)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Flush file contents to disk
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::string path_;
};

} // namespace hdfetch::disk
