// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace hdfetch::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    rename_failed,
    handle_invalid,
    slot_overflow,
    incomplete_output,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hdfetch::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::file_not_found:     return "File not found";
            case DiskErrc::access_denied:      return "Access denied";
            case DiskErrc::disk_full:          return "Disk full";
            case DiskErrc::invalid_path:       return "Invalid path";
            case DiskErrc::write_error:        return "Write error";
            case DiskErrc::rename_failed:      return "Could not move partial file into place";
            case DiskErrc::handle_invalid:     return "Invalid handle";
            case DiskErrc::slot_overflow:      return "Write past the end of a segment slot";
            case DiskErrc::incomplete_output:  return "Output still has segments that are not done";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an errno value from open/pwrite/rename to a DiskErrc
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace hdfetch::disk

namespace std {

template<>
struct is_error_code_enum<hdfetch::disk::DiskErrc> : true_type {};

} // namespace std
