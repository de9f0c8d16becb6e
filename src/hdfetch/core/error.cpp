// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/error.hpp>
#include <hdfetch/disk/error.hpp>

namespace hdfetch::core {

bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != fetch_errc_category()) return false;

    switch (static_cast<FetchErrc>(ec.value())) {
        case FetchErrc::network_error:
        case FetchErrc::timeout:
        case FetchErrc::connection_lost:
        case FetchErrc::server_error:
        case FetchErrc::short_read:
            return true;
        default:
            return false;
    }
}

std::string_view error_kind(const std::error_code& ec) noexcept {
    if (ec.category() == disk::disk_errc_category()) return "DiskError";
    if (ec.category() != fetch_errc_category()) return "SystemError";

    switch (static_cast<FetchErrc>(ec.value())) {
        case FetchErrc::resolve_failed:
        case FetchErrc::video_unavailable:
        case FetchErrc::quality_unavailable:
            return "ResolveError";
        case FetchErrc::unsupported_range:
            return "UnsupportedRangeError";
        case FetchErrc::segment_fetch_failed:
            return "SegmentFetchError";
        case FetchErrc::rate_parse_failed:
            return "RateParseError";
        case FetchErrc::mux_failed:
            return "MuxError";
        case FetchErrc::cancelled:
            return "Cancelled";
        default:
            return "FetchError";
    }
}

} // namespace hdfetch::core
