// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>
#include <string_view>

namespace hdfetch::core {

enum class FetchErrc {
    success = 0,
    // Transport level, retried by the worker pool
    network_error,
    timeout,
    connection_lost,
    server_error,
    short_read,
    // Permanent
    not_found,
    http_error,
    unsupported_range,
    // Job level
    resolve_failed,
    video_unavailable,
    quality_unavailable,
    segment_fetch_failed,
    mux_failed,
    cancelled,
    invalid_transition,
    // Startup
    rate_parse_failed,
    invalid_argument,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hdfetch::fetch";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:              return "Success";
            case FetchErrc::network_error:        return "Network error";
            case FetchErrc::timeout:              return "Operation timed out";
            case FetchErrc::connection_lost:      return "Connection lost";
            case FetchErrc::server_error:         return "Server error (5xx)";
            case FetchErrc::short_read:           return "Response ended before the requested range";
            case FetchErrc::not_found:            return "Resource not found (404)";
            case FetchErrc::http_error:           return "HTTP request rejected";
            case FetchErrc::unsupported_range:    return "Server does not support range requests";
            case FetchErrc::resolve_failed:       return "Could not resolve video";
            case FetchErrc::video_unavailable:    return "Video unavailable";
            case FetchErrc::quality_unavailable:  return "Requested quality not offered";
            case FetchErrc::segment_fetch_failed: return "Segment retry limit exhausted";
            case FetchErrc::mux_failed:           return "Muxing audio and video failed";
            case FetchErrc::cancelled:            return "Cancelled";
            case FetchErrc::invalid_transition:   return "Illegal job state transition";
            case FetchErrc::rate_parse_failed:    return "Malformed rate (expected e.g. 50M)";
            case FetchErrc::invalid_argument:     return "Invalid argument";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

// True for failures a segment retry may cure
[[nodiscard]] bool is_transient(const std::error_code& ec) noexcept;

// Error taxonomy name shown to the user: ResolveError, SegmentFetchError, ...
[[nodiscard]] std::string_view error_kind(const std::error_code& ec) noexcept;

} // namespace hdfetch::core

namespace std {

template<>
struct is_error_code_enum<hdfetch::core::FetchErrc> : true_type {};

} // namespace std
