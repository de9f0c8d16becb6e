// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/error.hpp>
#include <hdfetch/core/segment.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace hdfetch::core {

// What a HEAD request tells us about a resource
struct ResourceInfo {
    std::int32_t status_code{0};
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string content_type;
};

// Receives body bytes as they arrive. Returning an error aborts the
// transfer and the error is handed back by fetch().
using ChunkSink = std::function<std::error_code(std::span<const std::byte>)>;

// Performs range requests. Implementations must be safe to call from many
// worker threads at once.
class RangeSource {
public:
    virtual ~RangeSource() = default;

    [[nodiscard]] virtual std::expected<ResourceInfo, std::error_code>
    probe(const std::string& address) = 0;

    // Stream `range` of `address` into `sink`. Transport failures map to
    // the transient FetchErrc values; a server that ignores the Range
    // header yields unsupported_range.
    [[nodiscard]] virtual std::error_code
    fetch(const std::string& address, const ByteRange& range,
          const ChunkSink& sink, std::stop_token stoken) = 0;
};

// libcurl implementation, one easy handle per request
class HttpSession final : public RangeSource {
public:
    HttpSession() = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<ResourceInfo, std::error_code>
    probe(const std::string& address) override;

    [[nodiscard]] std::error_code
    fetch(const std::string& address, const ByteRange& range,
          const ChunkSink& sink, std::stop_token stoken) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    static void parse_headers(const std::map<std::string, std::string>& headers,
                              ResourceInfo& info) noexcept;
};

// Map an HTTP status code to a FetchErrc, success for 2xx
[[nodiscard]] std::error_code http_status_to_error(long status) noexcept;

} // namespace hdfetch::core
