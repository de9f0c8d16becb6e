// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hdfetch::core {

enum class MediaKind : std::uint8_t {
    video,  // Video-only elementary stream
    audio,  // Audio-only elementary stream
    muxed   // Both tracks in one container
};

enum class Quality : std::uint8_t {
    p1080,
    p1440,
    p2160,
    best
};

[[nodiscard]] std::string_view to_string(MediaKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Quality quality) noexcept;
[[nodiscard]] std::optional<Quality> parse_quality(std::string_view text) noexcept;

// Height ceiling for a quality request, nullopt for best
[[nodiscard]] std::optional<std::uint32_t> max_height(Quality quality) noexcept;

// Fetchable description of one media resource, immutable once resolved
struct Locator {
    std::string address;
    std::optional<std::uint64_t> total_size;
    bool supports_ranges{false};
    MediaKind kind{MediaKind::muxed};
    std::string container;   // File extension: mp4, webm, m4a ...
    std::string codec;
    std::string format_id;
};

// One entry of a format listing
struct FormatOption {
    std::string format_id;
    std::string container;
    std::string resolution;  // "1920x1080" or "audio only"
    std::uint32_t height{0};
    double fps{0.0};
    std::string video_codec;
    std::string audio_codec;
    std::optional<std::uint64_t> size;
    std::string note;
};

struct Resolution {
    std::string title;
    std::vector<Locator> locators;  // One entry, or video + audio when muxing
};

// Stream resolver: turns an identifier into locators and lists formats
class Resolver {
public:
    virtual ~Resolver() = default;

    [[nodiscard]] virtual std::expected<Resolution, std::error_code>
    resolve(std::string_view identifier, Quality quality, bool audio_only) = 0;

    [[nodiscard]] virtual std::expected<std::vector<FormatOption>, std::error_code>
    list_formats(std::string_view identifier) = 0;
};

} // namespace hdfetch::core
