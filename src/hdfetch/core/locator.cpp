// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/locator.hpp>
#include <algorithm>
#include <cctype>

namespace hdfetch::core {

std::string_view to_string(MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::video: return "video";
        case MediaKind::audio: return "audio";
        case MediaKind::muxed: return "muxed";
    }
    return "unknown";
}

std::string_view to_string(Quality quality) noexcept {
    switch (quality) {
        case Quality::p1080: return "1080p";
        case Quality::p1440: return "1440p";
        case Quality::p2160: return "2160p";
        case Quality::best:  return "best";
    }
    return "best";
}

std::optional<Quality> parse_quality(std::string_view text) noexcept {
    auto equals = [text](std::string_view name) {
        return std::ranges::equal(text, name, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    };

    if (equals("1080p")) return Quality::p1080;
    if (equals("1440p")) return Quality::p1440;
    if (equals("2160p")) return Quality::p2160;
    if (equals("best")) return Quality::best;
    return std::nullopt;
}

std::optional<std::uint32_t> max_height(Quality quality) noexcept {
    switch (quality) {
        case Quality::p1080: return 1080;
        case Quality::p1440: return 1440;
        case Quality::p2160: return 2160;
        case Quality::best:  return std::nullopt;
    }
    return std::nullopt;
}

} // namespace hdfetch::core
