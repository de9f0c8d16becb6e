// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/locator.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace hdfetch::media {

// One downloadable stream found in the yt-dlp info document
struct StreamCandidate {
    core::Locator locator;
    std::uint32_t height{0};
    double bitrate{0.0};  // kbit/s, 0 if unknown
};

struct VideoInfo {
    std::string title;
    std::vector<StreamCandidate> streams;        // Direct HTTP streams only
    std::vector<core::FormatOption> formats;     // Everything yt-dlp lists
};

// Resolver backed by the yt-dlp executable (`yt-dlp -J`)
class YtDlpResolver final : public core::Resolver {
public:
    explicit YtDlpResolver(std::string executable = "yt-dlp");

    [[nodiscard]] std::expected<core::Resolution, std::error_code>
    resolve(std::string_view identifier, core::Quality quality, bool audio_only) override;

    [[nodiscard]] std::expected<std::vector<core::FormatOption>, std::error_code>
    list_formats(std::string_view identifier) override;

    // Parse the JSON printed by `yt-dlp -J`
    [[nodiscard]] static std::expected<VideoInfo, std::error_code>
    parse_info(std::string_view json_text);

    // Pick the best video (<= quality) + best audio, falling back to the
    // best muxed stream; audio_only picks the best audio stream alone
    [[nodiscard]] static std::expected<core::Resolution, std::error_code>
    select(const VideoInfo& info, core::Quality quality, bool audio_only);

private:
    [[nodiscard]] std::expected<VideoInfo, std::error_code> fetch_info(std::string_view identifier);

    std::string executable_;
};

} // namespace hdfetch::media
