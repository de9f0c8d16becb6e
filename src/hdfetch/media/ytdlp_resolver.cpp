// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/media/ytdlp_resolver.hpp>
#include <hdfetch/media/process.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <optional>

using json = nlohmann::json;

namespace hdfetch::media {

namespace {

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

double number_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0.0;
    return it->get<double>();
}

std::optional<std::uint64_t> size_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number() || it->get<double>() < 0) return std::nullopt;
    return it->get<std::uint64_t>();
}

bool has_codec(const std::string& codec) {
    return !codec.empty() && codec != "none";
}

// Only plain HTTP(S) files can be fetched by byte range
bool is_direct_http(const std::string& protocol) {
    return protocol == "https" || protocol == "http";
}

bool better(const StreamCandidate& a, const StreamCandidate& b) {
    if (a.height != b.height) return a.height > b.height;
    return a.bitrate > b.bitrate;
}

} // namespace

YtDlpResolver::YtDlpResolver(std::string executable)
    : executable_(std::move(executable)) {}

std::expected<VideoInfo, std::error_code> YtDlpResolver::parse_info(std::string_view json_text) {
    auto doc = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(make_error_code(core::FetchErrc::resolve_failed));
    }

    VideoInfo info;
    info.title = string_field(doc, "title");

    auto formats = doc.find("formats");
    if (formats == doc.end() || !formats->is_array() || formats->empty()) {
        return std::unexpected(make_error_code(core::FetchErrc::video_unavailable));
    }

    for (const auto& f : *formats) {
        if (!f.is_object()) continue;

        const auto vcodec = string_field(f, "vcodec");
        const auto acodec = string_field(f, "acodec");
        const auto protocol = string_field(f, "protocol");
        const auto height = static_cast<std::uint32_t>(number_field(f, "height"));

        core::FormatOption option;
        option.format_id = string_field(f, "format_id");
        option.container = string_field(f, "ext");
        option.resolution = string_field(f, "resolution");
        option.height = height;
        option.fps = number_field(f, "fps");
        option.video_codec = vcodec;
        option.audio_codec = acodec;
        option.size = size_field(f, "filesize");
        if (!option.size) option.size = size_field(f, "filesize_approx");
        option.note = string_field(f, "format_note");
        info.formats.push_back(option);

        const auto url = string_field(f, "url");
        if (url.empty() || !is_direct_http(protocol)) continue;
        if (!has_codec(vcodec) && !has_codec(acodec)) continue;  // storyboards

        StreamCandidate c;
        c.locator.address = url;
        c.locator.total_size = size_field(f, "filesize");
        c.locator.supports_ranges = true;
        c.locator.container = option.container;
        c.locator.format_id = option.format_id;
        if (has_codec(vcodec) && has_codec(acodec)) {
            c.locator.kind = core::MediaKind::muxed;
            c.locator.codec = vcodec + "+" + acodec;
        } else if (has_codec(vcodec)) {
            c.locator.kind = core::MediaKind::video;
            c.locator.codec = vcodec;
        } else {
            c.locator.kind = core::MediaKind::audio;
            c.locator.codec = acodec;
        }
        c.height = height;
        c.bitrate = number_field(f, "tbr");
        info.streams.push_back(std::move(c));
    }

    return info;
}

std::expected<core::Resolution, std::error_code>
YtDlpResolver::select(const VideoInfo& info, core::Quality quality, bool audio_only) {
    const auto ceiling = core::max_height(quality);

    const StreamCandidate* best_video = nullptr;
    const StreamCandidate* best_audio = nullptr;
    const StreamCandidate* best_muxed = nullptr;

    for (const auto& c : info.streams) {
        switch (c.locator.kind) {
            case core::MediaKind::audio:
                if (!best_audio || c.bitrate > best_audio->bitrate) best_audio = &c;
                break;
            case core::MediaKind::video:
                if (ceiling && c.height > *ceiling) break;
                if (!best_video || better(c, *best_video)) best_video = &c;
                break;
            case core::MediaKind::muxed:
                if (ceiling && c.height > *ceiling) break;
                if (!best_muxed || better(c, *best_muxed)) best_muxed = &c;
                break;
        }
    }

    core::Resolution resolution;
    resolution.title = info.title;

    // bestaudio, falling back to the best muxed stream for its audio track
    if (audio_only) {
        const auto* source = best_audio ? best_audio : best_muxed;
        if (!source) {
            return std::unexpected(make_error_code(core::FetchErrc::quality_unavailable));
        }
        resolution.locators.push_back(source->locator);
        return resolution;
    }

    // bestvideo+bestaudio unless a muxed stream is at least as tall
    if (best_video && best_audio && (!best_muxed || best_video->height > best_muxed->height)) {
        resolution.locators.push_back(best_video->locator);
        resolution.locators.push_back(best_audio->locator);
        return resolution;
    }
    if (best_muxed) {
        resolution.locators.push_back(best_muxed->locator);
        return resolution;
    }
    return std::unexpected(make_error_code(core::FetchErrc::quality_unavailable));
}

std::expected<VideoInfo, std::error_code> YtDlpResolver::fetch_info(std::string_view identifier) {
    auto result = run_process({executable_, "-J", "--no-playlist", "--no-warnings", std::string(identifier)});
    if (!result) {
        spdlog::error("Could not start {}: {}", executable_, result.error().message());
        return std::unexpected(make_error_code(core::FetchErrc::resolve_failed));
    }
    if (result->exit_code != 0) {
        spdlog::debug("{} exited with status {} for {}", executable_, result->exit_code, identifier);
        return std::unexpected(make_error_code(core::FetchErrc::video_unavailable));
    }
    return parse_info(result->output);
}

std::expected<core::Resolution, std::error_code>
YtDlpResolver::resolve(std::string_view identifier, core::Quality quality, bool audio_only) {
    auto info = fetch_info(identifier);
    if (!info) {
        return std::unexpected(info.error());
    }
    return select(*info, quality, audio_only);
}

std::expected<std::vector<core::FormatOption>, std::error_code>
YtDlpResolver::list_formats(std::string_view identifier) {
    auto info = fetch_info(identifier);
    if (!info) {
        return std::unexpected(info.error());
    }
    return std::move(info->formats);
}

} // namespace hdfetch::media
