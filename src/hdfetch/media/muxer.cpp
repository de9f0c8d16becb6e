// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/media/muxer.hpp>
#include <hdfetch/media/process.hpp>
#include <hdfetch/core/config.hpp>
#include <hdfetch/core/error.hpp>
#include <spdlog/spdlog.h>

namespace hdfetch::media {

FfmpegMuxer::FfmpegMuxer(std::string executable)
    : executable_(std::move(executable)) {}

std::error_code FfmpegMuxer::mux(const std::filesystem::path& video,
                                 const std::filesystem::path& audio,
                                 const std::filesystem::path& output) {
    spdlog::debug("Muxing {} + {} -> {}", video.string(), audio.string(), output.string());

    return run({
        executable_, "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-i", video.string(),
        "-i", audio.string(),
        "-map", "0:v:0", "-map", "1:a:0",
        "-c", "copy",
        output.string(),
    }, output);
}

std::error_code FfmpegMuxer::extract_audio(const std::filesystem::path& input,
                                           const std::filesystem::path& output) {
    spdlog::debug("Extracting audio {} -> {}", input.string(), output.string());

    return run({
        executable_, "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-i", input.string(),
        "-vn", "-c:a", "libmp3lame", "-b:a", core::AUDIO_BITRATE,
        output.string(),
    }, output);
}

std::error_code FfmpegMuxer::run(const std::vector<std::string>& argv,
                                 const std::filesystem::path& output) {
    auto result = run_process(argv, false);
    if (!result) {
        spdlog::error("Could not start {}: {}", executable_, result.error().message());
        return make_error_code(core::FetchErrc::mux_failed);
    }
    if (result->exit_code != 0) {
        spdlog::error("{} exited with status {}", executable_, result->exit_code);
        std::error_code ec;
        std::filesystem::remove(output, ec);
        return make_error_code(core::FetchErrc::mux_failed);
    }
    return {};
}

} // namespace hdfetch::media
