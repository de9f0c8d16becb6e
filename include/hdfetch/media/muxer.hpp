// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace hdfetch::media {

// Combines an elementary video stream and an audio stream into one container
class Muxer {
public:
    virtual ~Muxer() = default;

    // On failure the inputs must be left untouched
    [[nodiscard]] virtual std::error_code mux(const std::filesystem::path& video,
                                              const std::filesystem::path& audio,
                                              const std::filesystem::path& output) = 0;

    // Re-encode the audio track of `input` into `output`; same failure contract
    [[nodiscard]] virtual std::error_code extract_audio(const std::filesystem::path& input,
                                                        const std::filesystem::path& output) = 0;
};

// Stream-copies both inputs with the ffmpeg executable. Audio extraction
// encodes with libmp3lame at AUDIO_BITRATE.
class FfmpegMuxer final : public Muxer {
public:
    explicit FfmpegMuxer(std::string executable = "ffmpeg");

    [[nodiscard]] std::error_code mux(const std::filesystem::path& video,
                                      const std::filesystem::path& audio,
                                      const std::filesystem::path& output) override;
    [[nodiscard]] std::error_code extract_audio(const std::filesystem::path& input,
                                                const std::filesystem::path& output) override;

private:
    [[nodiscard]] std::error_code run(const std::vector<std::string>& argv,
                                      const std::filesystem::path& output);

    std::string executable_;
};

} // namespace hdfetch::media
