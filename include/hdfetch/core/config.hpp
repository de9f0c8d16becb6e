// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>

namespace hdfetch::core {

constexpr std::uint32_t DEFAULT_THREADS = 4;
constexpr std::uint32_t MAX_THREADS = 32;
constexpr std::uint32_t MAX_CONCURRENT_JOBS = 4;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;                     // Below 1 B/s for this long = stalled
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Segment retry defaults
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds RETRY_INITIAL_BACKOFF{500};
constexpr std::chrono::milliseconds RETRY_MAX_BACKOFF{8000};

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                // 256 KB per curl callback
constexpr std::size_t SEQUENTIAL_FLUSH_SIZE = 1024 * 1024;

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{100};

constexpr const char* DEFAULT_OUTPUT_DIR = "downloads";
constexpr const char* MERGE_CONTAINER = "mp4";
constexpr const char* AUDIO_CONTAINER = "mp3";                     // --audio-only output
constexpr const char* AUDIO_BITRATE = "192k";
constexpr const char* PARTIAL_SUFFIX = ".part";

} // namespace hdfetch::core
