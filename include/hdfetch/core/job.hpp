// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/config.hpp>
#include <hdfetch/core/error.hpp>
#include <hdfetch/core/http_session.hpp>
#include <hdfetch/core/locator.hpp>
#include <hdfetch/core/rate_limiter.hpp>
#include <hdfetch/core/worker_pool.hpp>
#include <hdfetch/disk/assembler.hpp>
#include <hdfetch/media/muxer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace hdfetch::core {

// Job lifecycle
enum class JobState : std::uint8_t {
    queued,
    resolving,
    downloading,
    assembling,
    muxing,
    done,
    failed,
    canceled
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::done || state == JobState::failed || state == JobState::canceled;
}

// Legal moves: the happy path in order (muxing optional), plus failed or
// canceled from any non-terminal state
[[nodiscard]] constexpr bool can_transition(JobState from, JobState to) noexcept {
    if (is_terminal(from)) return false;
    if (to == JobState::failed || to == JobState::canceled) return true;

    switch (from) {
        case JobState::queued:      return to == JobState::resolving;
        case JobState::resolving:   return to == JobState::downloading;
        case JobState::downloading: return to == JobState::assembling;
        case JobState::assembling:  return to == JobState::muxing || to == JobState::done;
        case JobState::muxing:      return to == JobState::done;
        default:                    return false;
    }
}

// Per-job settings
struct JobOptions {
    Quality quality{Quality::best};
    bool audio_only{false};
    bool extract_audio{true};   // With audio_only, convert to AUDIO_CONTAINER
    std::uint32_t threads{DEFAULT_THREADS};
    std::filesystem::path output_dir{DEFAULT_OUTPUT_DIR};
    RetryPolicy retry{};
};

// Collaborators shared by every job; all must outlive the job
struct JobServices {
    Resolver& resolver;
    RangeSource& source;
    RateLimiter& limiter;
    media::Muxer& muxer;
};

// Make a title usable as a file name
[[nodiscard]] std::string sanitize_filename(std::string_view title);

//=============================================================================
// Job
//=============================================================================

// One video: resolve, plan, fetch, assemble and optionally mux or extract
// the audio track.
// run() drives the job to a terminal state on the calling thread; the
// accessors may be read from any thread meanwhile.
class Job {
public:
    Job(std::uint32_t id, std::string identifier, JobOptions options, JobServices services);
    ~Job();

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    // Returns the error that ended the job, empty when done
    std::error_code run(std::stop_token stoken = {});

    // Stop in-flight fetches at the next chunk boundary
    void cancel() noexcept { stop_.request_stop(); }

    // Move to `next` if the transition table allows it
    [[nodiscard]] std::error_code transition(JobState next) noexcept;

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string& identifier() const noexcept { return identifier_; }
    [[nodiscard]] JobState state() const noexcept { return state_.load(std::memory_order_acquire); }

    [[nodiscard]] std::uint64_t bytes_done() const noexcept { return bytes_done_.load(std::memory_order_relaxed); }
    // 0 until every locator size is known
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_.load(std::memory_order_relaxed); }

    [[nodiscard]] std::error_code error() const;
    [[nodiscard]] std::filesystem::path output_path() const;
    [[nodiscard]] std::string title() const;
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

    // Locators actually fetched, valid once downloading started
    [[nodiscard]] std::vector<Locator> locators() const;

    // Segment count used per locator, in locator order
    [[nodiscard]] std::vector<std::size_t> segment_counts() const;

private:
    struct Stream {
        Locator locator;
        std::filesystem::path path;
        std::unique_ptr<disk::RandomAccessAssembler> assembler;
        std::size_t segment_count{0};
    };

    std::error_code execute(std::stop_token stoken);
    [[nodiscard]] std::error_code prepare_streams(const Resolution& resolution);
    void probe_sizes();
    [[nodiscard]] std::error_code download(Stream& stream, std::stop_token stoken);
    [[nodiscard]] std::error_code fetch(Stream& stream, std::vector<ByteRange> ranges,
                                        bool resumable, std::stop_token stoken);
    [[nodiscard]] std::error_code mux();
    [[nodiscard]] std::error_code extract();
    std::error_code finish_with(JobState terminal, std::error_code ec);
    void discard_partials() noexcept;

    std::uint32_t id_;
    std::string identifier_;
    JobOptions options_;
    JobServices services_;

    std::atomic<JobState> state_{JobState::queued};
    std::atomic<std::uint64_t> bytes_done_{0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::stop_source stop_;

    mutable std::mutex mutex_;  // Guards the fields below
    std::vector<Stream> streams_;
    std::error_code error_;
    std::string title_;
    std::filesystem::path output_path_;
    std::chrono::steady_clock::time_point started_{};
    std::chrono::steady_clock::time_point finished_{};
};

} // namespace hdfetch::core
