// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/job.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace hdfetch::core {

struct SchedulerConfig {
    std::uint32_t concurrency{1};  // Jobs running at once, C
    bool all_or_nothing{false};    // First failure cancels the rest
};

// Final outcome of one identifier
struct JobReport {
    std::string identifier;
    JobState state{JobState::queued};
    std::error_code error;
    std::filesystem::path output;
    std::uint64_t bytes{0};
    std::chrono::milliseconds elapsed{0};
};

struct Summary {
    std::vector<JobReport> jobs;  // Same order as the identifiers
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] std::size_t count(JobState state) const noexcept;
    [[nodiscard]] std::size_t succeeded() const noexcept { return count(JobState::done); }
    [[nodiscard]] std::size_t failed() const noexcept { return count(JobState::failed); }
    [[nodiscard]] std::size_t canceled() const noexcept { return count(JobState::canceled); }
};

// Aggregated progress across all jobs
struct ProgressSnapshot {
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};  // Sum of the sizes known so far
    std::uint32_t queued{0};
    std::uint32_t active{0};
    std::uint32_t done{0};
    std::uint32_t failed{0};
    std::uint32_t canceled{0};
};

//=============================================================================
// JobScheduler
//=============================================================================

// Runs up to `concurrency` jobs at once. Identifiers wait in a FIFO queue
// and a Job object is only created when a runner picks one up, so no more
// than `concurrency` jobs are ever in a non-terminal state.
class JobScheduler {
public:
    JobScheduler(SchedulerConfig config, JobOptions options, JobServices services);

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // Blocks until every identifier reached a terminal state. One call per
    // scheduler.
    [[nodiscard]] Summary run(const std::vector<std::string>& identifiers, std::stop_token stoken = {});

    // Cancel running jobs and drop queued ones; callable from any thread
    void cancel() noexcept { stop_.request_stop(); }

    [[nodiscard]] ProgressSnapshot progress() const;

    // Highest number of jobs that were running at the same time
    [[nodiscard]] std::uint32_t peak_active() const noexcept {
        return peak_active_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

private:
    void runner();
    void record(std::size_t index, const Job& job);

    SchedulerConfig config_;
    JobOptions options_;
    JobServices services_;
    std::stop_source stop_;

    mutable std::mutex mutex_;       // Guards everything below
    std::deque<std::size_t> queue_;  // Indexes into reports_
    std::vector<JobReport> reports_;
    std::vector<const Job*> active_;
    std::uint64_t finished_bytes_{0};
    std::uint32_t next_id_{1};
    std::atomic<std::uint32_t> peak_active_{0};
};

} // namespace hdfetch::core
