// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/scheduler.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <thread>

namespace hdfetch::core {

std::size_t Summary::count(JobState state) const noexcept {
    return static_cast<std::size_t>(std::count_if(jobs.begin(), jobs.end(),
        [state](const JobReport& r) { return r.state == state; }));
}

//=============================================================================
// JobScheduler
//=============================================================================

JobScheduler::JobScheduler(SchedulerConfig config, JobOptions options, JobServices services)
    : config_(config)
    , options_(std::move(options))
    , services_(services) {
    config_.concurrency = std::max<std::uint32_t>(config_.concurrency, 1);
}

Summary JobScheduler::run(const std::vector<std::string>& identifiers, std::stop_token stoken) {
    const auto started = std::chrono::steady_clock::now();
    std::stop_callback forward(stoken, [this] { stop_.request_stop(); });

    {
        auto lock = std::lock_guard(mutex_);
        reports_.clear();
        queue_.clear();
        for (std::size_t i = 0; i < identifiers.size(); ++i) {
            JobReport report;
            report.identifier = identifiers[i];
            reports_.push_back(std::move(report));
            queue_.push_back(i);
        }
    }

    const auto runner_count = std::min<std::size_t>(config_.concurrency, identifiers.size());
    spdlog::debug("Scheduling {} job(s), {} at a time", identifiers.size(), runner_count);
    {
        std::vector<std::jthread> runners;
        runners.reserve(runner_count);
        for (std::size_t i = 0; i < runner_count; ++i) {
            runners.emplace_back([this] { runner(); });
        }
    } // Joins every runner

    Summary summary;
    {
        auto lock = std::lock_guard(mutex_);
        summary.jobs = reports_;
    }
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return summary;
}

void JobScheduler::runner() {
    auto token = stop_.get_token();

    while (true) {
        std::unique_ptr<Job> job;
        std::size_t index = 0;
        {
            auto lock = std::lock_guard(mutex_);
            if (queue_.empty()) return;
            index = queue_.front();
            queue_.pop_front();

            if (token.stop_requested()) {
                reports_[index].state = JobState::canceled;
                reports_[index].error = make_error_code(FetchErrc::cancelled);
                continue;
            }

            job = std::make_unique<Job>(next_id_++, reports_[index].identifier, options_, services_);
            active_.push_back(job.get());

            const auto active = static_cast<std::uint32_t>(active_.size());
            auto peak = peak_active_.load(std::memory_order_relaxed);
            while (active > peak &&
                   !peak_active_.compare_exchange_weak(peak, active, std::memory_order_relaxed)) {
            }
        }

        auto ec = job->run(token);

        record(index, *job);

        if (ec && ec != FetchErrc::cancelled && config_.all_or_nothing) {
            spdlog::warn("{} failed, cancelling the remaining jobs", job->identifier());
            stop_.request_stop();
        }
    }
}

void JobScheduler::record(std::size_t index, const Job& job) {
    auto lock = std::lock_guard(mutex_);
    auto& report = reports_[index];
    report.state = job.state();
    report.error = job.error();
    report.output = job.output_path();
    report.bytes = job.bytes_done();
    report.elapsed = job.elapsed();

    // Partial output of failed or cancelled jobs is discarded
    if (report.state == JobState::done) {
        finished_bytes_ += report.bytes;
    }
    std::erase(active_, &job);
}

ProgressSnapshot JobScheduler::progress() const {
    auto lock = std::lock_guard(mutex_);

    ProgressSnapshot snapshot;
    snapshot.bytes_done = finished_bytes_;
    snapshot.bytes_total = finished_bytes_;
    snapshot.queued = static_cast<std::uint32_t>(queue_.size());
    snapshot.active = static_cast<std::uint32_t>(active_.size());

    for (const auto* job : active_) {
        snapshot.bytes_done += job->bytes_done();
        snapshot.bytes_total += job->total_bytes();
    }
    for (const auto& report : reports_) {
        switch (report.state) {
            case JobState::done:     ++snapshot.done; break;
            case JobState::failed:   ++snapshot.failed; break;
            case JobState::canceled: ++snapshot.canceled; break;
            default: break;
        }
    }
    return snapshot;
}

} // namespace hdfetch::core
