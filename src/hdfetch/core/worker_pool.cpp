// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/worker_pool.hpp>
#include <hdfetch/core/segment_planner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace hdfetch::core {

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t failed_attempts) const noexcept {
    if (failed_attempts == 0) return std::chrono::milliseconds{0};

    double factor = std::pow(multiplier, static_cast<double>(failed_attempts - 1));
    double ms = static_cast<double>(initial_backoff.count()) * factor;
    ms = std::min(ms, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(ms)};
}

bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stoken) {
    std::mutex m;
    std::condition_variable_any cv;
    auto lock = std::unique_lock(m);
    return !cv.wait_for(lock, stoken, duration, [] { return false; }) && !stoken.stop_requested();
}

//=============================================================================
// WorkerPool
//=============================================================================

WorkerPool::WorkerPool(RangeSource& source,
                       RateLimiter& limiter,
                       disk::Assembler& assembler,
                       std::atomic<std::uint64_t>& progress,
                       RetryPolicy retry,
                       std::uint32_t threads) noexcept
    : source_(source)
    , limiter_(limiter)
    , assembler_(assembler)
    , progress_(progress)
    , retry_(retry)
    , threads_(clamp_threads(threads)) {}

std::error_code WorkerPool::run(const std::string& address,
                                std::vector<std::unique_ptr<Segment>>& segments,
                                bool resumable,
                                std::stop_token stoken) {
    if (segments.empty()) {
        return {};
    }

    // Pool-local stop: set by the caller's token or by the first failure
    std::stop_source pool_stop;
    std::stop_callback forward(stoken, [&pool_stop] { pool_stop.request_stop(); });

    std::atomic<std::size_t> next{0};
    std::mutex error_mutex;
    std::error_code first_error;

    auto worker = [&] {
        auto token = pool_stop.get_token();
        while (!token.stop_requested()) {
            std::size_t idx = next.fetch_add(1, std::memory_order_relaxed);
            if (idx >= segments.size()) return;

            auto ec = fetch_segment(address, *segments[idx], resumable, token);
            if (!ec) continue;

            {
                auto lock = std::lock_guard(error_mutex);
                // Siblings stopped because of this failure report cancelled
                if (!first_error || first_error == FetchErrc::cancelled) {
                    first_error = ec;
                }
            }
            pool_stop.request_stop();
            return;
        }
    };

    const auto worker_count = std::min<std::size_t>(threads_, segments.size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(worker);
        }
    } // Joins every worker

    if (first_error) {
        return first_error;
    }
    if (stoken.stop_requested()) {
        return make_error_code(FetchErrc::cancelled);
    }
    return {};
}

std::error_code WorkerPool::fetch_segment(const std::string& address,
                                          Segment& segment,
                                          bool resumable,
                                          std::stop_token stoken) {
    const auto index = segment.index();
    const auto& range = segment.range();
    segment.state(SegmentState::in_flight);

    auto sink = [&](std::span<const std::byte> chunk) -> std::error_code {
        if (stoken.stop_requested()) {
            return make_error_code(FetchErrc::cancelled);
        }
        if (auto ec = limiter_.acquire(chunk.size(), stoken)) {
            return ec;
        }
        if (auto ec = assembler_.write(index, segment.received(), chunk)) {
            return ec;
        }
        segment.add_received(chunk.size());
        progress_.fetch_add(chunk.size(), std::memory_order_relaxed);
        return {};
    };

    while (true) {
        const auto attempt = segment.begin_attempt();

        // Resume after the bytes already stored, or start the slot over
        if (!resumable || !range.bounded) {
            if (auto got = segment.received(); got > 0) {
                progress_.fetch_sub(got, std::memory_order_relaxed);
                segment.reset_received();
                assembler_.reset(index);
            }
        }
        ByteRange request = range;
        request.offset += segment.received();
        if (range.bounded) {
            request.length -= segment.received();
        }

        std::error_code ec;
        if (!request.empty()) {
            ec = source_.fetch(address, request, sink, stoken);
        }

        if (!ec) {
            segment.state(SegmentState::done);
            return assembler_.complete(index);
        }

        if (ec == FetchErrc::cancelled || stoken.stop_requested()) {
            segment.state(SegmentState::pending);
            return make_error_code(FetchErrc::cancelled);
        }

        if (!is_transient(ec)) {
            spdlog::error("Segment {}: {} ({})", index, ec.message(), error_kind(ec));
            segment.state(SegmentState::failed);
            segment.error(ec);
            return ec;
        }

        if (attempt >= retry_.max_attempts) {
            spdlog::error("Segment {}: giving up after {} attempts: {}", index, attempt, ec.message());
            segment.state(SegmentState::failed);
            segment.error(ec);
            return make_error_code(FetchErrc::segment_fetch_failed);
        }

        auto delay = retry_.backoff(attempt);
        spdlog::warn("Segment {}: retry {}/{} in {} ms after: {}",
                     index, attempt, retry_.max_attempts - 1, delay.count(), ec.message());
        if (!interruptible_sleep(delay, stoken)) {
            segment.state(SegmentState::pending);
            return make_error_code(FetchErrc::cancelled);
        }
    }
}

} // namespace hdfetch::core
