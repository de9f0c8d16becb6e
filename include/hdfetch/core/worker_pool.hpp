// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/config.hpp>
#include <hdfetch/core/error.hpp>
#include <hdfetch/core/http_session.hpp>
#include <hdfetch/core/rate_limiter.hpp>
#include <hdfetch/core/segment.hpp>
#include <hdfetch/disk/assembler.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace hdfetch::core {

// Segment retry schedule
struct RetryPolicy {
    std::uint32_t max_attempts{RETRY_COUNT};
    std::chrono::milliseconds initial_backoff{RETRY_INITIAL_BACKOFF};
    double multiplier{2.0};
    std::chrono::milliseconds max_backoff{RETRY_MAX_BACKOFF};

    // Delay before the attempt following `failed_attempts` failures
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t failed_attempts) const noexcept;
};

// Fixed-size pool fetching the segments of one locator, at most `threads`
// in flight. Each worker owns one segment at a time and its slot in the
// assembler; only the progress counter and the rate limiter are shared.
class WorkerPool {
public:
    WorkerPool(RangeSource& source,
               RateLimiter& limiter,
               disk::Assembler& assembler,
               std::atomic<std::uint64_t>& progress,
               RetryPolicy retry,
               std::uint32_t threads) noexcept;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Fetch every segment of `address` and hand it to the assembler.
    // `resumable` = the server honours ranges, so a retry continues where
    // the failed attempt stopped instead of starting the slot over.
    // Returns the first error: segment_fetch_failed once a segment runs out
    // of retries, the permanent error itself, or cancelled.
    [[nodiscard]] std::error_code run(const std::string& address,
                                      std::vector<std::unique_ptr<Segment>>& segments,
                                      bool resumable,
                                      std::stop_token stoken);

private:
    [[nodiscard]] std::error_code fetch_segment(const std::string& address,
                                                Segment& segment,
                                                bool resumable,
                                                std::stop_token stoken);

    RangeSource& source_;
    RateLimiter& limiter_;
    disk::Assembler& assembler_;
    std::atomic<std::uint64_t>& progress_;
    RetryPolicy retry_;
    std::uint32_t threads_;
};

// Sleep that returns false early if stop is requested
[[nodiscard]] bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stoken);

} // namespace hdfetch::core
