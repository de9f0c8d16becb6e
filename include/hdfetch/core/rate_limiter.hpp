// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/error.hpp>
#include <cstdint>
#include <atomic>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>

namespace hdfetch::core {

// Shared throttle consumed by every worker of every job. One instance is
// owned by the caller and passed by reference into jobs and pools.
class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    // Block until `bytes` fit the budget. Returns cancelled if stop was
    // requested while waiting; the bytes are then not granted.
    [[nodiscard]] virtual std::error_code acquire(std::uint64_t bytes, std::stop_token stoken) = 0;

    // Configured bytes/sec, nullopt = unlimited
    [[nodiscard]] virtual std::optional<std::uint64_t> limit() const noexcept = 0;

    // Total bytes granted so far (lock-free read for progress reporting)
    [[nodiscard]] virtual std::uint64_t granted_bytes() const noexcept = 0;
};

// Token bucket with elapsed-time refill. Every caller reserves its share of
// the timeline under the mutex in arrival order and then sleeps outside the
// lock until its reservation matures, so waits are FIFO and bounded.
class TokenBucket final : public RateLimiter {
public:
    using clock = std::chrono::steady_clock;

    // limit_bps: nullopt or 0 = unlimited. burst_bytes: bucket capacity,
    // 0 = one second of budget.
    explicit TokenBucket(std::optional<std::uint64_t> limit_bps = std::nullopt,
                         std::uint64_t burst_bytes = 0) noexcept;

    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    [[nodiscard]] std::error_code acquire(std::uint64_t bytes, std::stop_token stoken) override;

    [[nodiscard]] std::optional<std::uint64_t> limit() const noexcept override;
    [[nodiscard]] std::uint64_t granted_bytes() const noexcept override {
        return granted_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t burst_bytes() const noexcept { return burst_bytes_; }

private:
    // Reserve `bytes` and return the time the caller may proceed
    [[nodiscard]] clock::time_point reserve(std::uint64_t bytes);
    // Return the share of a reservation that was never consumed
    void release(std::uint64_t bytes);

    const std::uint64_t limit_bps_;  // 0 = unlimited
    const std::uint64_t burst_bytes_;
    const clock::duration burst_window_;

    std::mutex mutex_;               // Serializes refill/consume
    clock::time_point next_free_;    // Theoretical time the bucket is full again
    std::atomic<std::uint64_t> granted_{0};
};

// Parse a CLI rate such as "50M", "512k" or "1.5G" into bytes/sec.
// A K/M/G suffix (1024 based) is required.
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
parse_rate(std::string_view text) noexcept;

} // namespace hdfetch::core
