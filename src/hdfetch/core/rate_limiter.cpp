// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/rate_limiter.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <condition_variable>

namespace hdfetch::core {

namespace {

// Longest single sleep, so stop requests are noticed promptly
constexpr auto MAX_WAIT_SLICE = std::chrono::milliseconds(50);

TokenBucket::clock::duration seconds_for(std::uint64_t bytes, std::uint64_t bps) noexcept {
    auto ns = static_cast<double>(bytes) * 1e9 / static_cast<double>(bps);
    return std::chrono::duration_cast<TokenBucket::clock::duration>(
        std::chrono::duration<double, std::nano>(ns));
}

} // namespace

//=============================================================================
// TokenBucket
//=============================================================================

TokenBucket::TokenBucket(std::optional<std::uint64_t> limit_bps, std::uint64_t burst_bytes) noexcept
    : limit_bps_(limit_bps.value_or(0))
    , burst_bytes_(limit_bps_ == 0 ? 0 : (burst_bytes == 0 ? limit_bps_ : burst_bytes))
    , burst_window_(limit_bps_ == 0 ? clock::duration::zero() : seconds_for(burst_bytes_, limit_bps_))
    , next_free_(clock::now()) {}

std::optional<std::uint64_t> TokenBucket::limit() const noexcept {
    if (limit_bps_ == 0) return std::nullopt;
    return limit_bps_;
}

TokenBucket::clock::time_point TokenBucket::reserve(std::uint64_t bytes) {
    auto lock = std::lock_guard(mutex_);
    auto now = clock::now();

    // A bucket idle for longer than the burst window is full: tokens never
    // accumulate beyond capacity
    if (next_free_ < now) {
        next_free_ = now;
    }

    // Caller may start once the bucket holds `bytes`, i.e. when the
    // theoretical full time minus one burst window has passed
    auto cost = seconds_for(bytes, limit_bps_);
    next_free_ += cost;
    return next_free_ - burst_window_;
}

void TokenBucket::release(std::uint64_t bytes) {
    auto lock = std::lock_guard(mutex_);
    auto now = clock::now();

    // Hand an abandoned reservation back without refilling past capacity
    next_free_ = std::max(next_free_ - seconds_for(bytes, limit_bps_), now);
}

std::error_code TokenBucket::acquire(std::uint64_t bytes, std::stop_token stoken) {
    if (bytes == 0 || limit_bps_ == 0) {
        granted_.fetch_add(bytes, std::memory_order_relaxed);
        return {};
    }

    if (stoken.stop_requested()) {
        return make_error_code(FetchErrc::cancelled);
    }

    const auto ready_at = reserve(bytes);

    std::mutex wait_mutex;
    std::condition_variable_any cv;
    auto lock = std::unique_lock(wait_mutex);
    while (clock::now() < ready_at) {
        auto slice = std::min<clock::duration>(ready_at - clock::now(), MAX_WAIT_SLICE);
        cv.wait_for(lock, stoken, slice, [] { return false; });
        if (stoken.stop_requested()) {
            release(bytes);
            return make_error_code(FetchErrc::cancelled);
        }
    }

    granted_.fetch_add(bytes, std::memory_order_relaxed);
    return {};
}

//=============================================================================
// Rate parsing
//=============================================================================

std::expected<std::uint64_t, std::error_code> parse_rate(std::string_view text) noexcept {
    auto fail = [] { return std::unexpected(make_error_code(FetchErrc::rate_parse_failed)); };

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

    if (text.size() < 2) return fail();

    std::uint64_t multiplier = 0;
    switch (std::toupper(static_cast<unsigned char>(text.back()))) {
        case 'K': multiplier = 1024ULL; break;
        case 'M': multiplier = 1024ULL * 1024; break;
        case 'G': multiplier = 1024ULL * 1024 * 1024; break;
        default:  return fail();
    }
    text.remove_suffix(1);

    // Digits with an optional fraction; no sign, no exponent
    bool seen_dot = false;
    bool seen_digit = false;
    for (char c : text) {
        if (c == '.') {
            if (seen_dot) return fail();
            seen_dot = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else {
            return fail();
        }
    }
    if (!seen_digit) return fail();

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return fail();

    double bytes = value * static_cast<double>(multiplier);
    if (!std::isfinite(bytes) || bytes < 1.0 || bytes > 1.8e19) return fail();

    return static_cast<std::uint64_t>(bytes);
}

} // namespace hdfetch::core
