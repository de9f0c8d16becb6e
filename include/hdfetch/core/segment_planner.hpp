// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/error.hpp>
#include <hdfetch/core/locator.hpp>
#include <hdfetch/core/segment.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace hdfetch::core {

// Clamp a requested thread count to [1, MAX_THREADS]
[[nodiscard]] std::uint32_t clamp_threads(std::uint32_t threads) noexcept;

// Partition [0, total_size) into at most `threads` contiguous ranges of
// ceil(total / count) bytes, the last one truncated. Unknown or zero size
// yields one segment. More than one segment on a resource without range
// support fails with FetchErrc::unsupported_range.
[[nodiscard]] std::expected<std::vector<ByteRange>, std::error_code>
plan_segments(std::optional<std::uint64_t> total_size,
              bool supports_ranges,
              std::uint32_t threads);

[[nodiscard]] inline std::expected<std::vector<ByteRange>, std::error_code>
plan_segments(const Locator& locator, std::uint32_t threads) {
    return plan_segments(locator.total_size, locator.supports_ranges, threads);
}

} // namespace hdfetch::core
