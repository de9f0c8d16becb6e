// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/segment_planner.hpp>
#include <hdfetch/core/config.hpp>
#include <algorithm>

namespace hdfetch::core {

std::uint32_t clamp_threads(std::uint32_t threads) noexcept {
    return std::clamp(threads, 1u, MAX_THREADS);
}

std::expected<std::vector<ByteRange>, std::error_code>
plan_segments(std::optional<std::uint64_t> total_size,
              bool supports_ranges,
              std::uint32_t threads) {
    threads = clamp_threads(threads);

    if (!supports_ranges && threads > 1) {
        return std::unexpected(make_error_code(FetchErrc::unsupported_range));
    }

    std::vector<ByteRange> ranges;

    if (!total_size) {
        ranges.push_back(ByteRange{0, 0, false});
        return ranges;
    }

    const std::uint64_t total = *total_size;
    if (total == 0) {
        ranges.push_back(ByteRange{0, 0, true});
        return ranges;
    }

    const std::uint64_t count = std::min<std::uint64_t>(threads, total);
    const std::uint64_t seg_size = (total + count - 1) / count;  // Round up

    ranges.reserve(static_cast<std::size_t>(count));
    std::uint64_t offset = 0;
    while (offset < total) {
        std::uint64_t this_size = std::min(seg_size, total - offset);
        ranges.push_back(ByteRange{offset, this_size, true});
        offset += this_size;
    }

    return ranges;
}

} // namespace hdfetch::core
