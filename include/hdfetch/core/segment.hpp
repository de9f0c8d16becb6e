// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <atomic>
#include <string>
#include <system_error>

namespace hdfetch::core {

// Byte range of a resource. Bounded ranges cover [offset, offset + length);
// an unbounded range runs from offset to the end of a resource of unknown size.
struct ByteRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};
    bool bounded{true};

    [[nodiscard]] std::uint64_t end() const noexcept { return offset + length; }

    // Inclusive last byte, only meaningful for a bounded non-empty range
    [[nodiscard]] std::uint64_t last() const noexcept { return offset + length - 1; }

    [[nodiscard]] bool empty() const noexcept { return bounded && length == 0; }

    // HTTP Range value "first-last" or "first-"
    [[nodiscard]] std::string header_value() const;

    bool operator==(const ByteRange&) const = default;
};

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,    // Not started
    in_flight,  // Owned by a worker
    done,       // Every byte received and handed to the assembler
    failed      // Retry ceiling exhausted or permanent error
};

// One unit of parallel fetch. Index is the authoritative output order.
class Segment {
public:
    Segment(std::uint32_t index, ByteRange range) noexcept
        : index_(index)
        , range_(range) {}

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }

    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }
    void state(SegmentState s) noexcept { state_.store(s, std::memory_order_release); }

    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_.load(std::memory_order_relaxed); }
    std::uint32_t begin_attempt() noexcept { return attempts_.fetch_add(1, std::memory_order_relaxed) + 1; }

    // Bytes of this segment received so far
    [[nodiscard]] std::uint64_t received() const noexcept { return received_.load(std::memory_order_relaxed); }
    void add_received(std::uint64_t bytes) noexcept { received_.fetch_add(bytes, std::memory_order_relaxed); }
    void reset_received() noexcept { received_.store(0, std::memory_order_relaxed); }

    // Bytes still to fetch, 0 for an unbounded segment
    [[nodiscard]] std::uint64_t remaining() const noexcept;

    [[nodiscard]] const std::error_code& error() const noexcept { return error_; }
    void error(std::error_code ec) noexcept { error_ = ec; }

private:
    std::uint32_t index_;
    ByteRange range_;
    std::atomic<SegmentState> state_{SegmentState::pending};
    std::atomic<std::uint32_t> attempts_{0};
    std::atomic<std::uint64_t> received_{0};
    std::error_code error_;
};

} // namespace hdfetch::core
