// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hdfetch/core/segment.hpp>
#include <hdfetch/disk/error.hpp>
#include <hdfetch/disk/file_writer.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <ostream>
#include <span>
#include <vector>

namespace hdfetch::disk {

// Rebuilds one ordered artifact from segments that complete in any order.
// Slot `index` is written only by the worker that owns segment `index`.
class Assembler {
public:
    virtual ~Assembler() = default;

    // Allocate one slot per planned range, indexed by segment ordinal
    [[nodiscard]] virtual std::error_code open(const std::vector<core::ByteRange>& ranges) = 0;

    // Store `data` at `offset` bytes into the slot of segment `index`
    [[nodiscard]] virtual std::error_code write(std::uint32_t index,
                                                std::uint64_t offset,
                                                std::span<const std::byte> data) = 0;

    // Forget everything written to a slot (restarted non-ranged fetch)
    virtual void reset(std::uint32_t index) = 0;

    // Segment `index` holds all of its bytes
    [[nodiscard]] virtual std::error_code complete(std::uint32_t index) = 0;

    // Every segment is complete: produce the final artifact
    [[nodiscard]] virtual std::error_code finish() = 0;

    // Drop partial output
    virtual void discard() noexcept = 0;
};

// Writes each segment straight to its final offset in a pre-sized
// `<output>.part` file and renames it into place on finish().
class RandomAccessAssembler final : public Assembler {
public:
    explicit RandomAccessAssembler(std::filesystem::path output);
    ~RandomAccessAssembler() override;

    [[nodiscard]] std::error_code open(const std::vector<core::ByteRange>& ranges) override;
    [[nodiscard]] std::error_code write(std::uint32_t index, std::uint64_t offset,
                                        std::span<const std::byte> data) override;
    void reset(std::uint32_t) override {}
    [[nodiscard]] std::error_code complete(std::uint32_t index) override;
    [[nodiscard]] std::error_code finish() override;
    void discard() noexcept override;

    [[nodiscard]] const std::filesystem::path& output() const noexcept { return output_; }
    [[nodiscard]] const std::filesystem::path& partial_path() const noexcept { return partial_; }

private:
    std::filesystem::path output_;
    std::filesystem::path partial_;
    std::vector<core::ByteRange> ranges_;
    std::unique_ptr<std::atomic<bool>[]> done_;
    FileWriter writer_;
    bool finished_{false};
};

// For sinks that only accept sequential writes. Completed segments are
// buffered per slot and flushed strictly by increasing index; a slot's
// memory is released as soon as it has been flushed.
class SequentialAssembler final : public Assembler {
public:
    explicit SequentialAssembler(std::ostream& sink);

    [[nodiscard]] std::error_code open(const std::vector<core::ByteRange>& ranges) override;
    [[nodiscard]] std::error_code write(std::uint32_t index, std::uint64_t offset,
                                        std::span<const std::byte> data) override;
    void reset(std::uint32_t index) override;
    [[nodiscard]] std::error_code complete(std::uint32_t index) override;
    [[nodiscard]] std::error_code finish() override;
    void discard() noexcept override;

    // Next segment index waiting to be flushed
    [[nodiscard]] std::uint32_t next_index() const noexcept;

private:
    struct Slot {
        std::vector<std::byte> data;
        core::ByteRange range;
        bool done{false};
    };

    std::ostream& sink_;
    std::vector<Slot> slots_;
    std::uint32_t next_{0};
    mutable std::mutex mutex_;  // Guards done flags, next_ and the sink
};

} // namespace hdfetch::disk
