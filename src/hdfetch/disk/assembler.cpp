// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/disk/assembler.hpp>
#include <hdfetch/core/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace hdfetch::disk {

namespace {

// Slot bounds check shared by both strategies
bool fits(const core::ByteRange& range, std::uint64_t offset, std::size_t size) noexcept {
    if (!range.bounded) return true;
    return offset <= range.length && size <= range.length - offset;
}

} // namespace

//=============================================================================
// RandomAccessAssembler
//=============================================================================

RandomAccessAssembler::RandomAccessAssembler(std::filesystem::path output)
    : output_(std::move(output))
    , partial_(output_.string() + core::PARTIAL_SUFFIX) {}

RandomAccessAssembler::~RandomAccessAssembler() {
    writer_.close();
}

std::error_code RandomAccessAssembler::open(const std::vector<core::ByteRange>& ranges) {
    ranges_ = ranges;
    done_ = std::make_unique<std::atomic<bool>[]>(ranges_.size());
    finished_ = false;

    // Pre-size only when every range is bounded
    std::uint64_t total = 0;
    for (const auto& r : ranges_) {
        if (!r.bounded) {
            total = 0;
            break;
        }
        total = std::max(total, r.end());
    }

    return writer_.open(partial_.string(), total);
}

std::error_code RandomAccessAssembler::write(std::uint32_t index, std::uint64_t offset,
                                             std::span<const std::byte> data) {
    if (index >= ranges_.size()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    const auto& range = ranges_[index];
    if (!fits(range, offset, data.size())) {
        return make_error_code(DiskErrc::slot_overflow);
    }

    return writer_.write(range.offset + offset, data.data(), data.size());
}

std::error_code RandomAccessAssembler::complete(std::uint32_t index) {
    if (index >= ranges_.size()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    done_[index].store(true, std::memory_order_release);
    return {};
}

std::error_code RandomAccessAssembler::finish() {
    for (std::size_t i = 0; i < ranges_.size(); ++i) {
        if (!done_[i].load(std::memory_order_acquire)) {
            return make_error_code(DiskErrc::incomplete_output);
        }
    }

    if (auto ec = writer_.flush()) {
        return ec;
    }
    writer_.close();

    std::error_code ec;
    std::filesystem::rename(partial_, output_, ec);
    if (ec) {
        spdlog::error("Could not rename {} to {}: {}", partial_.string(), output_.string(), ec.message());
        return make_error_code(DiskErrc::rename_failed);
    }

    finished_ = true;
    return {};
}

void RandomAccessAssembler::discard() noexcept {
    writer_.close();
    if (finished_) return;

    std::error_code ec;
    std::filesystem::remove(partial_, ec);
    if (ec) {
        spdlog::warn("Could not remove partial file {}: {}", partial_.string(), ec.message());
    }
}

//=============================================================================
// SequentialAssembler
//=============================================================================

SequentialAssembler::SequentialAssembler(std::ostream& sink)
    : sink_(sink) {}

std::error_code SequentialAssembler::open(const std::vector<core::ByteRange>& ranges) {
    auto lock = std::lock_guard(mutex_);
    slots_.clear();
    slots_.resize(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        slots_[i].range = ranges[i];
        if (ranges[i].bounded) {
            slots_[i].data.reserve(static_cast<std::size_t>(
                std::min<std::uint64_t>(ranges[i].length, core::SEQUENTIAL_FLUSH_SIZE)));
        }
    }
    next_ = 0;
    return {};
}

std::error_code SequentialAssembler::write(std::uint32_t index, std::uint64_t offset,
                                           std::span<const std::byte> data) {
    // No lock: the slot belongs to the worker fetching segment `index`
    if (index >= slots_.size()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    auto& slot = slots_[index];
    if (!fits(slot.range, offset, data.size())) {
        return make_error_code(DiskErrc::slot_overflow);
    }

    if (offset != slot.data.size()) {
        slot.data.resize(static_cast<std::size_t>(offset));
    }
    slot.data.insert(slot.data.end(), data.begin(), data.end());
    return {};
}

void SequentialAssembler::reset(std::uint32_t index) {
    if (index < slots_.size()) {
        slots_[index].data.clear();
    }
}

std::error_code SequentialAssembler::complete(std::uint32_t index) {
    auto lock = std::lock_guard(mutex_);
    if (index >= slots_.size()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    slots_[index].done = true;

    // Flush every consecutive completed slot starting at the next expected index
    while (next_ < slots_.size() && slots_[next_].done) {
        auto& slot = slots_[next_];
        sink_.write(reinterpret_cast<const char*>(slot.data.data()),
                    static_cast<std::streamsize>(slot.data.size()));
        if (!sink_) {
            return make_error_code(DiskErrc::write_error);
        }
        std::vector<std::byte>().swap(slot.data);
        ++next_;
    }
    return {};
}

std::error_code SequentialAssembler::finish() {
    auto lock = std::lock_guard(mutex_);
    if (next_ != slots_.size()) {
        return make_error_code(DiskErrc::incomplete_output);
    }
    sink_.flush();
    return sink_ ? std::error_code{} : make_error_code(DiskErrc::write_error);
}

void SequentialAssembler::discard() noexcept {
    auto lock = std::lock_guard(mutex_);
    for (auto& slot : slots_) {
        std::vector<std::byte>().swap(slot.data);
    }
}

std::uint32_t SequentialAssembler::next_index() const noexcept {
    auto lock = std::lock_guard(mutex_);
    return next_;
}

} // namespace hdfetch::disk
