// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace hdfetch::cli {

// Single-line progress bar redrawn in place with '\r'
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::uint64_t total = 0, std::string_view label = {});

    // Redraw with `current` bytes done. Skipped unless the percentage or
    // the status text changed since the last draw.
    void update(std::uint64_t current, std::uint64_t speed_bps = 0);

    // Draw 100% and move to the next line
    void finish();

    // Erase the bar line
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    std::ostream& out_;
    std::uint64_t total_{0};
    std::string label_;
    std::string last_line_;
    std::size_t last_width_{0};
    bool finished_{false};
};

// Spinner for phases without a known size
class Spinner {
public:
    explicit Spinner(std::ostream& out) noexcept : out_(out) {}

    void update(std::string_view text);
    void clear();

private:
    std::ostream& out_;
    std::size_t frame_{0};
    std::size_t last_width_{0};
};

} // namespace hdfetch::cli
