// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace hdfetch::cli {

namespace {

constexpr const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};
constexpr int BAR_WIDTH = 30;

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::string_view text) {
    std::string line = SPINNER_FRAMES[frame_ % 4];
    line += ' ';
    line += text;
    ++frame_;

    const auto pad = last_width_ > line.size() ? last_width_ - line.size() : 0;
    out_ << '\r' << line << std::string(pad, ' ') << std::flush;
    last_width_ = line.size();
}

void Spinner::clear() {
    if (last_width_ == 0) return;
    out_ << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
    last_width_ = 0;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::uint64_t total, std::string_view label)
    : out_(out)
    , total_(total)
    , label_(label) {}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const {
    double percent = 0.0;
    if (total_ > 0) {
        percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
        percent = std::clamp(percent, 0.0, 100.0);
    }

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        line += '>';
        line.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    line += ']';

    auto pct = std::to_string(static_cast<int>(percent));
    line += ' ';
    line.append(3 - std::min<std::size_t>(pct.size(), 3), ' ');
    line += pct;
    line += '%';

    line += " (";
    line += format_bytes(current);
    if (total_ > 0) {
        line += '/';
        line += format_bytes(total_);
    }
    line += ')';

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        if (total_ > current) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed_bps);
        }
    }
    return line;
}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) {
    if (finished_) return;

    auto line = render(current, speed_bps);
    if (line == last_line_) return;

    const auto pad = last_width_ > line.size() ? last_width_ - line.size() : 0;
    out_ << '\r' << line << std::string(pad, ' ') << std::flush;
    last_width_ = line.size();
    last_line_ = std::move(line);
}

void ProgressBar::finish() {
    if (finished_) return;
    update(total_, 0);
    finished_ = true;
    out_ << '\n' << std::flush;
}

void ProgressBar::clear() {
    if (last_width_ == 0) return;
    out_ << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
    last_width_ = 0;
    last_line_.clear();
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) return fixed(static_cast<double>(bps) / GB, 1) + " GB/s";
    if (bps >= MB) return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
    if (bps >= KB) return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    if (bytes >= GB) return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    if (bytes >= MB) return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    if (bytes >= KB) return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace hdfetch::cli
