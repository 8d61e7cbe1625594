// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <ostream>

namespace splitdl::cli {

namespace {

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

constexpr int BAR_WIDTH = 30;

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

} // namespace

//=============================================================================
// Formatting
//=============================================================================

std::string format_bytes(std::uint64_t bytes) {
    const auto value = static_cast<double>(bytes);
    if (bytes >= TB) return std::format("{:.2f} TB", value / TB);
    if (bytes >= GB) return std::format("{:.2f} GB", value / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", value / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", value / KB);
    return std::format("{} B", bytes);
}

std::string format_speed(std::uint64_t bps) {
    const auto value = static_cast<double>(bps);
    if (bps >= GB) return std::format("{:.1f} GB/s", value / GB);
    if (bps >= MB) return std::format("{:.1f} MB/s", value / MB);
    if (bps >= KB) return std::format("{:.1f} KB/s", value / KB);
    return std::format("{} B/s", bps);
}

std::string format_time(std::uint64_t seconds) {
    const auto hours = seconds / 3600;
    const auto minutes = (seconds % 3600) / 60;
    const auto secs = seconds % 60;

    if (hours > 0) return std::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return std::format("{}m {}s", minutes, secs);
    return std::format("{}s", secs);
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::uint64_t total, std::string_view label)
    : out_(out)
    , total_(total)
    , label_(label) {}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const {
    double percent = total_ == 0 ? 100.0
        : static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        line += '>';
        line.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    line += ']';

    line += std::format(" {:3}% ({}/{})", static_cast<int>(percent),
                        format_bytes(current), format_bytes(total_));

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        if (current < total_) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed_bps);
        }
    }
    return line;
}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) {
    if (finished_) return;

    current_ = current;
    const int percent = total_ == 0 ? 100
        : static_cast<int>(std::min<std::uint64_t>(current * 100 / total_, 100));
    if (percent == last_percent_) return;
    last_percent_ = percent;

    auto line = render(current, speed_bps);
    // Pad over whatever the previous, possibly longer, line left behind
    std::size_t width = line.size();
    if (width < last_width_) {
        line.append(last_width_ - width, ' ');
    }
    last_width_ = width;

    out_ << '\r' << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    last_percent_ = -1;
    update(current_);
    finished_ = true;
    out_ << std::endl;
}

void ProgressBar::clear() {
    out_ << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
    last_width_ = 0;
    last_percent_ = -1;
}

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::string_view text) {
    auto line = std::format("{} {}", SPINNER_FRAMES[frame_ % 4], text);
    ++frame_;
    std::size_t width = line.size();
    if (width < last_width_) {
        line.append(last_width_ - width, ' ');
    }
    last_width_ = width;
    out_ << '\r' << line << std::flush;
}

void Spinner::clear() {
    out_ << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
    last_width_ = 0;
}

} // namespace splitdl::cli
