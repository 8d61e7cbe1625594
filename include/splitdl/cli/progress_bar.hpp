// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace splitdl::cli {

// Human-readable sizes, rates and durations (binary units)
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

// Single-line progress bar redrawn in place with '\r'
class ProgressBar {
public:
    ProgressBar(std::ostream& out, std::uint64_t total, std::string_view label = {});

    // Redraw when the whole percentage changed since the last draw
    void update(std::uint64_t current, std::uint64_t speed_bps = 0);

    // Draw the final state and end the line
    void finish();

    // Erase the line without ending it
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    // Text of the line for the given state, without the leading '\r'
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed_bps) const;

private:
    std::ostream& out_;
    std::uint64_t total_{0};
    std::uint64_t current_{0};
    int last_percent_{-1};
    std::size_t last_width_{0};
    std::string label_;
    bool finished_{false};
};

// Spinner for the probe phase, while the size is still unknown
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

} // namespace splitdl::cli
