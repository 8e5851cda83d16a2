// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <reel/core/download_record.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace reel::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

constexpr std::uint64_t REDRAW_BYTES = 1024 * 1024;

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::uint64_t bytes) noexcept {
    std::cout << "\r" << SPINNER_FRAMES[frame_ % 4] << " ";
    if (!label_.empty()) {
        std::cout << label_ << ": ";
    }
    std::cout << ProgressBar::format_bytes(bytes) << "     " << std::flush;
    ++frame_;
}

void Spinner::finish() noexcept {
    std::cout << "\r done" << std::string(40, ' ') << std::endl;
}

void Spinner::clear() noexcept {
    std::cout << "\r" << std::string(60, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(double fraction, std::uint64_t bytes) noexcept {
    if (finished_) return;

    const double percent = std::clamp(fraction * 100.0, 0.0, 100.0);

    // Only redraw on a new whole percent or another megabyte
    const int scaled = static_cast<int>(percent);
    if (scaled <= last_percent_ && bytes < bytes_ + REDRAW_BYTES) return;
    last_percent_ = scaled;
    bytes_ = bytes;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    line += " ";
    if (scaled < 100) line += " ";
    if (scaled < 10) line += " ";
    line += std::to_string(scaled) + "%";

    if (bytes > 0) {
        line += " (";
        line += format_bytes(bytes);
        line += ")";
    }

    // Clear rest of line
    line += std::string(10, ' ');

    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    last_percent_ = -1;
    update(1.0, bytes_);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const noexcept {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) noexcept {
    return core::format_file_size(bytes);
}

} // namespace reel::cli
