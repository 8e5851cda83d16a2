// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Update progress; fraction in 0.0 - 1.0, bytes received so far
    void update(double fraction, std::uint64_t bytes = 0) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] bool finished() const noexcept { return finished_; }

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes) noexcept;

private:
    [[nodiscard]] std::string render_bar(double percent) const noexcept;

    std::string label_;
    int last_percent_{-1};
    std::uint64_t bytes_{0};
    bool finished_{false};
};

// Spinner for indeterminate progress (media files without a length)
class Spinner {
public:
    explicit Spinner(std::string_view label = {}) : label_(label) {}

    void update(std::uint64_t bytes) noexcept;
    void finish() noexcept;
    void clear() noexcept;

private:
    std::string label_;
    std::size_t frame_{0};
};

} // namespace reel::cli
