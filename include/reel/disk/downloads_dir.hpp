// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace reel::disk {

// Layout of the downloads root:
//   <root>/<key>.ts | <key>.mp4     finished videos
//   <root>/temp_<key>/              per-transfer scratch segments
//   <root>/subtitles/<key>_*.vtt    caption files
class DownloadsDir {
public:
    explicit DownloadsDir(std::filesystem::path root)
        : root_(std::move(root)) {}

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    [[nodiscard]] std::filesystem::path scratch_dir(std::string_view key) const;
    [[nodiscard]] std::filesystem::path video_path(std::string_view key, bool playlist) const;
    [[nodiscard]] std::filesystem::path subtitles_dir() const;
    [[nodiscard]] std::filesystem::path subtitle_path(std::string_view file_name) const;

    // Create root and subtitles directory
    [[nodiscard]] std::error_code ensure() const noexcept;

    // Create (or wipe and re-create) the scratch directory of a key
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    fresh_scratch_dir(std::string_view key) const noexcept;

    // Delete a file or directory tree; a missing path is not an error
    [[nodiscard]] static std::error_code remove_all(const std::filesystem::path& path) noexcept;

    [[nodiscard]] static std::expected<std::uint64_t, std::error_code>
    file_size(const std::filesystem::path& path) noexcept;

    [[nodiscard]] static bool exists(const std::filesystem::path& path) noexcept;

    // Remove scratch directory and both possible partial videos of a key
    void discard_partial(std::string_view key) const noexcept;

    // Remove every temp_* directory left behind, except the one of keep_key;
    // returns how many were removed
    std::size_t remove_orphan_scratch(std::string_view keep_key = {}) const noexcept;

private:
    std::filesystem::path root_;
};

} // namespace reel::disk
