// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <reel/disk/downloads_dir.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// Media download progress
struct MediaProgress {
    double fraction{0.0};               // 0.0 - 1.0
    bool fraction_known{true};          // False for direct files without a length
    std::uint64_t downloaded_bytes{0};
    std::uint32_t segments_attempted{0};
    std::uint32_t total_segments{0};
};

// Callback for media download progress
using MediaProgressCallback = std::function<void(const MediaProgress&)>;

// Outcome of a finished transfer
struct MediaResult {
    std::filesystem::path path;
    std::uint64_t file_size{0};
    std::uint32_t segments_downloaded{0};
    std::uint32_t total_segments{0};
};

// Fetches HLS segment lists or single media files into the downloads root.
// Every failure path leaves neither a destination file nor a scratch directory.
class MediaDownloader {
public:
    MediaDownloader(core::HttpClient& http,
                    const disk::DownloadsDir& dir,
                    const core::EngineConfig& config) noexcept
        : http_(http)
        , dir_(dir)
        , config_(config) {}

    MediaDownloader(const MediaDownloader&) = delete;
    MediaDownloader& operator=(const MediaDownloader&) = delete;

    // Set progress callback
    void callback(MediaProgressCallback cb) noexcept { callback_ = std::move(cb); }

    // Resolve a playlist URL, then download its segments into dest
    [[nodiscard]] std::expected<MediaResult, std::error_code>
    download_hls(std::string_view key,
                 const std::string& playlist_url,
                 const std::filesystem::path& dest,
                 const core::HttpHeaders& extra_headers,
                 std::stop_token stop) noexcept;

    // Fetch segments in order into <root>/temp_<key>, skip failures,
    // then concatenate the successful ones into dest
    [[nodiscard]] std::expected<MediaResult, std::error_code>
    download_segments(std::string_view key,
                      const std::vector<std::string>& segments,
                      const std::filesystem::path& dest,
                      const core::HttpHeaders& extra_headers,
                      std::stop_token stop) noexcept;

    // Single streamed download of a non-HLS media file
    [[nodiscard]] std::expected<MediaResult, std::error_code>
    download_file(const std::string& url,
                  const std::filesystem::path& dest,
                  const core::HttpHeaders& extra_headers,
                  std::stop_token stop) noexcept;

private:
    [[nodiscard]] std::expected<MediaResult, std::error_code>
    fetch_and_merge(std::string_view key,
                    const std::vector<std::string>& segments,
                    const std::filesystem::path& dest,
                    const core::HttpHeaders& extra_headers,
                    std::stop_token stop);

    [[nodiscard]] std::error_code merge(const std::vector<std::filesystem::path>& parts,
                                        const std::filesystem::path& dest) noexcept;

    // Update progress
    void update_progress(const MediaProgress& progress) noexcept;

    core::HttpClient& http_;
    const disk::DownloadsDir& dir_;
    const core::EngineConfig& config_;
    MediaProgressCallback callback_;
};

} // namespace reel::media
