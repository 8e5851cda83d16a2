// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::core {

// Record lifecycle:
//   pending -> downloading -> completed | failed | paused
//   failed | paused -> pending (retry)
enum class DownloadStatus : std::uint8_t {
    pending,
    downloading,
    completed,
    failed,
    paused,
};

[[nodiscard]] std::string_view status_name(DownloadStatus status) noexcept;

// Unknown names map to pending
[[nodiscard]] DownloadStatus status_from_name(std::string_view name) noexcept;

// A caption track saved next to a completed episode
struct SubtitleRecord {
    std::string label;
    std::string language;
    std::string file_path;
};

// What the caller asks to download
struct DownloadRequest {
    std::string anime_slug;
    std::string anime_title;
    std::string anime_thumbnail;
    std::string episode_id;          // Catalog identifier for stream lookups
    std::int32_t episode_number{0};
    std::string episode_title;
    std::string server_variant{"sub"};
};

// Build the unique key "<slug>_ep<number>_<variant>"
[[nodiscard]] std::string make_download_key(std::string_view anime_slug,
                                            std::int32_t episode_number,
                                            std::string_view server_variant);

// Keys name files under the downloads root, so no separators or parent references
[[nodiscard]] bool is_valid_download_key(std::string_view key) noexcept;

// Persisted unit of work
struct DownloadRecord {
    std::string anime_slug;
    std::string anime_title;
    std::optional<std::string> anime_thumbnail;
    std::string episode_id;
    std::int32_t episode_number{0};
    std::optional<std::string> episode_title;
    std::string server_variant{"sub"};
    std::optional<std::string> file_path;     // Set on completion
    std::optional<std::string> stream_url;
    std::int64_t downloaded_at{0};            // Unix seconds of the request
    DownloadStatus status{DownloadStatus::pending};
    double progress{0.0};                     // 0.0 - 1.0
    std::optional<std::uint64_t> file_size;
    std::optional<std::string> error_message;
    std::vector<SubtitleRecord> subtitles;

    [[nodiscard]] std::string key() const {
        return make_download_key(anime_slug, episode_number, server_variant);
    }

    [[nodiscard]] static DownloadRecord from_request(const DownloadRequest& request,
                                                     std::int64_t requested_at);
};

// Human readable size, e.g. "1.5 MB"
[[nodiscard]] std::string format_file_size(std::uint64_t bytes);

} // namespace reel::core
