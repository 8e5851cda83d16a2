// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/download_record.hpp>
#include <iomanip>
#include <sstream>

namespace reel::core {

std::string_view status_name(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::pending:     return "pending";
        case DownloadStatus::downloading: return "downloading";
        case DownloadStatus::completed:   return "completed";
        case DownloadStatus::failed:      return "failed";
        case DownloadStatus::paused:      return "paused";
    }
    return "pending";
}

DownloadStatus status_from_name(std::string_view name) noexcept {
    if (name == "downloading") return DownloadStatus::downloading;
    if (name == "completed") return DownloadStatus::completed;
    if (name == "failed") return DownloadStatus::failed;
    if (name == "paused") return DownloadStatus::paused;
    return DownloadStatus::pending;
}

std::string make_download_key(std::string_view anime_slug,
                              std::int32_t episode_number,
                              std::string_view server_variant) {
    std::string key(anime_slug);
    key += "_ep";
    key += std::to_string(episode_number);
    key += "_";
    key += server_variant;
    return key;
}

bool is_valid_download_key(std::string_view key) noexcept {
    if (key.empty() || key.find("..") != std::string_view::npos) {
        return false;
    }
    return key.find_first_of(std::string_view("/\\\0:", 4)) == std::string_view::npos;
}

DownloadRecord DownloadRecord::from_request(const DownloadRequest& request,
                                            std::int64_t requested_at) {
    DownloadRecord record;
    record.anime_slug = request.anime_slug;
    record.anime_title = request.anime_title.empty() ? "Unknown" : request.anime_title;
    if (!request.anime_thumbnail.empty()) {
        record.anime_thumbnail = request.anime_thumbnail;
    }
    record.episode_id = request.episode_id;
    record.episode_number = request.episode_number;
    if (!request.episode_title.empty()) {
        record.episode_title = request.episode_title;
    }
    record.server_variant = request.server_variant;
    record.downloaded_at = requested_at;
    record.status = DownloadStatus::pending;
    return record;
}

std::string format_file_size(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    ss << std::fixed;
    if (bytes < KB) {
        return std::to_string(bytes) + " B";
    } else if (bytes < MB) {
        ss << std::setprecision(1) << (static_cast<double>(bytes) / KB) << " KB";
    } else if (bytes < GB) {
        ss << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else {
        ss << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    }
    return ss.str();
}

} // namespace reel::core
