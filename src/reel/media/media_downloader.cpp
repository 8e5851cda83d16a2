// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/media_downloader.hpp>
#include <reel/core/download_record.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/media/playlist_resolver.hpp>
#include <reel/media/stream_headers.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <memory>

namespace reel::media {

namespace fs = std::filesystem;
using core::DownloadErrc;

namespace {

std::string segment_file_name(std::size_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "segment_%05zu.ts", index);
    return name;
}

void discard(const fs::path& path) noexcept {
    if (auto ec = disk::DownloadsDir::remove_all(path)) {
        spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
    }
}

// First bytes of a payload too small to be media, for the log
std::string read_head(const fs::path& path, std::size_t limit) {
    struct Closer {
        void operator()(std::FILE* f) const noexcept { std::fclose(f); }
    };
    std::unique_ptr<std::FILE, Closer> file(std::fopen(path.c_str(), "rb"));
    if (!file) {
        return {};
    }
    std::string text(limit, '\0');
    text.resize(std::fread(text.data(), 1, text.size(), file.get()));
    return text;
}

} // namespace

//=============================================================================
// MediaDownloader
//=============================================================================

std::expected<MediaResult, std::error_code>
MediaDownloader::download_hls(std::string_view key,
                              const std::string& playlist_url,
                              const fs::path& dest,
                              const core::HttpHeaders& extra_headers,
                              std::stop_token stop) noexcept {
    std::expected<std::vector<std::string>, std::error_code> segments;
    try {
        PlaylistResolver resolver(http_, config_.max_playlist_depth);
        segments = resolver.resolve(playlist_url,
                                    stream_headers(playlist_url, config_, extra_headers),
                                    stop);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    if (!segments) {
        discard(dest);
        return std::unexpected(segments.error());
    }
    return download_segments(key, *segments, dest, extra_headers, stop);
}

std::expected<MediaResult, std::error_code>
MediaDownloader::download_segments(std::string_view key,
                                   const std::vector<std::string>& segments,
                                   const fs::path& dest,
                                   const core::HttpHeaders& extra_headers,
                                   std::stop_token stop) noexcept {
    std::expected<MediaResult, std::error_code> result;
    try {
        result = fetch_and_merge(key, segments, dest, extra_headers, stop);
    } catch (const std::bad_alloc&) {
        result = std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    if (!result) {
        spdlog::error("HLS download of {} failed: {}", key, result.error().message());
        // Unrecoverable: nothing partial may survive
        discard(dest);
        discard(dir_.scratch_dir(key));
    }
    return result;
}

std::expected<MediaResult, std::error_code>
MediaDownloader::fetch_and_merge(std::string_view key,
                                 const std::vector<std::string>& segments,
                                 const fs::path& dest,
                                 const core::HttpHeaders& extra_headers,
                                 std::stop_token stop) {
    if (segments.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::no_segments));
    }

    auto scratch = dir_.fresh_scratch_dir(key);
    if (!scratch) {
        return std::unexpected(scratch.error());
    }

    MediaProgress progress;
    progress.total_segments = static_cast<std::uint32_t>(segments.size());

    std::vector<fs::path> parts;
    parts.reserve(segments.size());

    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        }

        const auto& url = segments[i];
        auto part = *scratch / segment_file_name(i);

        auto bytes = http_.download_to(url, stream_headers(url, config_, extra_headers),
                                       part, {}, stop);
        if (bytes) {
            parts.push_back(part);
            progress.downloaded_bytes += *bytes;
            spdlog::trace("Downloaded segment {}/{}", i + 1, segments.size());
        } else if (bytes.error() == DownloadErrc::cancelled || stop.stop_requested()) {
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        } else if (bytes.error().category() != core::download_errc_category()) {
            // Only transport failures are skippable; storage errors end the transfer
            spdlog::error("Segment {} could not be stored: {}", i, bytes.error().message());
            return std::unexpected(bytes.error());
        } else {
            spdlog::warn("Failed to download segment {}: {}", i, bytes.error().message());
            if (auto ec = disk::DownloadsDir::remove_all(part)) {
                spdlog::debug("Could not remove failed segment {}: {}", i, ec.message());
            }
        }

        progress.segments_attempted = static_cast<std::uint32_t>(i + 1);
        progress.fraction = static_cast<double>(i + 1) / static_cast<double>(segments.size())
                          * core::SEGMENT_PROGRESS_SHARE;
        update_progress(progress);
    }

    if (parts.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::no_segments_downloaded));
    }

    const double ratio = static_cast<double>(parts.size()) / static_cast<double>(segments.size());
    if (ratio < config_.min_segment_success_ratio) {
        spdlog::error("Only {}/{} segments downloaded, below the configured minimum of {:.0f}%",
                      parts.size(), segments.size(), config_.min_segment_success_ratio * 100.0);
        return std::unexpected(make_error_code(DownloadErrc::too_few_segments));
    }

    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    spdlog::info("Merging {} segments...", parts.size());
    if (auto ec = merge(parts, dest)) {
        return std::unexpected(ec);
    }

    discard(*scratch);

    auto size = disk::DownloadsDir::file_size(dest);
    if (!size) {
        return std::unexpected(size.error());
    }

    progress.fraction = 1.0;
    progress.downloaded_bytes = *size;
    update_progress(progress);

    spdlog::info("HLS download complete: {} ({})", dest.string(), core::format_file_size(*size));

    MediaResult result;
    result.path = dest;
    result.file_size = *size;
    result.segments_downloaded = static_cast<std::uint32_t>(parts.size());
    result.total_segments = progress.total_segments;
    return result;
}

std::error_code MediaDownloader::merge(const std::vector<fs::path>& parts,
                                       const fs::path& dest) noexcept {
    disk::FileWriter writer;
    if (auto ec = writer.open(dest)) {
        return ec;
    }

    for (const auto& part : parts) {
        if (auto ec = writer.append_file(part)) {
            spdlog::error("Merge failed at {}: {}", part.filename().string(), ec.message());
            return ec;
        }
    }

    if (auto ec = writer.flush()) {
        return ec;
    }
    writer.close();
    return {};
}

std::expected<MediaResult, std::error_code>
MediaDownloader::download_file(const std::string& url,
                               const fs::path& dest,
                               const core::HttpHeaders& extra_headers,
                               std::stop_token stop) noexcept {
    try {
        spdlog::info("Downloading media file: {}", url);

        MediaProgress progress;
        auto on_bytes = [&](std::uint64_t received, std::uint64_t total) {
            // Without a length only the byte count moves
            progress.fraction_known = total > 0;
            if (total > 0) {
                progress.fraction = static_cast<double>(received) / static_cast<double>(total);
                progress.downloaded_bytes = total;
            } else {
                progress.downloaded_bytes = received;
            }
            update_progress(progress);
        };

        auto bytes = http_.download_to(url, stream_headers(url, config_, extra_headers),
                                       dest, on_bytes, stop);
        if (!bytes) {
            discard(dest);
            auto ec = stop.stop_requested() ? make_error_code(DownloadErrc::cancelled) : bytes.error();
            spdlog::error("Media download failed: {}", ec.message());
            return std::unexpected(ec);
        }

        auto size = disk::DownloadsDir::file_size(dest);
        if (!size) {
            return std::unexpected(size.error());
        }

        if (*size < config_.min_media_bytes) {
            // Probably an error response
            spdlog::error("Download failed, server returned {} bytes: {}",
                          *size, read_head(dest, static_cast<std::size_t>(*size)));
            discard(dest);
            return std::unexpected(make_error_code(DownloadErrc::payload_too_small));
        }

        progress.fraction_known = true;
        progress.fraction = 1.0;
        progress.downloaded_bytes = *size;
        update_progress(progress);

        spdlog::info("Video download complete: {}", core::format_file_size(*size));

        MediaResult result;
        result.path = dest;
        result.file_size = *size;
        return result;
    } catch (const std::bad_alloc&) {
        discard(dest);
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

void MediaDownloader::update_progress(const MediaProgress& progress) noexcept {
    if (callback_) {
        callback_(progress);
    }
}

} // namespace reel::media
