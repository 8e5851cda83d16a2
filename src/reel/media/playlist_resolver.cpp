// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/playlist_resolver.hpp>
#include <spdlog/spdlog.h>
#include <regex>

namespace reel::media {

using core::DownloadErrc;

std::expected<std::vector<std::string>, std::error_code>
PlaylistResolver::resolve(const std::string& playlist_url,
                          const core::HttpHeaders& headers,
                          std::stop_token stop) noexcept {
    try {
        return resolve_at(playlist_url, headers, 0, stop);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    } catch (const std::regex_error& e) {
        spdlog::error("Playlist parse failed: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::no_segments));
    }
}

std::expected<std::vector<std::string>, std::error_code>
PlaylistResolver::resolve_at(const std::string& playlist_url,
                             const core::HttpHeaders& headers,
                             std::uint32_t depth,
                             std::stop_token stop) {
    spdlog::info("Fetching HLS playlist: {}", playlist_url);

    auto text = http_.get_text(playlist_url, headers, stop);
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }
    if (!text) {
        return std::unexpected(text.error());
    }
    spdlog::debug("Playlist content length: {}", text->size());

    auto playlist = HLSParser::parse(*text, playlist_url);

    switch (playlist.kind()) {
        case HLSPlaylistKind::media:
            spdlog::info("Found {} segments to download", playlist.segments.size());
            return std::move(playlist.segments);

        case HLSPlaylistKind::master: {
            if (depth + 1 > max_depth_) {
                spdlog::error("Master playlist chain exceeds {} hops at {}", max_depth_, playlist_url);
                return std::unexpected(make_error_code(DownloadErrc::playlist_too_deep));
            }
            auto best = playlist.best_variant();
            spdlog::info("Found master playlist, fetching stream: {} ({} bps of {} variants)",
                         best->url, best->bandwidth, playlist.variants.size());
            return resolve_at(best->url, headers, depth + 1, stop);
        }

        case HLSPlaylistKind::empty:
            break;
    }

    spdlog::error("No video segments found in playlist {}", playlist_url);
    return std::unexpected(make_error_code(DownloadErrc::no_segments));
}

} // namespace reel::media
