// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/download_record.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/stream_catalog.hpp>
#include <reel/disk/downloads_dir.hpp>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// Lowercase; whitespace runs and <>:"/\|?* become '_'
[[nodiscard]] std::string sanitize_filename(std::string_view name);

// ISO 639-1 code guessed from a track label, "unknown" when nothing matches
[[nodiscard]] std::string_view language_code(std::string_view label) noexcept;

// Saves caption tracks as <root>/subtitles/<key>_<label>.vtt
class SubtitleFetcher {
public:
    SubtitleFetcher(core::HttpClient& http,
                    const disk::DownloadsDir& dir,
                    const core::EngineConfig& config) noexcept
        : http_(http)
        , dir_(dir)
        , config_(config) {}

    // Tracks that fail are logged and skipped
    [[nodiscard]] std::vector<core::SubtitleRecord>
    fetch_all(std::string_view key,
              const std::vector<core::SubtitleTrack>& tracks,
              std::stop_token stop) noexcept;

private:
    core::HttpClient& http_;
    const disk::DownloadsDir& dir_;
    const core::EngineConfig& config_;
};

} // namespace reel::media
