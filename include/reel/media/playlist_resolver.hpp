// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/http_session.hpp>
#include <reel/media/hls_parser.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace reel::media {

// Turns a playlist URL into the ordered segment URLs of one rendition,
// following master playlists to their highest-bandwidth variant.
class PlaylistResolver {
public:
    PlaylistResolver(core::HttpClient& http, std::uint32_t max_depth) noexcept
        : http_(http)
        , max_depth_(max_depth) {}

    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    resolve(const std::string& playlist_url,
            const core::HttpHeaders& headers,
            std::stop_token stop) noexcept;

private:
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    resolve_at(const std::string& playlist_url,
               const core::HttpHeaders& headers,
               std::uint32_t depth,
               std::stop_token stop);

    core::HttpClient& http_;
    std::uint32_t max_depth_;
};

} // namespace reel::media
