// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// HLS variant (for adaptive bitrate)
struct HLSVariant {
    std::uint64_t bandwidth{0};     // Bitrate in bps, 0 when not declared
    std::string url;
};

enum class HLSPlaylistKind {
    media,        // Flat list of segment URIs
    master,       // Variant streams only
    empty,        // Neither segments nor variants
};

// Parsed HLS playlist; every URL is already absolute
struct HLSPlaylist {
    std::vector<std::string> segments;
    std::vector<HLSVariant> variants;

    [[nodiscard]] HLSPlaylistKind kind() const noexcept {
        if (!segments.empty()) return HLSPlaylistKind::media;
        if (!variants.empty()) return HLSPlaylistKind::master;
        return HLSPlaylistKind::empty;
    }

    // Highest bandwidth variant, first one on ties
    [[nodiscard]] std::optional<HLSVariant> best_variant() const;
};

// HLS M3U8 parser
class HLSParser {
public:
    // Parse M3U8 text fetched from playlist_url
    [[nodiscard]] static HLSPlaylist parse(std::string_view content,
                                           std::string_view playlist_url);

    // Check if URL is an HLS playlist
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;
};

} // namespace reel::media
