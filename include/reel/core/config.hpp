// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace reel::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 120;
constexpr std::uint32_t TRANSFER_TIMEOUT_SEC = 1800;               // Large files can take a while
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;               // 256 KB
constexpr std::size_t COPY_BUFFER_SIZE = 1024 * 1024;               // 1 MB, merge step

constexpr std::uint32_t MAX_PLAYLIST_DEPTH = 5;                     // Master -> media hops
constexpr std::uint64_t MIN_MEDIA_BYTES = 1000;                     // Smaller is an error page
constexpr double SEGMENT_PROGRESS_SHARE = 0.9;                      // Rest is the merge
constexpr std::size_t NOTICE_MAX_CHARS = 50;

constexpr std::string_view DEFAULT_API_BASE_URL = "https://hianime-api-b6ix.onrender.com";
constexpr std::string_view DEFAULT_STREAM_ENDPOINT = "/api/stream";
constexpr std::string_view DEFAULT_REFERER = "https://megacloud.blog/";
constexpr std::string_view DEFAULT_SUBTITLE_REFERER = "https://megacloud.tv/";
constexpr std::string_view MOBILE_USER_AGENT =
    "Mozilla/5.0 (iPhone; CPU iPhone OS 16_0 like Mac OS X) AppleWebKit/605.1.15 "
    "(KHTML, like Gecko) Version/16.0 Mobile/15E148 Safari/604.1";
constexpr std::string_view DESKTOP_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";

// Runtime configuration, loaded from a JSON file. Every key is optional.
struct EngineConfig {
    std::string downloads_root{"downloads"};
    std::string records_file;               // Empty: <downloads_root>/downloads.json
    std::string api_base_url{DEFAULT_API_BASE_URL};
    std::string stream_endpoint{DEFAULT_STREAM_ENDPOINT};
    std::string user_agent{MOBILE_USER_AGENT};
    std::string subtitle_user_agent{DESKTOP_USER_AGENT};
    std::string default_referer{DEFAULT_REFERER};
    std::string subtitle_referer{DEFAULT_SUBTITLE_REFERER};
    std::uint32_t max_playlist_depth{MAX_PLAYLIST_DEPTH};
    std::uint64_t min_media_bytes{MIN_MEDIA_BYTES};
    double min_segment_success_ratio{0.0};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t transfer_timeout_sec{TRANSFER_TIMEOUT_SEC};
    std::string log_level{"info"};

    // Resolved path of the persisted record set
    [[nodiscard]] std::string records_path() const;

    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    parse(std::string_view json_text) noexcept;
};

} // namespace reel::core
