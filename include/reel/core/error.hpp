// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace reel::core {

enum class DownloadErrc {
    success = 0,

    // Transport
    network_error,
    timeout,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    ssl_error,
    dns_error,
    too_many_redirects,

    // Resolution
    stream_unavailable,
    no_segments,
    playlist_too_deep,

    // Empty or unusable result
    no_segments_downloaded,
    too_few_segments,
    payload_too_small,

    // Lifecycle
    cancelled,
    invalid_config,
    invalid_record,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                return "Success";
            case DownloadErrc::network_error:          return "Network error";
            case DownloadErrc::timeout:                return "Operation timed out";
            case DownloadErrc::not_found:              return "Resource not found (404)";
            case DownloadErrc::server_error:           return "Server error (5xx)";
            case DownloadErrc::permission_denied:      return "Access denied by server";
            case DownloadErrc::invalid_url:            return "Invalid URL";
            case DownloadErrc::ssl_error:              return "SSL/TLS error";
            case DownloadErrc::dns_error:              return "DNS resolution failed";
            case DownloadErrc::too_many_redirects:     return "Too many redirects";
            case DownloadErrc::stream_unavailable:     return "No stream available for episode";
            case DownloadErrc::no_segments:            return "No video segments found in playlist";
            case DownloadErrc::playlist_too_deep:      return "Master playlist nesting too deep";
            case DownloadErrc::no_segments_downloaded: return "No segments were downloaded";
            case DownloadErrc::too_few_segments:       return "Too many segments failed to download";
            case DownloadErrc::payload_too_small:      return "Response too small to be media";
            case DownloadErrc::cancelled:              return "Cancelled by user";
            case DownloadErrc::invalid_config:         return "Invalid configuration";
            case DownloadErrc::invalid_record:         return "Invalid download record";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::DownloadErrc> : true_type {};

} // namespace std
