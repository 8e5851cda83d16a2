// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <string_view>

namespace reel::media {

// Headers for playlist, segment and direct-file requests to a stream host.
// Referer/Origin follow the host: the API itself (or a local/onrender deployment)
// gets the API base URL, everything else gets the configured default referer.
[[nodiscard]] core::HttpHeaders stream_headers(std::string_view url,
                                               const core::EngineConfig& config);

// Same as stream_headers(), then the catalog-supplied headers on top
[[nodiscard]] core::HttpHeaders stream_headers(std::string_view url,
                                               const core::EngineConfig& config,
                                               const core::HttpHeaders& overrides);

// Headers for caption file requests
[[nodiscard]] core::HttpHeaders subtitle_headers(const core::EngineConfig& config);

} // namespace reel::media
