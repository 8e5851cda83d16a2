// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/stream_headers.hpp>
#include <reel/core/url.hpp>

namespace reel::media {

namespace {

bool is_api_host(std::string_view host, const core::EngineConfig& config) {
    if (host == "localhost" || host == "127.0.0.1" || host.ends_with("onrender.com")) {
        return true;
    }
    auto api = core::Url::parse(config.api_base_url);
    return api && !api->host().empty() && api->host() == host;
}

} // namespace

core::HttpHeaders stream_headers(std::string_view url, const core::EngineConfig& config) {
    std::string referer = config.default_referer;

    if (auto parsed = core::Url::parse(url); parsed && is_api_host(parsed->host(), config)) {
        referer = config.api_base_url;
    }

    std::string origin = referer;
    while (!origin.empty() && origin.back() == '/') {
        origin.pop_back();
    }

    return {
        {"User-Agent", config.user_agent},
        {"Accept", "*/*"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Referer", referer},
        {"Origin", origin},
    };
}

core::HttpHeaders stream_headers(std::string_view url,
                                 const core::EngineConfig& config,
                                 const core::HttpHeaders& overrides) {
    auto headers = stream_headers(url, config);
    for (const auto& [name, value] : overrides) {
        headers[name] = value;
    }
    return headers;
}

core::HttpHeaders subtitle_headers(const core::EngineConfig& config) {
    return {
        {"User-Agent", config.subtitle_user_agent},
        {"Referer", config.subtitle_referer},
    };
}

} // namespace reel::media
