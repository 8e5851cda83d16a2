// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/stream_catalog.hpp>
#include <reel/core/url.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace reel::core {

namespace {

using nlohmann::json;

std::string string_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

HttpHeaders catalog_headers() {
    return {
        {"Accept", "application/json"},
    };
}

} // namespace

std::expected<StreamLinks, std::error_code>
parse_stream_links(std::string_view json_text) noexcept {
    try {
        auto j = json::parse(json_text);
        if (!j.is_object() || !j.value("success", false)) {
            return std::unexpected(make_error_code(DownloadErrc::stream_unavailable));
        }

        auto streams = j.find("streams");
        if (streams == j.end() || !streams->is_array() || streams->empty()) {
            return std::unexpected(make_error_code(DownloadErrc::stream_unavailable));
        }

        // Subtitles are usually identical across servers; the first stream is used
        const auto& stream = streams->front();
        StreamLinks links;

        auto sources = stream.find("sources");
        if (sources == stream.end() || !sources->is_array() || sources->empty()) {
            return std::unexpected(make_error_code(DownloadErrc::stream_unavailable));
        }

        const auto& source = sources->front();
        links.source.url = string_field(source, "file");
        if (links.source.url.empty()) {
            links.source.url = string_field(source, "proxy_url");
        }
        if (links.source.url.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::stream_unavailable));
        }

        auto is_m3u8 = source.find("isM3U8");
        if (is_m3u8 != source.end() && is_m3u8->is_boolean()) {
            links.source.is_playlist = is_m3u8->get<bool>();
        } else {
            links.source.is_playlist = links.source.url.find("m3u8") != std::string::npos;
        }

        auto headers = stream.find("headers");
        if (headers != stream.end() && headers->is_object()) {
            for (const auto& [name, value] : headers->items()) {
                if (value.is_string()) {
                    links.source.headers[name] = value.get<std::string>();
                }
            }
        }

        auto subtitles = stream.find("subtitles");
        if (subtitles != stream.end() && subtitles->is_array()) {
            for (const auto& s : *subtitles) {
                SubtitleTrack track;
                track.url = string_field(s, "file");
                track.label = string_field(s, "label");
                if (track.label.empty()) {
                    track.label = "Unknown";
                }
                links.subtitles.push_back(std::move(track));
            }
        }

        return links;
    } catch (const json::exception& e) {
        spdlog::warn("Malformed streaming-link response: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::stream_unavailable));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::stream_unavailable));
    }
}

//=============================================================================
// HttpStreamCatalog
//=============================================================================

std::string HttpStreamCatalog::links_url(std::string_view episode_id,
                                         std::string_view variant) const {
    std::string url = config_.api_base_url + config_.stream_endpoint;
    url += "?id=";
    url += url_escape(episode_id);
    url += "&server=";
    url += url_escape(variant);
    return url;
}

std::expected<StreamLinks, std::error_code>
HttpStreamCatalog::fetch_links(const std::string& episode_id,
                               const std::string& variant,
                               std::stop_token stop) noexcept {
    std::string url;
    try {
        url = links_url(episode_id, variant);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    spdlog::debug("Fetching streaming links: {}", url);
    auto body = http_.get_text(url, catalog_headers(), stop);
    if (!body) {
        spdlog::warn("Streaming-link request for {} failed: {}", episode_id, body.error().message());
        return std::unexpected(body.error());
    }
    return parse_stream_links(*body);
}

std::expected<StreamSource, std::error_code>
HttpStreamCatalog::resolve_stream_source(const std::string& episode_id,
                                         const std::string& variant,
                                         std::stop_token stop) noexcept {
    auto links = fetch_links(episode_id, variant, stop);
    if (!links) {
        return std::unexpected(links.error());
    }
    return std::move(links->source);
}

std::expected<std::vector<SubtitleTrack>, std::error_code>
HttpStreamCatalog::subtitle_tracks(const std::string& episode_id,
                                   const std::string& variant,
                                   std::stop_token stop) noexcept {
    auto links = fetch_links(episode_id, variant, stop);
    if (!links) {
        return std::unexpected(links.error());
    }
    return std::move(links->subtitles);
}

} // namespace reel::core
