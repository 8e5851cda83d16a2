// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace reel::core {

// Where an episode's video lives
struct StreamSource {
    std::string url;
    bool is_playlist{true};     // HLS playlist vs. direct media file
    HttpHeaders headers;        // Extra headers the host requires
};

// A caption track offered for an episode
struct SubtitleTrack {
    std::string url;
    std::string label;
};

// Remote catalog collaborator: maps (episode, variant) to stream and caption URLs
class StreamCatalog {
public:
    virtual ~StreamCatalog() = default;

    [[nodiscard]] virtual std::expected<StreamSource, std::error_code>
    resolve_stream_source(const std::string& episode_id,
                          const std::string& variant,
                          std::stop_token stop) noexcept = 0;

    [[nodiscard]] virtual std::expected<std::vector<SubtitleTrack>, std::error_code>
    subtitle_tracks(const std::string& episode_id,
                    const std::string& variant,
                    std::stop_token stop) noexcept = 0;
};

// Parsed streaming-link response; first stream, first source
struct StreamLinks {
    StreamSource source;
    std::vector<SubtitleTrack> subtitles;
};

// Parse the JSON body of the streaming-link endpoint
[[nodiscard]] std::expected<StreamLinks, std::error_code>
parse_stream_links(std::string_view json_text) noexcept;

// StreamCatalog over the remote JSON API:
//   GET <api_base_url><stream_endpoint>?id=<episode>&server=<variant>
class HttpStreamCatalog : public StreamCatalog {
public:
    HttpStreamCatalog(HttpClient& http, const EngineConfig& config)
        : http_(http)
        , config_(config) {}

    [[nodiscard]] std::expected<StreamSource, std::error_code>
    resolve_stream_source(const std::string& episode_id,
                          const std::string& variant,
                          std::stop_token stop) noexcept override;

    [[nodiscard]] std::expected<std::vector<SubtitleTrack>, std::error_code>
    subtitle_tracks(const std::string& episode_id,
                    const std::string& variant,
                    std::stop_token stop) noexcept override;

    [[nodiscard]] std::string links_url(std::string_view episode_id,
                                        std::string_view variant) const;

private:
    [[nodiscard]] std::expected<StreamLinks, std::error_code>
    fetch_links(const std::string& episode_id,
                const std::string& variant,
                std::stop_token stop) noexcept;

    HttpClient& http_;
    EngineConfig config_;
};

} // namespace reel::core
