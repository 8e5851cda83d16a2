// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/hls_parser.hpp>
#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

namespace reel::media {

namespace {

constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::uint64_t parse_bandwidth(const std::string& tag) {
    // Anchored on the attribute separator so AVERAGE-BANDWIDTH is not taken
    static const std::regex bandwidth_regex(R"((?:^|[:,])BANDWIDTH=(\d+))");
    std::smatch match;
    if (!std::regex_search(tag, match, bandwidth_regex)) {
        return 0;
    }

    std::uint64_t value = 0;
    const auto text = match[1].str();
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{}) {
        return 0;
    }
    return value;
}

} // namespace

std::optional<HLSVariant> HLSPlaylist::best_variant() const {
    if (variants.empty()) {
        return std::nullopt;
    }
    // max_element keeps the first of equal maxima
    auto it = std::max_element(variants.begin(), variants.end(),
        [](const HLSVariant& a, const HLSVariant& b) { return a.bandwidth < b.bandwidth; });
    return *it;
}

bool HLSParser::is_hls_url(std::string_view url) noexcept {
    std::string lower_url;
    lower_url.reserve(url.size());
    for (char c : url) {
        lower_url += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return lower_url.find(".m3u8") != std::string::npos;
}

HLSPlaylist HLSParser::parse(std::string_view content, std::string_view playlist_url) {
    HLSPlaylist playlist;
    auto base = core::Url::parse(playlist_url);

    auto absolute = [&](std::string_view reference) {
        return base ? base->resolve(reference) : std::string(reference);
    };

    std::optional<std::uint64_t> pending_variant;

    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        auto line = trim(content.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty()) {
            continue;
        }

        if (line.starts_with(TAG_STREAM_INF)) {
            // The URI of this variant is on the next non-comment line
            pending_variant = parse_bandwidth(std::string(line));
            continue;
        }

        if (line.front() == '#') {
            continue;
        }

        if (pending_variant) {
            playlist.variants.push_back({*pending_variant, absolute(line)});
            pending_variant.reset();
        } else {
            playlist.segments.push_back(absolute(line));
        }
    }

    return playlist;
}

} // namespace reel::media
