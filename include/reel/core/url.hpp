// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace reel::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string base() const;       // scheme://host[:port]
    [[nodiscard]] std::string directory() const;  // scheme://host[:port]/dir/ (no file, no query)
    [[nodiscard]] std::string filename() const;   // last path component, for fetch output names

    // Resolve a playlist entry against the URL of the playlist that contains it
    [[nodiscard]] std::string resolve(std::string_view reference) const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Percent-encode a query parameter value (RFC 3986 unreserved characters pass through)
[[nodiscard]] std::string url_escape(std::string_view value);

} // namespace reel::core
