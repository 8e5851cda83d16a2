// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/url.hpp>

using namespace reel::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/master.m3u8");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "example.com");
        CHECK(url.path() == "/master.m3u8");
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://localhost:3000/api/stream");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "http");
        CHECK(url.host() == "localhost");
        CHECK(url.port() == "3000");
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://cdn.example.com/hls/index.m3u8?token=abc#t=10");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/hls/index.m3u8");
        CHECK(result->query() == "token=abc");
        CHECK(result->fragment() == "t=10");
    }

    SECTION("Host only") {
        auto result = Url::parse("https://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
    }

    SECTION("Scheme is lowercased") {
        auto result = Url::parse("HTTPS://Example.com/a");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    SECTION("Missing scheme") {
        auto result = Url::parse("example.com/master.m3u8");
        REQUIRE(!result.has_value());
        CHECK(result.error() == DownloadErrc::invalid_url);
    }

    SECTION("Empty string") {
        CHECK(!Url::parse("").has_value());
    }

    SECTION("Empty host") {
        CHECK(!Url::parse("https:///path").has_value());
    }
}

TEST_CASE("Url::filename extraction", "[url]") {
    SECTION("Simple filename") {
        CHECK(Url::parse("https://example.com/seg-1.ts")->filename() == "seg-1.ts");
    }

    SECTION("URL with query params") {
        CHECK(Url::parse("https://example.com/index.m3u8?id=123")->filename() == "index.m3u8");
    }

    SECTION("Path without filename") {
        CHECK(Url::parse("https://example.com/folder/")->filename() == "index.html");
    }
}

TEST_CASE("Url::directory drops file and query", "[url]") {
    auto url = Url::parse("https://cdn.example.com/hls/720/index.m3u8?token=abc");
    REQUIRE(url.has_value());
    CHECK(url->base() == "https://cdn.example.com");
    CHECK(url->directory() == "https://cdn.example.com/hls/720/");
}

TEST_CASE("Url::resolve playlist references", "[url]") {
    auto playlist = Url::parse("https://cdn.example.com/hls/720/index.m3u8?token=abc");
    REQUIRE(playlist.has_value());

    SECTION("Relative reference joins the playlist directory") {
        CHECK(playlist->resolve("seg-0.ts") == "https://cdn.example.com/hls/720/seg-0.ts");
        CHECK(playlist->resolve("sub/seg-1.ts?x=1") == "https://cdn.example.com/hls/720/sub/seg-1.ts?x=1");
    }

    SECTION("Absolute path attaches to scheme and host") {
        CHECK(playlist->resolve("/other/seg-0.ts") == "https://cdn.example.com/other/seg-0.ts");
    }

    SECTION("Absolute URL is kept") {
        CHECK(playlist->resolve("https://other.example.net/a.ts") == "https://other.example.net/a.ts");
        CHECK(playlist->resolve("http://other.example.net/a.ts") == "http://other.example.net/a.ts");
    }

    SECTION("Protocol-relative reference takes the playlist scheme") {
        CHECK(playlist->resolve("//edge.example.net/a.ts") == "https://edge.example.net/a.ts");
    }

    SECTION("Port is preserved") {
        auto local = Url::parse("http://127.0.0.1:8080/live/index.m3u8");
        REQUIRE(local.has_value());
        CHECK(local->resolve("/x.ts") == "http://127.0.0.1:8080/x.ts");
        CHECK(local->resolve("x.ts") == "http://127.0.0.1:8080/live/x.ts");
    }
}

TEST_CASE("url_escape", "[url]") {
    CHECK(url_escape("one-piece-100?ep=2142") == "one-piece-100%3Fep%3D2142");
    CHECK(url_escape("a b&c") == "a%20b%26c");
    CHECK(url_escape("sub") == "sub");
    CHECK(url_escape("~._-") == "~._-");
}
