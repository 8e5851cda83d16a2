// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/disk/downloads_dir.hpp>
#include <reel/disk/file_writer.hpp>
#include "test_support.hpp"

using namespace reel;
using namespace reel::disk;

TEST_CASE("DownloadsDir layout", "[disk]") {
    DownloadsDir dir("/data/downloads");
    CHECK(dir.video_path("frieren_ep1_sub", true) == std::filesystem::path("/data/downloads/frieren_ep1_sub.ts"));
    CHECK(dir.video_path("frieren_ep1_sub", false) == std::filesystem::path("/data/downloads/frieren_ep1_sub.mp4"));
    CHECK(dir.scratch_dir("frieren_ep1_sub") == std::filesystem::path("/data/downloads/temp_frieren_ep1_sub"));
    CHECK(dir.subtitle_path("x.vtt") == std::filesystem::path("/data/downloads/subtitles/x.vtt"));
}

TEST_CASE("DownloadsDir cleanup", "[disk]") {
    test::TempDir tmp;
    DownloadsDir dir(tmp.path() / "downloads");
    REQUIRE_FALSE(dir.ensure());
    CHECK(DownloadsDir::exists(dir.subtitles_dir()));

    SECTION("fresh_scratch_dir wipes earlier content") {
        test::write_file(dir.scratch_dir("a_ep1_sub") / "segment_00000.ts", "old");
        auto scratch = dir.fresh_scratch_dir("a_ep1_sub");
        REQUIRE(scratch.has_value());
        CHECK(DownloadsDir::exists(*scratch));
        CHECK(std::filesystem::is_empty(*scratch));
    }

    SECTION("discard_partial removes scratch and both video kinds") {
        test::write_file(dir.scratch_dir("a_ep1_sub") / "segment_00000.ts", "x");
        test::write_file(dir.video_path("a_ep1_sub", true), "x");
        test::write_file(dir.video_path("a_ep1_sub", false), "x");
        test::write_file(dir.video_path("a_ep2_sub", true), "keep");

        dir.discard_partial("a_ep1_sub");
        CHECK_FALSE(DownloadsDir::exists(dir.scratch_dir("a_ep1_sub")));
        CHECK_FALSE(DownloadsDir::exists(dir.video_path("a_ep1_sub", true)));
        CHECK_FALSE(DownloadsDir::exists(dir.video_path("a_ep1_sub", false)));
        CHECK(DownloadsDir::exists(dir.video_path("a_ep2_sub", true)));

        // Nothing left to remove
        dir.discard_partial("a_ep1_sub");
    }

    SECTION("remove_orphan_scratch spares the active key") {
        test::write_file(dir.scratch_dir("a_ep1_sub") / "segment_00000.ts", "x");
        test::write_file(dir.scratch_dir("a_ep2_sub") / "segment_00000.ts", "x");
        test::write_file(dir.scratch_dir("a_ep3_sub") / "segment_00000.ts", "x");

        CHECK(dir.remove_orphan_scratch("a_ep2_sub") == 2);
        CHECK(DownloadsDir::exists(dir.scratch_dir("a_ep2_sub")));
        CHECK_FALSE(DownloadsDir::exists(dir.scratch_dir("a_ep1_sub")));
        CHECK(DownloadsDir::exists(dir.subtitles_dir()));

        CHECK(dir.remove_orphan_scratch() == 1);
    }

    SECTION("remove_all of a missing path is fine") {
        CHECK_FALSE(DownloadsDir::remove_all(tmp.path() / "never"));
    }

    SECTION("file_size") {
        test::write_file(tmp.path() / "five", "12345");
        CHECK(DownloadsDir::file_size(tmp.path() / "five").value() == 5);
        CHECK(DownloadsDir::file_size(tmp.path() / "missing").error() == DiskErrc::file_not_found);
    }
}

TEST_CASE("FileWriter", "[disk]") {
    test::TempDir tmp;
    const auto out = tmp.path() / "merged.ts";
    test::write_file(tmp.path() / "a", "AAA");
    test::write_file(tmp.path() / "b", std::string(3 * 1024 * 1024, 'b'));

    FileWriter writer;
    REQUIRE_FALSE(writer.open(out));
    CHECK(writer.is_open());
    REQUIRE_FALSE(writer.write("head", 4));
    REQUIRE_FALSE(writer.append_file(tmp.path() / "a"));
    REQUIRE_FALSE(writer.append_file(tmp.path() / "b"));
    REQUIRE_FALSE(writer.flush());
    CHECK(writer.bytes_written() == 4 + 3 + 3 * 1024 * 1024);
    writer.close();
    CHECK_FALSE(writer.is_open());

    auto content = test::read_file(out);
    CHECK(content.size() == 7 + 3 * 1024 * 1024);
    CHECK(content.substr(0, 7) == "headAAA");

    SECTION("Missing source is an error") {
        FileWriter other;
        REQUIRE_FALSE(other.open(tmp.path() / "other.ts"));
        CHECK(other.append_file(tmp.path() / "missing") == DiskErrc::file_not_found);
    }

    SECTION("Reopening truncates") {
        FileWriter again;
        REQUIRE_FALSE(again.open(out));
        again.close();
        CHECK(DownloadsDir::file_size(out).value() == 0);
    }
}
