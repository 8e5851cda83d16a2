// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/download_scheduler.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <set>

using namespace reel;
using namespace reel::core;
using namespace std::chrono_literals;

namespace {

DownloadRequest request_for(const std::string& slug, std::int32_t number) {
    DownloadRequest request;
    request.anime_slug = slug;
    request.anime_title = slug;
    request.episode_id = slug + "-ep" + std::to_string(number);
    request.episode_number = number;
    request.server_variant = "sub";
    return request;
}

DownloadRecord record_with(const std::string& slug, std::int32_t number, DownloadStatus status) {
    auto record = DownloadRecord::from_request(request_for(slug, number), 1760000000 + number);
    record.status = status;
    return record;
}

// Serve a media playlist of `count` segments for an episode
void serve_episode(test::FakeHttpClient& http, test::FakeCatalog& catalog,
                   const std::string& episode_id, std::size_t count) {
    const std::string base = "https://cdn.example.com/" + episode_id + "/";
    std::string playlist = "#EXTM3U\n";
    for (std::size_t i = 0; i < count; ++i) {
        playlist += "#EXTINF:4,\nseg-" + std::to_string(i) + ".ts\n";
        http.serve(base + "seg-" + std::to_string(i) + ".ts", episode_id + std::to_string(i) + ";");
    }
    http.serve(base + "index.m3u8", playlist);
    catalog.stream(episode_id, {base + "index.m3u8", true, {}});
}

// Collaborators of one scheduler under test
struct Fixture {
    explicit Fixture(std::vector<DownloadRecord> initial = {})
        : dir(tmp.path() / "downloads")
        , store(std::move(initial))
        , scheduler(store, catalog, http, dir, config, &sink) {}

    test::TempDir tmp;
    disk::DownloadsDir dir;
    test::FakeHttpClient http;
    test::FakeCatalog catalog;
    test::MemoryRecordStore store;
    test::RecordingSink sink;
    EngineConfig config;
    DownloadScheduler scheduler;
};

DownloadStatus status_of(const DownloadScheduler& scheduler, const std::string& key) {
    auto record = scheduler.record(key);
    REQUIRE(record.has_value());
    return record->status;
}

} // namespace

TEST_CASE("Scheduler: HLS episode end to end", "[scheduler]") {
    Fixture f;
    auto request = request_for("frieren", 1);
    const auto key = make_download_key("frieren", 1, "sub");

    const std::string master = "https://cdn.example.com/frieren/master.m3u8";
    f.http.serve(master,
                 "#EXTM3U\n"
                 "#EXT-X-STREAM-INF:BANDWIDTH=400000\nlow.m3u8\n"
                 "#EXT-X-STREAM-INF:BANDWIDTH=1600000\nhigh.m3u8\n");
    f.http.serve("https://cdn.example.com/frieren/high.m3u8", "#EXTM3U\na.ts\nb.ts\nc.ts\n");
    f.http.serve("https://cdn.example.com/frieren/a.ts", "AAA");
    f.http.fail("https://cdn.example.com/frieren/b.ts", DownloadErrc::server_error);
    f.http.serve("https://cdn.example.com/frieren/c.ts", "CCC");
    f.catalog.stream(request.episode_id, {master, true, {}});

    f.http.serve("https://cc.example.com/eng.vtt", "WEBVTT\n");
    f.http.fail("https://cc.example.com/spa.vtt", DownloadErrc::not_found);
    f.catalog.subtitles(request.episode_id, {
        {"https://cc.example.com/eng.vtt", "English"},
        {"https://cc.example.com/spa.vtt", "Spanish"},
    });

    std::mutex progress_mutex;
    std::vector<double> progress;
    f.scheduler.on_change([&](const DownloadRecord& record) {
        if (record.key() == key && record.status == DownloadStatus::downloading) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            progress.push_back(record.progress);
        }
    });

    REQUIRE_FALSE(f.scheduler.start());
    REQUIRE(f.scheduler.enqueue(request));
    REQUIRE(f.scheduler.wait_idle(10s));

    auto record = f.scheduler.record(key);
    REQUIRE(record.has_value());
    CHECK(record->status == DownloadStatus::completed);
    CHECK(record->progress == 1.0);
    CHECK(record->stream_url == master);
    CHECK(record->file_path == f.dir.video_path(key, true).string());
    CHECK(record->file_size == 6);
    CHECK_FALSE(record->error_message.has_value());
    CHECK(test::read_file(f.dir.video_path(key, true)) == "AAACCC");
    CHECK_FALSE(disk::DownloadsDir::exists(f.dir.scratch_dir(key)));

    REQUIRE(record->subtitles.size() == 1);
    CHECK(record->subtitles[0].language == "en");
    CHECK(disk::DownloadsDir::exists(record->subtitles[0].file_path));

    {
        std::lock_guard<std::mutex> lock(progress_mutex);
        REQUIRE_FALSE(progress.empty());
        for (std::size_t i = 1; i < progress.size(); ++i) {
            CHECK(progress[i] >= progress[i - 1]);
        }
    }

    CHECK(f.sink.saw("Download Started"));
    CHECK(f.sink.saw("Download Complete"));
    CHECK(f.sink.saw("Subtitles Downloaded"));
    CHECK(f.sink.completed_keys() == std::vector<std::string>{key});

    // The persisted set matches the live one
    auto saved = f.store.saved();
    REQUIRE(saved.size() == 1);
    CHECK(saved[0].status == DownloadStatus::completed);
    CHECK(saved[0].subtitles.size() == 1);

    CHECK(f.scheduler.is_downloaded("frieren", 1, "sub"));
    CHECK_FALSE(f.scheduler.is_downloading("frieren", 1, "sub"));
    CHECK(f.scheduler.total_downloaded_bytes() == 6);
    CHECK(f.scheduler.downloaded_anime() == std::vector<std::string>{"frieren"});
}

TEST_CASE("Scheduler: direct media file", "[scheduler]") {
    Fixture f;
    auto request = request_for("frieren", 2);
    const auto key = request.anime_slug + "_ep2_sub";

    f.http.serve("https://files.example.com/ep2.mp4", std::string(5000, 'm'));
    f.catalog.stream(request.episode_id, {"https://files.example.com/ep2.mp4", false, {}});

    REQUIRE_FALSE(f.scheduler.start());
    REQUIRE(f.scheduler.enqueue(request));
    REQUIRE(f.scheduler.wait_idle(10s));

    auto record = f.scheduler.record(key);
    REQUIRE(record.has_value());
    CHECK(record->status == DownloadStatus::completed);
    CHECK(record->file_path == f.dir.video_path(key, false).string());
    CHECK(record->file_size == 5000);
}

TEST_CASE("Scheduler: failures", "[scheduler]") {
    Fixture f;
    auto request = request_for("frieren", 3);
    const auto key = make_download_key("frieren", 3, "sub");

    SECTION("Catalog without a stream") {
        REQUIRE_FALSE(f.scheduler.start());
        REQUIRE(f.scheduler.enqueue(request));
        REQUIRE(f.scheduler.wait_idle(10s));

        auto record = f.scheduler.record(key);
        REQUIRE(record.has_value());
        CHECK(record->status == DownloadStatus::failed);
        CHECK(record->error_message == "No stream available for episode");
        CHECK(f.sink.failed_keys() == std::vector<std::string>{key});

        bool found = false;
        for (const auto& [title, message] : f.sink.notices()) {
            if (title == "Download Failed") {
                CHECK(message == "Failed to download episode: No stream available for episode");
                found = true;
            }
        }
        CHECK(found);
    }

    SECTION("No segment succeeds") {
        f.http.serve("https://cdn.example.com/f3/index.m3u8", "#EXTM3U\nx.ts\ny.ts\n");
        f.catalog.stream(request.episode_id, {"https://cdn.example.com/f3/index.m3u8", true, {}});

        REQUIRE_FALSE(f.scheduler.start());
        REQUIRE(f.scheduler.enqueue(request));
        REQUIRE(f.scheduler.wait_idle(10s));

        auto record = f.scheduler.record(key);
        REQUIRE(record.has_value());
        CHECK(record->status == DownloadStatus::failed);
        CHECK(record->error_message == "No segments were downloaded");
        CHECK_FALSE(disk::DownloadsDir::exists(f.dir.video_path(key, true)));
        CHECK_FALSE(disk::DownloadsDir::exists(f.dir.scratch_dir(key)));
    }

    SECTION("Endless master playlist chain") {
        f.http.serve("https://cdn.example.com/f3/index.m3u8", "#EXTM3U\n"
                     "#EXT-X-STREAM-INF:BANDWIDTH=1\nindex.m3u8\n");
        f.catalog.stream(request.episode_id, {"https://cdn.example.com/f3/index.m3u8", true, {}});

        REQUIRE_FALSE(f.scheduler.start());
        REQUIRE(f.scheduler.enqueue(request));
        REQUIRE(f.scheduler.wait_idle(10s));

        CHECK(f.scheduler.record(key)->error_message == "Master playlist nesting too deep");
    }
}

TEST_CASE("Scheduler: enqueue rules", "[scheduler]") {
    SECTION("Completed key is a no-op") {
        Fixture f({record_with("frieren", 1, DownloadStatus::completed)});
        REQUIRE_FALSE(f.scheduler.load());
        const auto saves = f.store.saves();

        CHECK_FALSE(f.scheduler.enqueue(request_for("frieren", 1)));
        CHECK(f.scheduler.queue().empty());
        CHECK(status_of(f.scheduler, "frieren_ep1_sub") == DownloadStatus::completed);
        CHECK(f.store.saves() == saves);
        CHECK(f.sink.saw("Already Downloaded"));
    }

    SECTION("Pending key is not queued twice") {
        Fixture f;
        REQUIRE_FALSE(f.scheduler.load());
        CHECK(f.scheduler.enqueue(request_for("frieren", 1)));
        CHECK_FALSE(f.scheduler.enqueue(request_for("frieren", 1)));
        CHECK(f.scheduler.queue().size() == 1);
        CHECK(f.scheduler.records().size() == 1);
        CHECK(f.sink.saw("Download in Progress"));
    }

    SECTION("Slug that would leave the downloads root is refused") {
        Fixture f;
        REQUIRE_FALSE(f.scheduler.load());
        const auto saves = f.store.saves();

        CHECK_FALSE(f.scheduler.enqueue(request_for("../../etc", 1)));
        CHECK_FALSE(f.scheduler.enqueue(request_for("frieren/extra", 1)));
        CHECK(f.scheduler.records().empty());
        CHECK(f.scheduler.queue().empty());
        CHECK(f.store.saves() == saves);
        CHECK(f.sink.saw("Invalid Episode"));
    }

    SECTION("Failed key is replaced by a fresh record at the front") {
        auto failed = record_with("frieren", 1, DownloadStatus::failed);
        failed.error_message = "Network error";
        Fixture f({record_with("frieren", 2, DownloadStatus::completed), failed});
        REQUIRE_FALSE(f.scheduler.load());

        CHECK(f.scheduler.enqueue(request_for("frieren", 1)));
        auto records = f.scheduler.records();
        REQUIRE(records.size() == 2);
        CHECK(records[0].key() == "frieren_ep1_sub");
        CHECK(records[0].status == DownloadStatus::pending);
        CHECK_FALSE(records[0].error_message.has_value());
    }
}

TEST_CASE("Scheduler: retry", "[scheduler]") {
    auto failed = record_with("frieren", 4, DownloadStatus::failed);
    failed.error_message = "Network error";
    failed.progress = 0.4;
    Fixture f({failed, record_with("frieren", 5, DownloadStatus::completed)});
    REQUIRE_FALSE(f.scheduler.load());

    REQUIRE(f.scheduler.retry("frieren_ep4_sub"));
    auto record = f.scheduler.record("frieren_ep4_sub");
    REQUIRE(record.has_value());
    CHECK(record->status == DownloadStatus::pending);
    CHECK(record->progress == 0.0);
    CHECK_FALSE(record->error_message.has_value());
    CHECK(f.scheduler.queue() == std::vector<std::string>{"frieren_ep4_sub"});

    // Already queued, completed and unknown keys are refused
    CHECK_FALSE(f.scheduler.retry("frieren_ep4_sub"));
    CHECK_FALSE(f.scheduler.retry("frieren_ep5_sub"));
    CHECK_FALSE(f.scheduler.retry("nope_ep1_sub"));
    CHECK(f.scheduler.queue().size() == 1);
}

TEST_CASE("Scheduler: cancel", "[scheduler]") {
    SECTION("Running transfer stops and cleans up") {
        Fixture f;
        auto request = request_for("frieren", 6);
        const auto key = make_download_key("frieren", 6, "sub");
        serve_episode(f.http, f.catalog, request.episode_id, 3);
        f.http.block("https://cdn.example.com/" + request.episode_id + "/seg-1.ts");

        REQUIRE_FALSE(f.scheduler.start());
        REQUIRE(f.scheduler.enqueue(request));
        REQUIRE(test::eventually([&] { return f.http.blocked(); }));
        CHECK(status_of(f.scheduler, key) == DownloadStatus::downloading);
        CHECK(f.scheduler.active_key() == key);
        CHECK(disk::DownloadsDir::exists(f.dir.scratch_dir(key)));

        f.scheduler.cancel(key);
        REQUIRE(f.scheduler.wait_idle(10s));

        auto record = f.scheduler.record(key);
        REQUIRE(record.has_value());
        CHECK(record->status == DownloadStatus::paused);
        CHECK(record->error_message == "Cancelled by user");
        CHECK_FALSE(f.scheduler.active_key().has_value());
        CHECK_FALSE(disk::DownloadsDir::exists(f.dir.scratch_dir(key)));
        CHECK_FALSE(disk::DownloadsDir::exists(f.dir.video_path(key, true)));

        // The slot is free again
        auto next = request_for("frieren", 7);
        serve_episode(f.http, f.catalog, next.episode_id, 1);
        REQUIRE(f.scheduler.enqueue(next));
        REQUIRE(f.scheduler.wait_idle(10s));
        CHECK(status_of(f.scheduler, "frieren_ep7_sub") == DownloadStatus::completed);

        // A paused record can be retried
        f.http.serve("https://cdn.example.com/" + request.episode_id + "/seg-1.ts", "x");
        REQUIRE(f.scheduler.retry(key));
        REQUIRE(f.scheduler.wait_idle(10s));
        CHECK(status_of(f.scheduler, key) == DownloadStatus::completed);
    }

    SECTION("Queued record is paused without running") {
        Fixture f;
        REQUIRE_FALSE(f.scheduler.load());
        REQUIRE(f.scheduler.enqueue(request_for("frieren", 8)));

        f.scheduler.cancel("frieren_ep8_sub");
        CHECK(f.scheduler.queue().empty());
        CHECK(status_of(f.scheduler, "frieren_ep8_sub") == DownloadStatus::paused);
        CHECK(f.http.requests().empty());
    }

    SECTION("Shutdown marks the running transfer interrupted") {
        Fixture f;
        auto request = request_for("frieren", 9);
        serve_episode(f.http, f.catalog, request.episode_id, 2);
        f.http.block("https://cdn.example.com/" + request.episode_id + "/seg-0.ts");

        REQUIRE_FALSE(f.scheduler.start());
        REQUIRE(f.scheduler.enqueue(request));
        REQUIRE(test::eventually([&] { return f.http.blocked(); }));

        f.scheduler.stop();
        auto record = f.scheduler.record("frieren_ep9_sub");
        REQUIRE(record.has_value());
        CHECK(record->status == DownloadStatus::paused);
        CHECK(record->error_message == "Interrupted");
        CHECK(f.store.saved().front().status == DownloadStatus::paused);
    }

    SECTION("Scheduler runs new work after a stop and restart") {
        Fixture f;
        REQUIRE_FALSE(f.scheduler.start());
        f.scheduler.stop();
        REQUIRE_FALSE(f.scheduler.start());

        auto request = request_for("frieren", 14);
        serve_episode(f.http, f.catalog, request.episode_id, 2);
        REQUIRE(f.scheduler.enqueue(request));
        REQUIRE(f.scheduler.wait_idle(10s));
        CHECK(status_of(f.scheduler, "frieren_ep14_sub") == DownloadStatus::completed);
    }
}

TEST_CASE("Scheduler: one transfer at a time", "[scheduler]") {
    Fixture f;
    auto a = request_for("frieren", 10);
    auto b = request_for("frieren", 11);
    serve_episode(f.http, f.catalog, a.episode_id, 4);
    serve_episode(f.http, f.catalog, b.episode_id, 4);

    std::mutex mutex;
    std::set<std::string> running;
    std::size_t max_running = 0;
    f.scheduler.on_change([&](const DownloadRecord& record) {
        std::lock_guard<std::mutex> lock(mutex);
        if (record.status == DownloadStatus::downloading) {
            running.insert(record.key());
        } else {
            running.erase(record.key());
        }
        max_running = std::max(max_running, running.size());
    });

    REQUIRE_FALSE(f.scheduler.load());
    REQUIRE(f.scheduler.enqueue(a));
    REQUIRE(f.scheduler.enqueue(b));
    CHECK(f.scheduler.queue() == std::vector<std::string>{"frieren_ep10_sub", "frieren_ep11_sub"});

    REQUIRE_FALSE(f.scheduler.start());
    REQUIRE(f.scheduler.wait_idle(10s));

    CHECK(status_of(f.scheduler, "frieren_ep10_sub") == DownloadStatus::completed);
    CHECK(status_of(f.scheduler, "frieren_ep11_sub") == DownloadStatus::completed);
    {
        std::lock_guard<std::mutex> lock(mutex);
        CHECK(max_running == 1);
    }

    // Every request for A precedes the first request for B
    auto requests = f.http.requests();
    std::size_t last_a = 0;
    std::size_t first_b = requests.size();
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (requests[i].find(a.episode_id + "/") != std::string::npos) {
            last_a = i;
        }
        if (requests[i].find(b.episode_id + "/") != std::string::npos && first_b == requests.size()) {
            first_b = i;
        }
    }
    CHECK(last_a < first_b);
    CHECK(test::read_file(f.dir.video_path("frieren_ep11_sub", true)) == b.episode_id + "0;"
          + b.episode_id + "1;" + b.episode_id + "2;" + b.episode_id + "3;");

    // Newest first
    auto records = f.scheduler.records();
    REQUIRE(records.size() == 2);
    CHECK(records[0].key() == "frieren_ep11_sub");
}

TEST_CASE("Scheduler: episode queued behind a running one", "[scheduler]") {
    Fixture f;
    auto a = request_for("frieren", 12);
    auto b = request_for("frieren", 13);
    serve_episode(f.http, f.catalog, a.episode_id, 2);
    serve_episode(f.http, f.catalog, b.episode_id, 2);
    const std::string held = "https://cdn.example.com/" + a.episode_id + "/seg-1.ts";
    f.http.block(held);

    REQUIRE_FALSE(f.scheduler.start());
    REQUIRE(f.scheduler.enqueue(a));
    REQUIRE(test::eventually([&] { return f.http.blocked(); }));
    REQUIRE(f.scheduler.enqueue(b));

    CHECK(status_of(f.scheduler, "frieren_ep12_sub") == DownloadStatus::downloading);
    CHECK(status_of(f.scheduler, "frieren_ep13_sub") == DownloadStatus::pending);
    CHECK(f.scheduler.active_key() == "frieren_ep12_sub");
    CHECK(f.scheduler.queue() == std::vector<std::string>{"frieren_ep13_sub"});

    // Let A finish; B must start without another call
    f.http.serve(held, "late;");
    REQUIRE(f.scheduler.wait_idle(10s));

    CHECK(status_of(f.scheduler, "frieren_ep12_sub") == DownloadStatus::completed);
    CHECK(status_of(f.scheduler, "frieren_ep13_sub") == DownloadStatus::completed);
    CHECK(test::read_file(f.dir.video_path("frieren_ep12_sub", true)) == a.episode_id + "0;late;");

    auto requests = f.http.requests();
    auto first_b = std::find_if(requests.begin(), requests.end(), [&](const std::string& url) {
        return url.find(b.episode_id + "/") != std::string::npos;
    });
    auto held_at = std::find(requests.begin(), requests.end(), held);
    REQUIRE(first_b != requests.end());
    CHECK(held_at < first_b);
}

TEST_CASE("Scheduler: delete", "[scheduler]") {
    auto completed = record_with("frieren", 12, DownloadStatus::completed);
    Fixture f({completed, record_with("frieren", 13, DownloadStatus::completed),
               record_with("other", 1, DownloadStatus::failed)});

    const auto video = f.dir.video_path("frieren_ep12_sub", true);
    const auto subtitle = f.dir.subtitle_path("frieren_ep12_sub_english.vtt");
    test::write_file(video, "video");
    test::write_file(subtitle, "WEBVTT\n");

    // Point the record at the files written above
    auto records = f.store.saved();
    records[0].file_path = video.string();
    records[0].subtitles = {{"English", "en", subtitle.string()}};
    REQUIRE_FALSE(f.store.save_records(records));
    REQUIRE_FALSE(f.scheduler.load());

    SECTION("Removes video, subtitles and record; idempotent") {
        f.scheduler.remove("frieren_ep12_sub");
        CHECK_FALSE(disk::DownloadsDir::exists(video));
        CHECK_FALSE(disk::DownloadsDir::exists(subtitle));
        CHECK_FALSE(f.scheduler.record("frieren_ep12_sub").has_value());
        CHECK(f.store.saved().size() == 2);

        f.scheduler.remove("frieren_ep12_sub");
        f.scheduler.remove("never_ep1_sub");
        CHECK(f.scheduler.records().size() == 2);
    }

    SECTION("Delete completed keeps the others") {
        test::write_file(f.dir.scratch_dir("stale_ep1_sub") / "segment_00000.ts", "x");
        f.scheduler.remove_completed();
        auto left = f.scheduler.records();
        REQUIRE(left.size() == 1);
        CHECK(left[0].anime_slug == "other");
        CHECK_FALSE(disk::DownloadsDir::exists(f.dir.scratch_dir("stale_ep1_sub")));
    }

    SECTION("Delete by anime") {
        f.scheduler.remove_anime("frieren");
        auto left = f.scheduler.records();
        REQUIRE(left.size() == 1);
        CHECK(left[0].anime_slug == "other");
    }

    SECTION("Delete all") {
        f.scheduler.remove_all();
        CHECK(f.scheduler.records().empty());
        CHECK(f.store.saved().empty());
    }
}

TEST_CASE("Scheduler: startup recovery", "[scheduler]") {
    // Newest first: ep22 was requested after ep21
    Fixture f({record_with("frieren", 22, DownloadStatus::pending),
               record_with("frieren", 20, DownloadStatus::downloading),
               record_with("frieren", 21, DownloadStatus::pending),
               record_with("frieren", 19, DownloadStatus::completed)});

    test::write_file(f.dir.scratch_dir("frieren_ep20_sub") / "segment_00000.ts", "partial");
    test::write_file(f.dir.video_path("frieren_ep20_sub", true), "partial");

    REQUIRE_FALSE(f.scheduler.load());

    auto interrupted = f.scheduler.record("frieren_ep20_sub");
    REQUIRE(interrupted.has_value());
    CHECK(interrupted->status == DownloadStatus::paused);
    CHECK(interrupted->error_message == "Interrupted");
    CHECK_FALSE(disk::DownloadsDir::exists(f.dir.scratch_dir("frieren_ep20_sub")));
    CHECK_FALSE(disk::DownloadsDir::exists(f.dir.video_path("frieren_ep20_sub", true)));

    CHECK(f.scheduler.queue() == std::vector<std::string>{"frieren_ep21_sub", "frieren_ep22_sub"});
    CHECK(status_of(f.scheduler, "frieren_ep19_sub") == DownloadStatus::completed);

    auto saved = f.store.saved();
    REQUIRE(saved.size() == 4);
    CHECK(saved[1].status == DownloadStatus::paused);
}

TEST_CASE("Scheduler: queries", "[scheduler]") {
    Fixture f({record_with("frieren", 3, DownloadStatus::completed),
               record_with("frieren", 1, DownloadStatus::completed),
               record_with("other", 1, DownloadStatus::pending),
               record_with("frieren", 2, DownloadStatus::failed)});
    REQUIRE_FALSE(f.scheduler.load());

    auto episodes = f.scheduler.records_for_anime("frieren");
    REQUIRE(episodes.size() == 3);
    CHECK(episodes[0].episode_number == 1);
    CHECK(episodes[1].episode_number == 2);
    CHECK(episodes[2].episode_number == 3);

    CHECK(f.scheduler.downloaded_anime() == std::vector<std::string>{"frieren"});
    CHECK(f.scheduler.is_downloading("other", 1, "sub"));
    CHECK_FALSE(f.scheduler.is_downloaded("frieren", 2, "sub"));
    CHECK(f.scheduler.is_downloaded("frieren", 3, "sub"));
    CHECK_FALSE(f.scheduler.is_downloaded("frieren", 3, "dub"));
}
