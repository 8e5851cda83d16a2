// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/download_record.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/notification_sink.hpp>
#include <reel/core/record_store.hpp>
#include <reel/core/stream_catalog.hpp>
#include <reel/disk/downloads_dir.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace reel::media {
struct MediaProgress;
struct MediaResult;
} // namespace reel::media

namespace reel::core {

// Record change callback; receives a copy after every mutation
using RecordCallback = std::function<void(const DownloadRecord&)>;

// Owns the record set and runs at most one transfer at a time on a worker thread.
//
// Public methods may be called from any thread. Every state transition rewrites
// the whole record set through the RecordStore while the scheduler lock is held,
// so saves land in the order the transitions happened.
class DownloadScheduler {
public:
    DownloadScheduler(RecordStore& store,
                      StreamCatalog& catalog,
                      HttpClient& http,
                      const disk::DownloadsDir& dir,
                      EngineConfig config,
                      NotificationSink* sink = nullptr);
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;
    DownloadScheduler(DownloadScheduler&&) noexcept = delete;
    DownloadScheduler& operator=(DownloadScheduler&&) noexcept = delete;

    // Load persisted records and recover interrupted ones. Pending records are
    // queued but nothing runs until start().
    [[nodiscard]] std::error_code load() noexcept;

    // load() if needed, then start the worker
    [[nodiscard]] std::error_code start() noexcept;

    // Cancel the active transfer and join the worker
    void stop() noexcept;

    // Queue an episode. Returns false (and posts a notice) when the key is
    // already completed, pending or downloading.
    bool enqueue(const DownloadRequest& request) noexcept;

    // Stop a queued or running transfer; the record ends up paused
    void cancel(std::string_view key) noexcept;

    // Re-queue a failed or paused record
    bool retry(std::string_view key) noexcept;

    // Cancel, then delete the video, its subtitles and the record
    void remove(std::string_view key) noexcept;

    void remove_all() noexcept;
    void remove_completed() noexcept;
    void remove_anime(std::string_view anime_slug) noexcept;

    // Set change callback (thread-safe)
    void on_change(RecordCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    // Block until nothing is queued or running; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout) noexcept;

    // Snapshots, newest first
    [[nodiscard]] std::vector<DownloadRecord> records() const;
    [[nodiscard]] std::optional<DownloadRecord> record(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> queue() const;
    [[nodiscard]] std::optional<std::string> active_key() const;

    [[nodiscard]] bool is_downloaded(std::string_view anime_slug,
                                     std::int32_t episode_number,
                                     std::string_view server_variant) const;
    [[nodiscard]] bool is_downloading(std::string_view anime_slug,
                                      std::int32_t episode_number,
                                      std::string_view server_variant) const;

    // One anime's records ordered by episode number
    [[nodiscard]] std::vector<DownloadRecord> records_for_anime(std::string_view anime_slug) const;

    // Slugs with at least one completed episode
    [[nodiscard]] std::vector<std::string> downloaded_anime() const;

    [[nodiscard]] std::uint64_t total_downloaded_bytes() const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void worker_loop(std::stop_token stoken) noexcept;

    // Runs one transfer end to end, then the subtitle pass
    void run_transfer(const DownloadRecord& snapshot, std::stop_token stop) noexcept;
    void fetch_subtitles(const DownloadRecord& snapshot, std::stop_token stop) noexcept;

    void on_progress(const std::string& key, const media::MediaProgress& progress) noexcept;
    void finish_completed(const std::string& key, const media::MediaResult& result) noexcept;
    void finish_failed(const std::string& key, std::error_code ec) noexcept;
    void finish_cancelled(const std::string& key, std::string_view stage) noexcept;

    // Caller holds mutex_
    [[nodiscard]] DownloadRecord* find_locked(std::string_view key) noexcept;
    [[nodiscard]] const DownloadRecord* find_locked(std::string_view key) const noexcept;
    void persist_locked() noexcept;
    void recover_locked() noexcept;

    // Call outside the lock
    void publish(const DownloadRecord& record) noexcept;
    void notice(std::string_view title, std::string_view message) noexcept;

    RecordStore& store_;
    StreamCatalog& catalog_;
    HttpClient& http_;
    const disk::DownloadsDir& dir_;
    EngineConfig config_;
    NotificationSink* sink_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::vector<DownloadRecord> records_;      // Newest first
    std::deque<std::string> queue_;
    std::optional<std::string> active_key_;
    std::stop_source active_stop_;
    bool loaded_{false};
    bool shutting_down_{false};

    std::mutex callback_mutex_;
    RecordCallback callback_;

    std::jthread worker_;
};

} // namespace reel::core
