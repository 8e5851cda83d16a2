// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/download_scheduler.hpp>
#include <reel/media/media_downloader.hpp>
#include <reel/media/subtitle_fetcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <system_error>

namespace reel::core {

namespace {

std::int64_t unix_now() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// "<text>" or its first NOTICE_MAX_CHARS characters followed by "..."
std::string clip_notice(std::string text) {
    if (text.size() > NOTICE_MAX_CHARS) {
        text.resize(NOTICE_MAX_CHARS);
        text += "...";
    }
    return text;
}

std::string episode_label(const DownloadRecord& record) {
    return "Episode " + std::to_string(record.episode_number);
}

void remove_file(const std::string& path) noexcept {
    if (auto ec = disk::DownloadsDir::remove_all(path)) {
        spdlog::warn("Could not delete {}: {}", path, ec.message());
    }
}

} // namespace

//=============================================================================
// DownloadScheduler
//=============================================================================

DownloadScheduler::DownloadScheduler(RecordStore& store,
                                     StreamCatalog& catalog,
                                     HttpClient& http,
                                     const disk::DownloadsDir& dir,
                                     EngineConfig config,
                                     NotificationSink* sink)
    : store_(store)
    , catalog_(catalog)
    , http_(http)
    , dir_(dir)
    , config_(std::move(config))
    , sink_(sink) {}

DownloadScheduler::~DownloadScheduler() {
    stop();
}

std::error_code DownloadScheduler::load() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loaded_) {
            return {};
        }
    }

    if (auto ec = dir_.ensure()) {
        return ec;
    }

    auto loaded = store_.load_records();
    if (!loaded) {
        spdlog::error("Failed to load downloads: {}", loaded.error().message());
        return loaded.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(*loaded);
    recover_locked();
    loaded_ = true;
    spdlog::info("Loaded downloads: {}", records_.size());
    return {};
}

std::error_code DownloadScheduler::start() noexcept {
    if (worker_.joinable()) {
        return {};
    }

    if (auto ec = load()) {
        return ec;
    }

    {
        // Restart after stop()
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = false;
    }

    try {
        worker_ = std::jthread([this](std::stop_token stoken) {
            worker_loop(stoken);
        });
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start download worker: {}", e.what());
        return e.code();
    }

    spdlog::debug("Download worker started");
    cv_.notify_all();
    return {};
}

void DownloadScheduler::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        active_stop_.request_stop();
    }

    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    cv_.notify_all();
}

void DownloadScheduler::recover_locked() noexcept {
    std::vector<std::string> requeue;
    bool changed = false;

    for (auto& record : records_) {
        auto key = record.key();
        if (record.status == DownloadStatus::downloading) {
            // The process died mid-transfer
            spdlog::warn("Recovering interrupted download {}", key);
            record.status = DownloadStatus::paused;
            record.error_message = "Interrupted";
            dir_.discard_partial(key);
            changed = true;
        } else if (record.status == DownloadStatus::pending) {
            requeue.push_back(std::move(key));
        }
    }

    // Records are newest first, the queue runs oldest first
    for (auto it = requeue.rbegin(); it != requeue.rend(); ++it) {
        if (std::find(queue_.begin(), queue_.end(), *it) == queue_.end()) {
            queue_.push_back(*it);
        }
    }

    if (!requeue.empty()) {
        spdlog::info("Re-queued {} pending download(s)", requeue.size());
    }
    if (changed || !requeue.empty()) {
        persist_locked();
    }
}

//-----------------------------------------------------------------------------
// Worker
//-----------------------------------------------------------------------------

void DownloadScheduler::worker_loop(std::stop_token stoken) noexcept {
    while (!stoken.stop_requested()) {
        DownloadRecord snapshot;
        std::stop_token transfer_stop;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait(lock, stoken, [this] { return !queue_.empty(); })) {
                return;
            }
            if (stoken.stop_requested() || shutting_down_) {
                return;
            }

            auto key = std::move(queue_.front());
            queue_.pop_front();

            auto* record = find_locked(key);
            if (record == nullptr || record->status != DownloadStatus::pending) {
                // Stale entry: the record was cancelled or deleted while queued
                cv_.notify_all();
                continue;
            }

            active_key_ = key;
            active_stop_ = std::stop_source{};
            transfer_stop = active_stop_.get_token();

            record->status = DownloadStatus::downloading;
            record->progress = 0.0;
            record->error_message.reset();
            persist_locked();
            snapshot = *record;
        }

        spdlog::info("Starting download {}", snapshot.key());
        publish(snapshot);

        run_transfer(snapshot, transfer_stop);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_key_.reset();
        }
        cv_.notify_all();
    }
}

void DownloadScheduler::run_transfer(const DownloadRecord& snapshot, std::stop_token stop) noexcept {
    const auto key = snapshot.key();

    auto source = catalog_.resolve_stream_source(snapshot.episode_id, snapshot.server_variant, stop);
    if (stop.stop_requested()) {
        finish_cancelled(key, "stream lookup");
        return;
    }
    if (!source) {
        finish_failed(key, source.error());
        return;
    }

    spdlog::info("Resolved stream for {}: {} ({})", key, source->url,
                 source->is_playlist ? "HLS" : "direct");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* record = find_locked(key)) {
            record->stream_url = source->url;
        }
    }

    media::MediaDownloader downloader(http_, dir_, config_);
    downloader.callback([this, &key](const media::MediaProgress& progress) {
        on_progress(key, progress);
    });

    const auto dest = dir_.video_path(key, source->is_playlist);
    auto result = source->is_playlist
        ? downloader.download_hls(key, source->url, dest, source->headers, stop)
        : downloader.download_file(source->url, dest, source->headers, stop);

    if (!result) {
        if (result.error() == DownloadErrc::cancelled || stop.stop_requested()) {
            finish_cancelled(key, "transfer");
        } else {
            finish_failed(key, result.error());
        }
        return;
    }

    if (stop.stop_requested()) {
        finish_cancelled(key, "merge");
        return;
    }

    finish_completed(key, *result);
    fetch_subtitles(snapshot, stop);
}

void DownloadScheduler::fetch_subtitles(const DownloadRecord& snapshot, std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return;
    }

    const auto key = snapshot.key();
    spdlog::info("Fetching subtitles for episode: {}", snapshot.episode_id);

    auto tracks = catalog_.subtitle_tracks(snapshot.episode_id, snapshot.server_variant, stop);
    if (!tracks) {
        spdlog::warn("No stream data available for subtitles of {}: {}", key, tracks.error().message());
        return;
    }

    media::SubtitleFetcher fetcher(http_, dir_, config_);
    auto saved = fetcher.fetch_all(key, *tracks, stop);
    if (saved.empty()) {
        return;
    }

    DownloadRecord updated;
    bool kept = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = find_locked(key);
        if (record != nullptr && record->status == DownloadStatus::completed) {
            record->subtitles.insert(record->subtitles.end(), saved.begin(), saved.end());
            persist_locked();
            updated = *record;
            kept = true;
        }
    }

    if (!kept) {
        // Deleted while the pass was running
        for (const auto& subtitle : saved) {
            remove_file(subtitle.file_path);
        }
        return;
    }

    publish(updated);
    notice("Subtitles Downloaded",
           std::to_string(saved.size()) + " subtitle(s) available for offline viewing");
}

void DownloadScheduler::on_progress(const std::string& key, const media::MediaProgress& progress) noexcept {
    DownloadRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = find_locked(key);
        if (record == nullptr || record->status != DownloadStatus::downloading) {
            return;
        }
        if (progress.fraction_known) {
            record->progress = std::max(record->progress, std::min(progress.fraction, 1.0));
        }
        record->file_size = progress.downloaded_bytes;
        snapshot = *record;
    }

    publish(snapshot);
    if (sink_ != nullptr) {
        sink_->progress(snapshot);
    }
}

void DownloadScheduler::finish_completed(const std::string& key, const media::MediaResult& result) noexcept {
    DownloadRecord snapshot;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* record = find_locked(key)) {
            record->status = DownloadStatus::completed;
            record->progress = 1.0;
            record->file_path = result.path.string();
            record->file_size = result.file_size;
            record->error_message.reset();
            persist_locked();
            snapshot = *record;
            found = true;
        }
    }

    if (!found) {
        spdlog::info("Download {} finished after its record was deleted", key);
        dir_.discard_partial(key);
        return;
    }

    spdlog::info("Download complete: {} ({})", key, format_file_size(result.file_size));
    publish(snapshot);
    if (sink_ != nullptr) {
        sink_->completed(snapshot);
    }
    notice("Download Complete",
           episode_label(snapshot) + " downloaded (" + format_file_size(result.file_size) + ")");
}

void DownloadScheduler::finish_failed(const std::string& key, std::error_code ec) noexcept {
    spdlog::error("Download {} failed: {}", key, ec.message());
    dir_.discard_partial(key);

    DownloadRecord snapshot;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* record = find_locked(key)) {
            record->status = DownloadStatus::failed;
            record->error_message = ec.message();
            persist_locked();
            snapshot = *record;
            found = true;
        }
    }

    if (!found) {
        return;
    }

    publish(snapshot);
    if (sink_ != nullptr) {
        sink_->failed(snapshot);
    }
    notice("Download Failed", "Failed to download episode: " + clip_notice(ec.message()));
}

void DownloadScheduler::finish_cancelled(const std::string& key, std::string_view stage) noexcept {
    spdlog::info("Download {} cancelled during {}", key, stage);
    dir_.discard_partial(key);

    DownloadRecord snapshot;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* record = find_locked(key); record != nullptr
                && record->status == DownloadStatus::downloading) {
            record->status = DownloadStatus::paused;
            record->error_message = shutting_down_
                ? std::string("Interrupted")
                : make_error_code(DownloadErrc::cancelled).message();
            persist_locked();
            snapshot = *record;
            found = true;
        }
    }

    if (found) {
        publish(snapshot);
    }
}

//-----------------------------------------------------------------------------
// Commands
//-----------------------------------------------------------------------------

bool DownloadScheduler::enqueue(const DownloadRequest& request) noexcept {
    DownloadRecord snapshot;
    std::string rejected_title;
    std::string rejected_message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto record = DownloadRecord::from_request(request, unix_now());
        const auto key = record.key();

        if (!is_valid_download_key(key)) {
            rejected_title = "Invalid Episode";
            rejected_message = "Cannot download " + key;
        } else if (const auto* existing = find_locked(key)) {
            if (existing->status == DownloadStatus::completed) {
                rejected_title = "Already Downloaded";
                rejected_message = episode_label(record) + " is already downloaded";
            } else if (existing->status == DownloadStatus::pending
                    || existing->status == DownloadStatus::downloading) {
                rejected_title = "Download in Progress";
                rejected_message = episode_label(record) + " is already being downloaded";
            }
        }
        if (rejected_title.empty() && active_key_ == key) {
            // A cancelled or deleted transfer of this key is still winding down
            rejected_title = "Download in Progress";
            rejected_message = episode_label(record) + " is still stopping, try again shortly";
        }

        if (rejected_title.empty()) {
            // Replace any failed or paused record of the same key
            std::erase_if(records_, [&](const DownloadRecord& r) { return r.key() == key; });
            records_.insert(records_.begin(), record);
            queue_.push_back(key);
            persist_locked();
            snapshot = std::move(record);
        }
    }

    if (!rejected_title.empty()) {
        notice(rejected_title, rejected_message);
        return false;
    }

    spdlog::info("Queued {}", snapshot.key());
    cv_.notify_all();
    publish(snapshot);
    notice("Download Started", episode_label(snapshot) + " added to download queue");
    return true;
}

void DownloadScheduler::cancel(std::string_view key) noexcept {
    DownloadRecord snapshot;
    bool paused = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase(queue_, key);

        if (active_key_ && *active_key_ == key) {
            spdlog::info("Cancelling active download {}", key);
            active_stop_.request_stop();
        }

        auto* record = find_locked(key);
        if (record != nullptr && record->status == DownloadStatus::pending) {
            record->status = DownloadStatus::paused;
            record->error_message = make_error_code(DownloadErrc::cancelled).message();
            persist_locked();
            snapshot = *record;
            paused = true;
        }
    }

    cv_.notify_all();
    if (paused) {
        spdlog::info("Cancelled queued download {}", key);
        publish(snapshot);
    }
}

bool DownloadScheduler::retry(std::string_view key) noexcept {
    DownloadRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = find_locked(key);
        if (record == nullptr) {
            return false;
        }
        if (record->status != DownloadStatus::failed && record->status != DownloadStatus::paused) {
            return false;
        }
        if (std::find(queue_.begin(), queue_.end(), key) != queue_.end()) {
            return false;
        }

        record->status = DownloadStatus::pending;
        record->progress = 0.0;
        record->error_message.reset();
        queue_.emplace_back(key);
        persist_locked();
        snapshot = *record;
    }

    spdlog::info("Retrying {}", key);
    cv_.notify_all();
    publish(snapshot);
    return true;
}

void DownloadScheduler::remove(std::string_view key) noexcept {
    std::optional<DownloadRecord> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase(queue_, key);

        if (active_key_ && *active_key_ == key) {
            active_stop_.request_stop();
        }

        auto it = std::find_if(records_.begin(), records_.end(),
                               [&](const DownloadRecord& r) { return r.key() == key; });
        if (it != records_.end()) {
            removed = std::move(*it);
            records_.erase(it);
            persist_locked();
        }
    }
    cv_.notify_all();

    if (!removed) {
        return;
    }

    if (removed->file_path) {
        remove_file(*removed->file_path);
    }
    for (const auto& subtitle : removed->subtitles) {
        remove_file(subtitle.file_path);
    }
    dir_.discard_partial(key);

    spdlog::info("Deleted download {}", key);
}

void DownloadScheduler::remove_all() noexcept {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            keys.push_back(record.key());
        }
    }

    for (const auto& key : keys) {
        remove(key);
    }

    auto active = active_key();
    dir_.remove_orphan_scratch(active ? *active : std::string{});
}

void DownloadScheduler::remove_completed() noexcept {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            if (record.status == DownloadStatus::completed) {
                keys.push_back(record.key());
            }
        }
    }

    for (const auto& key : keys) {
        remove(key);
    }

    auto active = active_key();
    dir_.remove_orphan_scratch(active ? *active : std::string{});
}

void DownloadScheduler::remove_anime(std::string_view anime_slug) noexcept {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            if (record.anime_slug == anime_slug) {
                keys.push_back(record.key());
            }
        }
    }

    for (const auto& key : keys) {
        remove(key);
    }
}

bool DownloadScheduler::wait_idle(std::chrono::milliseconds timeout) noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !active_key_;
    });
}

//-----------------------------------------------------------------------------
// Queries
//-----------------------------------------------------------------------------

std::vector<DownloadRecord> DownloadScheduler::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::optional<DownloadRecord> DownloadScheduler::record(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* record = find_locked(key)) {
        return *record;
    }
    return std::nullopt;
}

std::vector<std::string> DownloadScheduler::queue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {queue_.begin(), queue_.end()};
}

std::optional<std::string> DownloadScheduler::active_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_key_;
}

bool DownloadScheduler::is_downloaded(std::string_view anime_slug,
                                      std::int32_t episode_number,
                                      std::string_view server_variant) const {
    const auto key = make_download_key(anime_slug, episode_number, server_variant);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* record = find_locked(key);
    return record != nullptr && record->status == DownloadStatus::completed;
}

bool DownloadScheduler::is_downloading(std::string_view anime_slug,
                                       std::int32_t episode_number,
                                       std::string_view server_variant) const {
    const auto key = make_download_key(anime_slug, episode_number, server_variant);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* record = find_locked(key);
    return record != nullptr
        && (record->status == DownloadStatus::pending || record->status == DownloadStatus::downloading);
}

std::vector<DownloadRecord> DownloadScheduler::records_for_anime(std::string_view anime_slug) const {
    std::vector<DownloadRecord> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            if (record.anime_slug == anime_slug) {
                result.push_back(record);
            }
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const DownloadRecord& a, const DownloadRecord& b) {
        return a.episode_number < b.episode_number;
    });
    return result;
}

std::vector<std::string> DownloadScheduler::downloaded_anime() const {
    std::vector<std::string> slugs;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.status == DownloadStatus::completed
                && std::find(slugs.begin(), slugs.end(), record.anime_slug) == slugs.end()) {
            slugs.push_back(record.anime_slug);
        }
    }
    return slugs;
}

std::uint64_t DownloadScheduler::total_downloaded_bytes() const {
    std::uint64_t total = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.status == DownloadStatus::completed) {
            total += record.file_size.value_or(0);
        }
    }
    return total;
}

//-----------------------------------------------------------------------------
// Helpers
//-----------------------------------------------------------------------------

DownloadRecord* DownloadScheduler::find_locked(std::string_view key) noexcept {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const DownloadRecord& r) { return r.key() == key; });
    return it != records_.end() ? &*it : nullptr;
}

const DownloadRecord* DownloadScheduler::find_locked(std::string_view key) const noexcept {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const DownloadRecord& r) { return r.key() == key; });
    return it != records_.end() ? &*it : nullptr;
}

void DownloadScheduler::persist_locked() noexcept {
    if (auto ec = store_.save_records(records_)) {
        spdlog::error("Failed to save downloads: {}", ec.message());
    }
}

void DownloadScheduler::publish(const DownloadRecord& record) noexcept {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) {
        callback_(record);
    }
}

void DownloadScheduler::notice(std::string_view title, std::string_view message) noexcept {
    spdlog::info("{}: {}", title, message);
    if (sink_ != nullptr) {
        sink_->notice(title, message);
    }
}

} // namespace reel::core
