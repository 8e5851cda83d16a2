// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/downloads_dir.hpp>
#include <spdlog/spdlog.h>

namespace reel::disk {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view SCRATCH_PREFIX = "temp_";
constexpr std::string_view SUBTITLES_DIR = "subtitles";

} // namespace

fs::path DownloadsDir::scratch_dir(std::string_view key) const {
    std::string name(SCRATCH_PREFIX);
    name += key;
    return root_ / name;
}

fs::path DownloadsDir::video_path(std::string_view key, bool playlist) const {
    std::string name(key);
    name += playlist ? ".ts" : ".mp4";
    return root_ / name;
}

fs::path DownloadsDir::subtitles_dir() const {
    return root_ / SUBTITLES_DIR;
}

fs::path DownloadsDir::subtitle_path(std::string_view file_name) const {
    return subtitles_dir() / fs::path(file_name);
}

std::error_code DownloadsDir::ensure() const noexcept {
    std::error_code ec;
    try {
        fs::create_directories(subtitles_dir(), ec);
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::invalid_path);
    }
    if (ec) {
        spdlog::error("Cannot create downloads directory {}: {}", root_.string(), ec.message());
        return to_disk_error(ec, DiskErrc::invalid_path);
    }
    return {};
}

std::expected<fs::path, std::error_code>
DownloadsDir::fresh_scratch_dir(std::string_view key) const noexcept {
    try {
        auto dir = scratch_dir(key);
        if (auto ec = remove_all(dir)) {
            return std::unexpected(ec);
        }

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return std::unexpected(to_disk_error(ec, DiskErrc::invalid_path));
        }
        return dir;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
}

std::error_code DownloadsDir::remove_all(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return to_disk_error(ec, DiskErrc::remove_failed);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code>
DownloadsDir::file_size(const fs::path& path) noexcept {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(to_disk_error(ec, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(size);
}

bool DownloadsDir::exists(const fs::path& path) noexcept {
    std::error_code ec;
    return fs::exists(path, ec);
}

void DownloadsDir::discard_partial(std::string_view key) const noexcept {
    try {
        for (const auto& path : {scratch_dir(key), video_path(key, true), video_path(key, false)}) {
            if (auto ec = remove_all(path)) {
                spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
            }
        }
    } catch (const std::bad_alloc&) {
        spdlog::error("Out of memory while cleaning up {}", key);
    }
}

std::size_t DownloadsDir::remove_orphan_scratch(std::string_view keep_key) const noexcept {
    std::size_t removed = 0;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return 0;
    }

    try {
        for (const auto& entry : it) {
            std::error_code type_ec;
            if (!entry.is_directory(type_ec)) {
                continue;
            }
            auto name = entry.path().filename().string();
            if (!name.starts_with(SCRATCH_PREFIX)) {
                continue;
            }
            if (!keep_key.empty() && std::string_view(name).substr(SCRATCH_PREFIX.size()) == keep_key) {
                continue;
            }
            if (auto rm_ec = remove_all(entry.path())) {
                spdlog::warn("Could not remove scratch directory {}: {}", name, rm_ec.message());
            } else {
                ++removed;
            }
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("Scratch cleanup stopped: {}", e.what());
    }

    if (removed > 0) {
        spdlog::info("Removed {} orphaned scratch director{}", removed, removed == 1 ? "y" : "ies");
    }
    return removed;
}

} // namespace reel::disk
