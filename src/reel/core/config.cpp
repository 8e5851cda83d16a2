// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace reel::core {

std::string EngineConfig::records_path() const {
    if (!records_file.empty()) {
        return records_file;
    }
    return (std::filesystem::path(downloads_root) / "downloads.json").string();
}

std::expected<EngineConfig, std::error_code>
EngineConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        return parse(ss.str());
    } catch (const std::exception& e) {
        spdlog::error("Failed to read config {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::expected<EngineConfig, std::error_code>
EngineConfig::parse(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        EngineConfig cfg;
        cfg.downloads_root = j.value("downloads_root", cfg.downloads_root);
        cfg.records_file = j.value("records_file", cfg.records_file);
        cfg.api_base_url = j.value("api_base_url", cfg.api_base_url);
        cfg.stream_endpoint = j.value("stream_endpoint", cfg.stream_endpoint);
        cfg.user_agent = j.value("user_agent", cfg.user_agent);
        cfg.subtitle_user_agent = j.value("subtitle_user_agent", cfg.subtitle_user_agent);
        cfg.default_referer = j.value("default_referer", cfg.default_referer);
        cfg.subtitle_referer = j.value("subtitle_referer", cfg.subtitle_referer);
        cfg.max_playlist_depth = j.value("max_playlist_depth", cfg.max_playlist_depth);
        cfg.min_media_bytes = j.value("min_media_bytes", cfg.min_media_bytes);
        cfg.min_segment_success_ratio = j.value("min_segment_success_ratio", cfg.min_segment_success_ratio);
        cfg.connect_timeout_sec = j.value("connect_timeout_sec", cfg.connect_timeout_sec);
        cfg.transfer_timeout_sec = j.value("transfer_timeout_sec", cfg.transfer_timeout_sec);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (cfg.max_playlist_depth == 0 || cfg.downloads_root.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }
        cfg.min_segment_success_ratio = std::clamp(cfg.min_segment_success_ratio, 0.0, 1.0);

        // Trailing slash would produce "//api/stream"
        while (!cfg.api_base_url.empty() && cfg.api_base_url.back() == '/') {
            cfg.api_base_url.pop_back();
        }

        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Malformed config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

} // namespace reel::core
