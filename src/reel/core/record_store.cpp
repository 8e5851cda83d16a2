// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/record_store.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace reel::core {

namespace {

using nlohmann::json;

template<typename T>
json nullable(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_string(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json subtitle_to_json(const SubtitleRecord& subtitle) {
    return json{
        {"label", subtitle.label},
        {"language", subtitle.language},
        {"filePath", subtitle.file_path},
    };
}

SubtitleRecord subtitle_from_json(const json& j) {
    SubtitleRecord subtitle;
    subtitle.label = optional_string(j, "label").value_or("Unknown");
    subtitle.language = optional_string(j, "language").value_or("en");
    subtitle.file_path = j.at("filePath").get<std::string>();
    return subtitle;
}

json record_to_json(const DownloadRecord& record) {
    json subtitles = json::array();
    for (const auto& subtitle : record.subtitles) {
        subtitles.push_back(subtitle_to_json(subtitle));
    }

    return json{
        {"animeSlug", record.anime_slug},
        {"animeTitle", record.anime_title},
        {"animeThumbnail", nullable(record.anime_thumbnail)},
        {"episodeId", record.episode_id},
        {"episodeNumber", record.episode_number},
        {"episodeTitle", nullable(record.episode_title)},
        {"serverType", record.server_variant},
        {"filePath", nullable(record.file_path)},
        {"streamUrl", nullable(record.stream_url)},
        {"downloadedAt", record.downloaded_at},
        {"status", std::string(status_name(record.status))},
        {"progress", record.progress},
        {"fileSize", nullable(record.file_size)},
        {"errorMessage", nullable(record.error_message)},
        {"subtitles", std::move(subtitles)},
    };
}

// Throws nlohmann::json::exception on missing required fields
DownloadRecord record_from_json(const json& j) {
    DownloadRecord record;
    record.anime_slug = j.at("animeSlug").get<std::string>();
    record.anime_title = j.at("animeTitle").get<std::string>();
    record.anime_thumbnail = optional_string(j, "animeThumbnail");
    record.episode_id = j.at("episodeId").get<std::string>();
    record.episode_number = j.at("episodeNumber").get<std::int32_t>();
    record.episode_title = optional_string(j, "episodeTitle");
    record.server_variant = optional_string(j, "serverType").value_or("sub");
    record.file_path = optional_string(j, "filePath");
    record.stream_url = optional_string(j, "streamUrl");
    record.downloaded_at = j.value("downloadedAt", std::int64_t{0});
    record.status = status_from_name(optional_string(j, "status").value_or("pending"));

    auto progress = j.find("progress");
    if (progress != j.end() && progress->is_number()) {
        record.progress = progress->get<double>();
    }

    auto size = j.find("fileSize");
    if (size != j.end() && size->is_number_unsigned()) {
        record.file_size = size->get<std::uint64_t>();
    }

    record.error_message = optional_string(j, "errorMessage");

    auto subtitles = j.find("subtitles");
    if (subtitles != j.end() && subtitles->is_array()) {
        for (const auto& s : *subtitles) {
            record.subtitles.push_back(subtitle_from_json(s));
        }
    }
    return record;
}

} // namespace

std::string serialize_records(const std::vector<DownloadRecord>& records) {
    json array = json::array();
    for (const auto& record : records) {
        array.push_back(record_to_json(record));
    }
    // Titles come from the command line and may not be valid UTF-8
    return array.dump(2, ' ', false, json::error_handler_t::replace);
}

std::expected<std::vector<DownloadRecord>, std::error_code>
parse_records(std::string_view json_text) noexcept {
    try {
        auto j = json::parse(json_text);
        if (!j.is_array()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_record));
        }

        std::vector<DownloadRecord> records;
        records.reserve(j.size());
        for (const auto& item : j) {
            records.push_back(record_from_json(item));
        }
        return records;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse download records: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_record));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_record));
    }
}

//=============================================================================
// JsonRecordStore
//=============================================================================

std::expected<std::vector<DownloadRecord>, std::error_code>
JsonRecordStore::load_records() noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::vector<DownloadRecord>{};
    }

    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        auto records = parse_records(ss.str());
        if (records) {
            spdlog::debug("Loaded {} downloads from {}", records->size(), path_);
        }
        return records;
    } catch (const std::exception& e) {
        spdlog::error("Failed to read {}: {}", path_, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code JsonRecordStore::save_records(const std::vector<DownloadRecord>& records) noexcept {
    try {
        std::filesystem::path p(path_);
        std::error_code ec;
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                return disk::to_disk_error(ec, disk::DiskErrc::invalid_path);
            }
        }

        auto tmp = p;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << serialize_records(records);
            file.flush();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::filesystem::rename(tmp, p, ec);
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(tmp, rm_ec);
            return disk::to_disk_error(ec, disk::DiskErrc::write_error);
        }

        spdlog::debug("Saved {} downloads", records.size());
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Failed to save downloads to {}: {}", path_, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace reel::core
