// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/subtitle_fetcher.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/media/stream_headers.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cctype>
#include <utility>

namespace reel::media {

namespace {

struct LanguageEntry {
    std::string_view code;
    std::array<std::string_view, 3> needles;
};

// Checked in order, first match wins
constexpr std::array<LanguageEntry, 19> LANGUAGES{{
    {"en", {"english"}},
    {"es", {"spanish", "español"}},
    {"fr", {"french", "français"}},
    {"de", {"german", "deutsch"}},
    {"pt", {"portuguese", "português"}},
    {"it", {"italian", "italiano"}},
    {"ru", {"russian", "русский", "Русский"}},
    {"ja", {"japanese", "日本語"}},
    {"ko", {"korean", "한국어"}},
    {"zh", {"chinese", "中文"}},
    {"ar", {"arabic", "العربية"}},
    {"hi", {"hindi", "हिन्दी"}},
    {"id", {"indonesian"}},
    {"ms", {"malay"}},
    {"th", {"thai", "ไทย"}},
    {"vi", {"vietnamese", "tiếng việt"}},
    {"tr", {"turkish", "türkçe"}},
    {"pl", {"polish", "polski"}},
    {"nl", {"dutch", "nederlands"}},
}};

bool is_reserved(char c) noexcept {
    switch (c) {
        case '<': case '>': case ':': case '"': case '/':
        case '\\': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

std::string ascii_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::string sanitize_filename(std::string_view name) {
    std::string out;
    out.reserve(name.size());

    bool in_space = false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            if (!in_space) {
                out += '_';
            }
            in_space = true;
            continue;
        }
        in_space = false;
        out += is_reserved(c) ? '_' : static_cast<char>(std::tolower(uc));
    }
    return out;
}

std::string_view language_code(std::string_view label) noexcept {
    std::string lower;
    try {
        lower = ascii_lower(label);
    } catch (const std::bad_alloc&) {
        return "unknown";
    }

    for (const auto& entry : LANGUAGES) {
        for (auto needle : entry.needles) {
            if (!needle.empty() && lower.find(needle) != std::string::npos) {
                return entry.code;
            }
        }
    }
    return "unknown";
}

//=============================================================================
// SubtitleFetcher
//=============================================================================

std::vector<core::SubtitleRecord>
SubtitleFetcher::fetch_all(std::string_view key,
                           const std::vector<core::SubtitleTrack>& tracks,
                           std::stop_token stop) noexcept {
    std::vector<core::SubtitleRecord> saved;

    if (tracks.empty()) {
        spdlog::info("No subtitles available for {}", key);
        return saved;
    }

    if (auto ec = dir_.ensure()) {
        spdlog::warn("Skipping subtitles of {}: {}", key, ec.message());
        return saved;
    }

    spdlog::info("Found {} subtitle tracks to download", tracks.size());

    for (const auto& track : tracks) {
        if (stop.stop_requested()) {
            break;
        }
        if (track.url.empty()) {
            continue;
        }

        try {
            std::string file_name(key);
            file_name += '_';
            file_name += sanitize_filename(track.label);
            file_name += ".vtt";
            auto path = dir_.subtitle_path(file_name);

            spdlog::debug("Downloading subtitle: {} from {}", track.label, track.url);

            auto text = http_.get_text(track.url, subtitle_headers(config_), stop);
            if (!text) {
                spdlog::warn("Failed to download subtitle {}: {}", track.label, text.error().message());
                continue;
            }

            disk::FileWriter writer;
            std::error_code ec = writer.open(path);
            if (!ec) ec = writer.write(text->data(), text->size());
            if (!ec) ec = writer.flush();
            writer.close();
            if (ec) {
                spdlog::warn("Failed to save subtitle {}: {}", track.label, ec.message());
                if (auto rm_ec = disk::DownloadsDir::remove_all(path)) {
                    spdlog::debug("Could not remove {}: {}", path.string(), rm_ec.message());
                }
                continue;
            }

            core::SubtitleRecord record;
            record.label = track.label;
            record.language = std::string(language_code(track.label));
            record.file_path = path.string();
            saved.push_back(std::move(record));

            spdlog::debug("Downloaded subtitle: {}", track.label);
        } catch (const std::bad_alloc&) {
            spdlog::warn("Out of memory saving subtitle {}", track.label);
        }
    }

    if (!saved.empty()) {
        spdlog::info("Downloaded {} subtitle tracks", saved.size());
    }
    return saved;
}

} // namespace reel::media
