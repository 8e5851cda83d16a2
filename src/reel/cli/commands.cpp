// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/config.hpp>
#include <reel/core/download_scheduler.hpp>
#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/record_store.hpp>
#include <reel/core/stream_catalog.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/downloads_dir.hpp>
#include <reel/media/hls_parser.hpp>
#include <reel/media/media_downloader.hpp>
#include <reel/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>

using namespace reel::core;

namespace chrono = std::chrono;

namespace reel::cli {

namespace {

constexpr auto IDLE_POLL = chrono::milliseconds(500);

// Prints scheduler notices to the terminal
class ConsoleNotifier : public NotificationSink {
public:
    explicit ConsoleNotifier(bool quiet) noexcept : quiet_(quiet) {}

    void notice(std::string_view title, std::string_view message) noexcept override {
        if (quiet_) return;
        std::cout << "\n" << title << ": " << message << std::endl;
    }

private:
    bool quiet_;
};

// Draws one progress bar per transfer from the scheduler's change callback
class TransferProgress {
public:
    void operator()(const DownloadRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto key = record.key();

        if (record.status == DownloadStatus::downloading) {
            if (!bar_ || key_ != key) {
                bar_.emplace(key);
                key_ = key;
            }
            bar_->update(record.progress, record.file_size.value_or(0));
        } else if (bar_ && key_ == key) {
            if (record.status == DownloadStatus::completed) {
                bar_->finish();
            } else {
                bar_->clear();
            }
            bar_.reset();
        }
    }

private:
    std::mutex mutex_;
    std::optional<ProgressBar> bar_;
    std::string key_;
};

// Collaborators of one CLI invocation
struct Engine {
    explicit Engine(const EngineConfig& cfg, bool quiet)
        : config(cfg)
        , http(HttpTimeouts{cfg.connect_timeout_sec, cfg.transfer_timeout_sec, STALL_TIMEOUT_SEC})
        , dir(cfg.downloads_root)
        , store(cfg.records_path())
        , catalog(http, config)
        , notifier(quiet)
        , scheduler(store, catalog, http, dir, config, &notifier) {}

    EngineConfig config;
    HttpSession http;
    disk::DownloadsDir dir;
    JsonRecordStore store;
    HttpStreamCatalog catalog;
    ConsoleNotifier notifier;
    TransferProgress progress;              // Outlives the scheduler's worker
    DownloadScheduler scheduler;
};

// curl_global_init/cleanup for the lifetime of a command
struct CurlGlobal {
    CurlGlobal() noexcept { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }
};

std::expected<EngineConfig, std::error_code> load_config(const CliArgs& args) {
    EngineConfig config;
    if (!args.config_file.empty()) {
        auto loaded = EngineConfig::load(args.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (!args.directory.empty()) {
        config.downloads_root = args.directory;
    }
    return config;
}

void configure_logging(const EngineConfig& config, const CliArgs& args) {
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    }
}

void wait_until_idle(DownloadScheduler& scheduler) {
    while (!scheduler.wait_idle(IDLE_POLL)) {
    }
}

int report(const DownloadScheduler& scheduler, const std::string& key) {
    auto record = scheduler.record(key);
    if (!record) {
        std::cerr << "Error: " << key << " was deleted" << std::endl;
        return 1;
    }

    if (record->status == DownloadStatus::completed) {
        std::cout << "Saved " << record->file_path.value_or("") << " ("
                  << format_file_size(record->file_size.value_or(0)) << ")";
        if (!record->subtitles.empty()) {
            std::cout << " with " << record->subtitles.size() << " subtitle track(s)";
        }
        std::cout << std::endl;
        return 0;
    }

    std::cerr << "Error: " << key << " is " << status_name(record->status);
    if (record->error_message) {
        std::cerr << ": " << *record->error_message;
    }
    std::cerr << std::endl;
    return 1;
}

//=============================================================================
// Commands
//=============================================================================

CliResult cmd_get(Engine& engine, const CliArgs& args) {
    if (args.operands.size() < 3) {
        std::cerr << "Error: get needs <slug> <episode-number> <episode-id> [variant]" << std::endl;
        return 1;
    }

    DownloadRequest request;
    request.anime_slug = args.operands[0];
    request.episode_id = args.operands[2];
    request.anime_title = args.title;
    if (args.operands.size() > 3) {
        request.server_variant = args.operands[3];
    }

    const auto& number = args.operands[1];
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), request.episode_number);
    if (ec != std::errc{} || ptr != number.data() + number.size()) {
        std::cerr << "Error: Invalid episode number: " << number << std::endl;
        return 1;
    }

    if (!args.quiet) {
        engine.scheduler.on_change([&engine](const DownloadRecord& record) {
            engine.progress(record);
        });
    }

    if (auto start_ec = engine.scheduler.start()) {
        std::cerr << "Error: Failed to start: " << start_ec.message() << std::endl;
        return std::unexpected(start_ec);
    }

    const auto key = make_download_key(request.anime_slug, request.episode_number, request.server_variant);
    if (!engine.scheduler.enqueue(request)) {
        return engine.scheduler.is_downloaded(request.anime_slug, request.episode_number,
                                              request.server_variant) ? 0 : 1;
    }

    wait_until_idle(engine.scheduler);
    return report(engine.scheduler, key);
}

CliResult cmd_list(Engine& engine, const CliArgs& /*args*/) {
    // Read-only view: the store is not rewritten
    auto records = engine.store.load_records();
    if (!records) {
        std::cerr << "Error: Cannot read " << engine.store.path() << ": "
                  << records.error().message() << std::endl;
        return std::unexpected(records.error());
    }

    if (records->empty()) {
        std::cout << "No downloads" << std::endl;
        return 0;
    }

    std::uint64_t total = 0;
    for (const auto& record : *records) {
        std::cout << record.key() << "  " << status_name(record.status);
        if (record.status == DownloadStatus::downloading || record.status == DownloadStatus::paused
                || record.status == DownloadStatus::failed) {
            std::cout << " " << static_cast<int>(record.progress * 100.0) << "%";
        }
        if (record.file_size) {
            std::cout << "  " << format_file_size(*record.file_size);
        }
        std::cout << "  " << record.anime_title << " - Episode " << record.episode_number;
        if (record.error_message) {
            std::cout << "  (" << *record.error_message << ")";
        }
        std::cout << "\n";

        if (record.status == DownloadStatus::completed) {
            total += record.file_size.value_or(0);
        }
    }
    std::cout << records->size() << " download(s), " << format_file_size(total)
              << " on disk" << std::endl;
    return 0;
}

CliResult cmd_retry(Engine& engine, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: retry needs <key>" << std::endl;
        return 1;
    }
    const auto& key = args.operands[0];

    if (!args.quiet) {
        engine.scheduler.on_change([&engine](const DownloadRecord& record) {
            engine.progress(record);
        });
    }

    if (auto ec = engine.scheduler.start()) {
        std::cerr << "Error: Failed to start: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    if (!engine.scheduler.retry(key)) {
        std::cerr << "Error: " << key << " is not a failed or paused download" << std::endl;
        return 1;
    }

    wait_until_idle(engine.scheduler);
    return report(engine.scheduler, key);
}

CliResult cmd_cancel(Engine& engine, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: cancel needs <key>" << std::endl;
        return 1;
    }
    const auto& key = args.operands[0];

    if (auto ec = engine.scheduler.load()) {
        return std::unexpected(ec);
    }
    if (!engine.scheduler.record(key)) {
        std::cerr << "Error: No download named " << key << std::endl;
        return 1;
    }

    engine.scheduler.cancel(key);
    auto record = engine.scheduler.record(key);
    std::cout << key << " is " << status_name(record ? record->status : DownloadStatus::paused) << std::endl;
    return 0;
}

CliResult cmd_delete(Engine& engine, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: delete needs <key>" << std::endl;
        return 1;
    }

    if (auto ec = engine.scheduler.load()) {
        return std::unexpected(ec);
    }

    for (const auto& key : args.operands) {
        if (!engine.scheduler.record(key)) {
            std::cout << "Nothing to delete for " << key << std::endl;
            continue;
        }
        engine.scheduler.remove(key);
        std::cout << "Deleted " << key << std::endl;
    }
    return 0;
}

CliResult cmd_delete_bulk(Engine& engine, bool completed_only) {
    if (auto ec = engine.scheduler.load()) {
        return std::unexpected(ec);
    }

    const auto before = engine.scheduler.records().size();
    if (completed_only) {
        engine.scheduler.remove_completed();
    } else {
        engine.scheduler.remove_all();
    }
    std::cout << "Deleted " << before - engine.scheduler.records().size() << " download(s)" << std::endl;
    return 0;
}

CliResult cmd_fetch(Engine& engine, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: fetch needs <url>" << std::endl;
        return 1;
    }
    const auto& url = args.operands[0];

    auto parsed = Url::parse(url);
    if (!parsed) {
        std::cerr << "Error: Invalid URL: " << url << std::endl;
        return std::unexpected(parsed.error());
    }

    const bool playlist = media::HLSParser::is_hls_url(url);
    std::filesystem::path dest = args.output_file;
    if (dest.empty()) {
        dest = engine.dir.root() / parsed->filename();
        if (playlist) {
            dest.replace_extension(".ts");
        }
    }

    if (auto ec = engine.dir.ensure()) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    ProgressBar bar(dest.filename().string());
    Spinner spinner(dest.filename().string());
    std::uint64_t last_spin = 0;

    media::MediaDownloader downloader(engine.http, engine.dir, engine.config);
    if (!args.quiet) {
        downloader.callback([&](const media::MediaProgress& p) {
            if (p.fraction_known) {
                bar.update(p.fraction, p.downloaded_bytes);
            } else if (p.downloaded_bytes >= last_spin + 256 * 1024) {
                last_spin = p.downloaded_bytes;
                spinner.update(p.downloaded_bytes);
            }
        });
    }

    std::stop_source never;
    auto result = playlist
        ? downloader.download_hls(dest.stem().string(), url, dest, {}, never.get_token())
        : downloader.download_file(url, dest, {}, never.get_token());

    if (!result) {
        if (!args.quiet) bar.clear();
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error());
    }

    if (!args.quiet) bar.finish();
    std::cout << "Saved " << result->path.string() << " (" << format_file_size(result->file_size) << ")";
    if (result->total_segments > 0) {
        std::cout << ", " << result->segments_downloaded << "/" << result->total_segments << " segments";
    }
    std::cout << std::endl;
    return 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                args.config_file = argv[++i];
            }
            continue;
        }
        if (arg == "-d" || arg == "--directory") {
            if (i + 1 < argc) {
                args.directory = argv[++i];
            }
            continue;
        }
        if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                args.output_file = argv[++i];
            }
            continue;
        }
        if (arg == "-t" || arg == "--title") {
            if (i + 1 < argc) {
                args.title = argv[++i];
            }
            continue;
        }

        // First bare word is the command, the rest are its operands
        if (args.command.empty()) {
            args.command = std::move(arg);
        } else {
            args.operands.push_back(std::move(arg));
        }
    }

    return args;
}

CliResult run(const CliArgs& args) noexcept {
    try {
        auto config = load_config(args);
        if (!config) {
            std::cerr << "Error: Cannot load config " << args.config_file << ": "
                      << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }
        configure_logging(*config, args);

        CurlGlobal curl;
        auto engine = std::make_unique<Engine>(*config, args.quiet);

        const auto& cmd = args.command;
        if (cmd == "get") return cmd_get(*engine, args);
        if (cmd == "list") return cmd_list(*engine, args);
        if (cmd == "retry") return cmd_retry(*engine, args);
        if (cmd == "cancel") return cmd_cancel(*engine, args);
        if (cmd == "delete") return cmd_delete(*engine, args);
        if (cmd == "delete-all") return cmd_delete_bulk(*engine, false);
        if (cmd == "delete-completed") return cmd_delete_bulk(*engine, true);
        if (cmd == "fetch") return cmd_fetch(*engine, args);

        std::cerr << "Error: Unknown command: " << cmd << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    } catch (const std::bad_alloc&) {
        std::cerr << "Error: Out of memory" << std::endl;
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Reel " << program_name << " - Offline episode downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  get <slug> <episode-number> <episode-id> [variant]\n";
    std::cout << "                          Queue an episode and wait for it (variant: sub, dub)\n";
    std::cout << "  list                    Show all downloads\n";
    std::cout << "  retry <key>             Re-run a failed or paused download\n";
    std::cout << "  cancel <key>            Pause a queued download\n";
    std::cout << "  delete <key>...         Delete downloads with their files\n";
    std::cout << "  delete-all              Delete every download\n";
    std::cout << "  delete-completed        Delete finished downloads\n";
    std::cout << "  fetch <url>             Download one playlist or media URL\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -c, --config <FILE>     Load settings from a JSON file\n";
    std::cout << "  -d, --directory <DIR>   Downloads directory (default: downloads)\n";
    std::cout << "  -o, --output <FILE>     Output file for fetch\n";
    std::cout << "  -t, --title <TITLE>     Anime title for get\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " get one-piece-100 1 one-piece-100?ep=2142 sub --title \"One Piece\"\n";
    std::cout << "  " << program_name << " retry one-piece-100_ep1_sub\n";
    std::cout << "  " << program_name << " fetch -o clip.ts https://example.com/hls/master.m3u8\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
    std::cout << "Copyright changcheng967 2026\n";
}

void print_version() noexcept {
    std::cout << "Reel " << reel::version.to_string() << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace reel::cli
