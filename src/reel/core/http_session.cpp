// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/http_session.hpp>
#include <reel/disk/error.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <exception>
#include <memory>

namespace reel::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct CurlHeaderList {
    curl_slist* list = nullptr;

    CurlHeaderList() = default;
    ~CurlHeaderList() { if (list) curl_slist_free_all(list); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    void append(const std::string& line) noexcept {
        if (auto* next = curl_slist_append(list, line.c_str())) {
            list = next;
        }
    }
};

struct FileCloser {
    void operator()(std::FILE* f) const noexcept { std::fclose(f); }
};

// Shared state for the transfer callbacks
struct TransferContext {
    std::stop_token stop;
    const TransferProgress* progress{nullptr};
    std::string* text{nullptr};
    std::FILE* file{nullptr};
    std::uint64_t written{0};
    std::uint64_t last_reported{0};
    bool write_failed{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->file) {
        if (std::fwrite(ptr, 1, bytes, ctx->file) != bytes) {
            ctx->write_failed = true;
            return 0;
        }
    } else if (ctx->text) {
        try {
            ctx->text->append(ptr, bytes);
        } catch (const std::exception&) {
            ctx->write_failed = true;
            return 0;
        }
    }

    ctx->written += bytes;
    return bytes;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->stop.stop_requested()) {
        return 1;
    }

    auto now = static_cast<std::uint64_t>(dlnow);
    if (ctx->progress && *ctx->progress && now != ctx->last_reported) {
        ctx->last_reported = now;
        (*ctx->progress)(now, dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0);
    }
    return 0;
}

std::error_code map_curl_error(CURLcode result, const TransferContext& ctx, long http_code) noexcept {
    switch (result) {
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_WRITE_ERROR:
            if (ctx.write_failed) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            return make_error_code(DownloadErrc::network_error);
        case CURLE_HTTP_RETURNED_ERROR:
            if (http_code == 404 || http_code == 410) {
                return make_error_code(DownloadErrc::not_found);
            }
            if (http_code == 401 || http_code == 403) {
                return make_error_code(DownloadErrc::permission_denied);
            }
            if (http_code >= 500) {
                return make_error_code(DownloadErrc::server_error);
            }
            return make_error_code(DownloadErrc::network_error);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

// Options shared by every request
void apply_common_options(CURL* curl,
                          const std::string& url,
                          const HttpTimeouts& timeouts,
                          CurlHeaderList& header_list,
                          const HttpHeaders& headers,
                          TransferContext& ctx) noexcept {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeouts.connect_sec));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeouts.transfer_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeouts.stall_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));

    for (const auto& [name, value] : headers) {
        if (name == "User-Agent") {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, value.c_str());
        } else {
            header_list.append(name + ": " + value);
        }
    }
    if (header_list.list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.list);
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<std::string, std::error_code>
HttpSession::get_text(const std::string& url,
                      const HttpHeaders& headers,
                      std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    std::string body;
    TransferContext ctx;
    ctx.stop = stop;
    ctx.text = &body;

    // Header list must outlive curl_easy_perform
    CurlHeaderList header_list;
    apply_common_options(curl.ptr, url, timeouts_, header_list, headers, ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);

    if (result != CURLE_OK) {
        auto ec = map_curl_error(result, ctx, http_code);
        spdlog::debug("GET {} failed: {} (curl {}, http {})", url, ec.message(),
                      static_cast<int>(result), http_code);
        return std::unexpected(ec);
    }

    return body;
}

std::expected<std::uint64_t, std::error_code>
HttpSession::download_to(const std::string& url,
                         const HttpHeaders& headers,
                         const std::filesystem::path& dest,
                         const TransferProgress& progress,
                         std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(dest.c_str(), "wb"));
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TransferContext ctx;
    ctx.stop = stop;
    ctx.progress = &progress;
    ctx.file = file.get();

    CurlHeaderList header_list;
    apply_common_options(curl.ptr, url, timeouts_, header_list, headers, ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);

    bool flushed = std::fflush(file.get()) == 0;
    file.reset();

    if (result != CURLE_OK) {
        auto ec = map_curl_error(result, ctx, http_code);
        spdlog::debug("Download {} failed: {} (curl {}, http {})", url, ec.message(),
                      static_cast<int>(result), http_code);
        std::error_code rm_ec;
        std::filesystem::remove(dest, rm_ec);
        return std::unexpected(ec);
    }

    if (!flushed) {
        std::error_code rm_ec;
        std::filesystem::remove(dest, rm_ec);
        return std::unexpected(make_error_code(disk::DiskErrc::write_error));
    }

    return ctx.written;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace reel::core
