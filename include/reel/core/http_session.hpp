// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <stop_token>
#include <string>

namespace reel::core {

// Request headers, name -> value
using HttpHeaders = std::map<std::string, std::string>;

// Byte progress of a streamed transfer; total is 0 when the server sends no length
using TransferProgress = std::function<void(std::uint64_t received, std::uint64_t total)>;

// Network transport used by every fetch in the engine.
// Implementations return DownloadErrc::cancelled once the stop token fires.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // GET a text resource (playlist, subtitle, JSON) into memory
    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    get_text(const std::string& url,
             const HttpHeaders& headers,
             std::stop_token stop) noexcept = 0;

    // GET a resource streamed straight to dest; returns bytes written
    [[nodiscard]] virtual std::expected<std::uint64_t, std::error_code>
    download_to(const std::string& url,
                const HttpHeaders& headers,
                const std::filesystem::path& dest,
                const TransferProgress& progress,
                std::stop_token stop) noexcept = 0;
};

// Timeouts applied to every request of a session
struct HttpTimeouts {
    std::uint32_t connect_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t transfer_sec{TRANSFER_TIMEOUT_SEC};
    std::uint32_t stall_sec{STALL_TIMEOUT_SEC};
};

// libcurl-backed HttpClient
class HttpSession : public HttpClient {
public:
    HttpSession() = default;
    explicit HttpSession(HttpTimeouts timeouts) noexcept : timeouts_(timeouts) {}

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<std::string, std::error_code>
    get_text(const std::string& url,
             const HttpHeaders& headers,
             std::stop_token stop) noexcept override;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    download_to(const std::string& url,
                const HttpHeaders& headers,
                const std::filesystem::path& dest,
                const TransferProgress& progress,
                std::stop_token stop) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpTimeouts timeouts_;
};

} // namespace reel::core
