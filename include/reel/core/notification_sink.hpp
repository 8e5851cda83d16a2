// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/download_record.hpp>
#include <string_view>

namespace reel::core {

// Optional observer of download activity. Nothing in the engine depends on it.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void progress(const DownloadRecord& /*record*/) noexcept {}
    virtual void completed(const DownloadRecord& /*record*/) noexcept {}
    virtual void failed(const DownloadRecord& /*record*/) noexcept {}

    // Short user-visible message ("Already Downloaded", "Download Failed", ...)
    virtual void notice(std::string_view /*title*/, std::string_view /*message*/) noexcept {}
};

} // namespace reel::core
