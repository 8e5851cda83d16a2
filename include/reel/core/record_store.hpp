// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/download_record.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::core {

// Durable home of the record set. Read at startup, rewritten after every transition.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    [[nodiscard]] virtual std::expected<std::vector<DownloadRecord>, std::error_code>
    load_records() noexcept = 0;

    [[nodiscard]] virtual std::error_code
    save_records(const std::vector<DownloadRecord>& records) noexcept = 0;
};

// Serialize the record set as a JSON array
[[nodiscard]] std::string serialize_records(const std::vector<DownloadRecord>& records);

[[nodiscard]] std::expected<std::vector<DownloadRecord>, std::error_code>
parse_records(std::string_view json_text) noexcept;

// RecordStore backed by a single JSON file
class JsonRecordStore : public RecordStore {
public:
    explicit JsonRecordStore(std::string path) : path_(std::move(path)) {}

    // Missing file loads as an empty set
    [[nodiscard]] std::expected<std::vector<DownloadRecord>, std::error_code>
    load_records() noexcept override;

    // Writes <path>.tmp then renames it over <path>
    [[nodiscard]] std::error_code
    save_records(const std::vector<DownloadRecord>& records) noexcept override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace reel::core
