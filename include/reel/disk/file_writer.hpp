// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace reel::disk {

// Sequential writer for the merged output file. Closes on destruction.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter() { close(); }

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Open (truncating) the output file
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Append raw bytes
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Append the whole content of another file
    [[nodiscard]] std::error_code append_file(const std::filesystem::path& source) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct Closer {
        void operator()(std::FILE* f) const noexcept { std::fclose(f); }
    };

    std::unique_ptr<std::FILE, Closer> file_;
    std::filesystem::path path_;
    std::vector<char> buffer_;
    std::uint64_t written_{0};
};

} // namespace reel::disk
