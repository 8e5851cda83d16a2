// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/file_writer.hpp>
#include <reel/core/config.hpp>
#include <cerrno>
#include <new>

namespace reel::disk {

namespace {

std::error_code from_errno(DiskErrc fallback) noexcept {
    return to_disk_error(std::error_code(errno, std::generic_category()), fallback);
}

} // namespace

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    if (file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    file_.reset(std::fopen(path.c_str(), "wb"));
    if (!file_) {
        return from_errno(DiskErrc::invalid_path);
    }

    path_ = path;
    written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (size > 0 && std::fwrite(data, 1, size, file_.get()) != size) {
        return from_errno(DiskErrc::write_error);
    }
    written_ += size;
    return {};
}

std::error_code FileWriter::append_file(const std::filesystem::path& source) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    std::unique_ptr<std::FILE, Closer> in(std::fopen(source.c_str(), "rb"));
    if (!in) {
        return from_errno(DiskErrc::read_error);
    }

    try {
        if (buffer_.empty()) {
            buffer_.resize(core::COPY_BUFFER_SIZE);
        }
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }

    while (true) {
        std::size_t n = std::fread(buffer_.data(), 1, buffer_.size(), in.get());
        if (n > 0) {
            if (auto ec = write(buffer_.data(), n)) {
                return ec;
            }
        }
        if (n < buffer_.size()) {
            if (std::ferror(in.get())) {
                return make_error_code(DiskErrc::read_error);
            }
            break;
        }
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_.get()) != 0) {
        return from_errno(DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    file_.reset();
}

} // namespace reel::disk
