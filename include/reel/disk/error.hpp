// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace reel::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    remove_failed,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::disk_full:       return "Disk full";
            case DiskErrc::invalid_path:    return "Invalid path";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::remove_failed:   return "Could not remove file";
            case DiskErrc::handle_invalid:  return "Invalid handle";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an OS-level filesystem error onto the disk taxonomy
inline std::error_code to_disk_error(std::error_code ec, DiskErrc fallback) noexcept {
    if (ec == std::errc::no_space_on_device) return make_error_code(DiskErrc::disk_full);
    if (ec == std::errc::permission_denied) return make_error_code(DiskErrc::access_denied);
    if (ec == std::errc::no_such_file_or_directory) return make_error_code(DiskErrc::file_not_found);
    return make_error_code(fallback);
}

} // namespace reel::disk

namespace std {

template<>
struct is_error_code_enum<reel::disk::DiskErrc> : true_type {};

} // namespace std
