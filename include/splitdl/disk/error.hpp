// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace splitdl::disk {

// Failures of the preallocated output file, mapped from errno
enum class DiskErrc {
    success = 0,
    file_not_found,      // ENOENT: a directory on the output path is missing
    access_denied,       // EACCES, EPERM, EROFS
    disk_full,           // ENOSPC, EDQUOT
    invalid_path,        // ENAMETOOLONG, ENOTDIR, EISDIR
    write_error,         // Any other pwrite/ftruncate failure
    allocation_failed,   // ftruncate could not reach the requested length
    handle_invalid,      // File not open (closed or moved from)
    out_of_bounds,       // Write would end past the preallocated length
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "splitdl::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::file_not_found:     return "Output directory does not exist";
            case DiskErrc::access_denied:      return "Output file is not writable";
            case DiskErrc::disk_full:          return "No space left for the output file";
            case DiskErrc::invalid_path:       return "Output path is not a regular file path";
            case DiskErrc::write_error:        return "Output file write failed";
            case DiskErrc::allocation_failed:  return "Could not preallocate the output file";
            case DiskErrc::handle_invalid:     return "Output file is not open";
            case DiskErrc::out_of_bounds:      return "Write past the preallocated length";
            default:                           return "Unknown disk error";
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

} // namespace splitdl::disk

namespace std {

template<>
struct is_error_code_enum<splitdl::disk::DiskErrc> : true_type {};

} // namespace std
