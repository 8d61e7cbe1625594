// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace splitdl::disk {

// Preallocated output file with offset-addressed writes.
//
// Writers that target disjoint ranges may call write_at() concurrently: each
// call is a single pwrite(2) loop that never touches a shared file cursor.
class OutputFile {
public:
    // Create (or truncate) the file at `path` and size it to `size` bytes.
    // On sizing failure the new file is removed again.
    static std::expected<OutputFile, std::error_code>
    create(std::string_view path, std::uint64_t size) noexcept;

    OutputFile() = default;
    ~OutputFile();

    // Non-copyable, movable
    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;
    OutputFile(OutputFile&&) noexcept;
    OutputFile& operator=(OutputFile&&) noexcept;

    // Write `size` bytes at `offset`. Fails with out_of_bounds if the write
    // would extend past the preallocated length.
    [[nodiscard]] std::error_code write_at(std::uint64_t offset,
                                           const void* data,
                                           std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t length() const noexcept { return length_; }

private:
    int fd_{-1};
    std::string path_;
    std::uint64_t length_{0};
};

// Translate an errno value into the disk error category
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace splitdl::disk
