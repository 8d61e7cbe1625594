// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/disk/output_file.hpp>
#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace splitdl::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EFBIG:
        case ENOMEM:        return make_error_code(DiskErrc::allocation_failed);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// OutputFile
//=============================================================================

std::expected<OutputFile, std::error_code>
OutputFile::create(std::string_view path, std::uint64_t size) noexcept {
    OutputFile file;
    try {
        file.path_ = path;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }

    file.fd_ = ::open(file.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }

    // Fix the length up front; fetchers only ever write inside it
    if (::ftruncate(file.fd_, static_cast<off_t>(size)) != 0) {
        auto ec = errno_to_error_code(errno);
        file.close();
        ::unlink(file.path_.c_str());
        return std::unexpected(ec);
    }

    file.length_ = size;
    return file;
}

OutputFile::~OutputFile() {
    close();
}

OutputFile::OutputFile(OutputFile&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , length_(other.length_) {
    other.fd_ = -1;
    other.length_ = 0;
}

OutputFile& OutputFile::operator=(OutputFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        length_ = other.length_;
        other.fd_ = -1;
        other.length_ = 0;
    }
    return *this;
}

std::error_code OutputFile::write_at(std::uint64_t offset,
                                     const void* data,
                                     std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (offset > length_ || size > length_ - offset) {
        return make_error_code(DiskErrc::out_of_bounds);
    }

    const auto* p = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::pwrite(fd_, p, remaining, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        p += n;
        offset += static_cast<std::uint64_t>(n);
        remaining -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code OutputFile::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return ::fsync(fd_) == 0 ? std::error_code{} : errno_to_error_code(errno);
}

void OutputFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace splitdl::disk
