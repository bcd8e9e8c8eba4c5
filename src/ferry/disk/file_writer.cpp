// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/file_writer.hpp>
#include <cerrno>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry::disk {

namespace fs = std::filesystem;

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:       return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:       return make_error_code(DiskErrc::invalid_path);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        default:           return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

std::expected<FileWriter, std::error_code>
FileWriter::open(std::string_view path, OpenMode mode) noexcept {
    FileWriter writer;
    try {
        writer.path_ = std::string(path);
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= mode == OpenMode::truncate ? O_TRUNC : O_APPEND;

    writer.fd_ = ::open(writer.path_.c_str(), flags, 0644);
    if (writer.fd_ < 0) {
        return std::unexpected(from_errno(errno, DiskErrc::write_error));
    }
    return writer;
}

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code FileWriter::write_at(std::uint64_t offset,
                                     const void* data,
                                     std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        auto n = ::pwrite(fd_, bytes, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        bytes += n;
        size -= static_cast<std::size_t>(n);
        offset += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::append(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        auto n = ::write(fd_, bytes, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        bytes += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::resize(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return from_errno(errno, DiskErrc::truncate_error);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Filesystem helpers
//=============================================================================

std::expected<std::uint64_t, std::error_code>
file_size(std::string_view path) noexcept {
    std::error_code ec;
    auto size = fs::file_size(fs::path(path), ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return static_cast<std::uint64_t>(size);
}

bool exists(std::string_view path) noexcept {
    std::error_code ec;
    return fs::exists(fs::path(path), ec);
}

std::error_code rename_file(std::string_view from, std::string_view to) noexcept {
    std::error_code ec;
    fs::rename(fs::path(from), fs::path(to), ec);
    return ec ? make_error_code(DiskErrc::rename_error) : std::error_code{};
}

std::error_code remove_file(std::string_view path) noexcept {
    std::error_code ec;
    fs::remove(fs::path(path), ec);
    return ec ? make_error_code(DiskErrc::remove_error) : std::error_code{};
}

std::error_code ensure_directory(std::string_view path) noexcept {
    if (path.empty()) return {};
    std::error_code ec;
    fs::create_directories(fs::path(path), ec);
    return ec ? from_errno(ec.value(), DiskErrc::invalid_path) : std::error_code{};
}

} // namespace ferry::disk
