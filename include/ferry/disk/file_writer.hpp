// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace ferry::disk {

enum class OpenMode : std::uint8_t {
    truncate,  // create or empty the file
    append     // create or keep existing bytes, write at the end
};

// Positional file writer. Concurrent write_at() calls on one instance are
// safe as long as their byte ranges do not overlap.
class FileWriter {
public:
    static std::expected<FileWriter, std::error_code>
    open(std::string_view path, OpenMode mode) noexcept;

    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Write the whole buffer at offset (pwrite)
    [[nodiscard]] std::error_code write_at(std::uint64_t offset,
                                           const void* data,
                                           std::size_t size) noexcept;

    // Write the whole buffer at the current end of file
    [[nodiscard]] std::error_code append(const void* data, std::size_t size) noexcept;

    // Set the file length (pre-allocate or cut back)
    [[nodiscard]] std::error_code resize(std::uint64_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    FileWriter() = default;

    int fd_{-1};
    std::string path_;
};

// Size of a file on disk
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
file_size(std::string_view path) noexcept;

[[nodiscard]] bool exists(std::string_view path) noexcept;

// Atomic replace of `to` by `from`
[[nodiscard]] std::error_code rename_file(std::string_view from, std::string_view to) noexcept;

// Remove a file; a missing file is not an error
[[nodiscard]] std::error_code remove_file(std::string_view path) noexcept;

// Create a directory and its parents
[[nodiscard]] std::error_code ensure_directory(std::string_view path) noexcept;

} // namespace ferry::disk
