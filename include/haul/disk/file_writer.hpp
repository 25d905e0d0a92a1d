// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace haul::disk {

// Sequential writer for a resumable download. The file is cut back to the
// resume offset on open and only ever grows by appends after that.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create parent directories, open (or create) `path` and position at
    // `offset`. A file shorter than `offset` is an error: the caller decides
    // how to re-seed.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, std::uint64_t offset) noexcept;

    [[nodiscard]] std::error_code append(const void* data, std::size_t size) noexcept;

    // Drop everything past `size` and continue appending from there
    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    // fflush + fsync
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Size of an existing file, 0 when absent
    [[nodiscard]] static std::uint64_t existing_size(const std::filesystem::path& path) noexcept;

private:
    std::FILE* file_{nullptr};
    std::filesystem::path path_;
    std::uint64_t offset_{0};
};

// Fixed-capacity staging buffer filled from the network between writes
class ChunkBuffer {
public:
    explicit ChunkBuffer(std::size_t capacity);

    [[nodiscard]] const std::byte* data() const noexcept { return buffer_.data(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool full() const noexcept { return size_ == buffer_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    // Copy as much of `data` as fits; returns the number of bytes taken
    std::size_t fill(const std::byte* data, std::size_t size) noexcept;

    void reset() noexcept { size_ = 0; }

private:
    std::vector<std::byte> buffer_;
    std::size_t size_{0};
};

} // namespace haul::disk
