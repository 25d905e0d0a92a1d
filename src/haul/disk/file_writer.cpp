// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/disk/file_writer.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <unistd.h>

namespace haul::disk {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
            return make_error_code(DiskErrc::disk_full);
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
        case ENAMETOOLONG:
            return make_error_code(DiskErrc::invalid_path);
        default:
            return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(const std::filesystem::path& path, std::uint64_t offset) noexcept {
    if (file_) {
        return make_error_code(DiskErrc::open_failed);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return from_errno(ec.value(), DiskErrc::invalid_path);
        }
    }

    const bool exists = std::filesystem::exists(path, ec);
    std::FILE* file = std::fopen(path.c_str(), exists ? "r+b" : "w+b");
    if (!file) {
        return from_errno(errno, DiskErrc::open_failed);
    }

    auto size = existing_size(path);
    if (size < offset) {
        std::fclose(file);
        return make_error_code(DiskErrc::truncate_error);
    }

    file_ = file;
    path_ = path;
    offset_ = size;
    if (size > offset) {
        if (auto trunc_ec = truncate(offset)) {
            close();
            return trunc_ec;
        }
    } else if (::fseeko(file_, static_cast<off_t>(offset), SEEK_SET) != 0) {
        close();
        return from_errno(errno, DiskErrc::open_failed);
    }
    offset_ = offset;
    return {};
}

std::error_code FileWriter::append(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) return {};

    auto written = std::fwrite(data, 1, size, file_);
    if (written != size) {
        auto err = errno;
        offset_ += written;
        return from_errno(err, DiskErrc::write_error);
    }
    offset_ += size;
    return {};
}

std::error_code FileWriter::truncate(std::uint64_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    if (::ftruncate(::fileno(file_), static_cast<off_t>(size)) != 0) {
        return from_errno(errno, DiskErrc::truncate_error);
    }
    if (::fseeko(file_, static_cast<off_t>(size), SEEK_SET) != 0) {
        return from_errno(errno, DiskErrc::truncate_error);
    }
    offset_ = size;
    return {};
}

std::error_code FileWriter::sync() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    if (::fsync(::fileno(file_)) != 0) {
        return from_errno(errno, DiskErrc::sync_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

std::uint64_t FileWriter::existing_size(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

//=============================================================================
// ChunkBuffer
//=============================================================================

ChunkBuffer::ChunkBuffer(std::size_t capacity) {
    buffer_.resize(std::max<std::size_t>(capacity, 1));
}

std::size_t ChunkBuffer::fill(const std::byte* data, std::size_t size) noexcept {
    auto take = std::min(size, buffer_.size() - size_);
    std::memcpy(buffer_.data() + size_, data, take);
    size_ += take;
    return take;
}

} // namespace haul::disk
