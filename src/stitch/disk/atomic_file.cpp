// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/disk/atomic_file.hpp>
#include <cerrno>
#include <iterator>

namespace stitch::disk {

namespace {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:       return make_error_code(DiskErrc::invalid_path);
        default:            return make_error_code(fallback);
    }
}

} // namespace

//=============================================================================
// AtomicFile
//=============================================================================

std::expected<AtomicFile, std::error_code>
AtomicFile::create(const std::filesystem::path& final_path) noexcept {
    try {
        if (final_path.empty() || !final_path.has_filename()) {
            return std::unexpected(make_error_code(DiskErrc::invalid_path));
        }

        AtomicFile file;
        file.final_path_ = final_path;
        file.temp_path_ = final_path;
        file.temp_path_ += TEMP_SUFFIX;

        errno = 0;
        file.out_.open(file.temp_path_, std::ios::binary | std::ios::trunc);
        if (!file.out_) {
            return std::unexpected(from_errno(errno, DiskErrc::write_error));
        }
        file.open_ = true;
        return file;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::write_error));
    }
}

AtomicFile::~AtomicFile() {
    discard();
}

AtomicFile::AtomicFile(AtomicFile&& other) noexcept
    : out_(std::move(other.out_))
    , final_path_(std::move(other.final_path_))
    , temp_path_(std::move(other.temp_path_))
    , written_(other.written_)
    , open_(other.open_) {
    other.open_ = false;
    other.written_ = 0;
}

AtomicFile& AtomicFile::operator=(AtomicFile&& other) noexcept {
    if (this != &other) {
        discard();
        out_ = std::move(other.out_);
        final_path_ = std::move(other.final_path_);
        temp_path_ = std::move(other.temp_path_);
        written_ = other.written_;
        open_ = other.open_;
        other.open_ = false;
        other.written_ = 0;
    }
    return *this;
}

std::error_code AtomicFile::write(const void* data, std::size_t size) noexcept {
    if (!open_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) {
        return {};
    }

    errno = 0;
    out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out_) {
        return from_errno(errno, DiskErrc::write_error);
    }
    written_ += size;
    return {};
}

std::error_code AtomicFile::commit() noexcept {
    if (!open_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    errno = 0;
    out_.flush();
    out_.close();
    if (!out_) {
        auto ec = from_errno(errno, DiskErrc::write_error);
        discard();
        return ec;
    }

    std::error_code ec;
    std::filesystem::rename(temp_path_, final_path_, ec);
    if (ec) {
        discard();
        return make_error_code(DiskErrc::rename_failed);
    }
    open_ = false;
    return {};
}

void AtomicFile::discard() noexcept {
    if (!open_) {
        return;
    }
    open_ = false;
    if (out_.is_open()) {
        out_.close();
    }
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
}

//=============================================================================
// Helpers
//=============================================================================

std::error_code write_file_atomic(const std::filesystem::path& path, std::string_view content) noexcept {
    auto file = AtomicFile::create(path);
    if (!file) {
        return file.error();
    }
    if (auto ec = file->write(content.data(), content.size())) {
        return ec;
    }
    return file->commit();
}

std::expected<std::string, std::error_code> read_file(const std::filesystem::path& path) noexcept {
    try {
        errno = 0;
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::unexpected(from_errno(errno, DiskErrc::read_error));
        }
        std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }
        return content;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

} // namespace stitch::disk
