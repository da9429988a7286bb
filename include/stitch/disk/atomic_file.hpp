// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace stitch::disk {

constexpr std::string_view TEMP_SUFFIX = ".part";

// Write-then-rename file. Data goes to "<path>.part"; commit() renames it over
// the final path, so readers see either the old file or the complete new one.
// An uncommitted file is removed on destruction.
class AtomicFile {
public:
    [[nodiscard]] static std::expected<AtomicFile, std::error_code>
    create(const std::filesystem::path& final_path) noexcept;

    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;
    AtomicFile(AtomicFile&& other) noexcept;
    AtomicFile& operator=(AtomicFile&& other) noexcept;

    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush, close and rename into place
    [[nodiscard]] std::error_code commit() noexcept;

    // Close and delete the temp file; the final path is untouched
    void discard() noexcept;

    [[nodiscard]] std::uint64_t size() const noexcept { return written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return final_path_; }
    [[nodiscard]] const std::filesystem::path& temp_path() const noexcept { return temp_path_; }

private:
    AtomicFile() = default;

    std::ofstream out_;
    std::filesystem::path final_path_;
    std::filesystem::path temp_path_;
    std::uint64_t written_{0};
    bool open_{false};
};

// Replace path with content atomically
[[nodiscard]] std::error_code
write_file_atomic(const std::filesystem::path& path, std::string_view content) noexcept;

// Whole file contents
[[nodiscard]] std::expected<std::string, std::error_code>
read_file(const std::filesystem::path& path) noexcept;

} // namespace stitch::disk
