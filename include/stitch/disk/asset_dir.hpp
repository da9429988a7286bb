// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/disk/error.hpp>
#include <stitch/media/manifest.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stitch::disk {

constexpr std::string_view PLAYLIST_FILE = "playlist.txt";
constexpr std::string_view MANIFEST_FILE = "manifest.json";
constexpr std::string_view ENCRYPTION_INFO_FILE = "encryption_info.json";
constexpr std::string_view KEY_FILE = "encryption.key";
constexpr std::string_view CONTENT_LENGTHS_FILE = "content_lengths.json";

// Segment index -> expected byte size
using ContentLengths = std::map<std::uint32_t, std::uint64_t>;

// Directory name for an asset identifier: trimmed, with <>:"/\|?* replaced
// by '_'. Fails with ConfigErrc::invalid_identifier when nothing is left.
[[nodiscard]] std::expected<std::string, std::error_code>
sanitize_identifier(std::string_view identifier) noexcept;

// On-disk layout of one asset under <root>/<sanitised identifier>/. All side
// files are written atomically. The directory is created on first save and
// never deleted.
class AssetDir {
public:
    [[nodiscard]] static std::expected<AssetDir, std::error_code>
    open(const std::filesystem::path& root, std::string_view identifier) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] std::error_code create() const noexcept;

    [[nodiscard]] std::filesystem::path playlist_path() const;
    [[nodiscard]] std::filesystem::path manifest_path() const;
    [[nodiscard]] std::filesystem::path encryption_info_path() const;
    [[nodiscard]] std::filesystem::path key_path() const;
    [[nodiscard]] std::filesystem::path content_lengths_path() const;
    [[nodiscard]] std::filesystem::path segment_path(std::uint32_t index) const;

    // "segment_00042.ts"
    [[nodiscard]] static std::string segment_filename(std::uint32_t index);

    [[nodiscard]] std::error_code save_playlist(std::string_view text) const noexcept;
    [[nodiscard]] std::expected<std::string, std::error_code> load_playlist() const noexcept;

    // manifest.json carries the segment list only; encryption lives in its own file
    [[nodiscard]] std::error_code save_manifest(const media::SegmentManifest& manifest) const noexcept;
    [[nodiscard]] std::expected<media::SegmentManifest, std::error_code> load_manifest() const noexcept;

    [[nodiscard]] std::error_code
    save_encryption_info(const std::optional<media::EncryptionDescriptor>& desc) const noexcept;
    [[nodiscard]] std::expected<std::optional<media::EncryptionDescriptor>, std::error_code>
    load_encryption_info() const noexcept;

    [[nodiscard]] std::error_code save_key(std::span<const std::uint8_t> key) const noexcept;
    // Fails with corrupt_data unless the key is exactly 16 bytes
    [[nodiscard]] std::expected<std::vector<std::uint8_t>, std::error_code> load_key() const noexcept;

    [[nodiscard]] std::error_code save_content_lengths(const ContentLengths& lengths) const noexcept;
    [[nodiscard]] std::expected<ContentLengths, std::error_code> load_content_lengths() const noexcept;

    // Manifest plus encryption descriptor, as the fetch pipeline needs it
    [[nodiscard]] std::expected<media::SegmentManifest, std::error_code> load_full_manifest() const noexcept;

    // Playlist, manifest, encryption info and content-length index all
    // present and well-formed, and the key present when encrypted
    [[nodiscard]] bool has_metadata() const noexcept;

private:
    AssetDir() = default;

    std::filesystem::path path_;
    std::string name_;
};

} // namespace stitch::disk
