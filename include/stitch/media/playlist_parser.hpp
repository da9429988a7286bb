// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/media/error.hpp>
#include <stitch/media/manifest.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace stitch::media {

// HLS media playlist parser. Two strategies share one signature: a structured
// parser of the playlist grammar, and a tolerant line scan that is used when
// the structured parser fails or finds no segments.
class PlaylistParser {
public:
    // Structured parse, falling back to the line scan
    [[nodiscard]] static std::expected<SegmentManifest, std::error_code>
    parse(std::string_view content, std::string_view base_url) noexcept;

    // Requires #EXTM3U and an #EXTINF before every URI line. Understands
    // EXT-X-BYTERANGE, EXT-X-MEDIA-SEQUENCE and EXT-X-KEY attribute lists.
    [[nodiscard]] static std::expected<SegmentManifest, std::error_code>
    parse_structured(std::string_view content, std::string_view base_url) noexcept;

    // Every non-empty line not starting with '#' is a segment URI. Key and
    // media sequence tags are still recognised.
    [[nodiscard]] static std::expected<SegmentManifest, std::error_code>
    parse_lines(std::string_view content, std::string_view base_url) noexcept;

    // Check if URL looks like an HLS playlist
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;
};

// String-only reference resolution used by the line scan. Produces the same
// text as core::Url::resolve for http(s) bases; nullopt if base has no
// authority.
[[nodiscard]] std::optional<std::string>
resolve_reference(std::string_view base, std::string_view reference);

} // namespace stitch::media
