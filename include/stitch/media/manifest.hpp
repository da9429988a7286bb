// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stitch::media {

using AesBlock = std::array<std::uint8_t, 16>;

// EXT-X-BYTERANGE sub-range of a segment resource
struct ByteRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};

    bool operator==(const ByteRange&) const = default;
};

// One playlist entry. index is playback order and on-disk naming order.
struct SegmentRef {
    std::uint32_t index{0};
    std::string uri;                        // Absolute, already resolved
    std::optional<ByteRange> byte_range;

    bool operator==(const SegmentRef&) const = default;
};

enum class EncryptionMethod : std::uint8_t {
    none,
    aes_128,
};

// Single-key stream encryption (EXT-X-KEY)
struct EncryptionDescriptor {
    EncryptionMethod method{EncryptionMethod::none};
    std::string key_uri;                    // Absolute, already resolved
    std::optional<AesBlock> iv;             // Explicit IV, else derived from sequence number
    std::string keyformat;
    std::string keyformatversions;

    bool operator==(const EncryptionDescriptor&) const = default;
};

// Parsed, resolved playlist
struct SegmentManifest {
    std::string source_url;
    std::uint64_t media_sequence{0};
    std::vector<SegmentRef> segments;
    std::optional<EncryptionDescriptor> encryption;

    [[nodiscard]] bool is_encrypted() const noexcept {
        return encryption && encryption->method != EncryptionMethod::none;
    }

    // IV used to decrypt segment `index`: the explicit IV if the key line has
    // one, otherwise the big-endian 128-bit media sequence number.
    [[nodiscard]] AesBlock segment_iv(std::uint32_t index) const noexcept;

    [[nodiscard]] std::vector<std::string> uris() const;
};

[[nodiscard]] std::string_view to_string(EncryptionMethod method) noexcept;

// "0x" followed by 32 hex digits
[[nodiscard]] std::optional<AesBlock> parse_iv(std::string_view text) noexcept;
[[nodiscard]] std::string format_iv(const AesBlock& iv);

} // namespace stitch::media
