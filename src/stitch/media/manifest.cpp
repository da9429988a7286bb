// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/media/manifest.hpp>
#include <cctype>

namespace stitch::media {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

AesBlock SegmentManifest::segment_iv(std::uint32_t index) const noexcept {
    if (encryption && encryption->iv) {
        return *encryption->iv;
    }

    AesBlock iv{};
    std::uint64_t sequence = media_sequence + index;
    for (int i = 15; i >= 8; --i) {
        iv[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(sequence & 0xFF);
        sequence >>= 8;
    }
    return iv;
}

std::vector<std::string> SegmentManifest::uris() const {
    std::vector<std::string> result;
    result.reserve(segments.size());
    for (const auto& seg : segments) {
        result.push_back(seg.uri);
    }
    return result;
}

std::string_view to_string(EncryptionMethod method) noexcept {
    switch (method) {
        case EncryptionMethod::none:    return "NONE";
        case EncryptionMethod::aes_128: return "AES-128";
    }
    return "NONE";
}

std::optional<AesBlock> parse_iv(std::string_view text) noexcept {
    if (text.size() != 34 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }

    AesBlock iv{};
    for (std::size_t i = 0; i < iv.size(); ++i) {
        int hi = hex_value(text[2 + i * 2]);
        int lo = hex_value(text[3 + i * 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        iv[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return iv;
}

std::string format_iv(const AesBlock& iv) {
    constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(34);
    for (auto b : iv) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

} // namespace stitch::media
