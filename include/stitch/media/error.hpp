// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace stitch::media {

enum class ParseErrc {
    success = 0,
    empty,                      // No segments found by either strategy
    unresolvable_uri,           // A reference line cannot be resolved against the base URI
    unsupported_encryption,     // EXT-X-KEY method other than NONE/AES-128, or key rotation
    malformed,                  // Grammar violation (structured strategy only)
};

namespace detail {

struct ParseErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "stitch::parse";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ParseErrc>(ev)) {
            case ParseErrc::success:                return "Success";
            case ParseErrc::empty:                  return "Playlist contains no segments";
            case ParseErrc::unresolvable_uri:       return "Playlist reference cannot be resolved";
            case ParseErrc::unsupported_encryption: return "Unsupported playlist encryption";
            case ParseErrc::malformed:              return "Malformed playlist";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ParseErrcCategory& parse_errc_category() noexcept {
    static detail::ParseErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ParseErrc e) noexcept {
    return {static_cast<int>(e), parse_errc_category()};
}

} // namespace stitch::media

namespace std {

template<>
struct is_error_code_enum<stitch::media::ParseErrc> : true_type {};

} // namespace std
