// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace stitch::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    // RFC 3986 section 5.2 reference resolution against this URL. Handles
    // absolute ("https://h/x"), network-path ("//h/x"), root-relative ("/x")
    // and relative ("x", "../x") references, removing dot segments.
    [[nodiscard]] std::expected<Url, std::error_code> resolve(std::string_view reference) const noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& userinfo() const noexcept { return userinfo_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    // Rebuilt from components
    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://[userinfo@]host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    // Text this Url was parsed from, or full() for resolved URLs
    [[nodiscard]] const std::string& str() const noexcept { return str_; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    bool has_query_{false};
    bool has_fragment_{false};
};

// RFC 3986 section 5.2.4
[[nodiscard]] std::string remove_dot_segments(std::string_view path);

} // namespace stitch::core
