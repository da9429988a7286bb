// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace stitch::core {

namespace {

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ), terminated by ':'
// before any '/', '?' or '#'
bool has_scheme(std::string_view ref) noexcept {
    auto colon = ref.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    auto delim = ref.find_first_of("/?#");
    if (delim != std::string_view::npos && delim < colon) return false;
    if (!std::isalpha(static_cast<unsigned char>(ref[0]))) return false;
    for (std::size_t i = 1; i < colon; ++i) {
        auto c = static_cast<unsigned char>(ref[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

// Drop the last "/segment" from output (RFC 3986 5.2.4 step 2C)
void pop_segment(std::string& output) {
    auto last = output.rfind('/');
    if (last == std::string::npos) {
        output.clear();
    } else {
        output.erase(last);
    }
}

} // namespace

std::string remove_dot_segments(std::string_view path) {
    std::string input(path);
    std::string output;
    output.reserve(input.size());

    while (!input.empty()) {
        if (input.starts_with("../")) {
            input.erase(0, 3);
        } else if (input.starts_with("./")) {
            input.erase(0, 2);
        } else if (input.starts_with("/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (input.starts_with("/../")) {
            input.erase(0, 3);
            pop_segment(output);
        } else if (input == "/..") {
            input = "/";
            pop_segment(output);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            // Move the first segment (with its leading '/') to output
            auto next = input.find('/', input.front() == '/' ? 1 : 0);
            if (next == std::string::npos) next = input.size();
            output.append(input, 0, next);
            input.erase(0, next);
        }
    }

    return output;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        // Parse scheme
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || !has_scheme(url_str)) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        // Convert scheme to lowercase and store
        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) {
            path_start = url_str.length();
        }

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) {
            query_start = url_str.length();
        }

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) {
            fragment_start = url_str.length();
        }
        query_start = std::min(query_start, fragment_start);
        path_start = std::min(path_start, query_start);

        // host_end is at the first of: /, ?, #, or end
        auto host_end = path_start;

        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            url.userinfo_ = std::string(url_str.substr(rest_start, at_pos - rest_start));
            authority_start = at_pos + 1;
        }

        // Handle IPv6 address in brackets [::1]:port
        auto bracket_start = url_str.find('[', authority_start);
        if (bracket_start != std::string_view::npos && bracket_start < host_end) {
            auto bracket_end = url_str.find(']', bracket_start);
            if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
                return std::unexpected(make_error_code(FetchErrc::invalid_url));
            }
            url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
            auto ipv6_colon = url_str.find(':', bracket_end);
            if (ipv6_colon != std::string_view::npos && ipv6_colon < host_end) {
                url.port_ = std::string(url_str.substr(ipv6_colon + 1, host_end - ipv6_colon - 1));
            }
        } else {
            auto colon_pos = url_str.find(':', authority_start);
            if (colon_pos != std::string_view::npos && colon_pos < host_end) {
                url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
                url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
            } else {
                url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
            }
        }

        if (!url.port_.empty() &&
            !std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        // Extract path (if present)
        if (path_start < query_start) {
            url.path_ = std::string(url_str.substr(path_start, query_start - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < fragment_start) {
            url.has_query_ = true;
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.has_fragment_ = true;
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        url.str_ = std::string(url_str);
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }
}

std::expected<Url, std::error_code> Url::resolve(std::string_view reference) const noexcept {
    if (has_scheme(reference)) {
        return Url::parse(reference);
    }
    if (reference.starts_with("//")) {
        return Url::parse(scheme_ + ":" + std::string(reference));
    }

    try {
        // Split reference into path / query / fragment
        std::string_view ref_path = reference;
        std::string_view ref_query;
        std::string_view ref_fragment;
        bool ref_has_query = false;
        bool ref_has_fragment = false;

        auto hash = ref_path.find('#');
        if (hash != std::string_view::npos) {
            ref_fragment = ref_path.substr(hash + 1);
            ref_path = ref_path.substr(0, hash);
            ref_has_fragment = true;
        }
        auto qmark = ref_path.find('?');
        if (qmark != std::string_view::npos) {
            ref_query = ref_path.substr(qmark + 1);
            ref_path = ref_path.substr(0, qmark);
            ref_has_query = true;
        }

        Url target;
        target.scheme_ = scheme_;
        target.userinfo_ = userinfo_;
        target.host_ = host_;
        target.port_ = port_;

        if (ref_path.empty()) {
            target.path_ = path_;
            if (ref_has_query) {
                target.query_ = std::string(ref_query);
                target.has_query_ = true;
            } else {
                target.query_ = query_;
                target.has_query_ = has_query_;
            }
        } else {
            if (ref_path.front() == '/') {
                target.path_ = remove_dot_segments(ref_path);
            } else {
                // Merge with the base path's directory (RFC 3986 5.2.3)
                std::string merged;
                auto last_slash = path_.rfind('/');
                if (last_slash == std::string::npos) {
                    merged = "/";
                } else {
                    merged = path_.substr(0, last_slash + 1);
                }
                merged += ref_path;
                target.path_ = remove_dot_segments(merged);
            }
            target.query_ = std::string(ref_query);
            target.has_query_ = ref_has_query;
        }

        target.fragment_ = std::string(ref_fragment);
        target.has_fragment_ = ref_has_fragment;

        if (target.path_.empty()) {
            target.path_ = "/";
        }
        target.str_ = target.full();
        return target;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (has_query_) {
        result += "?";
        result += query_;
    }
    if (has_fragment_) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_;
    }
    return path_.substr(last_slash + 1);
}

} // namespace stitch::core
