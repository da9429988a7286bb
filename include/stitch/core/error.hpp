// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace stitch::core {

// Per-request failures. Never surfaced past the recovery coordinator on their
// own; they end up as FAILED fetch outcomes or as a metadata error.
enum class FetchErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    http_error,
    permission_denied,
    invalid_url,
    invalid_range,
    size_mismatch,
    empty_response,
    decrypt_failed,
    key_unavailable,
    write_failed,
    cancelled,
    too_many_redirects,
    ssl_error,
    dns_error,
    connection_lost,
};

enum class ConfigErrc {
    success = 0,
    invalid_concurrency,
    invalid_delay,
    invalid_retry_rounds,
    invalid_identifier,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "stitch::fetch";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:              return "Success";
            case FetchErrc::network_error:        return "Network error";
            case FetchErrc::timeout:              return "Operation timed out";
            case FetchErrc::not_found:            return "Resource not found (404)";
            case FetchErrc::server_error:         return "Server error (5xx)";
            case FetchErrc::http_error:           return "Unexpected HTTP status";
            case FetchErrc::permission_denied:    return "Access denied (401/403)";
            case FetchErrc::invalid_url:          return "Invalid URL";
            case FetchErrc::invalid_range:        return "Invalid byte range";
            case FetchErrc::size_mismatch:        return "Size does not match expected length";
            case FetchErrc::empty_response:       return "Empty response body";
            case FetchErrc::decrypt_failed:       return "Segment decryption failed";
            case FetchErrc::key_unavailable:      return "Encryption key unavailable";
            case FetchErrc::write_failed:         return "Failed to write segment";
            case FetchErrc::cancelled:            return "Fetch cancelled";
            case FetchErrc::too_many_redirects:   return "Too many redirects";
            case FetchErrc::ssl_error:            return "SSL/TLS error";
            case FetchErrc::dns_error:            return "DNS resolution failed";
            case FetchErrc::connection_lost:      return "Connection lost";
            default:                              return "Unknown error";
        }
    }
};

struct ConfigErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "stitch::config";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ConfigErrc>(ev)) {
            case ConfigErrc::success:              return "Success";
            case ConfigErrc::invalid_concurrency:  return "Concurrency must be greater than zero";
            case ConfigErrc::invalid_delay:        return "Delay must be a non-negative number of seconds";
            case ConfigErrc::invalid_retry_rounds: return "Retry rounds must be a non-negative integer";
            case ConfigErrc::invalid_identifier:   return "Invalid asset identifier";
            default:                               return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline const detail::ConfigErrcCategory& config_errc_category() noexcept {
    static detail::ConfigErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

inline std::error_code make_error_code(ConfigErrc e) noexcept {
    return {static_cast<int>(e), config_errc_category()};
}

} // namespace stitch::core

namespace std {

template<>
struct is_error_code_enum<stitch::core::FetchErrc> : true_type {};

template<>
struct is_error_code_enum<stitch::core::ConfigErrc> : true_type {};

} // namespace std
