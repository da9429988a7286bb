// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/core/http_client.hpp>

namespace stitch::core {

std::expected<std::string, std::error_code>
fetch_body(HttpClient& client, const std::string& url) noexcept {
    std::string body;
    bool overflow = false;

    auto response = client.get(url, [&](const std::byte* data, std::size_t size) {
        try {
            body.append(reinterpret_cast<const char*>(data), size);
        } catch (const std::bad_alloc&) {
            overflow = true;
            return false;
        }
        return true;
    });

    if (overflow) {
        return std::unexpected(make_error_code(FetchErrc::write_failed));
    }
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->content_length && *response->content_length != body.size()) {
        return std::unexpected(make_error_code(FetchErrc::size_mismatch));
    }
    return body;
}

} // namespace stitch::core
