// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace stitch::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;     // Lower-cased names
    std::optional<std::uint64_t> content_length;    // Declared Content-Length, if any
    std::string content_type;
    std::uint64_t body_bytes{0};                    // Bytes delivered to the sink
};

// Receives the response body in chunks. Returning false aborts the transfer.
using BodySink = std::function<bool(const std::byte* data, std::size_t size)>;

// Network seam for everything the recovery core fetches. Implementations must
// be safe to call from several fetch workers at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // HEAD request; fails on transport errors and non-2xx statuses
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // GET request streaming the body into sink. size > 0 requests the byte
    // range [offset, offset + size). Non-2xx statuses are errors and deliver
    // no body.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const BodySink& sink,
        std::uint64_t offset = 0,
        std::uint64_t size = 0) noexcept = 0;
};

// GET url and collect the whole body
[[nodiscard]] std::expected<std::string, std::error_code>
fetch_body(HttpClient& client, const std::string& url) noexcept;

} // namespace stitch::core
