// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/core/http_client.hpp>
#include <string>
#include <utility>

namespace stitch::core {

// libcurl-backed HttpClient. Every request uses its own easy handle, so one
// session can be shared by all fetch workers.
class HttpSession final : public HttpClient {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const BodySink& sink,
        std::uint64_t offset = 0,
        std::uint64_t size = 0) noexcept override;

    // User-Agent for every request; libcurl sends none when empty
    void user_agent(std::string ua) noexcept { user_agent_ = std::move(ua); }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::string user_agent_;
};

} // namespace stitch::core
