// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/core/config.hpp>
#include <stitch/core/error.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace stitch::core {

namespace {

bool parse_unsigned(const char* text, std::uint32_t& out) noexcept {
    if (!text || *text == '\0' || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long val = std::strtoul(text, &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || val > UINT32_MAX) {
        return false;
    }
    out = static_cast<std::uint32_t>(val);
    return true;
}

bool parse_double(const char* text, double& out) noexcept {
    if (!text || *text == '\0') return false;
    char* end = nullptr;
    errno = 0;
    double val = std::strtod(text, &end);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = val;
    return true;
}

} // namespace

std::error_code DownloadConfig::validate() const noexcept {
    if (concurrency == 0) {
        return make_error_code(ConfigErrc::invalid_concurrency);
    }
    if (!std::isfinite(delay_sec) || delay_sec < 0.0 || delay_sec > MAX_DELAY_SEC) {
        return make_error_code(ConfigErrc::invalid_delay);
    }
    return {};
}

std::chrono::nanoseconds DownloadConfig::delay() const noexcept {
    if (!(delay_sec > 0.0)) {
        return std::chrono::nanoseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(std::min(delay_sec, MAX_DELAY_SEC)));
}

std::expected<DownloadConfig, std::error_code>
DownloadConfig::from_env(DownloadConfig base) noexcept {
    if (const char* v = std::getenv(ENV_CONCURRENCY)) {
        if (!parse_unsigned(v, base.concurrency)) {
            return std::unexpected(make_error_code(ConfigErrc::invalid_concurrency));
        }
    }
    if (const char* v = std::getenv(ENV_DELAY)) {
        if (!parse_double(v, base.delay_sec)) {
            return std::unexpected(make_error_code(ConfigErrc::invalid_delay));
        }
    }
    if (const char* v = std::getenv(ENV_MAX_RETRY_ROUNDS)) {
        if (!parse_unsigned(v, base.max_retry_rounds)) {
            return std::unexpected(make_error_code(ConfigErrc::invalid_retry_rounds));
        }
    }

    if (auto ec = base.validate()) {
        return std::unexpected(ec);
    }
    return base;
}

} // namespace stitch::core
