// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>

namespace stitch::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 32;
constexpr double DEFAULT_DELAY_SEC = 0.0;
constexpr std::uint32_t DEFAULT_MAX_RETRY_ROUNDS = 3;
constexpr std::string_view DEFAULT_ROOT = "movies";

constexpr double MAX_DELAY_SEC = 3600.0;                           // 1 hour between fetch starts
constexpr double MAX_COOLDOWN_SEC = 86400.0;                       // 1 day between batch tasks

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;                     // Abort below 1 B/s for this long
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                // 256 KB
constexpr std::size_t AES_KEY_SIZE = 16;

// Environment overrides, applied on top of the defaults by the CLI
constexpr const char* ENV_CONCURRENCY = "STITCH_CONCURRENCY";
constexpr const char* ENV_DELAY = "STITCH_DELAY";
constexpr const char* ENV_MAX_RETRY_ROUNDS = "STITCH_MAX_RETRY_ROUNDS";

// Runtime configuration. Built once per process and passed by value into
// each component; nothing reads it from global state.
struct DownloadConfig {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};    // Simultaneous in-flight fetches
    double delay_sec{DEFAULT_DELAY_SEC};               // Minimum spacing between fetch starts
    std::uint32_t max_retry_rounds{DEFAULT_MAX_RETRY_ROUNDS};
    bool probe_content_lengths{false};                 // HEAD segments during the metadata pass

    [[nodiscard]] std::error_code validate() const noexcept;

    [[nodiscard]] std::chrono::nanoseconds delay() const noexcept;

    // Apply STITCH_* environment variables on top of base
    [[nodiscard]] static std::expected<DownloadConfig, std::error_code>
    from_env(DownloadConfig base = DownloadConfig{DEFAULT_CONCURRENCY, DEFAULT_DELAY_SEC,
                                                  DEFAULT_MAX_RETRY_ROUNDS, false}) noexcept;
};

} // namespace stitch::core
