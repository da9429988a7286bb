// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace stitch::core {

constexpr const char* LOGGER_NAME = "stitch";

// Shared "stitch" logger. Created with a console sink on first use if
// init_logging() has not been called.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger() noexcept;

// Replace the "stitch" logger: colour console sink, plus an append-mode file
// sink when log_file is non-empty.
void init_logging(spdlog::level::level_enum level,
                  const std::string& log_file = {}) noexcept;

} // namespace stitch::core
