// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/core/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <mutex>
#include <vector>

namespace stitch::core {

namespace {

constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] [t%t] %v";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, console);
    log->set_pattern(LOG_PATTERN);
    log->set_level(spdlog::level::info);
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() noexcept {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        try {
            g_logger = make_console_logger();
        } catch (const spdlog::spdlog_ex&) {
            // Sink creation failed; fall back to a sink-less logger
            g_logger = std::make_shared<spdlog::logger>(LOGGER_NAME);
        }
    }
    return g_logger;
}

void init_logging(spdlog::level::level_enum level, const std::string& log_file) noexcept {
    std::vector<spdlog::sink_ptr> sinks;

    try {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!log_file.empty()) {
            std::filesystem::path p(log_file);
            if (p.has_parent_path()) {
                std::filesystem::create_directories(p.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        }
    } catch (const std::exception& e) {
        // Keep whatever sinks were created; report the file sink failure on them
        auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        log->set_pattern(LOG_PATTERN);
        log->set_level(level);
        log->warn("Failed to open log file '{}': {}", log_file, e.what());
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = std::move(log);
        return;
    }

    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    log->set_pattern(LOG_PATTERN);
    log->set_level(level);
    log->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(log);
}

} // namespace stitch::core
