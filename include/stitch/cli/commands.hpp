// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace stitch::cli {

// Exit code on success, or the error that stopped the command
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    fetch,      // fetch <identifier> <url>
    validate,   // validate <identifier>
    batch,      // batch <tasks.json>
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> positional;
    std::string root{core::DEFAULT_ROOT};
    std::optional<std::uint32_t> concurrency;
    std::optional<double> delay_sec;
    std::optional<std::uint32_t> max_retry_rounds;
    bool probe{false};
    double cooldown_sec{0.0};
    std::size_t limit{0};
    std::vector<std::pair<std::string, std::string>> add;   // batch --add <id> <url>
    std::string log_file;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                                      // First bad argument, if any
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Defaults, then STITCH_* environment, then flags
[[nodiscard]] std::expected<core::DownloadConfig, std::error_code>
build_config(const CliArgs& args) noexcept;

// Recover one asset
[[nodiscard]] CliResult fetch(const CliArgs& args, std::stop_token stop) noexcept;

// Print the validation report of one asset without touching the network
[[nodiscard]] CliResult validate(const CliArgs& args) noexcept;

// Recover every pending task of a JSON task file
[[nodiscard]] CliResult batch(const CliArgs& args, std::stop_token stop) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace stitch::cli
