// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/cli/commands.hpp>
#include <stitch/cli/progress_bar.hpp>
#include <stitch/core/http_session.hpp>
#include <stitch/core/log.hpp>
#include <stitch/disk/asset_dir.hpp>
#include <stitch/recovery/batch_runner.hpp>
#include <stitch/recovery/json_task_source.hpp>
#include <stitch/recovery/recovery_coordinator.hpp>
#include <stitch/recovery/validator.hpp>
#include <stitch/version.hpp>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace stitch::cli {

using namespace stitch::recovery;

namespace {

constexpr int EXIT_INCOMPLETE = 1;
constexpr int EXIT_USAGE = 2;

bool parse_u32(const char* text, std::uint32_t& out) noexcept {
    if (!text || *text == '\0' || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long val = std::strtoul(text, &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || val > UINT32_MAX) return false;
    out = static_cast<std::uint32_t>(val);
    return true;
}

bool parse_seconds(const char* text, double& out) noexcept {
    if (!text || *text == '\0') return false;
    char* end = nullptr;
    errno = 0;
    double val = std::strtod(text, &end);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    out = val;
    return true;
}

void print_result(const std::string& identifier, const RecoveryResult& result) {
    std::cout << identifier << ": " << to_string(result.terminal_reason)
              << " (" << result.last_report.present_count << "/" << result.last_report.expected_count
              << " segments, " << ProgressBar::format_bytes(result.last_report.total_size)
              << ", " << result.rounds_used << " retry round(s)";
    if (!result.retry_history.empty()) {
        std::cout << ", retried";
        for (auto n : result.retry_history) {
            std::cout << " " << n;
        }
    }
    std::cout << ")" << std::endl;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto fail = [&](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> const char* {
                if (i + 1 < argc) return argv[++i];
                fail("Missing value for " + arg);
                return nullptr;
            };

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }

            if (arg == "-V" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "-q" || arg == "--quiet") {
                args.quiet = true;
            } else if (arg == "-r" || arg == "--root") {
                if (auto v = next()) args.root = v;
            } else if (arg == "-c" || arg == "--concurrency") {
                std::uint32_t n = 0;
                if (auto v = next()) {
                    if (parse_u32(v, n)) args.concurrency = n;
                    else fail("Invalid concurrency: " + std::string(v));
                }
            } else if (arg == "-d" || arg == "--delay") {
                double d = 0.0;
                if (auto v = next()) {
                    if (parse_seconds(v, d)) args.delay_sec = d;
                    else fail("Invalid delay: " + std::string(v));
                }
            } else if (arg == "-m" || arg == "--max-retry-rounds") {
                std::uint32_t n = 0;
                if (auto v = next()) {
                    if (parse_u32(v, n)) args.max_retry_rounds = n;
                    else fail("Invalid retry rounds: " + std::string(v));
                }
            } else if (arg == "--probe") {
                args.probe = true;
            } else if (arg == "--cooldown") {
                if (auto v = next()) {
                    double c = 0.0;
                    if (parse_seconds(v, c) && std::isfinite(c) && c >= 0.0 && c <= core::MAX_COOLDOWN_SEC) {
                        args.cooldown_sec = c;
                    } else {
                        fail("Invalid cooldown: " + std::string(v));
                    }
                }
            } else if (arg == "--limit") {
                std::uint32_t n = 0;
                if (auto v = next()) {
                    if (parse_u32(v, n)) args.limit = n;
                    else fail("Invalid limit: " + std::string(v));
                }
            } else if (arg == "--add") {
                auto id = next();
                auto url = id ? next() : nullptr;
                if (id && url) args.add.emplace_back(id, url);
            } else if (arg == "--log-file") {
                if (auto v = next()) args.log_file = v;
            } else if (arg.starts_with("-")) {
                fail("Unknown option: " + arg);
            } else if (args.command == Command::none) {
                if (arg == "fetch") args.command = Command::fetch;
                else if (arg == "validate") args.command = Command::validate;
                else if (arg == "batch") args.command = Command::batch;
                else fail("Unknown command: " + arg);
            } else {
                args.positional.push_back(arg);
            }
        }
    } catch (const std::bad_alloc&) {
        args.error = "Out of memory";
    }

    return args;
}

std::expected<core::DownloadConfig, std::error_code> build_config(const CliArgs& args) noexcept {
    auto config = core::DownloadConfig::from_env();
    if (!config) {
        return config;
    }

    if (args.concurrency) config->concurrency = *args.concurrency;
    if (args.delay_sec) config->delay_sec = *args.delay_sec;
    if (args.max_retry_rounds) config->max_retry_rounds = *args.max_retry_rounds;
    if (args.probe) config->probe_content_lengths = true;

    if (auto ec = config->validate()) {
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult fetch(const CliArgs& args, std::stop_token stop) noexcept {
    if (args.positional.size() != 2) {
        std::cerr << "Error: fetch needs <identifier> <url>" << std::endl;
        return EXIT_USAGE;
    }
    const auto& identifier = args.positional[0];
    const auto& url = args.positional[1];

    auto config = build_config(args);
    if (!config) {
        std::cerr << "Error: " << config.error().message() << std::endl;
        return std::unexpected(config.error());
    }

    try {
        core::HttpSession session;
        session.user_agent(version.user_agent());

        RecoveryCoordinator coordinator(session, *config, args.root);

        PassProgress progress;
        if (!args.quiet) {
            coordinator.pass_observer([&](std::size_t total) { progress.start(total); });
            coordinator.observer([&](const FetchOutcome& o, std::size_t, std::size_t) {
                progress.on_outcome(o);
            });
        }

        auto result = coordinator.recover(identifier, url, stop);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << std::endl;
            return std::unexpected(result.error());
        }

        print_result(identifier, *result);
        return result->is_complete ? 0 : EXIT_INCOMPLETE;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

CliResult validate(const CliArgs& args) noexcept {
    if (args.positional.size() != 1) {
        std::cerr << "Error: validate needs <identifier>" << std::endl;
        return EXIT_USAGE;
    }

    auto dir = disk::AssetDir::open(args.root, args.positional[0]);
    if (!dir) {
        std::cerr << "Error: " << dir.error().message() << std::endl;
        return std::unexpected(dir.error());
    }

    try {
        auto report = Validator::validate(*dir);
        print_report(report, *dir);

        std::cout << dir->name() << ": " << (report.is_complete() ? "complete" : "incomplete")
                  << " (" << report.present_count << "/" << report.expected_count << " segments, "
                  << report.missing.size() << " missing, " << report.empty.size() << " empty)"
                  << std::endl;
        return report.is_complete() ? 0 : EXIT_INCOMPLETE;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

CliResult batch(const CliArgs& args, std::stop_token stop) noexcept {
    if (args.positional.size() != 1) {
        std::cerr << "Error: batch needs <tasks.json>" << std::endl;
        return EXIT_USAGE;
    }

    auto config = build_config(args);
    if (!config) {
        std::cerr << "Error: " << config.error().message() << std::endl;
        return std::unexpected(config.error());
    }

    auto source = JsonTaskSource::open(args.positional[0]);
    if (!source) {
        std::cerr << "Error: cannot read " << args.positional[0] << ": "
                  << source.error().message() << std::endl;
        return std::unexpected(source.error());
    }

    for (const auto& [id, url] : args.add) {
        if (auto ec = source->add(id, url)) {
            std::cerr << "Error: cannot add " << id << ": " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
    }

    try {
        core::HttpSession session;
        session.user_agent(version.user_agent());

        RecoveryCoordinator coordinator(session, *config, args.root);

        PassProgress progress;
        if (!args.quiet) {
            coordinator.pass_observer([&](std::size_t total) { progress.start(total); });
            coordinator.observer([&](const FetchOutcome& o, std::size_t, std::size_t) {
                progress.on_outcome(o);
            });
        }

        BatchConfig batch_config;
        batch_config.cooldown = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(args.cooldown_sec));
        batch_config.limit = args.limit;

        BatchRunner runner(coordinator, *source, batch_config);
        auto stats = runner.run_once(stop);
        if (!stats) {
            return std::unexpected(stats.error());
        }

        std::cout << "Processed " << stats->processed << ": " << stats->completed << " complete, "
                  << stats->failed << " failed, "
                  << ProgressBar::format_bytes(stats->total_bytes) << std::endl;
        return stats->failed == 0 ? 0 : EXIT_INCOMPLETE;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "stitch " << version.to_string() << " - HLS asset retrieval with bounded recovery\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " fetch <IDENTIFIER> <URL> [OPTIONS]\n";
    std::cout << "  " << program_name << " validate <IDENTIFIER> [OPTIONS]\n";
    std::cout << "  " << program_name << " batch <TASKS.json> [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                    Show this help message\n";
    std::cout << "  -v, --version                 Show version information\n";
    std::cout << "  -V, --verbose                 Debug logging\n";
    std::cout << "  -q, --quiet                   Warnings only, no progress bar\n";
    std::cout << "  -r, --root <DIR>              Asset root directory (default: " << core::DEFAULT_ROOT << ")\n";
    std::cout << "  -c, --concurrency <N>         Parallel segment fetches (default: " << core::DEFAULT_CONCURRENCY << ")\n";
    std::cout << "  -d, --delay <SEC>             Minimum spacing between fetch starts (default: 0)\n";
    std::cout << "  -m, --max-retry-rounds <N>    Retry rounds per asset (default: " << core::DEFAULT_MAX_RETRY_ROUNDS << ")\n";
    std::cout << "      --probe                   HEAD segments for expected sizes\n";
    std::cout << "      --log-file <FILE>         Also log to FILE\n";
    std::cout << "\n";
    std::cout << "BATCH OPTIONS:\n";
    std::cout << "      --add <ID> <URL>          Queue a task before running\n";
    std::cout << "      --cooldown <SEC>          Pause between tasks\n";
    std::cout << "      --limit <N>               Process at most N tasks\n";
    std::cout << "\n";
    std::cout << "ENVIRONMENT:\n";
    std::cout << "  " << core::ENV_CONCURRENCY << ", " << core::ENV_DELAY << ", "
              << core::ENV_MAX_RETRY_ROUNDS << " override the defaults\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " fetch movie42 https://example.com/hls/index.m3u8\n";
    std::cout << "  " << program_name << " batch tasks.json --add movie43 https://example.com/b.m3u8\n";
}

void print_version() noexcept {
    std::cout << "stitch " << version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL, spdlog, nlohmann/json\n";
}

} // namespace stitch::cli
