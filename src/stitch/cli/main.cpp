// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/cli/commands.hpp>
#include <stitch/core/http_session.hpp>
#include <stitch/core/log.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace stitch::cli;

namespace {

std::atomic<int> g_interrupts{0};
static_assert(std::atomic<int>::is_always_lock_free);

// First Ctrl+C asks for a graceful stop, the second exits at once
extern "C" void on_interrupt(int) {
    if (g_interrupts.fetch_add(1) >= 1) {
        std::_Exit(130);
    }
}

// Terminate handler to report exceptions escaping noexcept functions
void stitch_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(stitch_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }
    if (args.command == Command::none) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    auto level = args.verbose ? spdlog::level::debug
               : args.quiet   ? spdlog::level::warn
                              : spdlog::level::info;
    stitch::core::init_logging(level, args.log_file);

    std::stop_source stop;
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    // Signal handlers may only touch the atomic; this thread turns it into a stop request
    std::jthread watcher([&stop](std::stop_token self) {
        while (!self.stop_requested()) {
            if (g_interrupts.load() > 0 && !stop.stop_requested()) {
                stitch::core::logger()->warn("Interrupted, finishing current pass (Ctrl+C again to quit)");
                stop.request_stop();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    stitch::core::HttpSession::global_init();

    CliResult result = 2;
    switch (args.command) {
        case Command::fetch:    result = fetch(args, stop.get_token()); break;
        case Command::validate: result = validate(args); break;
        case Command::batch:    result = batch(args, stop.get_token()); break;
        case Command::none:     break;
    }

    stitch::core::HttpSession::global_cleanup();

    watcher.request_stop();
    watcher.join();

    if (!result) {
        return 1;
    }
    return *result;
}
