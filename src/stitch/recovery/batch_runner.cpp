// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/recovery/batch_runner.hpp>
#include <stitch/core/log.hpp>
#include <condition_variable>
#include <mutex>

namespace stitch::recovery {

using core::logger;

namespace {

// Sleep for d unless stop is requested first
void cooldown(std::chrono::milliseconds d, std::stop_token stop) {
    if (d.count() <= 0) return;
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, d, [] { return false; });
}

} // namespace

std::expected<BatchStats, std::error_code> BatchRunner::run_once(std::stop_token stop) noexcept {
    auto pending = source_.list_pending();
    if (!pending) {
        logger()->error("Cannot list pending tasks: {}", pending.error().message());
        return std::unexpected(pending.error());
    }

    BatchStats run;
    logger()->info("{} pending task(s)", pending->size());

    try {
        for (std::size_t i = 0; i < pending->size(); ++i) {
            if (stop.stop_requested()) {
                logger()->warn("Batch stopped, {} task(s) left pending", pending->size() - i);
                break;
            }
            if (config_.limit > 0 && run.processed >= config_.limit) {
                break;
            }
            if (i > 0) {
                cooldown(config_.cooldown, stop);
                if (stop.stop_requested()) {
                    continue;  // Reported at the top of the loop
                }
            }

            const auto& task = (*pending)[i];
            logger()->info("[{}/{}] {}", i + 1, pending->size(), task.identifier);

            RecoveryResult result;
            auto recovered = coordinator_.recover(task.identifier, task.url, stop);
            if (recovered) {
                result = std::move(*recovered);
            } else {
                logger()->error("Task {} rejected: {}", task.identifier, recovered.error().message());
            }

            // A stopped task stays pending for the next run
            if (result.terminal_reason == TerminalReason::cancelled) {
                continue;
            }

            ++run.processed;
            run.rounds_used += result.rounds_used;
            if (result.is_complete) {
                ++run.completed;
                run.total_bytes += result.last_report.total_size;
            } else {
                ++run.failed;
            }

            if (auto ec = source_.mark_result(task.identifier, result)) {
                logger()->error("Failed to record result for {}: {}", task.identifier, ec.message());
            }
        }
    } catch (const std::bad_alloc&) {
        logger()->error("Batch aborted: out of memory");
    }

    stats_.processed += run.processed;
    stats_.completed += run.completed;
    stats_.failed += run.failed;
    stats_.rounds_used += run.rounds_used;
    stats_.total_bytes += run.total_bytes;

    logger()->info("Batch done: {} processed, {} complete, {} failed",
                   run.processed, run.completed, run.failed);
    return run;
}

} // namespace stitch::recovery
