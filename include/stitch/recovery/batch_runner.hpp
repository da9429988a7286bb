// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/recovery/recovery_coordinator.hpp>
#include <stitch/recovery/task_source.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <stop_token>

namespace stitch::recovery {

struct BatchConfig {
    std::chrono::milliseconds cooldown{0};      // Pause between tasks
    std::size_t limit{0};                       // Max tasks per run, 0 for all
};

struct BatchStats {
    std::uint32_t processed{0};
    std::uint32_t completed{0};
    std::uint32_t failed{0};
    std::uint32_t rounds_used{0};               // Sum over all tasks
    std::uint64_t total_bytes{0};               // Bytes in complete assets
};

// Runs the coordinator over a task source's pending tasks, one at a time
class BatchRunner {
public:
    BatchRunner(RecoveryCoordinator& coordinator, TaskSource& source, BatchConfig config = {}) noexcept
        : coordinator_(coordinator), source_(source), config_(config) {}

    // One sweep over the currently pending tasks. Stop is checked between
    // tasks; the task in progress sees the same token.
    [[nodiscard]] std::expected<BatchStats, std::error_code> run_once(std::stop_token stop = {}) noexcept;

    [[nodiscard]] const BatchStats& stats() const noexcept { return stats_; }

private:
    RecoveryCoordinator& coordinator_;
    TaskSource& source_;
    BatchConfig config_;
    BatchStats stats_;
};

} // namespace stitch::recovery
