// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/recovery/recovery_coordinator.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace stitch::recovery {

enum class TaskStatus : std::uint8_t {
    pending,
    complete,
    failed,
};

[[nodiscard]] const char* to_string(TaskStatus status) noexcept;
[[nodiscard]] std::optional<TaskStatus> task_status_from_string(std::string_view text) noexcept;

struct Task {
    std::string identifier;
    std::string url;
    TaskStatus status{TaskStatus::pending};
    std::string updated_at;                         // ISO 8601 UTC, empty if never updated
    std::uint32_t rounds_used{0};
    std::optional<TerminalReason> terminal_reason;
};

// Supplies assets to recover and records how each one ended. Storage is the
// implementation's business; callers serialise access per identifier.
class TaskSource {
public:
    virtual ~TaskSource() = default;

    [[nodiscard]] virtual std::expected<std::vector<Task>, std::error_code> list_pending() noexcept = 0;

    // complete if result.is_complete, failed otherwise
    [[nodiscard]] virtual std::error_code
    mark_result(std::string_view identifier, const RecoveryResult& result) noexcept = 0;
};

} // namespace stitch::recovery
