// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/recovery/task_source.hpp>
#include <filesystem>

namespace stitch::recovery {

// Task list kept in a JSON array file:
//   [{"identifier", "url", "status", "updated_at", "rounds_used", "terminal_reason"}]
// The whole file is rewritten atomically on every change.
class JsonTaskSource final : public TaskSource {
public:
    // Missing file gives an empty task list
    [[nodiscard]] static std::expected<JsonTaskSource, std::error_code>
    open(std::filesystem::path path) noexcept;

    [[nodiscard]] std::expected<std::vector<Task>, std::error_code> list_pending() noexcept override;

    [[nodiscard]] std::error_code
    mark_result(std::string_view identifier, const RecoveryResult& result) noexcept override;

    // Add a pending task, or reset an existing one to pending with a new url
    [[nodiscard]] std::error_code add(std::string_view identifier, std::string_view url) noexcept;

    [[nodiscard]] const std::vector<Task>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    JsonTaskSource() = default;

    [[nodiscard]] std::error_code save() const noexcept;
    [[nodiscard]] Task* find(std::string_view identifier) noexcept;

    std::filesystem::path path_;
    std::vector<Task> tasks_;
};

// Current time as "YYYY-MM-DDTHH:MM:SSZ"
[[nodiscard]] std::string utc_timestamp();

} // namespace stitch::recovery
