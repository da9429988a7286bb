// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/recovery/json_task_source.hpp>
#include <stitch/core/error.hpp>
#include <stitch/core/log.hpp>
#include <stitch/disk/atomic_file.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <format>

namespace stitch::recovery {

using nlohmann::json;

const char* to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::pending:  return "pending";
        case TaskStatus::complete: return "complete";
        case TaskStatus::failed:   return "failed";
    }
    return "pending";
}

std::optional<TaskStatus> task_status_from_string(std::string_view text) noexcept {
    if (text == "pending") return TaskStatus::pending;
    if (text == "complete") return TaskStatus::complete;
    if (text == "failed") return TaskStatus::failed;
    return std::nullopt;
}

std::string utc_timestamp() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

std::expected<JsonTaskSource, std::error_code>
JsonTaskSource::open(std::filesystem::path path) noexcept {
    JsonTaskSource source;
    source.path_ = std::move(path);

    auto text = disk::read_file(source.path_);
    if (!text) {
        if (text.error() == make_error_code(disk::DiskErrc::file_not_found)) {
            return source;
        }
        return std::unexpected(text.error());
    }

    try {
        auto doc = json::parse(*text);
        if (!doc.is_array()) {
            return std::unexpected(make_error_code(disk::DiskErrc::corrupt_data));
        }

        for (const auto& entry : doc) {
            Task task;
            task.identifier = entry.at("identifier").get<std::string>();
            task.url = entry.at("url").get<std::string>();

            auto status = task_status_from_string(entry.value("status", std::string("pending")));
            if (!status) {
                return std::unexpected(make_error_code(disk::DiskErrc::corrupt_data));
            }
            task.status = *status;

            auto updated = entry.find("updated_at");
            if (updated != entry.end() && !updated->is_null()) {
                task.updated_at = updated->get<std::string>();
            }
            task.rounds_used = entry.value("rounds_used", std::uint32_t{0});

            auto reason = entry.find("terminal_reason");
            if (reason != entry.end() && !reason->is_null()) {
                task.terminal_reason = terminal_reason_from_string(reason->get<std::string>());
            }
            source.tasks_.push_back(std::move(task));
        }
        return source;
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::corrupt_data));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::expected<std::vector<Task>, std::error_code> JsonTaskSource::list_pending() noexcept {
    try {
        std::vector<Task> pending;
        for (const auto& task : tasks_) {
            if (task.status == TaskStatus::pending) {
                pending.push_back(task);
            }
        }
        return pending;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code JsonTaskSource::mark_result(std::string_view identifier, const RecoveryResult& result) noexcept {
    auto* task = find(identifier);
    if (!task) {
        return make_error_code(core::ConfigErrc::invalid_identifier);
    }

    try {
        task->status = result.is_complete ? TaskStatus::complete : TaskStatus::failed;
        task->updated_at = utc_timestamp();
        task->rounds_used = result.rounds_used;
        task->terminal_reason = result.terminal_reason;
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return save();
}

std::error_code JsonTaskSource::add(std::string_view identifier, std::string_view url) noexcept {
    try {
        auto* task = find(identifier);
        if (!task) {
            tasks_.push_back(Task{std::string(identifier), {}, TaskStatus::pending, {}, 0, std::nullopt});
            task = &tasks_.back();
        }
        task->url = std::string(url);
        task->status = TaskStatus::pending;
        task->updated_at = utc_timestamp();
        task->rounds_used = 0;
        task->terminal_reason.reset();
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return save();
}

std::error_code JsonTaskSource::save() const noexcept {
    try {
        json doc = json::array();
        for (const auto& task : tasks_) {
            doc.push_back({
                {"identifier", task.identifier},
                {"url", task.url},
                {"status", to_string(task.status)},
                {"updated_at", task.updated_at.empty() ? json(nullptr) : json(task.updated_at)},
                {"rounds_used", task.rounds_used},
                {"terminal_reason", task.terminal_reason ? json(to_string(*task.terminal_reason))
                                                         : json(nullptr)},
            });
        }

        if (path_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path_.parent_path(), ec);
        }
        return disk::write_file_atomic(path_, doc.dump(2));
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

Task* JsonTaskSource::find(std::string_view identifier) noexcept {
    for (auto& task : tasks_) {
        if (task.identifier == identifier) {
            return &task;
        }
    }
    return nullptr;
}

} // namespace stitch::recovery
