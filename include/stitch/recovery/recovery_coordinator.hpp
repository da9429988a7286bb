// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/core/config.hpp>
#include <stitch/core/http_client.hpp>
#include <stitch/recovery/fetch_pipeline.hpp>
#include <stitch/recovery/validator.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace stitch::recovery {

enum class RecoveryState : std::uint8_t {
    init,               // Check for existing metadata
    fill_metadata,      // Metadata-only pass
    validate,           // Local diff against the manifest
    download,           // First segment pass after a metadata fill, not a retry round
    retry,              // Segment pass over missing and empty only
    done_complete,
    done_incomplete,
};

enum class TerminalReason : std::uint8_t {
    complete,
    metadata_unavailable,
    rounds_exhausted,
    cancelled,
};

[[nodiscard]] const char* to_string(RecoveryState state) noexcept;
[[nodiscard]] const char* to_string(TerminalReason reason) noexcept;
[[nodiscard]] std::optional<TerminalReason> terminal_reason_from_string(std::string_view text) noexcept;

struct RecoveryResult {
    bool is_complete{false};
    std::uint32_t rounds_used{0};
    ValidationReport last_report;
    TerminalReason terminal_reason{TerminalReason::metadata_unavailable};
    bool metadata_downloaded{false};
    std::vector<std::uint32_t> retry_history;   // Segments targeted per retry round
};

// Drives one asset to a terminal state: metadata fill, validation, then
// bounded retry rounds over only the segments that failed validation.
class RecoveryCoordinator {
public:
    RecoveryCoordinator(core::HttpClient& client,
                        core::DownloadConfig config,
                        std::filesystem::path root) noexcept;

    // Progress of segment passes
    void observer(OutcomeCallback cb) noexcept { pipeline_.observer(std::move(cb)); }
    void pass_observer(PassStartCallback cb) noexcept { pipeline_.pass_observer(std::move(cb)); }

    // Fails only for an identifier that sanitises to nothing. Stop is
    // honoured after each validation.
    [[nodiscard]] std::expected<RecoveryResult, std::error_code>
    recover(std::string_view identifier, const std::string& url, std::stop_token stop = {}) noexcept;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    FetchPipeline pipeline_;
    core::DownloadConfig config_;
    std::filesystem::path root_;
};

} // namespace stitch::recovery
