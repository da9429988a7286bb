// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/recovery/recovery_coordinator.hpp>
#include <stitch/core/log.hpp>
#include <stitch/disk/asset_dir.hpp>
#include <algorithm>

namespace stitch::recovery {

using core::logger;

const char* to_string(RecoveryState state) noexcept {
    switch (state) {
        case RecoveryState::init:            return "INIT";
        case RecoveryState::fill_metadata:   return "FILL_METADATA";
        case RecoveryState::validate:        return "VALIDATE";
        case RecoveryState::download:        return "DOWNLOAD";
        case RecoveryState::retry:           return "RETRY";
        case RecoveryState::done_complete:   return "DONE_COMPLETE";
        case RecoveryState::done_incomplete: return "DONE_INCOMPLETE";
    }
    return "UNKNOWN";
}

const char* to_string(TerminalReason reason) noexcept {
    switch (reason) {
        case TerminalReason::complete:             return "Complete";
        case TerminalReason::metadata_unavailable: return "MetadataUnavailable";
        case TerminalReason::rounds_exhausted:     return "RoundsExhausted";
        case TerminalReason::cancelled:            return "Cancelled";
    }
    return "Unknown";
}

std::optional<TerminalReason> terminal_reason_from_string(std::string_view text) noexcept {
    for (auto reason : {TerminalReason::complete, TerminalReason::metadata_unavailable,
                        TerminalReason::rounds_exhausted, TerminalReason::cancelled}) {
        if (text == to_string(reason)) {
            return reason;
        }
    }
    return std::nullopt;
}

RecoveryCoordinator::RecoveryCoordinator(core::HttpClient& client,
                                         core::DownloadConfig config,
                                         std::filesystem::path root) noexcept
    : pipeline_(client, config)
    , config_(config)
    , root_(std::move(root)) {}

std::expected<RecoveryResult, std::error_code>
RecoveryCoordinator::recover(std::string_view identifier, const std::string& url,
                             std::stop_token stop) noexcept {
    auto opened = disk::AssetDir::open(root_, identifier);
    if (!opened) {
        return std::unexpected(opened.error());
    }
    const auto& dir = *opened;

    RecoveryResult result;
    RecoveryState state = RecoveryState::init;
    bool segment_pass_run = false;
    std::optional<media::SegmentManifest> manifest;

    auto finish = [&](TerminalReason reason) {
        result.terminal_reason = reason;
        result.is_complete = reason == TerminalReason::complete;
        state = result.is_complete ? RecoveryState::done_complete : RecoveryState::done_incomplete;
    };

    try {
        while (state != RecoveryState::done_complete && state != RecoveryState::done_incomplete) {
            logger()->debug("[{}] state {}", dir.name(), to_string(state));

            switch (state) {
                case RecoveryState::init:
                    state = dir.has_metadata() ? RecoveryState::validate : RecoveryState::fill_metadata;
                    break;

                case RecoveryState::fill_metadata: {
                    result.metadata_downloaded = true;
                    auto fetched = pipeline_.fetch_metadata(url, dir);
                    if (!fetched) {
                        result.last_report = Validator::validate(dir);
                        finish(TerminalReason::metadata_unavailable);
                        break;
                    }
                    manifest = std::move(*fetched);
                    state = RecoveryState::validate;
                    break;
                }

                case RecoveryState::validate:
                    result.last_report = Validator::validate(dir);
                    print_report(result.last_report, dir);

                    if (result.last_report.is_complete()) {
                        finish(TerminalReason::complete);
                    } else if (stop.stop_requested()) {
                        finish(TerminalReason::cancelled);
                    } else if (!result.last_report.manifest_loaded) {
                        // Metadata vanished or went corrupt after INIT
                        if (result.metadata_downloaded) {
                            finish(TerminalReason::metadata_unavailable);
                        } else {
                            state = RecoveryState::fill_metadata;
                        }
                    } else if (result.metadata_downloaded && !segment_pass_run) {
                        state = RecoveryState::download;
                    } else if (result.rounds_used < config_.max_retry_rounds) {
                        state = RecoveryState::retry;
                    } else {
                        finish(TerminalReason::rounds_exhausted);
                    }
                    break;

                case RecoveryState::download:
                case RecoveryState::retry: {
                    if (!manifest) {
                        auto loaded = dir.load_full_manifest();
                        if (!loaded) {
                            logger()->error("[{}] cannot load manifest: {}", dir.name(),
                                            loaded.error().message());
                            finish(TerminalReason::metadata_unavailable);
                            break;
                        }
                        manifest = std::move(*loaded);
                    }

                    std::vector<media::SegmentRef> subset;
                    for (auto index : result.last_report.failed_indices()) {
                        if (index < manifest->segments.size()) {
                            subset.push_back(manifest->segments[index]);
                        }
                    }

                    if (state == RecoveryState::retry) {
                        ++result.rounds_used;
                        result.retry_history.push_back(static_cast<std::uint32_t>(subset.size()));
                        logger()->info("[{}] retry round {}/{}: {} segment(s)", dir.name(),
                                       result.rounds_used, config_.max_retry_rounds, subset.size());
                    }

                    auto outcomes = pipeline_.fetch(*manifest, subset, dir, stop);
                    auto failed = std::count_if(outcomes.begin(), outcomes.end(), [](const FetchOutcome& o) {
                        return o.status == FetchStatus::failed;
                    });
                    if (failed > 0) {
                        logger()->debug("[{}] {} of {} segment(s) failed this pass", dir.name(),
                                        failed, outcomes.size());
                    }
                    segment_pass_run = true;
                    state = RecoveryState::validate;
                    break;
                }

                case RecoveryState::done_complete:
                case RecoveryState::done_incomplete:
                    break;
            }
        }
    } catch (const std::bad_alloc&) {
        logger()->error("[{}] recovery aborted: out of memory", dir.name());
        finish(TerminalReason::metadata_unavailable);
    }

    if (result.is_complete) {
        logger()->info("[{}] complete after {} retry round(s)", dir.name(), result.rounds_used);
    } else {
        logger()->warn("[{}] incomplete: {} after {} retry round(s)", dir.name(),
                       to_string(result.terminal_reason), result.rounds_used);
    }
    return result;
}

} // namespace stitch::recovery
