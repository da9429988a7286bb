// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/core/config.hpp>
#include <stitch/core/http_client.hpp>
#include <stitch/disk/asset_dir.hpp>
#include <stitch/media/manifest.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace stitch::recovery {

enum class FetchStatus : std::uint8_t {
    fetched,    // Written and renamed into place
    failed,     // Final file untouched
    skipped,    // Already present with the recorded length
};

struct FetchOutcome {
    std::uint32_t index{0};
    FetchStatus status{FetchStatus::failed};
    std::uint64_t bytes_written{0};
    std::error_code error;
};

// Called from worker threads as each segment finishes; done counts finished
// segments of the current pass out of total
using OutcomeCallback = std::function<void(const FetchOutcome& outcome, std::size_t done, std::size_t total)>;

// Called on the calling thread when a non-empty pass begins, before any
// worker starts
using PassStartCallback = std::function<void(std::size_t total)>;

[[nodiscard]] const char* to_string(FetchStatus status) noexcept;

// Minimum spacing between consecutive fetch starts, shared by all workers
class Throttle {
public:
    explicit Throttle(std::chrono::nanoseconds spacing) noexcept : spacing_(spacing) {}

    // Wait for the next start slot. Returns false if stop was requested
    // while waiting.
    [[nodiscard]] bool acquire(std::stop_token stop) noexcept;

private:
    std::chrono::nanoseconds spacing_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::chrono::steady_clock::time_point next_{};
};

// Fetches playlists and segments into an asset directory. Every call is
// independent; all state between calls lives on disk.
class FetchPipeline {
public:
    FetchPipeline(core::HttpClient& client, core::DownloadConfig config) noexcept
        : client_(client), config_(config) {}

    void observer(OutcomeCallback cb) noexcept { observer_ = std::move(cb); }
    void pass_observer(PassStartCallback cb) noexcept { pass_observer_ = std::move(cb); }

    // Segment pass over subset (refs taken from manifest). Returns one outcome
    // per ref, in subset order, after every worker has finished. Once stop is
    // requested no new segment is started; unstarted ones report cancelled.
    [[nodiscard]] std::vector<FetchOutcome>
    fetch(const media::SegmentManifest& manifest,
          std::span<const media::SegmentRef> subset,
          const disk::AssetDir& dir,
          std::stop_token stop = {}) noexcept;

    // Metadata-only pass: playlist, manifest, encryption info, key and the
    // content-length index. Never fetches segment payloads.
    [[nodiscard]] std::expected<media::SegmentManifest, std::error_code>
    fetch_metadata(const std::string& url, const disk::AssetDir& dir) noexcept;

    [[nodiscard]] const core::DownloadConfig& config() const noexcept { return config_; }

private:
    struct PassState;

    [[nodiscard]] FetchOutcome fetch_segment(const media::SegmentManifest& manifest,
                                             const media::SegmentRef& ref,
                                             const disk::AssetDir& dir,
                                             PassState& state) noexcept;

    void record_cheap_lengths(const media::SegmentManifest& manifest,
                              disk::ContentLengths& lengths) noexcept;

    core::HttpClient& client_;
    core::DownloadConfig config_;
    OutcomeCallback observer_;
    PassStartCallback pass_observer_;
};

} // namespace stitch::recovery
