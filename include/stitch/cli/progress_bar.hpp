// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/recovery/fetch_pipeline.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace stitch::cli {

// Segment-count progress bar for CLI. Safe to update from fetch workers.
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // done of total segments finished in the current pass, failed of them failed
    void update(std::size_t done, std::size_t total, std::size_t failed) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes) noexcept;

private:
    [[nodiscard]] static std::string render_bar(double percent) noexcept;

    std::string label_;
    std::mutex mutex_;
    std::size_t last_percent_{101};
    bool drawn_{false};
};

// Pass-level view over a ProgressBar, fed by the pipeline observers. start()
// runs before a pass; on_outcome() may be called from any worker.
class PassProgress {
public:
    explicit PassProgress(std::string_view label = "Segments") : bar_(label) {}

    void start(std::size_t total) noexcept;

    void on_outcome(const recovery::FetchOutcome& outcome) noexcept;

    [[nodiscard]] std::size_t done() const noexcept;
    [[nodiscard]] std::size_t failed() const noexcept;

private:
    ProgressBar bar_;
    mutable std::mutex mutex_;
    std::size_t total_{0};
    std::size_t done_{0};
    std::size_t failed_{0};
};

} // namespace stitch::cli
