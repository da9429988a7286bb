// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stitch::cli {

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(std::size_t done, std::size_t total, std::size_t failed) noexcept {
    if (total == 0) return;

    double percent = static_cast<double>(done) * 100.0 / static_cast<double>(total);
    percent = std::clamp(percent, 0.0, 100.0);

    std::lock_guard<std::mutex> lock(mutex_);

    // Only redraw on whole-percent changes, and always for the last segment
    auto scaled = static_cast<std::size_t>(percent);
    if (scaled == last_percent_ && done != total) return;
    last_percent_ = scaled;
    drawn_ = true;

    try {
        std::string line = "\r";
        if (!label_.empty()) {
            line += label_;
            line += ": ";
        }
        line += render_bar(percent);

        line += " ";
        if (scaled < 10) line += " ";
        if (scaled < 100) line += " ";
        line += std::to_string(scaled) + "%";

        line += " (" + std::to_string(done) + "/" + std::to_string(total) + " segments";
        if (failed > 0) {
            line += ", " + std::to_string(failed) + " failed";
        }
        line += ")";

        // Clear rest of line
        line += std::string(10, ' ');

        std::cout << line << std::flush;
    } catch (const std::bad_alloc&) {
        // Skip this frame
    }
}

void ProgressBar::finish() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
        std::cout << std::endl;
    }
    drawn_ = false;
    last_percent_ = 101;
}

void ProgressBar::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
    drawn_ = false;
    last_percent_ = 101;
}

void PassProgress::start(std::size_t total) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    // A cancelled pass never reached its last segment
    if (done_ != total_) {
        bar_.finish();
    }
    total_ = total;
    done_ = 0;
    failed_ = 0;
}

void PassProgress::on_outcome(const recovery::FetchOutcome& outcome) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_ >= total_) return;
    ++done_;
    if (outcome.status == recovery::FetchStatus::failed) {
        ++failed_;
    }
    bar_.update(done_, total_, failed_);
    if (done_ == total_) {
        bar_.finish();
    }
}

std::size_t PassProgress::done() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

std::size_t PassProgress::failed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

std::string ProgressBar::render_bar(double percent) noexcept {
    const int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    if (bytes >= GB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::fixed << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        ss << bytes << " B";
    }
    return ss.str();
}

} // namespace stitch::cli
