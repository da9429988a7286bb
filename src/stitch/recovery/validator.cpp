// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/recovery/validator.hpp>
#include <stitch/core/log.hpp>
#include <algorithm>
#include <filesystem>
#include <iterator>

namespace stitch::recovery {

namespace {

constexpr std::size_t MAX_LISTED_FAILURES = 10;

} // namespace

std::vector<std::uint32_t> ValidationReport::failed_indices() const {
    std::vector<std::uint32_t> result;
    result.reserve(missing.size() + empty.size());
    std::merge(missing.begin(), missing.end(), empty.begin(), empty.end(), std::back_inserter(result));
    return result;
}

ValidationReport Validator::validate(const disk::AssetDir& dir) noexcept {
    ValidationReport report;

    try {
        auto manifest = dir.load_manifest();
        if (!manifest) {
            core::logger()->debug("No usable manifest for {}: {}", dir.name(), manifest.error().message());
            return report;
        }
        report.manifest_loaded = true;
        report.expected_count = static_cast<std::uint32_t>(manifest->segments.size());

        disk::ContentLengths lengths;
        if (auto loaded = dir.load_content_lengths()) {
            lengths = std::move(*loaded);
        }

        for (const auto& seg : manifest->segments) {
            auto path = dir.segment_path(seg.index);

            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                report.missing.push_back(seg.index);
                continue;
            }
            auto size = std::filesystem::file_size(path, ec);
            if (ec) {
                report.missing.push_back(seg.index);
                continue;
            }

            auto expected = lengths.find(seg.index);
            if (size == 0 || (expected != lengths.end() && expected->second != size)) {
                report.empty.push_back(seg.index);
                continue;
            }

            ++report.present_count;
            report.total_size += size;
        }
    } catch (const std::bad_alloc&) {
        core::logger()->error("Validation of {} ran out of memory", dir.name());
        return ValidationReport{};
    }
    return report;
}

void print_report(const ValidationReport& report, const disk::AssetDir& dir) {
    auto log = core::logger();

    if (!report.manifest_loaded) {
        log->warn("[{}] manifest missing or unreadable", dir.name());
        return;
    }

    log->info("[{}] {}/{} segments present, {} missing, {} empty, {:.2f} MB",
              dir.name(), report.present_count, report.expected_count,
              report.missing.size(), report.empty.size(),
              static_cast<double>(report.total_size) / (1024.0 * 1024.0));

    if (report.is_complete()) {
        return;
    }

    auto failed = report.failed_indices();
    auto listed = std::min(failed.size(), MAX_LISTED_FAILURES);
    for (std::size_t i = 0; i < listed; ++i) {
        log->warn("[{}]   {}", dir.name(), disk::AssetDir::segment_filename(failed[i]));
    }
    if (failed.size() > listed) {
        log->warn("[{}]   ... and {} more", dir.name(), failed.size() - listed);
    }
}

} // namespace stitch::recovery
