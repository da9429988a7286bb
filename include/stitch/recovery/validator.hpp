// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/disk/asset_dir.hpp>
#include <cstdint>
#include <vector>

namespace stitch::recovery {

// Local diff of an asset directory against its manifest
struct ValidationReport {
    bool manifest_loaded{false};
    std::uint32_t expected_count{0};
    std::uint32_t present_count{0};
    std::vector<std::uint32_t> missing;     // No segment file
    std::vector<std::uint32_t> empty;       // Zero bytes, or not the recorded length
    std::uint64_t total_size{0};            // Bytes in validly present segments

    [[nodiscard]] bool is_complete() const noexcept {
        return manifest_loaded && missing.empty() && empty.empty() &&
               present_count == expected_count;
    }

    // missing and empty merged in manifest order
    [[nodiscard]] std::vector<std::uint32_t> failed_indices() const;

    bool operator==(const ValidationReport&) const = default;
};

class Validator {
public:
    // Never touches the network. An unreadable manifest gives
    // expected_count = 0 and manifest_loaded = false.
    [[nodiscard]] static ValidationReport validate(const disk::AssetDir& dir) noexcept;
};

// Log the report; lists at most ten failed segment files
void print_report(const ValidationReport& report, const disk::AssetDir& dir);

} // namespace stitch::recovery
