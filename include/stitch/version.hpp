// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>

namespace stitch {

struct Version {
    std::uint32_t major;
    std::uint32_t minor;
    std::uint32_t patch;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    // Sent with every HTTP request
    [[nodiscard]] std::string user_agent() const {
        return "stitch/" + to_string();
    }
};

inline constexpr Version version{0, 3, 0};

} // namespace stitch
