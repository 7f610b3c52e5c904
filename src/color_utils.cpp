// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "color_utils.h"

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <cstdlib>

namespace printwatch {

std::optional<uint32_t> parse_hex_color(const std::string& hex_str) {
    if (hex_str.empty()) {
        return std::nullopt;
    }

    std::string hex = hex_str;
    if (hex[0] == '#') {
        hex = hex.substr(1);
    }

    if (hex.length() != 6) {
        return std::nullopt;
    }

    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    return static_cast<uint32_t>(std::strtoul(hex.c_str(), nullptr, 16));
}

glm::vec3 rgb_to_vec3(uint32_t rgb) {
    uint8_t r = (rgb >> 16) & 0xFF;
    uint8_t g = (rgb >> 8) & 0xFF;
    uint8_t b = rgb & 0xFF;
    return glm::vec3(r / 255.0f, g / 255.0f, b / 255.0f);
}

std::string format_hex_color(uint32_t rgb) {
    return fmt::format("#{:06X}", rgb & 0xFFFFFF);
}

} // namespace printwatch
