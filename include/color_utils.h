// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <string>

/**
 * @file color_utils.h
 * @brief Hex color parsing and conversion for mesh vertex colors
 */

namespace printwatch {

/**
 * @brief Parse a hex color string
 *
 * Accepts "#RRGGBB" or "RRGGBB" (case-insensitive).
 *
 * @param hex_str Color string
 * @return RGB color value (0x00RRGGBB format), or nullopt if malformed
 *
 * @example
 * parse_hex_color("#DED6AB"); // Returns 0xDED6AB
 * parse_hex_color("#FFF");    // Returns nullopt (short form not supported)
 */
std::optional<uint32_t> parse_hex_color(const std::string& hex_str);

/**
 * @brief Convert 0x00RRGGBB to normalized float RGB
 * @return Components in [0, 1]
 */
glm::vec3 rgb_to_vec3(uint32_t rgb);

/**
 * @brief Format 0x00RRGGBB as "#RRGGBB"
 */
std::string format_hex_color(uint32_t rgb);

} // namespace printwatch
