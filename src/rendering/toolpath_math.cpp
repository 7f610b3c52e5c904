// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "toolpath_math.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace printwatch {
namespace gcode {

glm::dvec2 rotate_vector(const glm::dvec2& v, double angle) {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    return glm::dvec2(v.x * c - v.y * s, v.x * s + v.y * c);
}

glm::dvec2 scale_vector(const glm::dvec2& v, double length) {
    const double magnitude = std::sqrt(v.x * v.x + v.y * v.y);
    if (magnitude == 0.0) {
        spdlog::error("[GCode Geometry] Cannot scale zero-length vector to {:.3f}mm", length);
        throw GeometryError("zero-length direction vector");
    }
    return v * (length / magnitude);
}

std::pair<glm::dvec3, glm::dvec3> offset_bidirectional(const glm::dvec2& offset,
                                                       const glm::dvec3& point) {
    return {glm::dvec3(point.x + offset.x, point.y + offset.y, point.z),
            glm::dvec3(point.x - offset.x, point.y - offset.y, point.z)};
}

} // namespace gcode
} // namespace printwatch
