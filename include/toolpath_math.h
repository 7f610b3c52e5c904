// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Toolpath Vector Math
// Small 2D helpers used to offset toolpath polylines into ribbon outlines.

#pragma once

#include <glm/glm.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace printwatch {
namespace gcode {

/**
 * @brief Raised when a geometric operation has no defined result
 *
 * Typical cause: normalizing a zero-length direction vector because a
 * polyline contains duplicate consecutive points.
 */
class GeometryError : public std::runtime_error {
  public:
    explicit GeometryError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Rotate a 2D vector counter-clockwise
 * @param v Vector to rotate
 * @param angle Rotation in radians (positive = counter-clockwise)
 * @return Rotated vector
 */
glm::dvec2 rotate_vector(const glm::dvec2& v, double angle);

/**
 * @brief Rotate by exactly +90 degrees (counter-clockwise)
 *
 * Component swap, no trigonometry: rotate_quarter_ccw({1, 0}) == {0, 1} exactly.
 */
inline glm::dvec2 rotate_quarter_ccw(const glm::dvec2& v) {
    return glm::dvec2(-v.y, v.x);
}

/**
 * @brief Rotate by exactly -90 degrees (clockwise)
 */
inline glm::dvec2 rotate_quarter_cw(const glm::dvec2& v) {
    return glm::dvec2(v.y, -v.x);
}

/**
 * @brief Rescale a vector to the given length
 * @param v Direction (must be non-zero)
 * @param length Target magnitude
 * @return Vector with direction of v and magnitude length
 * @throws GeometryError if v has zero length
 */
glm::dvec2 scale_vector(const glm::dvec2& v, double length);

/**
 * @brief Offset a point in both directions along a vector
 *
 * Only X/Y are offset; Z of the input point is preserved.
 *
 * @return (point + offset, point - offset)
 */
std::pair<glm::dvec3, glm::dvec3> offset_bidirectional(const glm::dvec2& offset,
                                                       const glm::dvec3& point);

/// XY difference a - b
inline glm::dvec2 xy_difference(const glm::dvec3& a, const glm::dvec3& b) {
    return glm::dvec2(a.x - b.x, a.y - b.y);
}

} // namespace gcode
} // namespace printwatch
