// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Mesh Exporter
// Writes an assembled object mesh as Wavefront OBJ with per-vertex colors.

#pragma once

#include "gcode_geometry_builder.h"

#include <iosfwd>
#include <string>

namespace printwatch {
namespace gcode {

/**
 * @brief Write mesh as OBJ to a stream
 *
 * Emits "v x y z r g b" per vertex followed by "f a b c" per triangle
 * (1-based indices, as OBJ requires).
 *
 * @return false if the stream reports a write failure
 */
bool write_obj(const ObjectMesh& mesh, std::ostream& out);

/**
 * @brief Write mesh as OBJ file
 *
 * The file is written to "<path>.tmp" and renamed into place, so a failed
 * export never leaves a truncated file at path.
 *
 * @return false if the file cannot be created or written (error is logged)
 */
bool write_obj(const ObjectMesh& mesh, const std::string& path);

} // namespace gcode
} // namespace printwatch
