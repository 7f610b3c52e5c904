// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// G-Code Geometry Builder
// Converts parsed extrusion polylines into closed ribbon meshes (one box-like
// ribbon per polyline) and assembles them into a single colored object mesh.

#pragma once

#include "gcode_parser.h"
#include "toolpath_math.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace printwatch {
namespace gcode {

// ============================================================================
// Mesh Data
// ============================================================================

/**
 * @brief Triangle indices into a vertex buffer
 * Uses uint32_t to support large models (>65k vertices)
 */
using TriangleIndices = std::array<uint32_t, 3>;

/**
 * @brief Mesh of a single polyline ribbon
 *
 * Indices are local to this fragment (0-based into its own vertices).
 */
struct MeshFragment {
    std::vector<glm::dvec3> vertices;
    std::vector<TriangleIndices> triangles;
};

/**
 * @brief Assembled mesh of the whole object
 *
 * Flat buffers handed to the renderer/exporter. Primary extruder vertices
 * come first, followed by the secondary extruder's.
 */
struct ObjectMesh {
    std::vector<glm::dvec3> vertices;       ///< Positions (mm)
    std::vector<TriangleIndices> triangles; ///< Indices into vertices
    std::vector<glm::vec3> colors;          ///< RGB [0,1], one per vertex

    size_t primary_vertex_count{0};   ///< Vertices generated from the primary track
    size_t secondary_vertex_count{0}; ///< Vertices generated from the secondary track

    /// Job indices (primary polylines first, in layer order) whose ribbon
    /// could not be built. The rest of the mesh is still valid.
    std::vector<size_t> failed_fragments;

    bool empty() const {
        return vertices.empty();
    }
};

// ============================================================================
// Cross-Section / Ribbon Primitives
// ============================================================================

/**
 * @brief Offset a polyline sideways into ribbon boundary points
 *
 * Each input point produces two outputs: (point + normal, point - normal),
 * where the normal is perpendicular to the path (left side first when
 * walking the path) with length half_width. Interior points use the
 * bisector of the adjoining segment normals so corners are mitered.
 *
 * @param line Polyline in print order
 * @param half_width Offset distance (half the extrusion width)
 * @return 2*N boundary points, empty if the line has fewer than 2 points
 * @throws GeometryError on a zero-length segment
 */
std::vector<glm::dvec3> compute_corner_offsets(const Polyline& line, double half_width);

/**
 * @brief Extrude boundary points vertically into a closed ribbon
 *
 * Vertices are the boundary points followed by the same points raised by
 * height. Triangles cover bottom, top, both sides and both end caps with
 * outward-facing counter-clockwise winding.
 *
 * @param boundary Output of compute_corner_offsets (even count, >= 4)
 * @param height Ribbon height (mm)
 * @throws GeometryError if the boundary count is odd or below 4
 */
MeshFragment build_ribbon_mesh(const std::vector<glm::dvec3>& boundary, double height);

// ============================================================================
// Worker Threads
// ============================================================================

/**
 * @brief Owns a set of worker threads and joins them on destruction
 *
 * Leaving scope by an exception (e.g. a failed thread start halfway through
 * spawning) joins whatever was already started instead of terminating.
 */
class WorkerGroup {
  public:
    WorkerGroup() = default;
    ~WorkerGroup();

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    /// Start a thread running fn
    /// @throws std::system_error if the thread cannot be started
    template <typename Fn> void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    /// Wait for all started threads (idempotent)
    void join();

    size_t size() const {
        return threads_.size();
    }

  private:
    std::vector<std::thread> threads_;
};

// ============================================================================
// Geometry Builder
// ============================================================================

/**
 * @brief Builds the object mesh from parsed extruder tracks
 *
 * Pipeline per polyline:
 * 1. Offset into boundary points (compute_corner_offsets)
 * 2. Extrude into a closed ribbon (build_ribbon_mesh)
 * 3. Rebase indices and append to the shared buffers
 * 4. Tag vertices with the extruder's flat color
 *
 * Step 1-2 may run on several worker threads. Appending is always done in
 * job order, so the output does not depend on the thread count.
 */
class GeometryBuilder {
  public:
    static constexpr const char* DEFAULT_PRIMARY_COLOR = "#0000FF";
    static constexpr const char* DEFAULT_SECONDARY_COLOR = "#DED6AB"; // PVA-like

    GeometryBuilder();

    /**
     * @brief Build the combined mesh of both tracks
     *
     * @param primary Layers printed by T0 (may be empty)
     * @param secondary Layers printed by T1 (may be empty)
     * @param layer_count Number of layers to include from the bottom of each
     *        track; negative includes all layers
     * @return Assembled mesh (partial if some fragments failed)
     */
    ObjectMesh build_object_mesh(const ExtruderTrack& primary, const ExtruderTrack& secondary,
                                 int layer_count = -1);

    /**
     * @brief Statistics about last build operation
     */
    struct BuildStats {
        size_t fragments_built{0};     ///< Ribbons appended to the mesh
        size_t fragments_failed{0};    ///< Ribbons skipped due to geometry errors
        size_t skipped_polylines{0};   ///< Polylines shorter than 2 points
        size_t vertices_generated{0};  ///< Total vertices
        size_t triangles_generated{0}; ///< Total triangles
        size_t worker_threads{1};      ///< Threads used for fragment generation
        double build_seconds{0.0};     ///< Wall time of the build

        void log() const; ///< Log statistics via spdlog
    };

    const BuildStats& last_stats() const {
        return stats_;
    }

    /**
     * @brief Set ribbon half width (default: 0.2mm, half of a 0.4mm nozzle)
     */
    void set_half_width(double half_width_mm) {
        half_width_mm_ = half_width_mm;
    }

    double half_width() const {
        return half_width_mm_;
    }

    /**
     * @brief Set ribbon height (default: 0.2mm)
     */
    void set_line_height(double height_mm) {
        line_height_mm_ = height_mm;
    }

    double line_height() const {
        return line_height_mm_;
    }

    /**
     * @brief Set primary extruder color
     * @param hex_color Color in hex format (e.g., "#0000FF" or "0000FF")
     * @return false if the string is not a valid color (current color kept)
     */
    bool set_primary_color(const std::string& hex_color);

    /**
     * @brief Set secondary extruder color
     * @param hex_color Color in hex format (e.g., "#DED6AB" or "DED6AB")
     * @return false if the string is not a valid color (current color kept)
     */
    bool set_secondary_color(const std::string& hex_color);

    void set_primary_color(const glm::vec3& rgb) {
        primary_color_ = rgb;
    }

    void set_secondary_color(const glm::vec3& rgb) {
        secondary_color_ = rgb;
    }

    const glm::vec3& primary_color() const {
        return primary_color_;
    }

    const glm::vec3& secondary_color() const {
        return secondary_color_;
    }

    /**
     * @brief Number of threads generating fragments (clamped to >= 1)
     */
    void set_worker_threads(size_t count) {
        worker_threads_ = count > 0 ? count : 1;
    }

    size_t worker_threads() const {
        return worker_threads_;
    }

  private:
    /// One polyline to turn into a ribbon
    struct FragmentJob {
        const Polyline* line;
        bool secondary;
    };

    /// Result slot of one job, written only by the worker that ran it
    struct FragmentSlot {
        MeshFragment mesh;
        bool failed{false};
    };

    void collect_jobs(const ExtruderTrack& track, bool secondary, int layer_count,
                      std::vector<FragmentJob>& jobs);

    FragmentSlot build_fragment(const FragmentJob& job) const;

    void run_jobs(const std::vector<FragmentJob>& jobs, std::vector<FragmentSlot>& slots) const;

    // Configuration
    double half_width_mm_ = 0.2;
    double line_height_mm_ = 0.2;
    glm::vec3 primary_color_;
    glm::vec3 secondary_color_;
    size_t worker_threads_ = 1;

    // Build statistics
    BuildStats stats_;
};

} // namespace gcode
} // namespace printwatch
