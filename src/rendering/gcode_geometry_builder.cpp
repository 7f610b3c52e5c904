// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// G-Code Geometry Builder Implementation

#include "gcode_geometry_builder.h"

#include "color_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <limits>
#include <mutex>
#include <system_error>
#include <thread>

namespace printwatch {
namespace gcode {

// ============================================================================
// Cross-Section Offsets
// ============================================================================

std::vector<glm::dvec3> compute_corner_offsets(const Polyline& line, double half_width) {
    std::vector<glm::dvec3> result;
    const size_t n = line.size();
    if (n < 2) {
        return result;
    }
    result.reserve(n * 2);

    auto append = [&result](const glm::dvec2& normal, const glm::dvec3& point) {
        auto corners = offset_bidirectional(normal, point);
        result.push_back(corners.first);
        result.push_back(corners.second);
    };

    // Start point: normal of the first segment
    append(scale_vector(rotate_quarter_ccw(xy_difference(line[1], line[0])), half_width), line[0]);

    for (size_t i = 1; i + 1 < n; i++) {
        glm::dvec2 last_dir = xy_difference(line[i], line[i - 1]);
        glm::dvec2 next_dir = xy_difference(line[i], line[i + 1]);

        glm::dvec2 last_normal = rotate_quarter_ccw(last_dir);
        glm::dvec2 next_normal = rotate_quarter_cw(next_dir);

        // Opposite normals would cancel to zero; fall back to the incoming
        // segment's normal. Quarter turns are exact so this catches every
        // zero-sum case.
        glm::dvec2 normal;
        if (last_normal.x == -next_normal.x && last_normal.y == -next_normal.y) {
            spdlog::trace("[GCode Geometry] Reversal at point {} ({:.3f}, {:.3f})", i,
                          line[i].x, line[i].y);
            normal = last_normal;
        } else {
            normal = last_normal + next_normal;
        }

        append(scale_vector(normal, half_width), line[i]);
    }

    // End point: normal of the last segment
    append(scale_vector(rotate_quarter_ccw(xy_difference(line[n - 1], line[n - 2])), half_width),
           line[n - 1]);

    return result;
}

// ============================================================================
// Ribbon Extrusion
// ============================================================================

MeshFragment build_ribbon_mesh(const std::vector<glm::dvec3>& boundary, double height) {
    const size_t m = boundary.size();
    if (m < 4 || m % 2 != 0) {
        spdlog::error("[GCode Geometry] Ribbon needs an even number (>= 4) of boundary points, "
                      "got {}",
                      m);
        throw GeometryError("invalid ribbon boundary size " + std::to_string(m));
    }

    MeshFragment fragment;
    fragment.vertices.reserve(m * 2);
    fragment.triangles.reserve(4 + 8 * (m / 2 - 1));

    // Bottom copy [0, M), top copy [M, 2M)
    for (const auto& p : boundary) {
        fragment.vertices.push_back(p);
    }
    for (const auto& p : boundary) {
        fragment.vertices.emplace_back(p.x, p.y, p.z + height);
    }

    // Even indices are point + normal, odd indices point - normal. All
    // triangles wind counter-clockwise seen from outside the ribbon.
    const uint32_t M = static_cast<uint32_t>(m);
    auto& tris = fragment.triangles;

    // Start cap
    tris.push_back({0, 1, M + 1});
    tris.push_back({0, M + 1, M});

    // End cap
    tris.push_back({M - 2, 2 * M - 1, M - 1});
    tris.push_back({M - 2, 2 * M - 2, 2 * M - 1});

    for (uint32_t i = 0; i + 2 < M; i += 2) {
        // Bottom
        tris.push_back({i, i + 3, i + 1});
        tris.push_back({i, i + 2, i + 3});

        // Top
        tris.push_back({M + i, M + i + 1, M + i + 3});
        tris.push_back({M + i, M + i + 3, M + i + 2});

        // Side along the +normal boundary
        tris.push_back({i, i + M, i + 2});
        tris.push_back({i + 2, i + M, i + 2 + M});

        // Side along the -normal boundary
        tris.push_back({i + 1, i + 3, i + 1 + M});
        tris.push_back({i + 3, i + 3 + M, i + 1 + M});
    }

    return fragment;
}

// ============================================================================
// WorkerGroup Implementation
// ============================================================================

WorkerGroup::~WorkerGroup() {
    join();
}

void WorkerGroup::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

// ============================================================================
// BuildStats Implementation
// ============================================================================

void GeometryBuilder::BuildStats::log() const {
    spdlog::info("[GCode Geometry] Object mesh statistics:");
    spdlog::info("[GCode Geometry]   Ribbons built:     {:>8}", fragments_built);
    if (fragments_failed > 0) {
        spdlog::warn("[GCode Geometry]   Ribbons failed:    {:>8}", fragments_failed);
    }
    if (skipped_polylines > 0) {
        spdlog::debug("[GCode Geometry]   Short polylines:   {:>8}", skipped_polylines);
    }
    spdlog::info("[GCode Geometry]   Vertices:          {:>8}", vertices_generated);
    spdlog::info("[GCode Geometry]   Triangles:         {:>8}", triangles_generated);
    spdlog::info("[GCode Geometry]   Build time:        {:.3f}s ({} thread{})", build_seconds,
                 worker_threads, worker_threads == 1 ? "" : "s");
}

// ============================================================================
// GeometryBuilder Implementation
// ============================================================================

GeometryBuilder::GeometryBuilder() {
    primary_color_ = rgb_to_vec3(*parse_hex_color(DEFAULT_PRIMARY_COLOR));
    secondary_color_ = rgb_to_vec3(*parse_hex_color(DEFAULT_SECONDARY_COLOR));
}

bool GeometryBuilder::set_primary_color(const std::string& hex_color) {
    auto rgb = parse_hex_color(hex_color);
    if (!rgb) {
        spdlog::warn("[GCode Geometry] Invalid primary color '{}', keeping current", hex_color);
        return false;
    }
    primary_color_ = rgb_to_vec3(*rgb);
    spdlog::debug("[GCode Geometry] Primary color set to {}", format_hex_color(*rgb));
    return true;
}

bool GeometryBuilder::set_secondary_color(const std::string& hex_color) {
    auto rgb = parse_hex_color(hex_color);
    if (!rgb) {
        spdlog::warn("[GCode Geometry] Invalid secondary color '{}', keeping current", hex_color);
        return false;
    }
    secondary_color_ = rgb_to_vec3(*rgb);
    spdlog::debug("[GCode Geometry] Secondary color set to {}", format_hex_color(*rgb));
    return true;
}

void GeometryBuilder::collect_jobs(const ExtruderTrack& track, bool secondary, int layer_count,
                                   std::vector<FragmentJob>& jobs) {
    size_t limit = track.size();
    if (layer_count >= 0) {
        limit = std::min(limit, static_cast<size_t>(layer_count));
    }

    for (size_t layer = 0; layer < limit; layer++) {
        for (const auto& line : track[layer]) {
            if (line.size() < 2) {
                stats_.skipped_polylines++;
                continue;
            }
            jobs.push_back({&line, secondary});
        }
    }
}

GeometryBuilder::FragmentSlot GeometryBuilder::build_fragment(const FragmentJob& job) const {
    FragmentSlot slot;
    try {
        std::vector<glm::dvec3> boundary = compute_corner_offsets(*job.line, half_width_mm_);
        slot.mesh = build_ribbon_mesh(boundary, line_height_mm_);
    } catch (const GeometryError& e) {
        spdlog::debug("[GCode Geometry] Ribbon of {} points failed: {}", job.line->size(),
                      e.what());
        slot.failed = true;
    }
    return slot;
}

void GeometryBuilder::run_jobs(const std::vector<FragmentJob>& jobs,
                               std::vector<FragmentSlot>& slots) const {
    size_t thread_count = std::min(worker_threads_, jobs.size());

    if (thread_count <= 1) {
        for (size_t i = 0; i < jobs.size(); i++) {
            slots[i] = build_fragment(jobs[i]);
        }
        return;
    }

    std::atomic<size_t> next_job{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        try {
            for (;;) {
                size_t i = next_job.fetch_add(1);
                if (i >= jobs.size()) {
                    break;
                }
                slots[i] = build_fragment(jobs[i]);
            }
        } catch (...) {
            // Anything other than a geometry error (e.g. bad_alloc) aborts the build
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) {
                first_error = std::current_exception();
            }
            next_job.store(jobs.size());
        }
    };

    WorkerGroup workers;
    try {
        for (size_t t = 0; t < thread_count; t++) {
            workers.spawn(worker);
        }
    } catch (const std::system_error& e) {
        // Let the running workers drain; the group joins them on unwind
        spdlog::error("[GCode Geometry] Failed to start worker thread {} of {}: {}",
                      workers.size() + 1, thread_count, e.what());
        next_job.store(jobs.size());
        throw;
    }
    workers.join();

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

ObjectMesh GeometryBuilder::build_object_mesh(const ExtruderTrack& primary,
                                              const ExtruderTrack& secondary, int layer_count) {
    auto build_start = std::chrono::steady_clock::now();
    stats_ = {};
    stats_.worker_threads = worker_threads_;

    spdlog::info("[GCode Geometry] Building object mesh (half width={:.3f}mm, height={:.3f}mm, "
                 "layers={})",
                 half_width_mm_, line_height_mm_,
                 layer_count < 0 ? std::string("all") : std::to_string(layer_count));

    std::vector<FragmentJob> jobs;
    collect_jobs(primary, false, layer_count, jobs);
    collect_jobs(secondary, true, layer_count, jobs);

    std::vector<FragmentSlot> slots(jobs.size());
    run_jobs(jobs, slots);

    // Fan-in: prefix sum of fragment sizes, appended in job order
    size_t total_vertices = 0;
    size_t total_triangles = 0;
    for (const auto& slot : slots) {
        if (!slot.failed) {
            total_vertices += slot.mesh.vertices.size();
            total_triangles += slot.mesh.triangles.size();
        }
    }
    if (total_vertices > std::numeric_limits<uint32_t>::max()) {
        spdlog::error("[GCode Geometry] {} vertices exceed 32-bit index range", total_vertices);
        throw GeometryError("mesh too large for 32-bit indices");
    }

    ObjectMesh mesh;
    mesh.vertices.reserve(total_vertices);
    mesh.colors.reserve(total_vertices);
    mesh.triangles.reserve(total_triangles);

    for (size_t i = 0; i < slots.size(); i++) {
        const FragmentSlot& slot = slots[i];
        if (slot.failed) {
            mesh.failed_fragments.push_back(i);
            continue;
        }

        const uint32_t base = static_cast<uint32_t>(mesh.vertices.size());
        const glm::vec3& color = jobs[i].secondary ? secondary_color_ : primary_color_;

        mesh.vertices.insert(mesh.vertices.end(), slot.mesh.vertices.begin(),
                             slot.mesh.vertices.end());
        mesh.colors.insert(mesh.colors.end(), slot.mesh.vertices.size(), color);
        for (const auto& tri : slot.mesh.triangles) {
            mesh.triangles.push_back({tri[0] + base, tri[1] + base, tri[2] + base});
        }

        if (jobs[i].secondary) {
            mesh.secondary_vertex_count += slot.mesh.vertices.size();
        } else {
            mesh.primary_vertex_count += slot.mesh.vertices.size();
        }
    }

    stats_.fragments_built = jobs.size() - mesh.failed_fragments.size();
    stats_.fragments_failed = mesh.failed_fragments.size();
    stats_.vertices_generated = mesh.vertices.size();
    stats_.triangles_generated = mesh.triangles.size();
    stats_.build_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - build_start).count();

    if (!mesh.failed_fragments.empty()) {
        spdlog::warn("[GCode Geometry] {} of {} ribbons failed (first failed job: {})",
                     mesh.failed_fragments.size(), jobs.size(), mesh.failed_fragments.front());
    }

    stats_.log();

    return mesh;
}

} // namespace gcode
} // namespace printwatch
