// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_geometry_builder.h"

#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace printwatch::gcode;
using Catch::Approx;

namespace {

/// Every triangle of a convex ribbon must face away from its center
void require_outward_winding(const MeshFragment& mesh) {
    glm::dvec3 center(0.0);
    for (const auto& v : mesh.vertices) {
        center += v;
    }
    center /= static_cast<double>(mesh.vertices.size());

    for (size_t t = 0; t < mesh.triangles.size(); t++) {
        const auto& tri = mesh.triangles[t];
        const glm::dvec3& a = mesh.vertices[tri[0]];
        const glm::dvec3& b = mesh.vertices[tri[1]];
        const glm::dvec3& c = mesh.vertices[tri[2]];

        glm::dvec3 normal = glm::cross(b - a, c - a);
        glm::dvec3 centroid = (a + b + c) / 3.0;

        INFO("triangle " << t << " = {" << tri[0] << ", " << tri[1] << ", " << tri[2] << "}");
        REQUIRE(glm::dot(normal, centroid - center) > 0.0);
    }
}

Polyline straight_line(size_t points, const glm::dvec3& step, double z = 0.2) {
    Polyline line;
    for (size_t i = 0; i < points; i++) {
        line.push_back(glm::dvec3(0.0, 0.0, z) + step * static_cast<double>(i));
    }
    return line;
}

} // namespace

// ============================================================================
// Cross-Section Offsets
// ============================================================================

TEST_CASE("GCodeGeometry - Corner offsets of a straight line", "[gcode][geometry][offsets]") {
    Polyline line = {{0.0, 0.0, 0.2}, {5.0, 0.0, 0.2}, {10.0, 0.0, 0.2}};
    auto boundary = compute_corner_offsets(line, 0.2);

    REQUIRE(boundary.size() == 6);

    // Interior normal matches both endpoint normals
    for (size_t i = 0; i < 3; i++) {
        INFO("point " << i);
        REQUIRE(boundary[2 * i].x == Approx(line[i].x));
        REQUIRE(boundary[2 * i].y == Approx(0.2));
        REQUIRE(boundary[2 * i + 1].x == Approx(line[i].x));
        REQUIRE(boundary[2 * i + 1].y == Approx(-0.2));
        REQUIRE(boundary[2 * i].z == 0.2);
        REQUIRE(boundary[2 * i + 1].z == 0.2);
    }
}

TEST_CASE("GCodeGeometry - Corner offsets at a turn", "[gcode][geometry][offsets]") {
    Polyline line = {{0.0, 0.0, 1.0}, {10.0, 0.0, 1.0}, {10.0, 10.0, 1.0}};
    auto boundary = compute_corner_offsets(line, 1.0);
    REQUIRE(boundary.size() == 6);

    // Bisector of the two segment normals, length = half width
    glm::dvec3 plus = boundary[2] - line[1];
    glm::dvec3 minus = boundary[3] - line[1];
    REQUIRE(glm::length(plus) == Approx(1.0));
    REQUIRE(plus.x == Approx(-std::sqrt(0.5)));
    REQUIRE(plus.y == Approx(std::sqrt(0.5)));
    REQUIRE(minus.x == Approx(-plus.x));
    REQUIRE(minus.y == Approx(-plus.y));

    // End point uses the last segment's normal
    REQUIRE(boundary[4].x == Approx(9.0));
    REQUIRE(boundary[4].y == Approx(10.0));
    REQUIRE(boundary[5].x == Approx(11.0));
}

TEST_CASE("GCodeGeometry - Exact reversal does not divide by zero", "[gcode][geometry][offsets]") {
    Polyline line = {{0.0, 0.0, 0.2}, {10.0, 0.0, 0.2}, {0.0, 0.0, 0.2}};

    std::vector<glm::dvec3> boundary;
    REQUIRE_NOTHROW(boundary = compute_corner_offsets(line, 0.2));
    REQUIRE(boundary.size() == 6);

    // Falls back to the incoming segment's normal
    REQUIRE(boundary[2].x == Approx(10.0));
    REQUIRE(boundary[2].y == Approx(0.2));
    REQUIRE(boundary[3].y == Approx(-0.2));
    for (const auto& p : boundary) {
        REQUIRE(std::isfinite(p.x));
        REQUIRE(std::isfinite(p.y));
    }
}

TEST_CASE("GCodeGeometry - Degenerate polylines", "[gcode][geometry][offsets]") {
    SECTION("Fewer than two points yields nothing") {
        REQUIRE(compute_corner_offsets({}, 0.2).empty());
        REQUIRE(compute_corner_offsets({{1.0, 2.0, 0.2}}, 0.2).empty());
    }

    SECTION("Duplicate start point throws") {
        Polyline line = {{0.0, 0.0, 0.2}, {0.0, 0.0, 0.2}, {5.0, 0.0, 0.2}};
        REQUIRE_THROWS_AS(compute_corner_offsets(line, 0.2), GeometryError);
    }

    SECTION("Duplicate end point throws") {
        Polyline line = {{0.0, 0.0, 0.2}, {5.0, 0.0, 0.2}, {5.0, 0.0, 0.2}};
        REQUIRE_THROWS_AS(compute_corner_offsets(line, 0.2), GeometryError);
    }

    SECTION("Vertical-only move throws") {
        Polyline line = {{0.0, 0.0, 0.2}, {0.0, 0.0, 0.4}};
        REQUIRE_THROWS_AS(compute_corner_offsets(line, 0.2), GeometryError);
    }
}

// ============================================================================
// Ribbon Extrusion
// ============================================================================

TEST_CASE("GCodeGeometry - Ribbon mesh is closed", "[gcode][geometry][ribbon]") {
    for (size_t n : {2u, 3u, 7u}) {
        INFO("points: " << n);
        auto boundary = compute_corner_offsets(straight_line(n, {1.0, 0.0, 0.0}), 0.2);
        MeshFragment mesh = build_ribbon_mesh(boundary, 0.2);

        const size_t m = 2 * n;
        REQUIRE(mesh.vertices.size() == 2 * m);
        REQUIRE(mesh.triangles.size() == 4 + 8 * (n - 1));

        std::set<uint32_t> referenced;
        for (const auto& tri : mesh.triangles) {
            for (uint32_t idx : tri) {
                REQUIRE(idx < mesh.vertices.size());
                referenced.insert(idx);
            }
            REQUIRE(tri[0] != tri[1]);
            REQUIRE(tri[1] != tri[2]);
            REQUIRE(tri[0] != tri[2]);
        }
        REQUIRE(referenced.size() == mesh.vertices.size());
    }
}

TEST_CASE("GCodeGeometry - Ribbon vertex layout", "[gcode][geometry][ribbon]") {
    auto boundary = compute_corner_offsets(straight_line(2, {4.0, 0.0, 0.0}), 0.2);
    MeshFragment mesh = build_ribbon_mesh(boundary, 0.3);

    REQUIRE(mesh.vertices.size() == 8);
    for (size_t i = 0; i < 4; i++) {
        REQUIRE(mesh.vertices[i] == boundary[i]);
        REQUIRE(mesh.vertices[i + 4].x == boundary[i].x);
        REQUIRE(mesh.vertices[i + 4].y == boundary[i].y);
        REQUIRE(mesh.vertices[i + 4].z == Approx(boundary[i].z + 0.3));
    }
}

TEST_CASE("GCodeGeometry - Ribbon winding faces outward", "[gcode][geometry][ribbon]") {
    SECTION("Along +X") {
        auto boundary = compute_corner_offsets(straight_line(2, {10.0, 0.0, 0.0}), 0.2);
        require_outward_winding(build_ribbon_mesh(boundary, 0.2));
    }

    SECTION("Along -Y with interior points") {
        auto boundary = compute_corner_offsets(straight_line(4, {0.0, -3.0, 0.0}), 0.2);
        require_outward_winding(build_ribbon_mesh(boundary, 0.2));
    }

    SECTION("Diagonal") {
        auto boundary = compute_corner_offsets(straight_line(3, {-2.0, 2.0, 0.0}), 0.5);
        require_outward_winding(build_ribbon_mesh(boundary, 0.1));
    }
}

TEST_CASE("GCodeGeometry - Invalid ribbon boundary", "[gcode][geometry][ribbon]") {
    std::vector<glm::dvec3> two = {{0.0, 0.2, 0.0}, {0.0, -0.2, 0.0}};
    REQUIRE_THROWS_AS(build_ribbon_mesh(two, 0.2), GeometryError);

    std::vector<glm::dvec3> odd(5, glm::dvec3(0.0));
    REQUIRE_THROWS_AS(build_ribbon_mesh(odd, 0.2), GeometryError);
}

// ============================================================================
// Object Mesh Assembly
// ============================================================================

TEST_CASE("GeometryBuilder - Defaults", "[gcode][geometry][builder]") {
    GeometryBuilder builder;
    REQUIRE(builder.half_width() == Approx(0.2));
    REQUIRE(builder.line_height() == Approx(0.2));
    REQUIRE(builder.worker_threads() == 1);
    REQUIRE(builder.primary_color() == glm::vec3(0.0f, 0.0f, 1.0f));
    REQUIRE(builder.secondary_color().r == Approx(0xDE / 255.0f));
    REQUIRE(builder.secondary_color().g == Approx(0xD6 / 255.0f));
    REQUIRE(builder.secondary_color().b == Approx(0xAB / 255.0f));
}

TEST_CASE("GeometryBuilder - Two extruders", "[gcode][geometry][builder]") {
    ExtruderTrack primary = {{straight_line(2, {1.0, 0.0, 0.0})}};
    ExtruderTrack secondary = {{straight_line(3, {0.0, 1.0, 0.0})}};

    GeometryBuilder builder;
    ObjectMesh mesh = builder.build_object_mesh(primary, secondary);

    REQUIRE(mesh.primary_vertex_count == 8);
    REQUIRE(mesh.secondary_vertex_count == 12);
    REQUIRE(mesh.vertices.size() == 20);
    REQUIRE(mesh.colors.size() == 20);
    REQUIRE(mesh.triangles.size() == 12 + 20);
    REQUIRE(mesh.failed_fragments.empty());

    SECTION("Indices are rebased onto the combined buffer") {
        for (size_t t = 0; t < 12; t++) {
            for (uint32_t idx : mesh.triangles[t]) {
                REQUIRE(idx < 8);
            }
        }
        for (size_t t = 12; t < mesh.triangles.size(); t++) {
            for (uint32_t idx : mesh.triangles[t]) {
                REQUIRE(idx >= 8);
                REQUIRE(idx < 20);
            }
        }
    }

    SECTION("Vertices carry their extruder's color") {
        for (size_t i = 0; i < 8; i++) {
            REQUIRE(mesh.colors[i] == builder.primary_color());
        }
        for (size_t i = 8; i < 20; i++) {
            REQUIRE(mesh.colors[i] == builder.secondary_color());
        }
    }

    SECTION("Statistics") {
        const auto& stats = builder.last_stats();
        REQUIRE(stats.fragments_built == 2);
        REQUIRE(stats.fragments_failed == 0);
        REQUIRE(stats.vertices_generated == 20);
        REQUIRE(stats.triangles_generated == 32);
    }
}

TEST_CASE("GeometryBuilder - Layer limit", "[gcode][geometry][builder]") {
    Polyline lower = straight_line(2, {1.0, 0.0, 0.0}, 0.2);
    Polyline upper = straight_line(2, {1.0, 0.0, 0.0}, 0.4);
    ExtruderTrack primary = {{lower}, {upper}};
    ExtruderTrack secondary = {{lower}, {upper}};

    GeometryBuilder builder;

    SECTION("Negative builds all layers") {
        ObjectMesh mesh = builder.build_object_mesh(primary, secondary, -1);
        REQUIRE(mesh.vertices.size() == 32);
    }

    SECTION("Limit applies to each track") {
        ObjectMesh mesh = builder.build_object_mesh(primary, secondary, 1);
        REQUIRE(mesh.primary_vertex_count == 8);
        REQUIRE(mesh.secondary_vertex_count == 8);
        for (const auto& v : mesh.vertices) {
            REQUIRE(v.z < 0.41);
        }
    }

    SECTION("Zero layers gives an empty mesh") {
        ObjectMesh mesh = builder.build_object_mesh(primary, secondary, 0);
        REQUIRE(mesh.empty());
        REQUIRE(mesh.triangles.empty());
    }

    SECTION("Limit beyond track size is fine") {
        ObjectMesh mesh = builder.build_object_mesh(primary, {}, 100);
        REQUIRE(mesh.vertices.size() == 16);
        REQUIRE(mesh.secondary_vertex_count == 0);
    }
}

TEST_CASE("GeometryBuilder - Failed ribbon is isolated", "[gcode][geometry][builder]") {
    Polyline good = straight_line(2, {1.0, 0.0, 0.0});
    Polyline bad = {{3.0, 3.0, 0.2}, {3.0, 3.0, 0.2}};
    ExtruderTrack primary = {{good, bad, good}};

    GeometryBuilder builder;
    ObjectMesh mesh = builder.build_object_mesh(primary, {});

    REQUIRE(mesh.failed_fragments == std::vector<size_t>{1});
    REQUIRE(mesh.vertices.size() == 16);
    REQUIRE(mesh.triangles.size() == 24);
    for (const auto& tri : mesh.triangles) {
        for (uint32_t idx : tri) {
            REQUIRE(idx < 16);
        }
    }
    REQUIRE(builder.last_stats().fragments_failed == 1);
}

TEST_CASE("GeometryBuilder - Short polylines are skipped", "[gcode][geometry][builder]") {
    ExtruderTrack primary = {{{{1.0, 1.0, 0.2}}, straight_line(2, {1.0, 0.0, 0.0})}};

    GeometryBuilder builder;
    ObjectMesh mesh = builder.build_object_mesh(primary, {});

    REQUIRE(mesh.vertices.size() == 8);
    REQUIRE(mesh.failed_fragments.empty());
    REQUIRE(builder.last_stats().skipped_polylines == 1);
}

TEST_CASE("GeometryBuilder - Worker threads do not change output", "[gcode][geometry][builder]") {
    ExtruderTrack primary;
    ExtruderTrack secondary;
    for (int layer = 0; layer < 10; layer++) {
        Layer p;
        Layer s;
        double z = 0.2 * (layer + 1);
        for (int i = 0; i < 8; i++) {
            p.push_back(straight_line(2 + (i % 4), {1.0, 0.5 * i, 0.0}, z));
            s.push_back(straight_line(3, {-0.5, 1.0 + i, 0.0}, z));
        }
        // One broken line per layer to exercise failure slots
        p.push_back({{1.0, 1.0, z}, {1.0, 1.0, z}});
        primary.push_back(p);
        secondary.push_back(s);
    }

    GeometryBuilder sequential;
    ObjectMesh expected = sequential.build_object_mesh(primary, secondary);

    GeometryBuilder parallel;
    parallel.set_worker_threads(4);
    ObjectMesh actual = parallel.build_object_mesh(primary, secondary);

    REQUIRE(actual.vertices == expected.vertices);
    REQUIRE(actual.triangles == expected.triangles);
    REQUIRE(actual.colors == expected.colors);
    REQUIRE(actual.failed_fragments == expected.failed_fragments);
    REQUIRE(actual.failed_fragments.size() == 10);
    REQUIRE(actual.primary_vertex_count == expected.primary_vertex_count);
    REQUIRE(actual.secondary_vertex_count == expected.secondary_vertex_count);
}

TEST_CASE("GeometryBuilder - Colors", "[gcode][geometry][builder]") {
    GeometryBuilder builder;

    SECTION("Hex color with and without #") {
        REQUIRE(builder.set_primary_color("#FF0000"));
        REQUIRE(builder.primary_color() == glm::vec3(1.0f, 0.0f, 0.0f));
        REQUIRE(builder.set_secondary_color("00ff00"));
        REQUIRE(builder.secondary_color() == glm::vec3(0.0f, 1.0f, 0.0f));
    }

    SECTION("Invalid color keeps the current one") {
        glm::vec3 before = builder.primary_color();
        REQUIRE_FALSE(builder.set_primary_color("not-a-color"));
        REQUIRE(builder.primary_color() == before);
    }

    SECTION("Mesh uses configured colors") {
        builder.set_primary_color(glm::vec3(0.5f, 0.25f, 0.0f));
        ExtruderTrack primary = {{straight_line(2, {1.0, 0.0, 0.0})}};
        ObjectMesh mesh = builder.build_object_mesh(primary, {});
        for (const auto& c : mesh.colors) {
            REQUIRE(c == glm::vec3(0.5f, 0.25f, 0.0f));
        }
    }
}

// ============================================================================
// Worker threads
// ============================================================================

TEST_CASE("WorkerGroup - Threads are joined", "[gcode][geometry][threads]") {
    std::atomic<int> finished{0};
    auto slow_task = [&finished]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        finished++;
    };

    SECTION("join() waits for every thread") {
        WorkerGroup group;
        for (int i = 0; i < 4; i++) {
            group.spawn(slow_task);
        }
        REQUIRE(group.size() == 4);
        group.join();
        REQUIRE(finished == 4);
        REQUIRE(group.size() == 0);

        // Second join is a no-op
        group.join();
        REQUIRE(finished == 4);
    }

    SECTION("Unwinding after a partial start joins the started threads") {
        bool caught = false;
        try {
            WorkerGroup group;
            group.spawn(slow_task);
            group.spawn(slow_task);
            throw std::runtime_error("thread start failed");
        } catch (const std::runtime_error&) {
            caught = true;
        }
        REQUIRE(caught);
        REQUIRE(finished == 2);
    }
}
