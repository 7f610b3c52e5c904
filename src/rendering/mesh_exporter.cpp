// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mesh_exporter.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <ostream>

namespace printwatch {
namespace gcode {

bool write_obj(const ObjectMesh& mesh, std::ostream& out) {
    out << "# printwatch toolpath mesh\n";
    out << fmt::format("# {} vertices, {} triangles\n", mesh.vertices.size(),
                       mesh.triangles.size());

    for (size_t i = 0; i < mesh.vertices.size(); i++) {
        const glm::dvec3& v = mesh.vertices[i];
        const glm::vec3 c = i < mesh.colors.size() ? mesh.colors[i] : glm::vec3(1.0f);
        out << fmt::format("v {:.6f} {:.6f} {:.6f} {:.4f} {:.4f} {:.4f}\n", v.x, v.y, v.z, c.r,
                           c.g, c.b);
    }

    // OBJ indices are 1-based
    for (const auto& tri : mesh.triangles) {
        out << fmt::format("f {} {} {}\n", tri[0] + 1, tri[1] + 1, tri[2] + 1);
    }

    out.flush();
    return out.good();
}

bool write_obj(const ObjectMesh& mesh, const std::string& path) {
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path);
        if (!file.is_open()) {
            spdlog::error("[Mesh Export] Cannot open {} for writing", temp_path);
            return false;
        }

        if (!write_obj(mesh, file)) {
            spdlog::error("[Mesh Export] Error writing mesh to {}", temp_path);
            file.close();
            std::remove(temp_path.c_str());
            return false;
        }
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        spdlog::error("[Mesh Export] Failed to move {} into place at {}", temp_path, path);
        std::remove(temp_path.c_str());
        return false;
    }

    spdlog::info("[Mesh Export] Wrote {} vertices, {} triangles to {}", mesh.vertices.size(),
                 mesh.triangles.size(), path);
    return true;
}

} // namespace gcode
} // namespace printwatch
