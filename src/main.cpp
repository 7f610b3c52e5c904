// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// printwatch: rebuild the printed toolpath of a G-code file as a mesh

#include "cli_args.h"
#include "config.h"
#include "gcode_geometry_builder.h"
#include "gcode_parser.h"
#include "logging_init.h"
#include "mesh_exporter.h"

#include <spdlog/spdlog.h>

#include <cstdio>

using namespace printwatch;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_PARSE_ERROR = 2;
constexpr int EXIT_EXPORT_ERROR = 3;

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_requested ? 0 : EXIT_USAGE;
    }

    // Config first so logging can honor /log_level
    Config* config = Config::get_instance();
    if (!args.config_path.empty()) {
        config->init(args.config_path);
    }

    // Logging is not up yet, so a bad value is reported on stderr
    std::string config_log_level;
    try {
        config_log_level = config->log_level();
    } catch (const json::exception& e) {
        fprintf(stderr, "Error: invalid /log_level in %s: %s\n", config->get_path().c_str(),
                e.what());
        return EXIT_USAGE;
    }

    // Initialize logging subsystem
    // Priority: CLI > config > default
    try {
        logging::LogConfig log_config;
        log_config.level = logging::resolve_log_level(args.verbosity, config_log_level);
        log_config.target = logging::parse_log_target(args.log_dest);
        log_config.file_path = args.log_file;
        logging::init(log_config);
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "Error: cannot initialize logging: %s\n", e.what());
        return EXIT_USAGE;
    }

    gcode::ParserOptions parser_options;
    gcode::GeometryBuilder builder;
    int layer_count = -1;
    try {
        parser_options = config->parser_options();
        config->apply_to(builder);
        layer_count = config->layer_count();
    } catch (const json::exception& e) {
        spdlog::error("[Config] Invalid value in {}: {}", config->get_path(), e.what());
        return EXIT_USAGE;
    }

    // CLI overrides
    if (args.hotend_offset) {
        parser_options.hotend_offset_mm = *args.hotend_offset;
    }
    if (args.layer_count) {
        layer_count = *args.layer_count;
    }
    if (args.worker_threads) {
        builder.set_worker_threads(static_cast<size_t>(*args.worker_threads));
    }

    gcode::ParsedToolpath toolpath;
    try {
        toolpath = gcode::parse_gcode_file(args.gcode_path, parser_options);
    } catch (const gcode::GCodeParseError& e) {
        spdlog::error("[GCode Parser] {}", e.what());
        spdlog::dump_backtrace();
        return EXIT_PARSE_ERROR;
    }

    gcode::ObjectMesh mesh;
    try {
        mesh = builder.build_object_mesh(toolpath.primary, toolpath.secondary, layer_count);
    } catch (const gcode::GeometryError& e) {
        spdlog::error("[GCode Geometry] Mesh build failed: {}", e.what());
        return EXIT_EXPORT_ERROR;
    }

    if (!mesh.failed_fragments.empty()) {
        spdlog::warn("[GCode Geometry] Mesh is missing {} ribbon(s) that could not be built",
                     mesh.failed_fragments.size());
    }
    if (mesh.empty()) {
        spdlog::warn("[GCode Geometry] No extrusion found, writing empty mesh");
    }

    std::string output_path =
        args.output_path.empty() ? default_output_path(args.gcode_path) : args.output_path;
    if (!gcode::write_obj(mesh, output_path)) {
        return EXIT_EXPORT_ERROR;
    }

    printf("%s: %zu vertices, %zu triangles\n", output_path.c_str(), mesh.vertices.size(),
           mesh.triangles.size());
    return 0;
}
