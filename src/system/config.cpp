// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "gcode_geometry_builder.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace printwatch {

Config* Config::instance{NULL};

namespace {

constexpr int CURRENT_CONFIG_VERSION = 1;

/// Upper bound for /geometry/worker_threads
constexpr int MAX_WORKER_THREADS = 64;

} // namespace

json Config::default_config() {
    // log_level empty: resolved from CLI verbosity, then the built-in default
    return {{"config_version", CURRENT_CONFIG_VERSION},
            {"log_level", ""},
            {"parser", {{"hotend_offset_mm", 18.0}, {"start_marker", "M205"}}},
            {"geometry",
             {{"nozzle_width_mm", 0.4},
              {"line_height_mm", 0.2},
              {"layer_count", -1},
              {"worker_threads", 1}}},
            {"colors",
             {{"primary", gcode::GeometryBuilder::DEFAULT_PRIMARY_COLOR},
              {"secondary", gcode::GeometryBuilder::DEFAULT_SECONDARY_COLOR}}}};
}

Config::Config() : data(default_config()) {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    if (stat(config_path.c_str(), &buffer) != 0) {
        spdlog::info("[Config] No config at {}, using defaults", config_path);
        data = default_config();
        return;
    }

    spdlog::info("[Config] Loading config from {}", config_path);
    json loaded;
    bool corrupt = false;
    try {
        std::ifstream file(config_path);
        loaded = json::parse(file);
        corrupt = !loaded.is_object();
        if (corrupt) {
            spdlog::error("[Config] {} does not contain a JSON object", config_path);
        }
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        corrupt = true;
    }

    if (corrupt) {
        spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

        // Backup the corrupt file for diagnosis
        std::string backup_path = config_path + ".corrupt";
        if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
            spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
        } else {
            spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
        }

        data = default_config();
        return;
    }

    // Keys absent from the file keep their defaults
    data = default_config();
    data.merge_patch(loaded);

    int version = data.value("config_version", 0);
    if (version > CURRENT_CONFIG_VERSION) {
        spdlog::warn("[Config] Config version {} is newer than supported version {}", version,
                     CURRENT_CONFIG_VERSION);
    }

    spdlog::debug("[Config] initialized: hotend_offset={}mm, layers={}, threads={}",
                  get<double>("/parser/hotend_offset_mm", 0.0), get<int>("/geometry/layer_count", -1),
                  get<int>("/geometry/worker_threads", 1));
}

std::string Config::get_path() {
    return path;
}

bool Config::save() {
    if (path.empty()) {
        spdlog::error("[Config] Cannot save: no config path set");
        return false;
    }

    spdlog::trace("[Config] Saving config to {}", path);
    std::string temp_path = path + ".tmp";

    {
        std::ofstream o(temp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", temp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", temp_path);
            o.close();
            std::remove(temp_path.c_str());
            return false;
        }
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        spdlog::error("[Config] Failed to replace {} with {}", path, temp_path);
        std::remove(temp_path.c_str());
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = default_config();
}

gcode::ParserOptions Config::parser_options() {
    gcode::ParserOptions options;
    options.hotend_offset_mm = get<double>("/parser/hotend_offset_mm", options.hotend_offset_mm);
    options.start_marker = get<std::string>("/parser/start_marker", options.start_marker);

    if (options.start_marker.empty()) {
        spdlog::warn("[Config] Empty /parser/start_marker, using M205");
        options.start_marker = "M205";
    }
    return options;
}

int Config::layer_count() {
    return get<int>("/geometry/layer_count", -1);
}

std::string Config::log_level() {
    return get<std::string>("/log_level", "");
}

void Config::apply_to(gcode::GeometryBuilder& builder) {
    double nozzle = get<double>("/geometry/nozzle_width_mm", 0.4);
    if (nozzle > 0.0) {
        builder.set_half_width(nozzle / 2.0);
    } else {
        spdlog::warn("[Config] Ignoring non-positive nozzle width {}", nozzle);
    }

    double height = get<double>("/geometry/line_height_mm", 0.2);
    if (height > 0.0) {
        builder.set_line_height(height);
    } else {
        spdlog::warn("[Config] Ignoring non-positive line height {}", height);
    }

    int threads = get<int>("/geometry/worker_threads", 1);
    if (threads < 1 || threads > MAX_WORKER_THREADS) {
        spdlog::warn("[Config] worker_threads {} out of range 1-{}, clamping", threads,
                     MAX_WORKER_THREADS);
        threads = std::max(1, std::min(threads, MAX_WORKER_THREADS));
    }
    builder.set_worker_threads(static_cast<size_t>(threads));

    if (!builder.set_primary_color(
            get<std::string>("/colors/primary", gcode::GeometryBuilder::DEFAULT_PRIMARY_COLOR))) {
        spdlog::warn("[Config] /colors/primary is not a #RRGGBB color, keeping current");
    }
    if (!builder.set_secondary_color(get<std::string>(
            "/colors/secondary", gcode::GeometryBuilder::DEFAULT_SECONDARY_COLOR))) {
        spdlog::warn("[Config] /colors/secondary is not a #RRGGBB color, keeping current");
    }
}

} // namespace printwatch
