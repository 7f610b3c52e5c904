// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_parser.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <sstream>

namespace printwatch {
namespace gcode {

namespace {

/// Plain decimal: [+-]digits[.digits][(e|E)[+-]digits]. Rejects the hex,
/// inf and nan spellings that strtod would otherwise accept.
bool is_decimal_number(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    auto digits = [&]() {
        size_t start = i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
            i++;
        }
        return i - start;
    };

    if (i < n && (text[i] == '+' || text[i] == '-')) {
        i++;
    }
    size_t mantissa = digits();
    if (i < n && text[i] == '.') {
        i++;
        mantissa += digits();
    }
    if (mantissa == 0) {
        return false;
    }
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        i++;
        if (i < n && (text[i] == '+' || text[i] == '-')) {
            i++;
        }
        if (digits() == 0) {
            return false;
        }
    }
    return i == n;
}

} // namespace

// ============================================================================
// ParsedToolpath Methods
// ============================================================================

size_t ParsedToolpath::polyline_count() const {
    size_t count = 0;
    for (const auto& layer : primary) {
        count += layer.size();
    }
    for (const auto& layer : secondary) {
        count += layer.size();
    }
    return count;
}

// ============================================================================
// GCodeParser Implementation
// ============================================================================

GCodeParser::GCodeParser() : GCodeParser(ParserOptions{}) {}

GCodeParser::GCodeParser(const ParserOptions& options) : options_(options) {
    reset();
}

void GCodeParser::reset() {
    states_ = {PrinterState{}, PrinterState{}};
    tracks_ = {TrackBuilder{}, TrackBuilder{}};
    active_ = PRIMARY;
    printing_ = false;
    last_move_extruded_ = false;
    absolute_positioning_ = true;
    absolute_extrusion_ = true;
    lines_parsed_ = 0;
    motion_commands_ = 0;
    extrusion_moves_ = 0;
    tool_changes_ = 0;
    ignored_tool_selects_ = 0;
}

void GCodeParser::parse_line(const std::string& line) {
    lines_parsed_++;

    std::string trimmed = trim_line(line);
    if (trimmed.empty()) {
        return;
    }

    std::string command = first_token(trimmed);

    // Tool selection is tracked even before recording starts so the active
    // extruder is right by the time the first real move arrives
    if (command[0] == 'T') {
        parse_tool_change_command(command);
        return;
    }

    // Positioning modes, tracked from the preamble onwards. Coordinates are
    // always read as absolute, so relative modes are only reported.
    if (command == "G90") {
        absolute_positioning_ = true;
        return;
    } else if (command == "G91") {
        if (absolute_positioning_) {
            spdlog::warn("[GCode Parser] G91 at line {}: relative positioning is not supported, "
                         "coordinates are read as absolute",
                         lines_parsed_);
        }
        absolute_positioning_ = false;
        return;
    } else if (command == "M82") {
        absolute_extrusion_ = true;
        return;
    } else if (command == "M83") {
        if (absolute_extrusion_) {
            spdlog::warn("[GCode Parser] M83 at line {}: relative extrusion is not supported, "
                         "E values are read as absolute",
                         lines_parsed_);
        }
        absolute_extrusion_ = false;
        return;
    }

    if (command == options_.start_marker) {
        if (!printing_) {
            spdlog::debug("[GCode Parser] Start marker {} at line {}, recording motion",
                          options_.start_marker, lines_parsed_);
        }
        printing_ = true;
        return;
    }

    if (!printing_) {
        return;
    }

    if (command == "G0" || command == "G1") {
        parse_movement_command(trimmed);
    } else if (command == "G92") {
        parse_set_position_command(trimmed);
    } else {
        spdlog::trace("[GCode Parser] Ignoring command '{}' at line {}", command, lines_parsed_);
    }
}

void GCodeParser::parse_tool_change_command(const std::string& command) {
    // Format: "T0", "T1" (standalone token)
    if (command.length() < 2) {
        return;
    }
    for (size_t i = 1; i < command.length(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(command[i]))) {
            return; // Not a tool select
        }
    }

    if (command != "T0" && command != "T1") {
        ignored_tool_selects_++;
        spdlog::warn("[GCode Parser] Ignoring {} at line {}: only T0 and T1 are tracked", command,
                     lines_parsed_);
        return;
    }

    size_t tool = (command == "T1") ? SECONDARY : PRIMARY;
    if (tool == active_) {
        return;
    }

    // Switching slots leaves the previous extruder's registers exactly as they were
    active_ = tool;
    tool_changes_++;
    spdlog::debug("[GCode Parser] Tool change: {} at line {} (resume at X={:.3f} Y={:.3f} Z={:.3f})",
                  command, lines_parsed_, states_[active_].position.x, states_[active_].position.y,
                  states_[active_].position.z);
}

GCodeParser::Operands GCodeParser::parse_operands(const std::string& line) const {
    const PrinterState& state = states_[active_];

    Operands ops;
    ops.position = state.position;
    ops.e = state.last_e;

    std::istringstream tokens(line);
    std::string token;
    tokens >> token; // Command code

    while (tokens >> token) {
        char axis = static_cast<char>(std::toupper(static_cast<unsigned char>(token[0])));
        if (axis != 'X' && axis != 'Y' && axis != 'Z' && axis != 'E') {
            continue; // Feedrate and friends do not affect geometry
        }

        std::string number = token.substr(1);
        double value = 0.0;
        bool valid = is_decimal_number(number);
        if (valid) {
            char* end = nullptr;
            value = std::strtod(number.c_str(), &end);
            // Underflow to a denormal or zero is fine; overflow shows up as inf
            valid = end == number.c_str() + number.size() && std::isfinite(value);
        }
        if (!valid) {
            throw GCodeParseError("Malformed " + std::string(1, axis) + " operand '" + token +
                                      "' at line " + std::to_string(lines_parsed_),
                                  lines_parsed_);
        }

        switch (axis) {
        case 'X':
            ops.position.x = (active_ == SECONDARY) ? value + options_.hotend_offset_mm : value;
            ops.has_x = true;
            break;
        case 'Y':
            ops.position.y = value;
            ops.has_y = true;
            break;
        case 'Z':
            ops.position.z = value;
            ops.has_z = true;
            break;
        default:
            ops.e = value;
            ops.has_e = true;
            break;
        }
    }

    return ops;
}

double GCodeParser::update_extrusion_balance(double new_e) {
    PrinterState& state = states_[active_];

    // A retraction drives the balance negative; it has to be refilled before
    // filament leaves the nozzle again
    double delta = new_e - state.last_e;
    if (state.extrusion_balance <= 0.0) {
        state.extrusion_balance += delta;
    } else {
        state.extrusion_balance = delta;
    }
    state.last_e = new_e;

    return state.extrusion_balance;
}

void GCodeParser::parse_movement_command(const std::string& line) {
    motion_commands_++;

    Operands ops = parse_operands(line);

    bool extruding = false;
    if (ops.has_e) {
        double balance = update_extrusion_balance(ops.e);
        extruding = ops.has_xyz() && balance > 0.0;
    }

    if (extruding) {
        record_extrusion(ops.position);
    } else {
        record_travel(ops.position);
    }

    states_[active_].position = ops.position;
    last_move_extruded_ = extruding;
}

void GCodeParser::parse_set_position_command(const std::string& line) {
    Operands ops = parse_operands(line);
    PrinterState& state = states_[active_];

    // Bare "G92" zeroes every axis
    if (!ops.has_xyz() && !ops.has_e) {
        state.position = glm::dvec3(0.0, 0.0, 0.0);
        state.last_e = 0.0;
        return;
    }

    if (ops.has_xyz()) {
        state.position = ops.position;
    }
    if (ops.has_e) {
        state.last_e = ops.e;
    }
    spdlog::trace("[GCode Parser] G92 at line {}: E={:.5f}", lines_parsed_, state.last_e);
}

void GCodeParser::record_extrusion(const glm::dvec3& point) {
    PrinterState& state = states_[active_];
    TrackBuilder& track = tracks_[active_];

    if (point.z != state.last_extruded_z) {
        if (track.open_line.size() > 1) {
            track.current_layer.push_back(std::move(track.open_line));
        }
        track.layers.push_back(std::move(track.current_layer));
        track.current_layer.clear();
        track.open_line.clear();
        spdlog::trace("[GCode Parser] T{} layer {} at Z={:.3f}", active_, track.layers.size(),
                      point.z);
    }

    track.open_line.push_back(point);
    state.last_extruded_z = point.z;
    extrusion_moves_++;
}

void GCodeParser::record_travel(const glm::dvec3& point) {
    TrackBuilder& track = tracks_[active_];

    if (track.open_line.size() > 1) {
        track.current_layer.push_back(std::move(track.open_line));
    }
    track.open_line.clear();
    track.open_line.push_back(point);
}

std::string GCodeParser::trim_line(const std::string& line) {
    size_t comment_pos = line.find(';');
    std::string without_comment =
        (comment_pos != std::string::npos) ? line.substr(0, comment_pos) : line;

    size_t start = 0;
    while (start < without_comment.length() &&
           std::isspace(static_cast<unsigned char>(without_comment[start]))) {
        start++;
    }
    size_t end = without_comment.length();
    while (end > start && std::isspace(static_cast<unsigned char>(without_comment[end - 1]))) {
        end--;
    }

    return without_comment.substr(start, end - start);
}

std::string GCodeParser::first_token(const std::string& line) {
    size_t end = 0;
    while (end < line.length() && !std::isspace(static_cast<unsigned char>(line[end]))) {
        end++;
    }
    return line.substr(0, end);
}

ParsedToolpath GCodeParser::finalize() {
    ParsedToolpath result;

    for (size_t i = 0; i < tracks_.size(); i++) {
        TrackBuilder& track = tracks_[i];

        bool has_content =
            !track.layers.empty() || !track.current_layer.empty() || track.open_line.size() > 1;
        if (has_content) {
            if (track.open_line.size() > 1) {
                track.current_layer.push_back(std::move(track.open_line));
            }
            track.layers.push_back(std::move(track.current_layer));

            // The move that brings the nozzle to the first layer height closes an
            // empty setup layer
            track.layers.erase(track.layers.begin());
        }

        ExtruderTrack& out = (i == PRIMARY) ? result.primary : result.secondary;
        out = std::move(track.layers);
    }

    result.lines_parsed = lines_parsed_;
    result.motion_commands = motion_commands_;
    result.extrusion_moves = extrusion_moves_;
    result.tool_changes = tool_changes_;
    result.ignored_tool_selects = ignored_tool_selects_;

    if (!printing_) {
        spdlog::warn("[GCode Parser] Start marker {} never seen, no motion recorded",
                     options_.start_marker);
    }
    if (result.secondary.empty()) {
        spdlog::debug("[GCode Parser] Secondary extruder track is empty");
    }

    spdlog::info("[GCode Parser] Parsed G-code: {} lines, {} primary layers, {} secondary layers, "
                 "{} polylines, {} tool changes",
                 result.lines_parsed, result.primary.size(), result.secondary.size(),
                 result.polyline_count(), result.tool_changes);

    reset();

    return result;
}

// ============================================================================
// Stream / File Helpers
// ============================================================================

ParsedToolpath parse_gcode_stream(std::istream& input, const ParserOptions& options) {
    GCodeParser parser(options);

    std::string line;
    while (std::getline(input, line)) {
        parser.parse_line(line);

        if (parser.lines_parsed() % 100000 == 0) {
            spdlog::debug("[GCode Parser] Processed {} lines...", parser.lines_parsed());
        }
    }

    if (input.bad()) {
        throw GCodeParseError("Read error after line " + std::to_string(parser.lines_parsed()),
                              parser.lines_parsed());
    }

    return parser.finalize();
}

ParsedToolpath parse_gcode_file(const std::string& path, const ParserOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GCodeParseError("Cannot open G-code file: " + path, 0);
    }

    spdlog::info("[GCode Parser] Parsing {} (hotend offset {:.2f}mm)", path,
                 options.hotend_offset_mm);
    return parse_gcode_stream(file, options);
}

} // namespace gcode
} // namespace printwatch
