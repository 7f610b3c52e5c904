// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 356C LLC
 *
 * This file is part of PrintWatch, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <array>
#include <cstddef>
#include <glm/glm.hpp>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file gcode_parser.h
 * @brief Streaming G-code parser producing per-extruder extrusion polylines
 *
 * The parser processes G-code line-by-line and reconstructs where material
 * was actually deposited. A polyline is one uninterrupted extrusion: it starts
 * at the last travel point and ends when the nozzle stops extruding. Polylines
 * are grouped into layers (one per extruded Z height) and layers are grouped
 * per extruder (primary = T0, secondary = T1).
 *
 * Design goals:
 * - Streaming: one pass, no seeking, no buffering of the file
 * - Dual extrusion: each extruder keeps its own position/E state across
 *   tool changes
 * - Retraction aware: moves that only refill a retraction are not extrusion
 */

namespace printwatch {
namespace gcode {

/// Ordered points of one continuous extrusion (always >= 2 points once stored)
using Polyline = std::vector<glm::dvec3>;

/// All polylines printed at one Z height
using Layer = std::vector<Polyline>;

/// Layers of one extruder, bottom to top
using ExtruderTrack = std::vector<Layer>;

/**
 * @brief Fatal parse failure (malformed operand, unreadable stream)
 *
 * No partial result is available once this is thrown.
 */
class GCodeParseError : public std::runtime_error {
  public:
    GCodeParseError(const std::string& what, size_t line_number)
        : std::runtime_error(what), line_number_(line_number) {}

    /// 1-based line number, or 0 when the error is not tied to a line
    size_t line_number() const {
        return line_number_;
    }

  private:
    size_t line_number_;
};

/**
 * @brief Parser configuration
 */
struct ParserOptions {
    /// Added to X while T1 is active. Slicers for dual-head printers shift the
    /// head so the second nozzle lands on the part; this undoes that shift.
    double hotend_offset_mm = 0.0;

    /// Command that marks the end of setup/priming. Nothing is recorded before it.
    std::string start_marker = "M205";
};

/**
 * @brief Per-extruder machine registers
 *
 * One instance per extruder slot. Tool changes switch which slot is active;
 * the inactive slot keeps its values untouched until it is selected again.
 */
struct PrinterState {
    glm::dvec3 position{0.0, 0.0, 0.0}; ///< Current nozzle position (mm)
    double last_extruded_z{0.0};        ///< Z of the most recent extruding move
    double last_e{0.0};                 ///< Last E register value seen
    double extrusion_balance{0.0};      ///< Signed retraction/extrusion accumulator

    bool operator==(const PrinterState& other) const {
        return position == other.position && last_extruded_z == other.last_extruded_z &&
               last_e == other.last_e && extrusion_balance == other.extrusion_balance;
    }
};

/**
 * @brief Result of parsing: one track per extruder
 *
 * Either track may be empty (single extruder prints leave secondary empty).
 */
struct ParsedToolpath {
    ExtruderTrack primary;   ///< Lines printed by T0
    ExtruderTrack secondary; ///< Lines printed by T1

    // Statistics
    size_t lines_parsed{0};     ///< Total input lines
    size_t motion_commands{0};  ///< G0/G1 lines seen while recording
    size_t extrusion_moves{0};  ///< Moves classified as extruding
    size_t tool_changes{0};     ///< Effective T0/T1 switches
    size_t ignored_tool_selects{0}; ///< T2+ selects that were skipped

    /// Total polyline count across both tracks
    size_t polyline_count() const;
};

/**
 * @brief Streaming toolpath parser
 *
 * Usage pattern:
 * @code
 *   GCodeParser parser(options);
 *   std::string line;
 *   while (std::getline(file, line)) {
 *       parser.parse_line(line);
 *   }
 *   ParsedToolpath result = parser.finalize();
 * @endcode
 *
 * The parser maintains state across parse_line() calls. Call finalize() once
 * when complete to get the result; the parser is reset afterwards.
 */
class GCodeParser {
  public:
    static constexpr size_t PRIMARY = 0;
    static constexpr size_t SECONDARY = 1;

    GCodeParser();
    explicit GCodeParser(const ParserOptions& options);
    ~GCodeParser() = default;

    /**
     * @brief Parse single line of G-code
     * @param line Raw G-code line (may include comments)
     * @throws GCodeParseError on malformed numeric operands
     */
    void parse_line(const std::string& line);

    /**
     * @brief Flush open layers, drop the setup artifact layer and return tracks
     *
     * Clears internal state.
     */
    ParsedToolpath finalize();

    /**
     * @brief Reset parser state for a new stream (options are kept)
     */
    void reset();

    size_t lines_parsed() const {
        return lines_parsed_;
    }

    /// True once the start marker has been seen
    bool is_printing() const {
        return printing_;
    }

    /// Index of the active extruder (PRIMARY or SECONDARY)
    size_t active_extruder() const {
        return active_;
    }

    /// Registers of an extruder slot (active or saved)
    const PrinterState& state(size_t extruder) const {
        return states_[extruder];
    }

    /// False after G91 (relative positioning is reported, not applied)
    bool is_absolute_positioning() const {
        return absolute_positioning_;
    }

    /// False after M83 (relative extrusion is reported, not applied)
    bool is_absolute_extrusion() const {
        return absolute_extrusion_;
    }

    /// Whether the most recent motion command was classified as extruding
    bool last_move_extruded() const {
        return last_move_extruded_;
    }

    const ParserOptions& options() const {
        return options_;
    }

  private:
    /**
     * @brief Accumulated output for one extruder while parsing
     */
    struct TrackBuilder {
        ExtruderTrack layers; ///< Closed layers (first is the setup artifact)
        Layer current_layer;  ///< Lines of the layer being printed
        Polyline open_line;   ///< Polyline being extended
    };

    /// Operands found on a G0/G1/G92 line
    struct Operands {
        glm::dvec3 position{0.0, 0.0, 0.0};
        double e{0.0};
        bool has_x{false};
        bool has_y{false};
        bool has_z{false};
        bool has_e{false};

        bool has_xyz() const {
            return has_x || has_y || has_z;
        }
    };

    void parse_tool_change_command(const std::string& line);
    void parse_movement_command(const std::string& line);
    void parse_set_position_command(const std::string& line);

    /**
     * @brief Parse X/Y/Z/E operands relative to the active state
     * @throws GCodeParseError on a malformed value
     */
    Operands parse_operands(const std::string& line) const;

    /**
     * @brief Update extrusion balance for a new E value
     * @return Updated balance
     */
    double update_extrusion_balance(double new_e);

    void record_extrusion(const glm::dvec3& point);
    void record_travel(const glm::dvec3& point);

    static std::string trim_line(const std::string& line);
    static std::string first_token(const std::string& line);

    ParserOptions options_;

    // Per-extruder state
    std::array<PrinterState, 2> states_;
    std::array<TrackBuilder, 2> tracks_;
    size_t active_{PRIMARY};

    bool printing_{false};
    bool last_move_extruded_{false};
    bool absolute_positioning_{true}; ///< G90/G91
    bool absolute_extrusion_{true};   ///< M82/M83

    // Progress tracking
    size_t lines_parsed_{0};
    size_t motion_commands_{0};
    size_t extrusion_moves_{0};
    size_t tool_changes_{0};
    size_t ignored_tool_selects_{0};
};

/**
 * @brief Parse a complete G-code stream
 * @throws GCodeParseError on malformed operands or stream failure
 */
ParsedToolpath parse_gcode_stream(std::istream& input, const ParserOptions& options = {});

/**
 * @brief Parse a G-code file
 * @throws GCodeParseError if the file cannot be read or is malformed
 */
ParsedToolpath parse_gcode_file(const std::string& path, const ParserOptions& options = {});

} // namespace gcode
} // namespace printwatch
