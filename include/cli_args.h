// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for printwatch
 */

#include <optional>
#include <string>

namespace printwatch {

/**
 * @brief Parsed command-line arguments
 *
 * Unset optionals fall back to the configuration file.
 */
struct CliArgs {
    std::string gcode_path;  ///< Positional: G-code input
    std::string config_path; ///< -c/--config (empty = defaults only)
    std::string output_path; ///< -o/--output (empty = derived from gcode_path)

    std::optional<int> layer_count;      ///< -l/--layers
    std::optional<double> hotend_offset; ///< --hotend-offset
    std::optional<int> worker_threads;   ///< -j/--jobs

    // Logging
    int verbosity = 0;
    std::string log_dest = "auto";
    std::string log_file;

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or error occurred
 *         (check args.help_requested to tell them apart)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Output path used when -o is not given: input with ".obj" extension
 *
 * "prints/benchy.gcode" -> "prints/benchy.obj"
 */
std::string default_output_path(const std::string& gcode_path);

void print_help(const char* program_name);

} // namespace printwatch
