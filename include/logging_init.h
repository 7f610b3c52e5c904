// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @file logging_init.h
 * @brief spdlog setup for the printwatch executable
 *
 * Builds the default logger from a console sink and an optional rotating
 * file sink. Level resolution order: CLI -v flags, then config /log_level,
 * then warn.
 */

namespace printwatch {
namespace logging {

/// Where log messages go in addition to (or instead of) the console
enum class LogTarget {
    Auto,    ///< Console only when interactive, file when a log path is given
    Console, ///< Console only
    File,    ///< Rotating log file (5MB x 3)
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path;      ///< Log file (empty = printwatch.log in temp dir)
    bool enable_console = true; ///< Colored stdout sink
};

/**
 * @brief Install the default logger
 *
 * Safe to call more than once; the previous default logger is replaced.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be created
 */
void init(const LogConfig& config);

/**
 * @brief Parse level name ("trace", "debug", "info", "warn"/"warning",
 *        "error", "critical", "off")
 * @return Matching level, or default_level if unrecognized (case sensitive)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level =
                                          spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level
 * @param cli_verbosity Number of -v flags (wins when > 0)
 * @param config_level /log_level from config (used when non-empty)
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/// Parse "console", "file" or "auto" (anything else is Auto)
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace printwatch
