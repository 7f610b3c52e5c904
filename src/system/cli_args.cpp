// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace printwatch {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// Helper to parse double with validation
static bool parse_double(const char* str, double& out, const char* name) {
    char* endptr;
    double val = strtod(str, &endptr);
    if (*str == '\0' || *endptr != '\0') {
        printf("Error: %s requires a numeric value\n", name);
        return false;
    }
    out = val;
    return true;
}

// Value of "--opt=value" or the following argument
static const char* option_value(int argc, char** argv, int& i, const char* long_name) {
    size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", argv[i]);
    return nullptr;
}

static bool matches(const char* arg, const char* short_name, const char* long_name) {
    if (short_name && strcmp(arg, short_name) == 0) {
        return true;
    }
    size_t len = strlen(long_name);
    return strncmp(arg, long_name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

void print_help(const char* program_name) {
    printf("Usage: %s <gcode_file> [options]\n", program_name);
    printf("Rebuild the printed toolpath of a G-code file as a colored OBJ mesh.\n");
    printf("Options:\n");
    printf("  -c, --config <path>    JSON configuration file\n");
    printf("  -o, --output <path>    OBJ output (default: <gcode_file>.obj)\n");
    printf("  -l, --layers <n>       Number of layers to build from the bottom (default: all)\n");
    printf("  --hotend-offset <mm>   X offset of the second extruder (overrides config)\n");
    printf("  -j, --jobs <n>         Worker threads for mesh generation (1-64)\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>      Log destination: auto, file, console\n");
    printf("  --log-file <path>      Log file path (when --log-dest=file)\n");
    printf("  -h, --help             Show this help message\n");
    printf("\nExit codes: 0 ok, 1 usage error, 2 G-code parse error, 3 export failure\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            args.help_requested = true;
            return false;
        } else if (matches(arg, "-c", "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value) {
                return false;
            }
            args.config_path = value;
        } else if (matches(arg, "-o", "--output")) {
            const char* value = option_value(argc, argv, i, "--output");
            if (!value) {
                return false;
            }
            args.output_path = value;
        } else if (matches(arg, "-l", "--layers")) {
            const char* value = option_value(argc, argv, i, "--layers");
            int layers = 0;
            if (!value || !parse_int(value, 0, 1000000, layers, "layer count")) {
                return false;
            }
            args.layer_count = layers;
        } else if (matches(arg, nullptr, "--hotend-offset")) {
            const char* value = option_value(argc, argv, i, "--hotend-offset");
            double offset = 0.0;
            if (!value || !parse_double(value, offset, "--hotend-offset")) {
                return false;
            }
            args.hotend_offset = offset;
        } else if (matches(arg, "-j", "--jobs")) {
            const char* value = option_value(argc, argv, i, "--jobs");
            int jobs = 0;
            if (!value || !parse_int(value, 1, 64, jobs, "job count")) {
                return false;
            }
            args.worker_threads = jobs;
        }
        // Verbosity: -v, -vv, -vvv (repeatable)
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "-vv") == 0 || strcmp(arg, "-vvv") == 0) {
            const char* p = arg;
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (matches(arg, nullptr, "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value) {
                return false;
            }
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", value);
                printf("Valid values: auto, file, console\n");
                return false;
            }
        } else if (matches(arg, nullptr, "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value) {
                return false;
            }
            args.log_file = value;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            printf("Unknown option: %s\n", arg);
            printf("Use --help for usage information\n");
            return false;
        } else if (args.gcode_path.empty()) {
            args.gcode_path = arg;
        } else {
            printf("Error: unexpected argument: %s\n", arg);
            return false;
        }
    }

    if (args.gcode_path.empty()) {
        printf("Error: no G-code file given\n");
        printf("Use --help for usage information\n");
        return false;
    }

    return true;
}

std::string default_output_path(const std::string& gcode_path) {
    size_t slash = gcode_path.find_last_of('/');
    size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;
    size_t dot = gcode_path.find_last_of('.');
    if (dot != std::string::npos && dot > name_start) {
        return gcode_path.substr(0, dot) + ".obj";
    }
    return gcode_path + ".obj";
}

} // namespace printwatch
