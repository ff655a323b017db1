#pragma once
#include <string>
#include "uberping/session.hpp"
#include "export.hpp"

/**
 * Parsed command-line options for the uberping executable.
 *
 * Session parameters go straight into the embedded SessionConfig;
 * everything else is front-end only (log file, colors, export).
 */
struct CliOptions {
    uberping::SessionConfig session;  // Probe + threshold parameters

    bool help{false};                 // -h / --help seen
    bool no_color{false};             // Disable ANSI colors

    std::string log_path;             // Empty = auto-generated

    std::string export_path;          // CSV/JSON summary export
    ExportFormat export_format{ExportFormat::CSV};
    bool export_append{false};        // Append instead of overwrite
};

/**
 * Parse all command-line arguments.
 *
 * Throws std::invalid_argument on unknown flags, missing values,
 * malformed numbers or an inconsistent configuration. With --help
 * the configuration is not validated.
 */
CliOptions parse_args(int argc, char** argv);

/**
 * Usage text for -h and configuration errors.
 */
void print_usage(const char* prog);
