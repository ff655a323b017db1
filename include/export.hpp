#pragma once
#include <string>
#include "uberping/session.hpp"

/**
 * Supported export formats.
 */
enum class ExportFormat {
    CSV,
    JSON
};

/**
 * Write the end-of-session summary to a file.
 *
 * CSV: one header line (skipped when appending) + one row.
 * JSON: one object per line, including the spike list.
 *
 * Returns false if the file could not be opened or written.
 */
bool export_summary(const std::string& path,
                    ExportFormat fmt,
                    const uberping::SessionSummary& summary,
                    bool append = false);
