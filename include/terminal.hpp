#pragma once

#if !defined(_WIN32)
  #include <unistd.h>
#endif

/**
 * Minimal ANSI terminal helper.
 *
 * Colors are switched off globally through term::g_enabled, either by
 * --no-color or because stdout is not a terminal.
 */
namespace term {

inline bool g_enabled = true;

inline const char* reset()   { return g_enabled ? "\x1b[0m"  : ""; }
inline const char* red()     { return g_enabled ? "\x1b[31m" : ""; }
inline const char* green()   { return g_enabled ? "\x1b[32m" : ""; }
inline const char* yellow()  { return g_enabled ? "\x1b[33m" : ""; }
inline const char* cyan()    { return g_enabled ? "\x1b[36m" : ""; }

/**
 * Keep colors only when stdout is an interactive terminal.
 */
inline void detect() {
#if defined(_WIN32)
    g_enabled = false;
#else
    if (!::isatty(STDOUT_FILENO)) g_enabled = false;
#endif
}

} // namespace term
