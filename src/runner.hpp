/**
 * High-level session execution for the CLI.
 *
 * Wires the ICMP prober, session log and signal handling around a
 * uberping::SessionCoordinator.
 */

#pragma once
#include "cli.hpp"

/**
 * Run one monitoring session until the time limit or CTRL+C, print the
 * summary and export it if requested.
 *
 * Returns 0 once the summary has been produced.
 */
int run_uberping(const CliOptions& opt);
