/**
 * Entry point for the uberping CLI.
 *
 * Responsible only for:
 * - Parsing command-line options
 * - Reporting configuration errors
 * - Delegating execution to `run_uberping`
 */

#include "cli.hpp"
#include "runner.hpp"
#include "terminal.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    CliOptions options;
    try {
        options = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        term::detect();
        std::cerr << term::red() << "Error: " << e.what() << term::reset() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }

    return run_uberping(options);
}
