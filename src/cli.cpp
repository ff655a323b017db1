#include "cli.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * Strict integer parse: the whole token must be a number.
 */
static int to_int(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
    if (used != value.size())
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    return v;
}

static std::string need_value(int argc, char** argv, int& i, const std::string& flag) {
    if (i + 1 >= argc)
        throw std::invalid_argument("Missing value for " + flag);
    return argv[++i];
}

/**
 * Parse command-line arguments into a CliOptions struct.
 *
 * Flags follow the classic UberPing script (-d, -t, -l, -i, -s, --debug)
 * with a few additions for the threshold controller, probe timeout,
 * colors and summary export. A first argument that is not a flag is
 * taken as the destination.
 */
CliOptions parse_args(int argc, char** argv) {
    CliOptions opt{};
    auto& s = opt.session;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        // ------------------------------
        // Target and session length
        // ------------------------------
        if (a == "-d" || a == "--destination") {
            s.destination = need_value(argc, argv, i, a);

        } else if (a == "-t" || a == "--time-limit") {
            s.time_limit_s = to_int(a, need_value(argc, argv, i, a));

        } else if (a == "-i" || a == "--interval") {
            s.interval_ms = to_int(a, need_value(argc, argv, i, a));

        } else if (a == "-W" || a == "--timeout") {
            s.probe_timeout_ms = to_int(a, need_value(argc, argv, i, a));

        // ------------------------------
        // Adaptive threshold
        // ------------------------------
        } else if (a == "-s" || a == "--spike-multiplier") {
            s.threshold.multiplier_pct = to_int(a, need_value(argc, argv, i, a));

        } else if (a == "-r" || a == "--recompute-interval") {
            s.threshold.recompute_interval = to_int(a, need_value(argc, argv, i, a));

        } else if (a == "--min-threshold") {
            s.threshold.min_ms = to_int(a, need_value(argc, argv, i, a));

        } else if (a == "--max-threshold") {
            s.threshold.max_ms = to_int(a, need_value(argc, argv, i, a));

        } else if (a == "--debug") {
            s.debug = true;

        // ------------------------------
        // Output
        // ------------------------------
        } else if (a == "-l" || a == "--log-file") {
            opt.log_path = need_value(argc, argv, i, a);

        } else if (a == "--no-color") {
            opt.no_color = true;

        } else if (a == "--csv") {
            opt.export_path = need_value(argc, argv, i, a);
            opt.export_format = ExportFormat::CSV;

        } else if (a == "--json") {
            opt.export_path = need_value(argc, argv, i, a);
            opt.export_format = ExportFormat::JSON;

        } else if (a == "--export-append") {
            opt.export_append = true;

        } else if (a == "-h" || a == "--help") {
            opt.help = true;

        // ------------------------------
        // Bare destination
        // ------------------------------
        } else if (i == 1 && !a.empty() && a[0] != '-') {
            s.destination = a;

        } else {
            throw std::invalid_argument("Unknown option: " + a);
        }
    }

    if (!opt.help)
        uberping::validate(s);

    return opt;
}

void print_usage(const char* prog) {
    std::cout
        << "UberPing - adaptive latency and spike monitor\n"
        << "\n"
        << "Usage: " << prog << " -d <destination> [options]\n"
        << "\n"
        << "Required:\n"
        << "  -d, --destination <target>       Target hostname or IPv4 address\n"
        << "\n"
        << "Optional:\n"
        << "  -t, --time-limit <seconds>       Time limit (0 = continuous, default: 0)\n"
        << "  -l, --log-file <path>            Log file (default: ./uberping_logs/...)\n"
        << "  -i, --interval <ms>              Ping interval (default: 1000)\n"
        << "  -W, --timeout <ms>               Per-ping timeout (default: 5000)\n"
        << "  -s, --spike-multiplier <pct>     Threshold multiplier (default: 200)\n"
        << "  -r, --recompute-interval <n>     Successes between recalculations (default: 10)\n"
        << "      --min-threshold <ms>         Threshold floor (default: 20)\n"
        << "      --max-threshold <ms>         Threshold ceiling (default: 500)\n"
        << "      --debug                      Show threshold recalculation details\n"
        << "      --no-color                   Disable ANSI colors\n"
        << "      --csv <path>                 Export summary as CSV\n"
        << "      --json <path>                Export summary as JSON\n"
        << "      --export-append              Append to the export file\n"
        << "  -h, --help                       Show this help message\n"
        << "\n"
        << "Examples:\n"
        << "  " << prog << " -d 8.8.8.8\n"
        << "  " << prog << " -d example.com -t 60 -i 2000\n"
        << "  " << prog << " -d 192.168.1.1 -s 150 -t 300 --debug\n";
}
