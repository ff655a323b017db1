/**
 * Runner: one monitoring session from the command line.
 *
 * This module handles:
 * - Log file location
 * - Start banner
 * - SIGINT/SIGTERM -> cooperative cancellation
 * - Summary export
 *
 * The probe loop itself lives in uberping::SessionCoordinator.
 */

#include "runner.hpp"
#include "uberping/output.hpp"
#include "uberping/ping.hpp"
#include "uberping/session.hpp"
#include "uberping/util.hpp"
#include "terminal.hpp"
#include "export.hpp"

#include <csignal>
#include <iostream>

using namespace uberping;

// Set from the signal handler, polled by the session loop
static CancelToken g_cancel;

static void handle_stop(int) {
    g_cancel.request();
}

int run_uberping(const CliOptions& opt) {
    term::detect();
    if (opt.no_color) term::g_enabled = false;

    const SessionConfig& cfg = opt.session;

    std::string log_path = opt.log_path.empty() ? default_log_path() : opt.log_path;
    if (!prepare_log_path(log_path)) {
        std::cerr << term::yellow() << "Warning: cannot create directory for "
                  << log_path << term::reset() << "\n";
    }

    SessionLog log(log_path);
    IcmpProber prober;
    SteadySessionClock clock;

    SessionCoordinator session(cfg, prober, log, clock);

    std::signal(SIGINT, handle_stop);
    std::signal(SIGTERM, handle_stop);

    // -------------------------------------------------------------
    // Banner
    // -------------------------------------------------------------
    std::cout << term::green() << "Starting ping to " << cfg.destination
              << term::reset() << "\n";
    std::cout << "Log file: " << log_path << "\n";
    if (cfg.time_limit_s == 0)
        std::cout << "Running continuously (Press Ctrl+C to stop)\n";
    else
        std::cout << "Time limit: " << cfg.time_limit_s << " seconds\n";
    std::cout << "Ping interval: " << cfg.interval_ms << "ms\n";
    std::cout << "Adaptive spike detection: " << cfg.threshold.multiplier_pct
              << "% multiplier (initial threshold: "
              << format_ms(cfg.threshold.initial_ms) << "ms, recalculated every "
              << cfg.threshold.recompute_interval << " replies)\n";
    std::cout << "----------------------------------------\n";

    log.emit(Tone::Banner, "Ping session started - Target: " + cfg.destination
                           + ", Adaptive spike detection: "
                           + std::to_string(cfg.threshold.multiplier_pct) + "% multiplier");

    // -------------------------------------------------------------
    // Session
    // -------------------------------------------------------------
    const SessionSummary summary = session.run(g_cancel);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (log.persisting())
        std::cout << "Log saved to: " << log.path() << "\n";

    if (!opt.export_path.empty()) {
        if (!export_summary(opt.export_path, opt.export_format, summary, opt.export_append)) {
            std::cerr << term::yellow() << "Warning: cannot export summary to "
                      << opt.export_path << term::reset() << "\n";
        }
    }

    log.emit(Tone::Banner, "Ping session ended");
    return 0;
}
