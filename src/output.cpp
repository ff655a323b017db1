/**
 * SessionLog: timestamped console lines plus an append-only log file.
 *
 * The file never sees ANSI escapes; coloring is applied only to the
 * console copy.
 */

#include "uberping/output.hpp"
#include "uberping/util.hpp"
#include "terminal.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace uberping {

static const char* color_for(Tone tone) {
    switch (tone) {
        case Tone::Banner:  return term::green();
        case Tone::Failure: return term::red();
        case Tone::Warning: return term::yellow();
        case Tone::Debug:   return term::cyan();
        case Tone::Plain:
        case Tone::Reply:
        case Tone::Spike:   return "";
    }
    return "";
}

SessionLog::SessionLog(const std::string& path)
    : path_(path)
{
    if (path_.empty()) return;

    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_) {
        file_failed_ = true;
        warn_once();
    }
}

void SessionLog::emit(Tone tone, const std::string& text) {
    const std::string stamp = format_timestamp(std::chrono::system_clock::now());
    const std::string line = stamp + " - " + text;

    if (tone == Tone::Plain) {
        std::cout << text << "\n";
    } else if (tone == Tone::Spike) {
        std::cout << line << " " << term::red() << "[SPIKE]" << term::reset() << "\n";
    } else {
        const char* c = color_for(tone);
        if (*c)
            std::cout << c << line << term::reset() << "\n";
        else
            std::cout << line << "\n";
    }
    std::cout.flush();

    write_file(tone == Tone::Spike ? line + " [SPIKE]" : line);
}

void SessionLog::write_file(const std::string& line) {
    if (path_.empty() || file_failed_) return;

    file_ << line << "\n";
    file_.flush();
    if (!file_) {
        file_failed_ = true;
        warn_once();
    }
}

void SessionLog::warn_once() {
    if (warned_) return;
    warned_ = true;
    std::cerr << term::yellow() << "Warning: cannot write log file "
              << path_ << term::reset() << "\n";
}

std::string default_log_path() {
    const auto stamp = format_file_stamp(std::chrono::system_clock::now());
    return (std::filesystem::path("uberping_logs") /
            ("uberping_log_" + stamp + ".txt")).string();
}

bool prepare_log_path(const std::string& path) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    return !ec;
}

} // namespace uberping
