#pragma once
#include <fstream>
#include <string>

namespace uberping {

/**
 * How a line should look on the console. The persisted copy is
 * always plain text.
 */
enum class Tone {
    Plain,    // console: no timestamp, no color
    Banner,   // session start/stop notices
    Reply,
    Spike,
    Failure,
    Warning,
    Debug
};

/**
 * Destination for session output.
 *
 * emit() must not throw: a sink that cannot persist a line reports it
 * on its own and keeps going.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void emit(Tone tone, const std::string& text) = 0;
};

/**
 * Console + append-only log file.
 *
 * Every line written to the file is "YYYY-MM-DD HH:MM:SS - text".
 * The console gets the same prefix (except Tone::Plain) and colors
 * from term::. If the file cannot be opened or written, a single
 * warning goes to stderr and the console output carries on.
 */
class SessionLog : public OutputSink {
public:
    // Empty path = console only.
    explicit SessionLog(const std::string& path);

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    void emit(Tone tone, const std::string& text) override;

    const std::string& path() const { return path_; }
    bool persisting() const { return file_.is_open() && !file_failed_; }

private:
    void write_file(const std::string& line);
    void warn_once();

    std::string path_;
    std::ofstream file_;
    bool file_failed_{false};
    bool warned_{false};
};

/**
 * Default log location: ./uberping_logs/uberping_log_YYYYMMDD_HHMMSS.txt
 */
std::string default_log_path();

/**
 * Create the parent directories of a log path. Returns false when they
 * could not be created; the caller decides whether that matters.
 */
bool prepare_log_path(const std::string& path);

} // namespace uberping
