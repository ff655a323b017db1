#include "export.hpp"
#include "uberping/util.hpp"

#include <cstdio>
#include <fstream>

using namespace uberping;

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// CSV fields may carry host names with commas or quotes
static std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

static std::string num(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}


// ------------------------------------------------------------
// CSV
// ------------------------------------------------------------

static void write_csv_header(std::ofstream& f) {
    f << "host,sent,received,failed,success_rate,min,avg,max,"
         "jitter,jitter_quality,threshold,spikes,runtime_s\n";
}

static void write_csv_row(std::ofstream& f, const SessionSummary& s) {
    f << csv_field(s.destination) << ","
      << s.attempts << "," << s.successes << "," << s.failures << ","
      << num(s.success_rate_pct) << ",";

    if (s.stats) {
        f << num(s.stats->min_ms) << "," << num(s.stats->mean_ms) << ","
          << num(s.stats->max_ms) << ",";
    } else {
        f << ",,,";
    }

    if (s.stats && s.stats->jitter_ms) {
        f << num(*s.stats->jitter_ms) << ","
          << to_string(classify_jitter(*s.stats->jitter_ms)) << ",";
    } else {
        f << ",,";
    }

    f << num(s.final_threshold_ms) << "," << s.spikes.size() << ","
      << num(s.elapsed_s) << "\n";
}


// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

static void write_json(std::ofstream& f, const SessionSummary& s) {
    f << "{"
      << "\"host\":\"" << json_escape(s.destination) << "\","
      << "\"sent\":" << s.attempts << ","
      << "\"received\":" << s.successes << ","
      << "\"failed\":" << s.failures << ","
      << "\"success_rate\":" << num(s.success_rate_pct) << ",";

    if (s.stats) {
        f << "\"rtt\":{"
          << "\"min\":" << num(s.stats->min_ms) << ","
          << "\"avg\":" << num(s.stats->mean_ms) << ","
          << "\"max\":" << num(s.stats->max_ms) << ",";
        if (s.stats->jitter_ms) {
            f << "\"jitter\":" << num(*s.stats->jitter_ms) << ","
              << "\"jitter_quality\":\""
              << to_string(classify_jitter(*s.stats->jitter_ms)) << "\"";
        } else {
            f << "\"jitter\":null,\"jitter_quality\":null";
        }
        f << "},";
    } else {
        f << "\"rtt\":null,";
    }

    f << "\"threshold\":" << num(s.final_threshold_ms) << ","
      << "\"multiplier_pct\":" << s.multiplier_pct << ","
      << "\"runtime_s\":" << num(s.elapsed_s) << ","
      << "\"stopped\":\"" << (s.reason == StopReason::TimeLimit ? "time_limit" : "cancelled") << "\","
      << "\"spikes\":[";

    for (size_t i = 0; i < s.spikes.size(); ++i) {
        const auto& sp = s.spikes[i];
        if (i) f << ",";
        f << "{"
          << "\"time\":\"" << format_timestamp(sp.taken_at) << "\","
          << "\"latency\":" << num(sp.latency_ms) << ","
          << "\"threshold\":" << num(sp.threshold_ms) << ","
          << "\"message\":\"" << json_escape(sp.raw_message) << "\""
          << "}";
    }

    f << "]}\n";
}


bool export_summary(const std::string& path, ExportFormat fmt,
                    const SessionSummary& summary, bool append)
{
    std::ofstream f(path, std::ios::out |
                            (append ? std::ios::app : std::ios::trunc));
    if (!f) return false;

    if (fmt == ExportFormat::CSV) {
        if (!append) write_csv_header(f);
        write_csv_row(f, summary);
    } else {
        write_json(f, summary);
    }

    f.flush();
    return static_cast<bool>(f);
}
