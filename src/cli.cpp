#include "cli.hpp"

#include <stdexcept>

namespace {

bool IsReportKind(const std::string &kind) {
    return kind == "overview" || kind == "time-of-day" || kind == "trends" ||
           kind == "patterns" || kind == "engagement" || kind == "episodes";
}

bool TakesValue(const std::string &arg) {
    return arg == "--days" || arg == "--hours" || arg == "--gap-minutes" ||
           arg == "--granularity" || arg == "--domain" || arg == "--config" || arg == "--db" ||
           arg == "--host" || arg == "--port" || arg == "--log-level";
}

bool ParseInt(const std::string &raw, int &out) {
    try {
        size_t used = 0;
        out = std::stoi(raw, &used);
        return used == raw.size();
    } catch (const std::exception &) {
        return false;
    }
}

} // namespace

// ─────────────────────────────────────
bool ParseCliOptions(int argc, const char *const *argv, CliOptions &opts, std::string &error) {
    int i = 1;
    if (i < argc) {
        const std::string cmd = argv[i];
        if (cmd == "serve") {
            opts.command = CMD_SERVE;
            i++;
        } else if (cmd == "report") {
            opts.command = CMD_REPORT;
            i++;
            if (i >= argc || !IsReportKind(argv[i])) {
                error = "report: expected overview, time-of-day, trends, patterns, engagement or "
                        "episodes";
                return false;
            }
            opts.report = argv[i];
            i++;
        } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            opts.command = CMD_HELP;
            return true;
        }
    }

    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string &value) {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            opts.command = CMD_HELP;
            return true;
        }
        if (arg == "--utc") {
            opts.utc = true;
            continue;
        }
        if (!TakesValue(arg)) {
            error = "unknown option: " + arg;
            return false;
        }
        if (!next(value)) {
            return false;
        }

        if (arg == "--days") {
            int days = 0;
            if (!ParseInt(value, days)) {
                error = "invalid --days: " + value;
                return false;
            }
            opts.days = days;
        } else if (arg == "--hours") {
            int hours = 0;
            if (!ParseInt(value, hours)) {
                error = "invalid --hours: " + value;
                return false;
            }
            opts.hours = hours;
        } else if (arg == "--gap-minutes") {
            int gap = 0;
            if (!ParseInt(value, gap)) {
                error = "invalid --gap-minutes: " + value;
                return false;
            }
            opts.gap_minutes = gap;
        } else if (arg == "--granularity") {
            if (value != "hour" && value != "day" && value != "week") {
                error = "invalid --granularity: " + value;
                return false;
            }
            opts.granularity = value;
        } else if (arg == "--domain") {
            opts.domain = value;
        } else if (arg == "--config") {
            opts.config_path = value;
        } else if (arg == "--db") {
            opts.db_path = value;
        } else if (arg == "--host") {
            opts.host = value;
        } else if (arg == "--port") {
            int port = 0;
            if (!ParseInt(value, port) || port < 1 || port > 65535) {
                error = "invalid --port: " + value;
                return false;
            }
            opts.port = port;
        } else if (arg == "--log-level") {
            const std::optional<LogLevel> level = ParseLogLevel(value);
            if (!level) {
                error = "invalid --log-level: " + value;
                return false;
            }
            opts.log_level = *level;
        }
    }

    if (opts.command == CMD_REPORT && opts.report == "engagement" && opts.domain.empty()) {
        error = "report engagement requires --domain";
        return false;
    }
    return true;
}

// ─────────────────────────────────────
void ApplyCliOverrides(const CliOptions &opts, Config &config) {
    if (opts.db_path) {
        config.db_path = *opts.db_path;
    }
    if (opts.host) {
        config.host = *opts.host;
    }
    if (opts.port) {
        config.port = *opts.port;
    }
    if (opts.log_level) {
        config.log_level = *opts.log_level;
    }
    if (opts.utc) {
        config.time_basis = BASIS_UTC;
    }
}

// ─────────────────────────────────────
const char *CliUsage() {
    return "usage: hourglass [serve] [--host H] [--port P]\n"
           "       hourglass report overview|time-of-day|trends|patterns|engagement|episodes\n"
           "                 [--days N] [--granularity hour|day|week] [--domain D]\n"
           "                 [--hours N] [--gap-minutes N]\n"
           "common options: --config FILE --db FILE --log-level debug|info|off --utc\n";
}
