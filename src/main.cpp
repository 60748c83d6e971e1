#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "analytics_engine.hpp"
#include "cli.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "interval_store.hpp"
#include "reports.hpp"
#include "settings.hpp"

namespace {

void SetLogLevel(LogLevel log_level) {
    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

Config LoadConfig(const CliOptions &opts) {
    const std::filesystem::path path =
      opts.config_path ? std::filesystem::path(*opts.config_path) : DefaultConfigPath();

    Config config = Config::Default();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (auto loaded = Config::LoadFromFile(path)) {
            config = *loaded;
            spdlog::debug("Config loaded from {}", path.string());
        } else {
            spdlog::error("Ignoring config file {}, using defaults", path.string());
        }
    } else {
        spdlog::debug("No config file at {}, using defaults", path.string());
    }

    ApplyCliOverrides(opts, config);
    return config;
}

nlohmann::json RunReport(AnalyticsEngine &engine, const CliOptions &opts) {
    if (opts.report == "overview") {
        return engine.GetOverview(opts.days.value_or(7));
    }
    if (opts.report == "time-of-day") {
        return engine.GetTimeOfDayAnalysis(opts.days.value_or(7));
    }
    if (opts.report == "trends") {
        return engine.GetTrends(ParseGranularity(opts.granularity).value_or(GRANULARITY_DAY));
    }
    if (opts.report == "patterns") {
        return engine.GetBehavioralPatterns(opts.days.value_or(30));
    }
    if (opts.report == "episodes") {
        EpisodeQuery query;
        if (opts.hours) {
            query.hours = *opts.hours;
        }
        if (opts.gap_minutes) {
            query.gap_minutes = *opts.gap_minutes;
        }
        return engine.GetBehaviorEpisodes(query);
    }
    return engine.GetEngagementMetrics(opts.domain, opts.days.value_or(7));
}

} // namespace

// ─────────────────────────────────────
int main(int argc, char **argv) {
    CliOptions opts;
    std::string error;
    if (!ParseCliOptions(argc, argv, opts, error)) {
        std::cerr << error << "\n" << CliUsage();
        return 2;
    }
    if (opts.command == CMD_HELP) {
        std::cout << CliUsage();
        return 0;
    }

    // Report output goes to stdout, so diagnostics move to stderr
    if (opts.command == CMD_REPORT) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("hourglass"));
    }
    SetLogLevel(opts.log_level.value_or(LOG_INFO));

    try {
        const Config config = LoadConfig(opts);
        SetLogLevel(config.log_level);

        const std::filesystem::path dbPath =
          config.db_path.empty() ? DefaultDbPath() : std::filesystem::path(config.db_path);
        spdlog::info("DataBase path: {}", dbPath.string());

        IntervalStore store(dbPath.string());
        SettingsStore settings(store, config.default_day_start_hour);
        SystemClock clock;
        AnalyticsEngine engine(store, clock, config.time_basis, settings.Getter());

        if (opts.command == CMD_REPORT) {
            std::cout << RunReport(engine, opts).dump(2) << "\n";
            return 0;
        }

        AnalyticsServer server(engine, settings, config);
        server.InitServer();
        return server.Listen() ? 0 : 1;
    } catch (const std::exception &e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
