#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common.hpp"
#include "time_utils.hpp"

std::optional<LogLevel> ParseLogLevel(const std::string &name);
std::optional<TimeBasis> ParseTimeBasis(const std::string &name);

// Service configuration. Every field has a default, so an absent or partial
// file still yields a usable config.
struct Config {
    std::string host = "127.0.0.1";
    int port = 8079;
    std::string db_path; // empty: DefaultDbPath()
    LogLevel log_level = LOG_INFO;
    std::string device_id = "local";
    TimeBasis time_basis = BASIS_LOCAL;
    int default_day_start_hour = kDefaultDayStartHour;

    static Config Default();

    // nullopt when the file cannot be read or parsed
    static std::optional<Config> LoadFromFile(const std::filesystem::path &path);
    static std::optional<Config> LoadFromString(const std::string &content);
};

// $XDG_DATA_HOME/Hourglass/data.sqlite, else ~/.local/share/Hourglass/data.sqlite
std::filesystem::path DefaultDbPath();

// $XDG_CONFIG_HOME/hourglass/config.json, else ~/.config/hourglass/config.json
std::filesystem::path DefaultConfigPath();
