#pragma once

#include <optional>
#include <string>

#include "common.hpp"
#include "config.hpp"

enum CliCommand { CMD_SERVE, CMD_REPORT, CMD_HELP };

struct CliOptions {
    CliCommand command = CMD_SERVE;
    std::string report; // overview | time-of-day | trends | patterns | engagement | episodes

    std::optional<int> days;
    std::optional<int> hours;       // episodes window
    std::optional<int> gap_minutes; // episodes
    std::string granularity = "day";
    std::string domain;

    std::optional<std::string> config_path;
    std::optional<std::string> db_path;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<LogLevel> log_level;
    bool utc = false;
};

// hourglass [serve|report <kind>] [options]. Returns false and fills error on
// an unknown command, option or malformed value.
bool ParseCliOptions(int argc, const char *const *argv, CliOptions &opts, std::string &error);

// Flags given on the command line win over the config file
void ApplyCliOverrides(const CliOptions &opts, Config &config);

const char *CliUsage();
