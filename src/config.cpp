#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "json.hpp"

namespace {

std::filesystem::path HomeDir() {
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        throw std::runtime_error("HOME environment variable not set");
    }
    return std::filesystem::path(home);
}

} // namespace

// ─────────────────────────────────────
std::optional<LogLevel> ParseLogLevel(const std::string &name) {
    if (name == "debug") {
        return LOG_DEBUG;
    }
    if (name == "info") {
        return LOG_INFO;
    }
    if (name == "off") {
        return LOG_OFF;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<TimeBasis> ParseTimeBasis(const std::string &name) {
    if (name == "local") {
        return BASIS_LOCAL;
    }
    if (name == "utc") {
        return BASIS_UTC;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
Config Config::Default() {
    return Config{};
}

// ─────────────────────────────────────
std::optional<Config> Config::LoadFromFile(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file: {}", path.string());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

// ─────────────────────────────────────
std::optional<Config> Config::LoadFromString(const std::string &content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Config parse error: {}", e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        spdlog::error("Config root must be a JSON object");
        return std::nullopt;
    }

    Config config = Default();
    config.host = GetString(j, "host", config.host);
    config.port = GetInt(j, "port", config.port);
    config.db_path = GetString(j, "db_path", config.db_path);
    config.device_id = GetString(j, "device_id", config.device_id);
    config.default_day_start_hour =
        GetInt(j, "default_day_start_hour", config.default_day_start_hour);

    const std::string level = GetString(j, "log_level", "info");
    if (const auto parsed = ParseLogLevel(level)) {
        config.log_level = *parsed;
    } else {
        spdlog::warn("Unknown log_level '{}', using info", level);
    }

    const std::string basis = GetString(j, "time_basis", "local");
    if (const auto parsed = ParseTimeBasis(basis)) {
        config.time_basis = *parsed;
    } else {
        spdlog::warn("Unknown time_basis '{}', using local", basis);
    }

    if (config.port < 1 || config.port > 65535) {
        spdlog::error("Config port out of range: {}", config.port);
        return std::nullopt;
    }
    if (config.default_day_start_hour < 0 || config.default_day_start_hour > 23) {
        spdlog::error("Config default_day_start_hour out of range: {}",
                      config.default_day_start_hour);
        return std::nullopt;
    }
    if (config.device_id.empty()) {
        spdlog::error("Config device_id cannot be empty");
        return std::nullopt;
    }

    return config;
}

// ─────────────────────────────────────
std::filesystem::path DefaultDbPath() {
    const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
    std::filesystem::path baseDir;
    if (xdgDataHome && *xdgDataHome) {
        baseDir = xdgDataHome;
    } else {
        baseDir = HomeDir() / ".local" / "share";
    }

    std::filesystem::path dbPath = baseDir / "Hourglass" / "data.sqlite";
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("unable to create data directory: " + ec.message());
    }
    return dbPath;
}

// ─────────────────────────────────────
std::filesystem::path DefaultConfigPath() {
    const char *xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "hourglass" / "config.json";
    }
    return HomeDir() / ".config" / "hourglass" / "config.json";
}
