#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include "cli.hpp"
#include "config.hpp"

namespace {

// Sets an environment variable for the scope, restoring the old value after
class ScopedEnv {
  public:
    ScopedEnv(const char *name, const std::string &value) : m_Name(name) {
        if (const char *old = std::getenv(name)) {
            m_Old = old;
        }
        setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (m_Old) {
            setenv(m_Name, m_Old->c_str(), 1);
        } else {
            unsetenv(m_Name);
        }
    }

  private:
    const char *m_Name;
    std::optional<std::string> m_Old;
};

bool Parse(std::vector<const char *> args, CliOptions &opts, std::string &error) {
    args.insert(args.begin(), "hourglass");
    return ParseCliOptions(static_cast<int>(args.size()), args.data(), opts, error);
}

std::filesystem::path TempDir(const std::string &name) {
    return std::filesystem::temp_directory_path() /
           ("hourglass_" + name + "_" + std::to_string(getpid()));
}

} // namespace

// ╭─────────────────────────────────────╮
// │               Config                │
// ╰─────────────────────────────────────╯
TEST(ConfigTest, DefaultsAreUsable) {
    const Config config = Config::Default();
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8079);
    EXPECT_TRUE(config.db_path.empty());
    EXPECT_EQ(config.log_level, LOG_INFO);
    EXPECT_EQ(config.device_id, "local");
    EXPECT_EQ(config.time_basis, BASIS_LOCAL);
    EXPECT_EQ(config.default_day_start_hour, 4);
}

TEST(ConfigTest, LoadsEveryField) {
    const auto config = Config::LoadFromString(R"({
        "host": "0.0.0.0",
        "port": 9100,
        "db_path": "/var/lib/hourglass/data.sqlite",
        "log_level": "debug",
        "device_id": "laptop",
        "time_basis": "utc",
        "default_day_start_hour": 6
    })");
    ASSERT_TRUE(config);
    EXPECT_EQ(config->host, "0.0.0.0");
    EXPECT_EQ(config->port, 9100);
    EXPECT_EQ(config->db_path, "/var/lib/hourglass/data.sqlite");
    EXPECT_EQ(config->log_level, LOG_DEBUG);
    EXPECT_EQ(config->device_id, "laptop");
    EXPECT_EQ(config->time_basis, BASIS_UTC);
    EXPECT_EQ(config->default_day_start_hour, 6);
}

TEST(ConfigTest, PartialFileKeepsDefaults) {
    const auto config = Config::LoadFromString(R"({"port": 9000})");
    ASSERT_TRUE(config);
    EXPECT_EQ(config->port, 9000);
    EXPECT_EQ(config->host, "127.0.0.1");
    EXPECT_EQ(config->device_id, "local");
}

TEST(ConfigTest, UnknownNamesFallBack) {
    const auto config =
      Config::LoadFromString(R"({"log_level": "verbose", "time_basis": "mars", "host": 7})");
    ASSERT_TRUE(config);
    EXPECT_EQ(config->log_level, LOG_INFO);
    EXPECT_EQ(config->time_basis, BASIS_LOCAL);
    EXPECT_EQ(config->host, "127.0.0.1");
}

TEST(ConfigTest, RejectsInvalidFiles) {
    EXPECT_FALSE(Config::LoadFromString("{ not json"));
    EXPECT_FALSE(Config::LoadFromString("[1, 2]"));
    EXPECT_FALSE(Config::LoadFromString(R"({"port": 0})"));
    EXPECT_FALSE(Config::LoadFromString(R"({"port": 70000})"));
    EXPECT_FALSE(Config::LoadFromString(R"({"default_day_start_hour": 24})"));
    EXPECT_FALSE(Config::LoadFromString(R"({"device_id": ""})"));
}

TEST(ConfigTest, LoadsFromFile) {
    const std::filesystem::path dir = TempDir("config");
    std::filesystem::create_directories(dir);
    const std::filesystem::path file = dir / "config.json";
    {
        std::ofstream out(file);
        out << R"({"device_id": "desk"})";
    }

    const auto config = Config::LoadFromFile(file);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->device_id, "desk");
    EXPECT_FALSE(Config::LoadFromFile(dir / "missing.json"));

    std::filesystem::remove_all(dir);
}

TEST(ConfigTest, DefaultPathsFollowXdg) {
    const std::filesystem::path dir = TempDir("xdg");
    ScopedEnv data("XDG_DATA_HOME", (dir / "data").string());
    ScopedEnv config("XDG_CONFIG_HOME", (dir / "config").string());

    EXPECT_EQ(DefaultConfigPath(), dir / "config" / "hourglass" / "config.json");

    const std::filesystem::path db = DefaultDbPath();
    EXPECT_EQ(db, dir / "data" / "Hourglass" / "data.sqlite");
    EXPECT_TRUE(std::filesystem::is_directory(db.parent_path()));

    std::filesystem::remove_all(dir);
}

TEST(ConfigTest, DefaultPathsFallBackToHome) {
    const std::filesystem::path dir = TempDir("home");
    ScopedEnv home("HOME", dir.string());
    ScopedEnv data("XDG_DATA_HOME", "");
    ScopedEnv config("XDG_CONFIG_HOME", "");

    EXPECT_EQ(DefaultConfigPath(), dir / ".config" / "hourglass" / "config.json");
    EXPECT_EQ(DefaultDbPath(), dir / ".local" / "share" / "Hourglass" / "data.sqlite");

    std::filesystem::remove_all(dir);
}

// ╭─────────────────────────────────────╮
// │           Command line              │
// ╰─────────────────────────────────────╯
TEST(CliTest, NoArgumentsServes) {
    CliOptions opts;
    std::string error;
    ASSERT_TRUE(Parse({}, opts, error)) << error;
    EXPECT_EQ(opts.command, CMD_SERVE);
    EXPECT_FALSE(opts.port);
}

TEST(CliTest, ParsesServeFlags) {
    CliOptions opts;
    std::string error;
    ASSERT_TRUE(Parse({"serve", "--host", "0.0.0.0", "--port", "9000", "--log-level", "debug",
                       "--db", "/tmp/x.sqlite", "--config", "/etc/hourglass.json"},
                      opts, error))
      << error;
    EXPECT_EQ(opts.command, CMD_SERVE);
    EXPECT_EQ(opts.host, "0.0.0.0");
    EXPECT_EQ(opts.port, 9000);
    EXPECT_EQ(opts.log_level, LOG_DEBUG);
    EXPECT_EQ(opts.db_path, "/tmp/x.sqlite");
    EXPECT_EQ(opts.config_path, "/etc/hourglass.json");
}

TEST(CliTest, ParsesReports) {
    CliOptions opts;
    std::string error;
    ASSERT_TRUE(Parse({"report", "trends", "--granularity", "week", "--utc"}, opts, error))
      << error;
    EXPECT_EQ(opts.command, CMD_REPORT);
    EXPECT_EQ(opts.report, "trends");
    EXPECT_EQ(opts.granularity, "week");
    EXPECT_TRUE(opts.utc);

    CliOptions engagement;
    ASSERT_TRUE(Parse({"report", "engagement", "--domain", "news.example", "--days", "14"},
                      engagement, error))
      << error;
    EXPECT_EQ(engagement.domain, "news.example");
    EXPECT_EQ(engagement.days, 14);
}

TEST(CliTest, RejectsBadInput) {
    std::string error;
    {
        CliOptions opts;
        EXPECT_FALSE(Parse({"report", "weather"}, opts, error));
    }
    {
        CliOptions opts;
        EXPECT_FALSE(Parse({"report", "engagement"}, opts, error));
        EXPECT_EQ(error, "report engagement requires --domain");
    }
    {
        CliOptions opts;
        EXPECT_FALSE(Parse({"--bogus"}, opts, error));
        EXPECT_EQ(error, "unknown option: --bogus");
    }
    {
        CliOptions opts;
        EXPECT_FALSE(Parse({"--port"}, opts, error));
        EXPECT_EQ(error, "missing value for --port");
    }
    {
        CliOptions opts;
        EXPECT_FALSE(Parse({"--port", "99999"}, opts, error));
        EXPECT_FALSE(Parse({"--days", "7d"}, opts, error));
        EXPECT_FALSE(Parse({"--granularity", "month"}, opts, error));
        EXPECT_FALSE(Parse({"--log-level", "loud"}, opts, error));
    }
}

TEST(CliTest, HelpStopsParsing) {
    CliOptions opts;
    std::string error;
    ASSERT_TRUE(Parse({"report", "overview", "--help", "--bogus"}, opts, error));
    EXPECT_EQ(opts.command, CMD_HELP);
    EXPECT_NE(std::string(CliUsage()).find("hourglass report"), std::string::npos);
}

TEST(CliTest, OverridesWinOverConfig) {
    CliOptions opts;
    std::string error;
    ASSERT_TRUE(Parse({"--port", "9001", "--utc", "--log-level", "off"}, opts, error)) << error;

    Config config = Config::Default();
    config.host = "10.0.0.2";
    ApplyCliOverrides(opts, config);
    EXPECT_EQ(config.port, 9001);
    EXPECT_EQ(config.host, "10.0.0.2");
    EXPECT_EQ(config.time_basis, BASIS_UTC);
    EXPECT_EQ(config.log_level, LOG_OFF);
}
